#include "CommandLineParser.hpp"
#include <sstream>

namespace realestate {

bool CommandLineParser::hasSubcommands(std::string_view command) noexcept
{
    return command == "deal" || command == "ledger";
}

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'realestate help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Глобальный help: "help <cmd>", "<cmd> --help", "<cmd> <sub> -h"
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "help" || arg == "--help" || arg == "-h") {
                if (i == 1) {
                    result.command = "help";
                    for (int j = 2; j < argc; ++j) {
                        if (argv[j][0] != '-') {
                            result.positional.push_back(argv[j]);
                        }
                    }
                } else {
                    result.positional.push_back(result.command);
                    result.command = "help";
                }
                return result;
            }
        }

        // Определяем есть ли subcommand
        int startIdx = 2;
        if (hasSubcommands(result.command) && argc > 2 && argv[2][0] != '-') {
            result.subcommand = argv[2];
            startIdx = 3;
        }

        std::vector<std::string> args(argv + startIdx, argv + argc);

        po::options_description desc;
        if (result.command == "analyze") {
            desc.add(createAnalyzeOptions());
        } else if (result.command == "offer") {
            desc.add(createOfferOptions());
        } else if (result.command == "amortize") {
            desc.add(createAmortizeOptions());
        } else if (result.command == "kpi") {
            desc.add(createKpiOptions());
        } else if (result.command == "deal") {
            desc.add(createDealOptions());
        } else if (result.command == "ledger") {
            desc.add(createLedgerOptions());
        } else if (result.command == "version") {
            result.positional = std::move(args);
            return result;
        } else {
            std::ostringstream oss;
            oss << "Unknown command: " << result.command;
            return std::unexpected(oss.str());
        }

        po::store(po::command_line_parser(args).options(desc).run(),
                  result.options);
        po::notify(result.options);

        return result;

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") +
                               e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Analyze / Offer
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createAnalyzeOptions() const {
    po::options_description desc("Analyze options");
    desc.add_options()
        ("deal,d", po::value<std::string>(),
         "Deal record file (JSON)")

        ("json", po::bool_switch()->default_value(false),
         "Print result as JSON")

        ("help,h", "Show help message");

    return desc;
}

po::options_description CommandLineParser::createOfferOptions() const {
    po::options_description desc("Offer options");
    desc.add_options()
        ("deal,d", po::value<std::string>(),
         "Deal record file (JSON)")

        ("estimated-value,v", po::value<double>(),
         "Estimated property value (default: after_repair_value of the deal)")

        ("target-cash-left,c", po::value<double>(),
         "Cash left in the deal after refinance (default: 10000)")

        ("json", po::bool_switch()->default_value(false),
         "Print result as JSON")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Amortize
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createAmortizeOptions() const {
    po::options_description desc("Amortize options");
    desc.add_options()
        ("principal,p", po::value<double>(),
         "Loan amount")

        ("rate,r", po::value<double>(),
         "Annual interest rate, percent")

        ("term,t", po::value<int>()->default_value(360),
         "Term in months")

        ("interest-only", po::bool_switch()->default_value(false),
         "Interest-only payments")

        ("months,m", po::value<int>(),
         "Print only the first N months")

        ("json", po::bool_switch()->default_value(false),
         "Print result as JSON")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// KPI
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createKpiOptions() const {
    po::options_description desc("KPI options");
    desc.add_options()
        ("property,p", po::value<std::string>(),
         "Property ID")

        ("properties", po::value<std::string>(),
         "Property catalog file (JSON)")

        ("ledger,l", po::value<std::string>(),
         "Ledger database path (default: <data dir>/ledger.db)")

        ("as-of", po::value<std::string>(),
         "Report date YYYY-MM-DD (default: today)")

        ("json", po::bool_switch()->default_value(false),
         "Print result as JSON")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Deal records
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createDealOptions() const {
    po::options_description desc("Deal options");
    desc.add_options()
        ("deal,d", po::value<std::string>(),
         "Deal record file (JSON) to save")

        ("id", po::value<std::string>(),
         "Deal ID")

        ("user,u", po::value<std::string>(),
         "Filter by user ID")

        ("store", po::value<std::string>(),
         "Deals directory (default: <data dir>/deals)")

        ("json", po::bool_switch()->default_value(false),
         "Print record as JSON")

        ("help,h", "Show help message");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Ledger
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createLedgerOptions() const {
    po::options_description desc("Ledger options");
    desc.add_options()
        ("ledger,l", po::value<std::string>(),
         "Ledger database path (default: <data dir>/ledger.db)")

        ("csv,f", po::value<std::string>(),
         "CSV file to import")

        ("property,p", po::value<std::string>(),
         "Property ID")

        ("delimiter", po::value<char>()->default_value(','),
         "CSV delimiter")

        ("replace", po::bool_switch()->default_value(false),
         "Remove existing transactions of the property before import")

        ("from", po::value<std::string>(),
         "Start date (YYYY-MM-DD)")

        ("to", po::value<std::string>(),
         "End date (YYYY-MM-DD)")

        ("help,h", "Show help message");

    return desc;
}

}  // namespace realestate
