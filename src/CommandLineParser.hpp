#pragma once

#include <boost/program_options.hpp>
#include <expected>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace realestate {

struct ParsedCommand {
    std::string command;
    std::string subcommand;
    po::variables_map options;
    std::vector<std::string> positional;
};

class CommandLineParser {
public:
    CommandLineParser() = default;

    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    // Описания опций по командам (используются и в справке)
    po::options_description createAnalyzeOptions() const;
    po::options_description createOfferOptions() const;
    po::options_description createAmortizeOptions() const;
    po::options_description createKpiOptions() const;
    po::options_description createDealOptions() const;
    po::options_description createLedgerOptions() const;

private:
    static bool hasSubcommands(std::string_view command) noexcept;
};

}  // namespace realestate
