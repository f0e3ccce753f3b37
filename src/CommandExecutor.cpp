#include "CommandExecutor.hpp"
#include "CsvTransactionImporter.hpp"
#include "DealCodec.hpp"
#include "DealRepository.hpp"
#include "PropertyCatalog.hpp"
#include "ResultSerializer.hpp"
#include "SQLiteLedgerStore.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace realestate {

namespace {

std::string formatPercent(const std::optional<double>& value)
{
    if (!value) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << *value << "%";
    return oss.str();
}

std::string formatRatio(const std::optional<double>& value)
{
    if (!value) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << *value;
    return oss.str();
}

} // namespace

CommandExecutor::CommandExecutor(std::filesystem::path dataDir)
    : dataDir_(dataDir.empty() ? DealRepository::defaultDataDirectory() : std::move(dataDir))
{
}

std::expected<void, std::string> CommandExecutor::execute(const ParsedCommand& cmd)
{
    // Маршрутизация команд
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "version") {
        return executeVersion(cmd);
    } else if (cmd.command == "analyze") {
        return executeAnalyze(cmd);
    } else if (cmd.command == "offer") {
        return executeOffer(cmd);
    } else if (cmd.command == "amortize") {
        return executeAmortize(cmd);
    } else if (cmd.command == "kpi") {
        return executeKpi(cmd);
    } else if (cmd.command == "deal") {
        return executeDeal(cmd);
    } else if (cmd.command == "ledger") {
        return executeLedger(cmd);
    } else {
        return std::unexpected("Unknown command: " + cmd.command);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═════════════════════════════════════════════════════════════════════════════

bool CommandExecutor::isJsonOutput(const ParsedCommand& cmd) const
{
    auto it = cmd.options.find("json");
    return it != cmd.options.end() && it->second.as<bool>();
}

std::expected<Deal, std::string> CommandExecutor::loadDealOption(
    const ParsedCommand& cmd) const
{
    auto pathResult = getRequiredOption<std::string>(cmd, "deal");
    if (!pathResult) {
        return std::unexpected(pathResult.error());
    }

    return DealCodec::loadFromFile(pathResult.value());
}

std::unique_ptr<IDealRepository> CommandExecutor::openDealRepository(
    const ParsedCommand& cmd) const
{
    std::string store = (dataDir_ / "deals").string();
    if (cmd.options.count("store")) {
        store = cmd.options.at("store").as<std::string>();
    }
    return std::make_unique<DealRepository>(store);
}

std::expected<std::unique_ptr<ILedgerStore>, std::string> CommandExecutor::openLedger(
    const ParsedCommand& cmd) const
{
    std::filesystem::path ledgerPath = dataDir_ / "ledger.db";
    if (cmd.options.count("ledger")) {
        ledgerPath = cmd.options.at("ledger").as<std::string>();
    }

    if (ledgerPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(ledgerPath.parent_path(), ec);
        if (ec) {
            return std::unexpected("Cannot create ledger directory " +
                                   ledgerPath.parent_path().string() + ": " + ec.message());
        }
    }

    try {
        return std::make_unique<SQLiteLedgerStore>(ledgerPath.string());
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::expected<std::optional<Date>, std::string> CommandExecutor::getDateOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const
{
    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::optional<Date>{};
    }

    auto date = parseDate(cmd.options.at(optName).as<std::string>());
    if (!date) {
        return std::unexpected("Invalid value for option '" + optName + "': " + date.error());
    }
    return std::optional<Date>{*date};
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    if (!cmd.positional.empty()) {
        printHelp(cmd.positional[0]);
    } else {
        printHelp();
    }
    return {};
}

std::expected<void, std::string> CommandExecutor::executeVersion(const ParsedCommand& /*cmd*/)
{
    printVersion();
    return {};
}

void CommandExecutor::printHelp(std::string_view topic) const
{
    CommandLineParser parser;

    auto printCommand = [](std::string_view name,
                           std::string_view summary,
                           std::string_view usage,
                           const po::options_description& desc,
                           std::initializer_list<std::string_view> examples) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: " << name << std::endl;
        std::cout << summary << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "USAGE:" << std::endl;
        std::cout << "  " << usage << std::endl << std::endl;

        std::cout << desc << std::endl;

        std::cout << "EXAMPLES:" << std::endl;
        for (const auto& example : examples) {
            std::cout << "  " << example << std::endl;
        }
        std::cout << std::string(70, '=') << std::endl;
    };

    if (topic.empty()) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "Real Estate Investment Analyzer" << std::endl;
        std::cout << "Usage: realestate <command> [options]" << std::endl << std::endl;

        std::cout << "COMMANDS:" << std::endl;
        std::cout << "  analyze                 Analyze a deal (cash flow, returns, ratios)" << std::endl;
        std::cout << "  offer                   Maximum allowable offer for a deal" << std::endl;
        std::cout << "  amortize                Loan amortization schedule" << std::endl;
        std::cout << "  kpi                     Actual KPIs of an owned property" << std::endl;
        std::cout << "  deal                    Manage saved deals" << std::endl;
        std::cout << "  ledger                  Manage property transactions" << std::endl;
        std::cout << "  help <command>          Show detailed help for a command" << std::endl;
        std::cout << "  version                 Show version information" << std::endl;
        std::cout << std::endl;

        std::cout << "ENVIRONMENT:" << std::endl;
        std::cout << "  REALESTATE_DATA_DIR     Data directory (default: ~/.realestate)" << std::endl;
        std::cout << std::endl;

        std::cout << "For more information on a specific command, use:" << std::endl;
        std::cout << "  realestate help <command>" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "analyze") {
        printCommand("analyze", "Analyze a deal record",
                     "realestate analyze --deal FILE [--json]",
                     parser.createAnalyzeOptions(),
                     {"realestate analyze --deal duplex.json",
                      "realestate analyze --deal brrrr.json --json"});

    } else if (topic == "offer") {
        printCommand("offer", "Maximum allowable offer (MAO)",
                     "realestate offer --deal FILE [--estimated-value V] [--target-cash-left C]",
                     parser.createOfferOptions(),
                     {"realestate offer --deal brrrr.json",
                      "realestate offer --deal brrrr.json --estimated-value 250000 --target-cash-left 0"});

    } else if (topic == "amortize") {
        printCommand("amortize", "Loan amortization schedule",
                     "realestate amortize --principal P --rate R [--term N] [--months K]",
                     parser.createAmortizeOptions(),
                     {"realestate amortize --principal 200000 --rate 4.5 --term 360 --months 12",
                      "realestate amortize -p 150000 -r 7 --interest-only --json"});

    } else if (topic == "kpi") {
        printCommand("kpi", "Year-to-date and since-acquisition KPIs from the ledger",
                     "realestate kpi --property ID --properties FILE [--ledger DB] [--as-of DATE]",
                     parser.createKpiOptions(),
                     {"realestate kpi --property elm-st --properties properties.json",
                      "realestate kpi -p elm-st --properties properties.json --as-of 2024-06-30 --json"});

    } else if (topic == "deal") {
        printCommand("deal", "Manage saved deals (save, show, list, delete)",
                     "realestate deal <save|show|list|delete> [options]",
                     parser.createDealOptions(),
                     {"realestate deal save --deal duplex.json",
                      "realestate deal list --user u-42",
                      "realestate deal show --id duplex-01 --json",
                      "realestate deal delete --id duplex-01"});

    } else if (topic == "ledger") {
        printCommand("ledger", "Manage property transactions (import, list, clear)",
                     "realestate ledger <import|list|clear> [options]",
                     parser.createLedgerOptions(),
                     {"realestate ledger import --csv 2024.csv --property elm-st",
                      "realestate ledger list --property elm-st --from 2024-01-01",
                      "realestate ledger list",
                      "realestate ledger clear --property elm-st"});

    } else {
        std::cout << "Unknown help topic: " << topic << std::endl;
        std::cout << "Available topics: analyze, offer, amortize, kpi, deal, ledger" << std::endl;
    }

    std::cout << std::endl;
}

void CommandExecutor::printVersion() const
{
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << "Real Estate Investment Analyzer" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl;
    std::cout << "Build Date: " << __DATE__ << std::endl;
    std::cout << std::string(50, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Analyze
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeAnalyze(const ParsedCommand& cmd)
{
    auto dealResult = loadDealOption(cmd);
    if (!dealResult) {
        return std::unexpected(dealResult.error());
    }

    const auto& deal = dealResult.value();
    auto result = AnalysisEngine::analyze(deal);

    if (isJsonOutput(cmd)) {
        std::cout << ResultSerializer::toJson(result).dump(2) << std::endl;
    } else {
        printAnalysisResult(deal, result);
    }

    return {};
}

void CommandExecutor::printAnalysisResult(
    const Deal& deal,
    const AnalysisResult& result) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "DEAL ANALYSIS: " << deal.name()
              << " (" << toString(result.strategy) << ")" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Address:         " << deal.core().property.address << std::endl;
    std::cout << "Purchase Price:  $" << std::fixed << std::setprecision(2)
              << deal.purchasePrice() << std::endl << std::endl;

    std::cout << "Monthly:" << std::endl;
    std::cout << "  Income:               $" << result.monthlyIncome << std::endl;
    std::cout << "  Operating Expenses:   $" << result.monthlyOperatingExpenses << std::endl;
    std::cout << "  NOI:                  $" << result.monthlyNoi << std::endl;
    std::cout << "  Debt Service:         $" << result.monthlyDebtService << std::endl;
    std::cout << "  Cash Flow:            $" << result.monthlyCashFlow << std::endl;
    std::cout << std::endl;

    std::cout << "Returns:" << std::endl;
    std::cout << "  Annual Cash Flow:     $" << result.annualCashFlow << std::endl;
    std::cout << "  Total Cash Invested:  $" << result.totalCashInvested << std::endl;
    std::cout << "  Cash-on-Cash Return:  " << formatPercent(result.cashOnCashReturn) << std::endl;
    std::cout << "  Cap Rate:             " << formatPercent(result.capRate) << std::endl;
    std::cout << std::endl;

    std::cout << "Ratios:" << std::endl;
    std::cout << "  DSCR:                 " << formatRatio(result.debtServiceCoverageRatio) << std::endl;
    std::cout << "  Expense Ratio:        " << formatPercent(result.expenseRatio) << std::endl;
    std::cout << "  Gross Rent Multiplier:" << " " << formatRatio(result.grossRentMultiplier) << std::endl;
    std::cout << "  Breakeven Occupancy:  " << formatPercent(result.breakevenOccupancy) << std::endl;

    if (result.pricePerUnit || result.occupancyRate) {
        std::cout << std::endl;
        std::cout << "Multi-Family:" << std::endl;
        std::cout << "  Price per Unit:       $" << formatRatio(result.pricePerUnit) << std::endl;
        std::cout << "  Occupancy Rate:       " << formatPercent(result.occupancyRate) << std::endl;
    }

    if (result.totalRentCredits || result.effectivePurchasePrice) {
        std::cout << std::endl;
        std::cout << "Lease Option:" << std::endl;
        std::cout << "  Total Rent Credits:   $" << formatRatio(result.totalRentCredits) << std::endl;
        std::cout << "  Effective Price:      $" << formatRatio(result.effectivePurchasePrice) << std::endl;
    }

    if (result.balloon) {
        const auto& balloon = *result.balloon;
        std::cout << std::endl;
        std::cout << "Balloon Refinance:" << std::endl;
        std::cout << "  Payment Before:       $" << balloon.preBalloonPayment << std::endl;
        std::cout << "  Payment After:        $" << balloon.postBalloonPayment << std::endl;
        std::cout << "  Difference:           $" << balloon.paymentDifference << std::endl;
        std::cout << "  Refinance Costs:      $" << balloon.refinanceCosts << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Offer
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeOffer(const ParsedCommand& cmd)
{
    auto dealResult = loadDealOption(cmd);
    if (!dealResult) {
        return std::unexpected(dealResult.error());
    }

    const auto& deal = dealResult.value();

    double targetCashLeft = MaximumOfferCalculator::kDefaultTargetCashLeft;
    if (cmd.options.count("target-cash-left")) {
        targetCashLeft = cmd.options.at("target-cash-left").as<double>();
    }

    auto offerResult = cmd.options.count("estimated-value")
        ? MaximumOfferCalculator::maxOffer(
              cmd.options.at("estimated-value").as<double>(), deal, targetCashLeft)
        : MaximumOfferCalculator::maxOfferFromArv(deal, targetCashLeft);

    if (!offerResult) {
        return std::unexpected(offerResult.error());
    }

    if (isJsonOutput(cmd)) {
        std::cout << ResultSerializer::toJson(offerResult.value()).dump(2) << std::endl;
    } else {
        printOfferBreakdown(deal, offerResult.value());
    }

    return {};
}

void CommandExecutor::printOfferBreakdown(
    const Deal& deal,
    const OfferBreakdown& offer) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "MAXIMUM ALLOWABLE OFFER: " << deal.name() << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Estimated Value:      $" << offer.estimatedValue << std::endl;
    std::cout << "  LTV:                  " << offer.ltvPercent << "%" << std::endl;
    std::cout << "  Loan Amount:          $" << offer.loanAmount << std::endl;
    std::cout << "  - Renovation:         $" << offer.renovationCosts << std::endl;
    std::cout << "  - Closing Costs:      $" << offer.closingCosts << std::endl;
    std::cout << "  - Holding Costs:      $" << offer.totalHoldingCost
              << " ($" << offer.monthlyHoldingCost << " x "
              << offer.holdingMonths << " months)" << std::endl;
    if (offer.carryLoan) {
        std::cout << "    (includes interest on " << toString(*offer.carryLoan)
                  << " loan)" << std::endl;
    }
    std::cout << "  + Target Cash Left:   $" << offer.targetCashLeft << std::endl;
    std::cout << std::string(70, '-') << std::endl;
    std::cout << "  Maximum Offer:        $" << offer.maximumOffer << std::endl;

    if (offer.clamped) {
        std::cout << "⚠ Costs exceed the loan amount, offer clamped to zero" << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Amortize
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeAmortize(const ParsedCommand& cmd)
{
    auto principalResult = getRequiredOption<double>(cmd, "principal");
    if (!principalResult) {
        return std::unexpected(principalResult.error());
    }

    auto rateResult = getRequiredOption<double>(cmd, "rate");
    if (!rateResult) {
        return std::unexpected(rateResult.error());
    }

    int term = 360;
    if (cmd.options.count("term")) {
        term = cmd.options.at("term").as<int>();
    }

    bool interestOnly = false;
    if (cmd.options.count("interest-only")) {
        interestOnly = cmd.options.at("interest-only").as<bool>();
    }

    auto loanResult = LoanSpec::create("Loan", principalResult.value(), rateResult.value(),
                                       term, 0.0, 0.0, interestOnly);
    if (!loanResult) {
        return std::unexpected(loanResult.error());
    }

    auto scheduleResult = AmortizationScheduler::schedule(loanResult.value());
    if (!scheduleResult) {
        return std::unexpected(scheduleResult.error());
    }

    const auto& schedule = scheduleResult.value();

    std::vector<AmortizationRow> rows;
    if (cmd.options.count("months")) {
        int months = cmd.options.at("months").as<int>();
        if (months <= 0) {
            return std::unexpected("Option 'months' must be positive");
        }
        rows = schedule.take(static_cast<std::size_t>(months));
    } else {
        rows = schedule.toVector();
    }

    if (isJsonOutput(cmd)) {
        json output;
        output["loan_amount"] = ResultSerializer::number(schedule.principal());
        output["interest_rate"] = ResultSerializer::number(rateResult.value());
        output["term"] = term;
        output["interest_only"] = schedule.isInterestOnly();
        output["monthly_payment"] = ResultSerializer::number(schedule.payment());
        output["schedule"] = ResultSerializer::toJson(rows);
        std::cout << output.dump(2) << std::endl;
    } else {
        printSchedule(schedule, rows);
    }

    return {};
}

void CommandExecutor::printSchedule(
    const AmortizationSchedule& schedule,
    const std::vector<AmortizationRow>& rows) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "AMORTIZATION SCHEDULE" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Loan Amount:      $" << schedule.principal() << std::endl;
    std::cout << "Monthly Payment:  $" << schedule.payment()
              << (schedule.isInterestOnly() ? " (interest only)" : "") << std::endl;
    std::cout << "Term:             " << schedule.size() << " months" << std::endl;
    std::cout << std::endl;

    std::cout << std::right
              << std::setw(6) << "Month"
              << std::setw(13) << "Payment"
              << std::setw(13) << "Principal"
              << std::setw(13) << "Interest"
              << std::setw(15) << "Balance" << std::endl;
    std::cout << std::string(70, '-') << std::endl;

    for (const auto& row : rows) {
        std::cout << std::setw(6) << row.month
                  << std::setw(13) << row.payment
                  << std::setw(13) << row.principal
                  << std::setw(13) << row.interest
                  << std::setw(15) << row.balance << std::endl;
    }

    if (!rows.empty()) {
        std::cout << std::string(70, '-') << std::endl;
        std::cout << "Total Interest:   $" << rows.back().cumulativeInterest << std::endl;
        std::cout << "Total Principal:  $" << rows.back().cumulativePrincipal << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// KPI
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeKpi(const ParsedCommand& cmd)
{
    auto propertyResult = getRequiredOption<std::string>(cmd, "property");
    if (!propertyResult) {
        return std::unexpected(propertyResult.error());
    }

    auto catalogPath = getRequiredOption<std::string>(cmd, "properties");
    if (!catalogPath) {
        return std::unexpected(catalogPath.error());
    }

    auto asOfResult = getDateOption(cmd, "as-of");
    if (!asOfResult) {
        return std::unexpected(asOfResult.error());
    }
    Date asOf = asOfResult.value().value_or(today());

    auto catalogResult = PropertyCatalog::loadFromFile(catalogPath.value());
    if (!catalogResult) {
        return std::unexpected(catalogResult.error());
    }

    auto ledgerResult = openLedger(cmd);
    if (!ledgerResult) {
        return std::unexpected(ledgerResult.error());
    }

    const auto& propertyId = propertyResult.value();
    auto transactions = ledgerResult.value()->listTransactions(propertyId);
    if (!transactions) {
        return std::unexpected(transactions.error());
    }

    PropertyKPIService service(catalogResult->properties, catalogResult->rules);
    auto dashboard = service.kpiDashboard(propertyId, transactions.value(), asOf);

    if (isJsonOutput(cmd)) {
        std::cout << ResultSerializer::toJson(dashboard).dump(2) << std::endl;
        return {};
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "PROPERTY KPI: " << propertyId << " (as of " << formatDate(asOf) << ")"
              << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Transactions: " << transactions->size() << std::endl;
    std::cout << "Complete history: " << (dashboard.hasCompleteHistory ? "yes" : "no")
              << std::endl;

    printKpiResult("Year to Date", dashboard.yearToDate);
    printKpiResult("Since Acquisition", dashboard.sinceAcquisition);

    std::cout << std::string(70, '=') << std::endl << std::endl;

    return {};
}

void CommandExecutor::printKpiResult(std::string_view title, const KpiResult& result) const
{
    std::cout << "\n" << title << " (" << result.monthsObserved << " months, confidence "
              << toString(result.metadata.confidence) << "):" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Income:               $" << result.totalIncome.monthly
              << "/mo  $" << result.totalIncome.annual << "/yr" << std::endl;
    std::cout << "  Operating Expenses:   $" << result.totalExpenses.monthly
              << "/mo  $" << result.totalExpenses.annual << "/yr" << std::endl;
    std::cout << "  NOI:                  $" << result.netOperatingIncome.monthly
              << "/mo  $" << result.netOperatingIncome.annual << "/yr" << std::endl;
    std::cout << "  Debt Service:         $" << result.monthlyDebtService << "/mo" << std::endl;
    std::cout << "  Cash Flow:            $" << result.monthlyCashFlow << "/mo" << std::endl;
    std::cout << "  Cash Invested:        $" << result.cashInvested << std::endl;
    std::cout << "  Cap Rate:             " << formatPercent(result.capRate) << std::endl;
    std::cout << "  Cash-on-Cash Return:  " << formatPercent(result.cashOnCashReturn) << std::endl;
    std::cout << "  DSCR:                 " << formatRatio(result.debtServiceCoverageRatio) << std::endl;

    const auto& refinance = result.metadata.refinance;
    if (refinance.hasRefinanced) {
        std::cout << "  Refinanced:           $" << refinance.originalDebtService
                  << " -> $" << refinance.currentDebtService << "/mo" << std::endl;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Deal records
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeDeal(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'realestate deal --help' for usage information" << std::endl;
        return {};
    }

    if (cmd.subcommand == "save") {
        return executeDealSave(cmd);
    } else if (cmd.subcommand == "show") {
        return executeDealShow(cmd);
    } else if (cmd.subcommand == "list") {
        return executeDealList(cmd);
    } else if (cmd.subcommand == "delete") {
        return executeDealDelete(cmd);
    } else {
        return std::unexpected("Unknown deal subcommand: " + cmd.subcommand);
    }
}

std::expected<void, std::string> CommandExecutor::executeDealSave(const ParsedCommand& cmd)
{
    auto dealResult = loadDealOption(cmd);
    if (!dealResult) {
        return std::unexpected(dealResult.error());
    }

    Deal deal = dealResult.value();

    // --id заменяет идентификатор из файла
    if (cmd.options.count("id")) {
        DealCore core = deal.core();
        core.id = cmd.options.at("id").as<std::string>();
        auto renamed = Deal::create(std::move(core), deal.terms());
        if (!renamed) {
            return std::unexpected(renamed.error());
        }
        deal = renamed.value();
    }

    auto repository = openDealRepository(cmd);
    auto saved = repository->saveDeal(deal);
    if (!saved) {
        return std::unexpected(saved.error());
    }

    return {};
}

std::expected<void, std::string> CommandExecutor::executeDealShow(const ParsedCommand& cmd)
{
    auto idResult = getRequiredOption<std::string>(cmd, "id");
    if (!idResult) {
        return std::unexpected(idResult.error());
    }

    auto repository = openDealRepository(cmd);
    auto dealResult = repository->getDeal(idResult.value());
    if (!dealResult) {
        return std::unexpected(dealResult.error());
    }

    if (isJsonOutput(cmd)) {
        std::cout << DealCodec::toJson(dealResult.value()).dump(2) << std::endl;
    } else {
        printDealSummary(dealResult.value());
    }

    return {};
}

void CommandExecutor::printDealSummary(const Deal& deal) const
{
    const auto& core = deal.core();

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "DEAL: " << core.id << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Name:            " << core.name << std::endl;
    std::cout << "Strategy:        " << toString(deal.strategy()) << std::endl;
    std::cout << "Address:         " << core.property.address << std::endl;
    if (!core.userId.empty()) {
        std::cout << "User:            " << core.userId << std::endl;
    }
    std::cout << "Purchase Price:  $" << std::fixed << std::setprecision(2)
              << core.purchasePrice << std::endl;
    if (core.monthlyRent) {
        std::cout << "Monthly Rent:    $" << *core.monthlyRent << std::endl;
    }
    std::cout << "Created:         " << core.createdAt << std::endl;
    std::cout << "Modified:        " << core.updatedAt << std::endl;

    std::cout << "\nLoans:" << std::endl;
    bool anyLoan = false;
    for (auto slot : kAllLoanSlots) {
        const auto& loan = core.loans.at(slot);
        if (!loan) {
            continue;
        }
        anyLoan = true;
        std::cout << "  " << std::left << std::setw(18) << toString(slot)
                  << "$" << loan->principal() << " @ " << loan->annualRate() << "% / "
                  << loan->termMonths() << " months"
                  << (loan->isInterestOnly() ? " (interest only)" : "") << std::endl;
    }
    if (!anyLoan) {
        std::cout << "  (none)" << std::endl;
    }

    if (!core.notes.empty()) {
        std::cout << "\nNotes:\n  " << core.notes << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl << std::endl;
}

std::expected<void, std::string> CommandExecutor::executeDealList(const ParsedCommand& cmd)
{
    std::string user;
    if (cmd.options.count("user")) {
        user = cmd.options.at("user").as<std::string>();
    }

    auto repository = openDealRepository(cmd);
    auto result = repository->listDeals(user);
    if (!result) {
        return std::unexpected(result.error());
    }

    const auto& deals = result.value();
    if (deals.empty()) {
        std::cout << "No deals found" << std::endl;
    } else {
        std::cout << "\nSaved deals:" << std::endl;
        for (const auto& id : deals) {
            std::cout << "  - " << id << std::endl;
        }
        std::cout << std::endl;
    }

    return {};
}

std::expected<void, std::string> CommandExecutor::executeDealDelete(const ParsedCommand& cmd)
{
    auto idResult = getRequiredOption<std::string>(cmd, "id");
    if (!idResult) {
        return std::unexpected(idResult.error());
    }

    auto repository = openDealRepository(cmd);
    return repository->deleteDeal(idResult.value());
}

// ═════════════════════════════════════════════════════════════════════════════
// Ledger
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeLedger(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'realestate ledger --help' for usage information" << std::endl;
        return {};
    }

    if (cmd.subcommand == "import") {
        return executeLedgerImport(cmd);
    } else if (cmd.subcommand == "list") {
        return executeLedgerList(cmd);
    } else if (cmd.subcommand == "clear") {
        return executeLedgerClear(cmd);
    } else {
        return std::unexpected("Unknown ledger subcommand: " + cmd.subcommand);
    }
}

std::expected<void, std::string> CommandExecutor::executeLedgerImport(const ParsedCommand& cmd)
{
    auto csvResult = getRequiredOption<std::string>(cmd, "csv");
    if (!csvResult) {
        return std::unexpected(csvResult.error());
    }

    std::string propertyId;
    if (cmd.options.count("property")) {
        propertyId = cmd.options.at("property").as<std::string>();
    }

    char delimiter = ',';
    if (cmd.options.count("delimiter")) {
        delimiter = cmd.options.at("delimiter").as<char>();
    }

    bool replace = false;
    if (cmd.options.count("replace")) {
        replace = cmd.options.at("replace").as<bool>();
    }

    if (replace && propertyId.empty()) {
        return std::unexpected("Option 'replace' requires --property");
    }

    CsvTransactionImporter importer(nullptr, delimiter);
    auto report = importer.importFile(csvResult.value(), propertyId);
    if (!report) {
        return std::unexpected(report.error());
    }

    for (const auto& skipped : report->skipped) {
        std::cout << "⚠ Line " << skipped.lineNumber << " skipped: "
                  << skipped.reason << std::endl;
    }

    auto ledgerResult = openLedger(cmd);
    if (!ledgerResult) {
        return std::unexpected(ledgerResult.error());
    }
    auto& ledger = ledgerResult.value();

    if (replace) {
        auto cleared = ledger->deleteTransactions(propertyId);
        if (!cleared) {
            return cleared;
        }
    }

    auto saved = ledger->saveTransactions(report->records);
    if (!saved) {
        return saved;
    }

    std::cout << "✓ Imported " << report->records.size() << " transactions";
    if (!report->skipped.empty()) {
        std::cout << " (" << report->skipped.size() << " lines skipped)";
    }
    std::cout << std::endl;

    return {};
}

std::expected<void, std::string> CommandExecutor::executeLedgerList(const ParsedCommand& cmd)
{
    auto ledgerResult = openLedger(cmd);
    if (!ledgerResult) {
        return std::unexpected(ledgerResult.error());
    }
    auto& ledger = ledgerResult.value();

    // Без --property выводим список объектов
    if (!cmd.options.count("property")) {
        auto properties = ledger->listProperties();
        if (!properties) {
            return std::unexpected(properties.error());
        }

        if (properties->empty()) {
            std::cout << "No transactions found" << std::endl;
        } else {
            std::cout << "\nProperties in ledger:" << std::endl;
            for (const auto& id : properties.value()) {
                std::cout << "  - " << id << std::endl;
            }
            std::cout << std::endl;
        }
        return {};
    }

    auto propertyId = cmd.options.at("property").as<std::string>();

    auto from = getDateOption(cmd, "from");
    if (!from) {
        return std::unexpected(from.error());
    }
    auto to = getDateOption(cmd, "to");
    if (!to) {
        return std::unexpected(to.error());
    }

    auto transactions = ledger->listTransactions(propertyId, from.value(), to.value());
    if (!transactions) {
        return std::unexpected(transactions.error());
    }

    if (transactions->empty()) {
        std::cout << "No transactions found for property " << propertyId << std::endl;
        return {};
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TRANSACTIONS: " << propertyId << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    double income = 0.0;
    double expenses = 0.0;

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& record : transactions.value()) {
        std::cout << formatDate(record.date) << "  "
                  << std::left << std::setw(8) << toString(record.type)
                  << std::setw(20) << record.category
                  << std::right << std::setw(12) << record.amount;
        if (!record.description.empty()) {
            std::cout << "  " << record.description;
        }
        std::cout << std::endl;

        if (record.type == TransactionType::Income) {
            income += record.amount;
        } else {
            expenses += record.amount;
        }
    }

    std::cout << std::string(70, '-') << std::endl;
    std::cout << "Total income:    $" << income << std::endl;
    std::cout << "Total expenses:  $" << expenses << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    return {};
}

std::expected<void, std::string> CommandExecutor::executeLedgerClear(const ParsedCommand& cmd)
{
    auto propertyResult = getRequiredOption<std::string>(cmd, "property");
    if (!propertyResult) {
        return std::unexpected(propertyResult.error());
    }

    auto ledgerResult = openLedger(cmd);
    if (!ledgerResult) {
        return std::unexpected(ledgerResult.error());
    }

    auto result = ledgerResult.value()->deleteTransactions(propertyResult.value());
    if (!result) {
        return result;
    }

    std::cout << "✓ Transactions of property '" << propertyResult.value()
              << "' removed" << std::endl;
    return {};
}

}  // namespace realestate
