#pragma once

#include "CommandLineParser.hpp"
#include "AnalysisEngine.hpp"
#include "AmortizationScheduler.hpp"
#include "Deal.hpp"
#include "IDealRepository.hpp"
#include "Ledger.hpp"
#include "MaximumOfferCalculator.hpp"
#include "PropertyKPIService.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace realestate {

class CommandExecutor {
public:
    // Пустой путь: $REALESTATE_DATA_DIR или ~/.realestate
    explicit CommandExecutor(std::filesystem::path dataDir = {});

    std::expected<void, std::string> execute(const ParsedCommand& cmd);

    const std::filesystem::path& dataDirectory() const noexcept { return dataDir_; }

private:
    std::filesystem::path dataDir_;

    // Help & Version
    std::expected<void, std::string> executeHelp(const ParsedCommand& cmd);
    std::expected<void, std::string> executeVersion(const ParsedCommand& cmd);
    void printHelp(std::string_view topic = "") const;
    void printVersion() const;

    // Analysis
    std::expected<void, std::string> executeAnalyze(const ParsedCommand& cmd);
    std::expected<void, std::string> executeOffer(const ParsedCommand& cmd);
    std::expected<void, std::string> executeAmortize(const ParsedCommand& cmd);
    std::expected<void, std::string> executeKpi(const ParsedCommand& cmd);

    // Deal records
    std::expected<void, std::string> executeDeal(const ParsedCommand& cmd);
    std::expected<void, std::string> executeDealSave(const ParsedCommand& cmd);
    std::expected<void, std::string> executeDealShow(const ParsedCommand& cmd);
    std::expected<void, std::string> executeDealList(const ParsedCommand& cmd);
    std::expected<void, std::string> executeDealDelete(const ParsedCommand& cmd);

    // Ledger
    std::expected<void, std::string> executeLedger(const ParsedCommand& cmd);
    std::expected<void, std::string> executeLedgerImport(const ParsedCommand& cmd);
    std::expected<void, std::string> executeLedgerList(const ParsedCommand& cmd);
    std::expected<void, std::string> executeLedgerClear(const ParsedCommand& cmd);

    // Utility methods
    template<typename T>
    std::expected<T, std::string> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    bool isJsonOutput(const ParsedCommand& cmd) const;

    std::expected<Deal, std::string> loadDealOption(const ParsedCommand& cmd) const;

    std::unique_ptr<IDealRepository> openDealRepository(const ParsedCommand& cmd) const;

    std::expected<std::unique_ptr<ILedgerStore>, std::string> openLedger(
        const ParsedCommand& cmd) const;

    std::expected<std::optional<Date>, std::string> getDateOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    void printAnalysisResult(const Deal& deal, const AnalysisResult& result) const;
    void printOfferBreakdown(const Deal& deal, const OfferBreakdown& offer) const;
    void printSchedule(const AmortizationSchedule& schedule,
                       const std::vector<AmortizationRow>& rows) const;
    void printKpiResult(std::string_view title, const KpiResult& result) const;
    void printDealSummary(const Deal& deal) const;
};

// Template implementation
template<typename T>
std::expected<T, std::string> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const {

    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::unexpected(
            "Required option '" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const std::exception& e) {
        return std::unexpected(
            "Invalid value for option '" + optName + "': " + e.what());
    }
}

}  // namespace realestate
