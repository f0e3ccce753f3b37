#pragma once

#include "DateUtils.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace realestate {

using Result = std::expected<void, std::string>;

enum class TransactionType {
    Income,
    Expense
};

std::string_view toString(TransactionType type) noexcept;

// "income" / "expense" без учёта регистра
std::expected<TransactionType, std::string> parseTransactionType(std::string_view name);

// Операция по объекту: сумма всегда положительна, знак задаётся типом
struct TransactionRecord {
    std::string propertyId;
    Date date;
    TransactionType type = TransactionType::Expense;
    std::string category;
    double amount = 0.0;
    std::string description;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ILedgerStore - хранилище операций
// ═══════════════════════════════════════════════════════════════════════════════

class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual Result saveTransactions(const std::vector<TransactionRecord>& records) = 0;

    // Операции объекта в порядке дат, границы включительно
    virtual std::expected<std::vector<TransactionRecord>, std::string> listTransactions(
        std::string_view propertyId,
        std::optional<Date> from = std::nullopt,
        std::optional<Date> to = std::nullopt) = 0;

    virtual std::expected<std::vector<std::string>, std::string> listProperties() = 0;

    virtual Result deleteTransactions(std::string_view propertyId) = 0;

    // Disable copy
    ILedgerStore(const ILedgerStore&) = delete;
    ILedgerStore& operator=(const ILedgerStore&) = delete;

protected:
    ILedgerStore() = default;
};

} // namespace realestate
