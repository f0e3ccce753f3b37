#pragma once

#include "Ledger.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// SQLiteLedgerStore - журнал операций в SQLite
// ═══════════════════════════════════════════════════════════════════════════════

class SQLiteLedgerStore : public ILedgerStore {
public:
    // ":memory:" - база в памяти. При ошибке открытия бросает std::runtime_error
    explicit SQLiteLedgerStore(std::string_view dbPath);
    ~SQLiteLedgerStore() override;

    Result saveTransactions(const std::vector<TransactionRecord>& records) override;

    std::expected<std::vector<TransactionRecord>, std::string> listTransactions(
        std::string_view propertyId,
        std::optional<Date> from = std::nullopt,
        std::optional<Date> to = std::nullopt) override;

    std::expected<std::vector<std::string>, std::string> listProperties() override;

    Result deleteTransactions(std::string_view propertyId) override;

    // Disable copy
    SQLiteLedgerStore(const SQLiteLedgerStore&) = delete;
    SQLiteLedgerStore& operator=(const SQLiteLedgerStore&) = delete;

private:
    Result initialize();
    Result createTables();

    std::string dbPath_;
    sqlite3* db_ = nullptr;
};

} // namespace realestate
