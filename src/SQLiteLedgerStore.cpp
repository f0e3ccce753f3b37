#include "SQLiteLedgerStore.hpp"
#include <iostream>
#include <stdexcept>

namespace realestate {

// ═════════════════════════════════════════════════════════════════════════════
// Конструктор и деструктор
// ═════════════════════════════════════════════════════════════════════════════

SQLiteLedgerStore::SQLiteLedgerStore(std::string_view dbPath)
    : dbPath_(dbPath)
{
    auto result = initialize();
    if (!result) {
        throw std::runtime_error("Failed to initialize ledger: " + result.error());
    }
}

SQLiteLedgerStore::~SQLiteLedgerStore()
{
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteLedgerStore::initialize()
{
    if (dbPath_.empty()) {
        return std::unexpected("Ledger database path is empty");
    }

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: ";
        if (db_) {
            error += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            error += "Out of memory";
        }
        return std::unexpected(error);
    }

    auto createResult = createTables();
    if (!createResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return createResult;
    }

    return {};
}

Result SQLiteLedgerStore::createTables()
{
    const char* sql = R"(
        -- Операции по объектам
        CREATE TABLE IF NOT EXISTS transactions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            property_id TEXT NOT NULL,
            date TEXT NOT NULL,
            type TEXT NOT NULL CHECK (type IN ('income', 'expense')),
            category TEXT NOT NULL,
            amount REAL NOT NULL,
            description TEXT NOT NULL DEFAULT ''
        );

        CREATE INDEX IF NOT EXISTS idx_transactions_property ON transactions(property_id);
        CREATE INDEX IF NOT EXISTS idx_transactions_date ON transactions(date);
    )";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected("Failed to create tables: " + error);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Запись
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteLedgerStore::saveTransactions(const std::vector<TransactionRecord>& records)
{
    if (!db_) {
        return std::unexpected("Ledger not initialized");
    }

    if (records.empty()) {
        return {};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, "BEGIN TRANSACTION", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected("Failed to begin transaction: " + error);
    }

    const char* sql = R"(
        INSERT INTO transactions
        (property_id, date, type, category, amount, description)
        VALUES (?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return std::unexpected("Failed to prepare statement: " + error);
    }

    for (const auto& record : records) {
        if (record.propertyId.empty()) {
            sqlite3_finalize(stmt);
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            return std::unexpected("Transaction property_id cannot be empty");
        }

        std::string dateStr = formatDate(record.date);
        std::string typeStr(toString(record.type));

        sqlite3_bind_text(stmt, 1, record.propertyId.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, dateStr.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, typeStr.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, record.category.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 5, record.amount);
        sqlite3_bind_text(stmt, 6, record.description.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            return std::unexpected("Failed to insert transaction: " + error);
        }

        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    sqlite3_finalize(stmt);

    // Коммитим транзакцию
    rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        return std::unexpected("Failed to commit transaction: " + error);
    }

    return {};
}

Result SQLiteLedgerStore::deleteTransactions(std::string_view propertyId)
{
    if (!db_) {
        return std::unexpected("Ledger not initialized");
    }

    const char* sql = "DELETE FROM transactions WHERE property_id = ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, propertyId.data(), static_cast<int>(propertyId.size()),
                      SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to delete transactions: " + std::string(sqlite3_errmsg(db_)));
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Чтение
// ═════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<TransactionRecord>, std::string>
SQLiteLedgerStore::listTransactions(
    std::string_view propertyId,
    std::optional<Date> from,
    std::optional<Date> to)
{
    if (!db_) {
        return std::unexpected("Ledger not initialized");
    }

    // Даты в формате YYYY-MM-DD сравниваются как строки
    std::string sql =
        "SELECT property_id, date, type, category, amount, description "
        "FROM transactions WHERE property_id = ?";
    if (from) {
        sql += " AND date >= ?";
    }
    if (to) {
        sql += " AND date <= ?";
    }
    sql += " ORDER BY date, id";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    sqlite3_bind_text(stmt, index++, propertyId.data(), static_cast<int>(propertyId.size()),
                      SQLITE_TRANSIENT);

    std::string fromStr = from ? formatDate(*from) : "";
    std::string toStr = to ? formatDate(*to) : "";
    if (from) {
        sqlite3_bind_text(stmt, index++, fromStr.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (to) {
        sqlite3_bind_text(stmt, index++, toStr.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<TransactionRecord> records;

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto text = [stmt](int column) {
            const unsigned char* value = sqlite3_column_text(stmt, column);
            return value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
        };

        auto date = parseDate(text(1));
        if (!date) {
            sqlite3_finalize(stmt);
            return std::unexpected("Corrupted transaction date: " + date.error());
        }

        auto type = parseTransactionType(text(2));
        if (!type) {
            sqlite3_finalize(stmt);
            return std::unexpected("Corrupted transaction type: " + type.error());
        }

        TransactionRecord record;
        record.propertyId = text(0);
        record.date = *date;
        record.type = *type;
        record.category = text(3);
        record.amount = sqlite3_column_double(stmt, 4);
        record.description = text(5);

        records.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to read transactions: " + std::string(sqlite3_errmsg(db_)));
    }

    return records;
}

std::expected<std::vector<std::string>, std::string> SQLiteLedgerStore::listProperties()
{
    if (!db_) {
        return std::unexpected("Ledger not initialized");
    }

    const char* sql = "SELECT DISTINCT property_id FROM transactions ORDER BY property_id";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    std::vector<std::string> properties;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* value = sqlite3_column_text(stmt, 0);
        if (value) {
            properties.emplace_back(reinterpret_cast<const char*>(value));
        }
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to list properties: " + std::string(sqlite3_errmsg(db_)));
    }

    return properties;
}

} // namespace realestate
