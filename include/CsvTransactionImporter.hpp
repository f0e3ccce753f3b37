#pragma once

#include "Ledger.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// Чтение файлов
// ═══════════════════════════════════════════════════════════════════════════════

// Абстрактный интерфейс для чтения файлов
class IFileReader {
public:
    virtual ~IFileReader() = default;
    virtual std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) = 0;
};

// Реальная реализация для чтения файлов
class FileReader : public IFileReader {
public:
    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override;
};

// ═══════════════════════════════════════════════════════════════════════════════
// CsvTransactionImporter - импорт журнала операций из CSV
//
// Первая строка - заголовок. Обязательные колонки: date, type, category, amount.
// Необязательные: property_id, description.
// ═══════════════════════════════════════════════════════════════════════════════

struct SkippedLine {
    std::size_t lineNumber = 0;  // с единицы, считая заголовок
    std::string reason;
};

struct ImportReport {
    std::vector<TransactionRecord> records;
    std::vector<SkippedLine> skipped;
};

class CsvTransactionImporter {
public:
    explicit CsvTransactionImporter(
        std::shared_ptr<IFileReader> reader = nullptr,
        char delimiter = ',');

    // defaultPropertyId подставляется, если колонки property_id нет или она пуста
    std::expected<ImportReport, std::string> importFile(
        std::string_view filePath,
        std::string_view defaultPropertyId = "") const;

    std::expected<ImportReport, std::string> importLines(
        const std::vector<std::string>& lines,
        std::string_view defaultPropertyId = "") const;

private:
    std::shared_ptr<IFileReader> reader_;
    char delimiter_;

    std::vector<std::string> parseCSVLine(std::string_view line) const;

    std::expected<TransactionRecord, std::string> parseRecord(
        const std::vector<std::string>& fields,
        const std::map<std::string, std::size_t>& columns,
        std::string_view defaultPropertyId) const;
};

} // namespace realestate
