#include "CsvTransactionImporter.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// FileReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<std::string>, std::string> FileReader::readLines(
    std::string_view filePath)
{
    std::vector<std::string> lines;
    std::ifstream file{std::string(filePath)};

    if (!file.is_open()) {
        return std::unexpected(std::string("Failed to open file: ") + std::string(filePath));
    }

    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    if (lines.empty()) {
        return std::unexpected(std::string("File is empty: ") + std::string(filePath));
    }

    return lines;
}

// ═══════════════════════════════════════════════════════════════════════════════
// CsvTransactionImporter Implementation
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool isBlank(std::string_view line)
{
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

} // namespace

CsvTransactionImporter::CsvTransactionImporter(
    std::shared_ptr<IFileReader> reader,
    char delimiter)
    : reader_(reader ? reader : std::make_shared<FileReader>())
    , delimiter_(delimiter)
{
}

std::expected<ImportReport, std::string> CsvTransactionImporter::importFile(
    std::string_view filePath,
    std::string_view defaultPropertyId) const
{
    auto linesResult = reader_->readLines(filePath);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    return importLines(*linesResult, defaultPropertyId);
}

std::expected<ImportReport, std::string> CsvTransactionImporter::importLines(
    const std::vector<std::string>& lines,
    std::string_view defaultPropertyId) const
{
    if (lines.empty() || isBlank(lines.front())) {
        return std::unexpected("CSV has no header line");
    }

    // Колонки по имени из заголовка
    std::map<std::string, std::size_t> columns;
    auto header = parseCSVLine(lines.front());
    for (std::size_t i = 0; i < header.size(); ++i) {
        columns[toLower(header[i])] = i;
    }

    for (const char* required : {"date", "type", "category", "amount"}) {
        if (!columns.contains(required)) {
            return std::unexpected(std::string("CSV header is missing column '") +
                                   required + "'");
        }
    }

    if (!columns.contains("property_id") && defaultPropertyId.empty()) {
        return std::unexpected(
            "CSV has no 'property_id' column and no default property was given");
    }

    ImportReport report;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        if (isBlank(lines[i])) {
            continue;
        }

        auto record = parseRecord(parseCSVLine(lines[i]), columns, defaultPropertyId);
        if (!record) {
            report.skipped.push_back({i + 1, record.error()});
            continue;
        }

        report.records.push_back(std::move(*record));
    }

    if (report.records.empty()) {
        std::ostringstream oss;
        oss << "No valid transactions found";
        if (!report.skipped.empty()) {
            oss << " (line " << report.skipped.front().lineNumber
                << ": " << report.skipped.front().reason << ")";
        }
        return std::unexpected(oss.str());
    }

    std::stable_sort(report.records.begin(), report.records.end(),
        [](const auto& a, const auto& b) { return a.date < b.date; });

    return report;
}

std::expected<TransactionRecord, std::string> CsvTransactionImporter::parseRecord(
    const std::vector<std::string>& fields,
    const std::map<std::string, std::size_t>& columns,
    std::string_view defaultPropertyId) const
{
    auto field = [&](const std::string& name) -> std::string {
        auto it = columns.find(name);
        if (it == columns.end() || it->second >= fields.size()) {
            return "";
        }
        return fields[it->second];
    };

    TransactionRecord record;

    record.propertyId = field("property_id");
    if (record.propertyId.empty()) {
        record.propertyId = std::string(defaultPropertyId);
    }
    if (record.propertyId.empty()) {
        return std::unexpected("property_id is empty");
    }

    auto date = parseDate(field("date"));
    if (!date) {
        return std::unexpected(date.error());
    }
    record.date = *date;

    auto type = parseTransactionType(field("type"));
    if (!type) {
        return std::unexpected(type.error());
    }
    record.type = *type;

    record.category = field("category");
    if (record.category.empty()) {
        return std::unexpected("category is empty");
    }

    std::string amountStr = field("amount");
    // Разделители тысяч и знак валюты
    amountStr.erase(std::remove_if(amountStr.begin(), amountStr.end(),
                                   [](char c) { return c == '$' || c == ','; }),
                    amountStr.end());
    try {
        std::size_t idx = 0;
        record.amount = std::stod(amountStr, &idx);
        if (idx != amountStr.size() || !std::isfinite(record.amount)) {
            return std::unexpected("Invalid amount: " + field("amount"));
        }
    } catch (const std::exception&) {
        return std::unexpected("Invalid amount: " + field("amount"));
    }

    // Сумма хранится положительной, знак задаёт тип
    record.amount = std::abs(record.amount);
    record.description = field("description");

    return record;
}

std::vector<std::string> CsvTransactionImporter::parseCSVLine(std::string_view line) const
{
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else {
                inQuotes = !inQuotes;
            }
        } else if (c == delimiter_ && !inQuotes) {
            fields.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(field);

    // Убираем пробелы с концов
    for (auto& f : fields) {
        auto start = f.find_first_not_of(" \t\r\n");
        auto end = f.find_last_not_of(" \t\r\n");
        f = (start == std::string::npos) ? "" : f.substr(start, end - start + 1);
    }

    return fields;
}

} // namespace realestate
