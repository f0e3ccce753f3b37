#include <gtest/gtest.h>
#include "CsvTransactionImporter.hpp"
#include <filesystem>
#include <fstream>

using namespace realestate;

// Mock для тестирования
class MockFileReader : public IFileReader {
public:
    std::vector<std::string> mockLines;
    bool shouldFail = false;

    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override {
        if (shouldFail) {
            return std::unexpected(std::string("Failed to open file: ") + std::string(filePath));
        }
        return mockLines;
    }
};

class CsvTransactionImporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReader = std::make_shared<MockFileReader>();
    }

    std::shared_ptr<MockFileReader> mockReader;
};

// ============================================================================
// ТЕСТЫ: Корректный импорт
// ============================================================================

TEST_F(CsvTransactionImporterTest, ImportsAndSortsByDate) {
    mockReader->mockLines = {
        "property_id,date,type,category,amount,description",
        "elm,2024-02-05,income,Rent,2000,February rent",
        "elm,2024-01-05,Income,Rent,\"$2,000.00\",January rent",
        "elm,2024-01-10,expense,Repairs,-450.50,\"Sink, kitchen\""
    };

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("ledger.csv");
    ASSERT_TRUE(report.has_value()) << report.error();

    ASSERT_EQ(report->records.size(), 3u);
    EXPECT_TRUE(report->skipped.empty());

    const auto& first = report->records[0];
    EXPECT_EQ(formatDate(first.date), "2024-01-05");
    EXPECT_DOUBLE_EQ(first.amount, 2000.0);
    EXPECT_EQ(first.description, "January rent");

    const auto& repair = report->records[1];
    EXPECT_EQ(repair.type, TransactionType::Expense);
    EXPECT_DOUBLE_EQ(repair.amount, 450.5);
    EXPECT_EQ(repair.description, "Sink, kitchen");
}

TEST_F(CsvTransactionImporterTest, HeaderIsCaseInsensitive) {
    mockReader->mockLines = {
        " Date , TYPE , Category , Amount ",
        "2024-01-05,income,Rent,1500"
    };

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("ledger.csv", "oak");
    ASSERT_TRUE(report.has_value()) << report.error();
    EXPECT_EQ(report->records.at(0).propertyId, "oak");
}

TEST_F(CsvTransactionImporterTest, DefaultPropertyFillsEmptyCells) {
    mockReader->mockLines = {
        "property_id,date,type,category,amount",
        ",2024-01-05,income,Rent,1500",
        "elm,2024-01-06,income,Rent,1600"
    };

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("ledger.csv", "oak");
    ASSERT_TRUE(report.has_value()) << report.error();
    EXPECT_EQ(report->records[0].propertyId, "oak");
    EXPECT_EQ(report->records[1].propertyId, "elm");
}

TEST_F(CsvTransactionImporterTest, CustomDelimiter) {
    std::vector<std::string> lines = {
        "date;type;category;amount",
        "2024-01-05;expense;Insurance;\"1,200.50\""
    };

    CsvTransactionImporter importer(mockReader, ';');
    auto report = importer.importLines(lines, "elm");
    ASSERT_TRUE(report.has_value()) << report.error();
    EXPECT_DOUBLE_EQ(report->records[0].amount, 1200.5);
}

// ============================================================================
// ТЕСТЫ: Пропуск строк
// ============================================================================

TEST_F(CsvTransactionImporterTest, BadLinesSkippedWithLineNumbers) {
    mockReader->mockLines = {
        "property_id,date,type,category,amount",
        "elm,2024-01-05,income,Rent,2000",
        "",
        "elm,not-a-date,income,Rent,2000",
        "elm,2024-01-07,transfer,Rent,2000",
        "elm,2024-01-08,expense,,100",
        "elm,2024-01-09,expense,Repairs,abc",
        ",2024-01-10,expense,Repairs,100"
    };

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("ledger.csv");
    ASSERT_TRUE(report.has_value()) << report.error();

    EXPECT_EQ(report->records.size(), 1u);
    ASSERT_EQ(report->skipped.size(), 5u);

    EXPECT_EQ(report->skipped[0].lineNumber, 4u);
    EXPECT_NE(report->skipped[0].reason.find("Failed to parse date"), std::string::npos);
    EXPECT_EQ(report->skipped[1].lineNumber, 5u);
    EXPECT_EQ(report->skipped[2].reason, "category is empty");
    EXPECT_EQ(report->skipped[3].reason, "Invalid amount: abc");
    EXPECT_EQ(report->skipped[4].reason, "property_id is empty");
}

// ============================================================================
// ТЕСТЫ: Ошибки
// ============================================================================

TEST_F(CsvTransactionImporterTest, MissingRequiredColumn) {
    mockReader->mockLines = {"property_id,date,type,amount", "elm,2024-01-05,income,100"};

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("ledger.csv");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error(), "CSV header is missing column 'category'");
}

TEST_F(CsvTransactionImporterTest, NoPropertyColumnWithoutDefault) {
    mockReader->mockLines = {"date,type,category,amount", "2024-01-05,income,Rent,100"};

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("ledger.csv");
    ASSERT_FALSE(report.has_value());
    EXPECT_NE(report.error().find("no default property"), std::string::npos);
}

TEST_F(CsvTransactionImporterTest, NoValidRows) {
    mockReader->mockLines = {
        "property_id,date,type,category,amount",
        "elm,2024-01-05,income,Rent,lots"
    };

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("ledger.csv");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error(), "No valid transactions found (line 2: Invalid amount: lots)");
}

TEST_F(CsvTransactionImporterTest, EmptyInput) {
    CsvTransactionImporter importer(mockReader);

    auto report = importer.importLines({});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error(), "CSV has no header line");
}

TEST_F(CsvTransactionImporterTest, ReaderFailurePropagates) {
    mockReader->shouldFail = true;

    CsvTransactionImporter importer(mockReader);
    auto report = importer.importFile("missing.csv");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error(), "Failed to open file: missing.csv");
}

// ============================================================================
// ТЕСТЫ: FileReader
// ============================================================================

TEST(FileReaderTest, ReadsRealFile) {
    auto path = std::filesystem::temp_directory_path() / "realestate_test_ledger.csv";
    {
        std::ofstream out(path);
        out << "date,type,category,amount\n2024-01-05,income,Rent,100\n";
    }

    FileReader reader;
    auto lines = reader.readLines(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(lines.has_value()) << lines.error();
    EXPECT_EQ(lines->size(), 2u);

    EXPECT_FALSE(reader.readLines(path.string()).has_value());
}
