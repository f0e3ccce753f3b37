#include <gtest/gtest.h>
#include "DealCodec.hpp"
#include <filesystem>
#include <fstream>

using namespace realestate;

namespace {

json makeLtrRecord() {
    return json{
        {"id", "elm-1"},
        {"user_id", "u-42"},
        {"analysis_type", "LTR"},
        {"analysis_name", "Elm Street"},
        {"address", "12 Elm St"},
        {"purchase_price", 200000},
        {"monthly_rent", "1500"},
        {"property_taxes", 2400},
        {"insurance", 1200},
        {"management_fee_percentage", 8},
        {"initial_loan_amount", 160000},
        {"initial_loan_interest_rate", "4.5"},
        {"initial_loan_down_payment", 40000},
        {"initial_loan_closing_costs", ""},
        {"notes", "corner lot"}
    };
}

} // namespace

// ============================================================================
// ТЕСТЫ: fromJson
// ============================================================================

TEST(DealCodecTest, ParsesNumbersAndNumericStrings) {
    auto deal = DealCodec::fromJson(makeLtrRecord());
    ASSERT_TRUE(deal.has_value()) << deal.error();

    EXPECT_EQ(deal->strategy(), StrategyType::LongTermRental);
    EXPECT_EQ(deal->core().userId, "u-42");
    EXPECT_DOUBLE_EQ(deal->purchasePrice(), 200000.0);
    EXPECT_DOUBLE_EQ(deal->monthlyRent(), 1500.0);
    EXPECT_DOUBLE_EQ(deal->core().expenses.managementPercent, 8.0);
}

TEST(DealCodecTest, ReadsLoanSlot) {
    auto deal = DealCodec::fromJson(makeLtrRecord());
    ASSERT_TRUE(deal.has_value()) << deal.error();

    const auto& initial = deal->core().loans.initial;
    ASSERT_TRUE(initial.has_value());
    EXPECT_DOUBLE_EQ(initial->principal(), 160000.0);
    EXPECT_DOUBLE_EQ(initial->annualRate(), 4.5);
    EXPECT_EQ(initial->termMonths(), 360);  // по умолчанию
    EXPECT_DOUBLE_EQ(initial->downPayment(), 40000.0);
    EXPECT_DOUBLE_EQ(initial->closingCosts(), 0.0);

    EXPECT_FALSE(deal->core().loans.loan1.has_value());
    EXPECT_FALSE(deal->core().loans.refinance.has_value());
}

TEST(DealCodecTest, ZeroLoanAmountLeavesSlotEmpty) {
    json record = makeLtrRecord();
    record["loan1_loan_amount"] = 0;

    auto deal = DealCodec::fromJson(record);
    ASSERT_TRUE(deal.has_value()) << deal.error();
    EXPECT_FALSE(deal->core().loans.loan1.has_value());
}

TEST(DealCodecTest, LoanWithoutRateFails) {
    json record = makeLtrRecord();
    record["loan1_loan_amount"] = 20000;

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("loan1_loan_interest_rate"), std::string::npos);
}

TEST(DealCodecTest, InvalidLoanRateNamesSlot) {
    json record = makeLtrRecord();
    record["initial_loan_interest_rate"] = 150;

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("initial_loan_interest_rate"), std::string::npos);
}

TEST(DealCodecTest, MissingAnalysisTypeFails) {
    json record = makeLtrRecord();
    record.erase("analysis_type");

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_EQ(deal.error(), "analysis_type is required");
}

TEST(DealCodecTest, MissingPurchasePriceFails) {
    json record = makeLtrRecord();
    record["purchase_price"] = nullptr;

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_EQ(deal.error(), "purchase_price is required");
}

TEST(DealCodecTest, NonNumericFieldFails) {
    json record = makeLtrRecord();
    record["insurance"] = "a lot";

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("insurance must be numeric"), std::string::npos);
}

TEST(DealCodecTest, IntegerOutOfRangeFails) {
    json record = makeLtrRecord();
    record["initial_loan_term"] = 1e12;

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("initial_loan_term is out of range"), std::string::npos);

    record = makeLtrRecord();
    record["analysis_type"] = "MultiFamily";
    record["total_units"] = 3e9;
    record["occupied_units"] = 4;
    record["unit_types"] = json::array({json{{"type", "1BR"}, {"count", 4}, {"rent", 900}}});

    deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("total_units is out of range"), std::string::npos);
}

TEST(DealCodecTest, NonObjectRecordFails) {
    auto deal = DealCodec::fromJson(json::array());
    ASSERT_FALSE(deal.has_value());
}

TEST(DealCodecTest, BrrrrMissingArvFromRecord) {
    json record = makeLtrRecord();
    record["analysis_type"] = "BRRRR";
    record["renovation_costs"] = 30000;
    record["renovation_duration"] = 4;

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("after_repair_value"), std::string::npos);
}

TEST(DealCodecTest, UnitTypesAsEncodedString) {
    json record = makeLtrRecord();
    record["analysis_type"] = "MultiFamily";
    record["total_units"] = "4";
    record["occupied_units"] = 4;
    record["unit_types"] = R"([{"type":"1BR","count":2,"rent":900},{"name":"2BR","count":"2","rent":"1200"}])";

    auto deal = DealCodec::fromJson(record);
    ASSERT_TRUE(deal.has_value()) << deal.error();

    const auto* terms = deal->termsAs<MultiFamilyTerms>();
    ASSERT_NE(terms, nullptr);
    ASSERT_EQ(terms->unitTypes.size(), 2u);
    EXPECT_EQ(terms->unitTypes[0].name, "1BR");
    EXPECT_EQ(terms->unitTypes[1].name, "2BR");
    EXPECT_EQ(terms->unitTypes[1].count, 2);
    EXPECT_DOUBLE_EQ(terms->unitTypes[1].rent, 1200.0);
}

TEST(DealCodecTest, BadUnitTypeEntryFails) {
    json record = makeLtrRecord();
    record["analysis_type"] = "MultiFamily";
    record["total_units"] = 4;
    record["occupied_units"] = 4;
    record["unit_types"] = json::array({json{{"type", "1BR"}, {"count", "two"}}});

    auto deal = DealCodec::fromJson(record);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("unit_types[0].count"), std::string::npos);
}

TEST(DealCodecTest, BalloonFields) {
    json record = makeLtrRecord();
    record["has_balloon_payment"] = "yes";
    record["balloon_due_date"] = "2029-06-01";
    record["balloon_refinance_ltv_percentage"] = 80;

    auto deal = DealCodec::fromJson(record);
    ASSERT_TRUE(deal.has_value()) << deal.error();

    const auto& balloon = deal->core().balloon;
    EXPECT_TRUE(balloon.hasBalloonPayment);
    ASSERT_TRUE(balloon.dueDate.has_value());
    EXPECT_EQ(formatDate(*balloon.dueDate), "2029-06-01");

    record["balloon_due_date"] = "2029-13-01";
    EXPECT_FALSE(DealCodec::fromJson(record).has_value());

    // Хвост после даты не допускается
    record["balloon_due_date"] = "2029-06-01junk";
    auto trailing = DealCodec::fromJson(record);
    ASSERT_FALSE(trailing.has_value());
    EXPECT_NE(trailing.error().find("balloon_due_date"), std::string::npos);
}

// ============================================================================
// ТЕСТЫ: toJson / loadFromFile
// ============================================================================

TEST(DealCodecTest, ToJsonWritesFlatRecord) {
    auto deal = DealCodec::fromJson(makeLtrRecord());
    ASSERT_TRUE(deal.has_value()) << deal.error();

    json j = DealCodec::toJson(*deal);
    EXPECT_EQ(j["analysis_type"], "LTR");
    EXPECT_EQ(j["initial_loan_amount"], 160000.0);
    EXPECT_EQ(j["initial_loan_term"], 360);
    EXPECT_FALSE(j.contains("loan1_loan_amount"));

    auto reloaded = DealCodec::fromJson(j);
    ASSERT_TRUE(reloaded.has_value()) << reloaded.error();
    EXPECT_EQ(reloaded->core().notes, "corner lot");
}

class DealCodecFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        testFile = std::filesystem::temp_directory_path() / "realestate_test_deal.json";
    }

    void TearDown() override {
        if (std::filesystem::exists(testFile)) {
            std::filesystem::remove(testFile);
        }
    }

    std::filesystem::path testFile;
};

TEST_F(DealCodecFileTest, LoadFromFile) {
    {
        std::ofstream out(testFile);
        out << makeLtrRecord().dump(2);
    }

    auto deal = DealCodec::loadFromFile(testFile);
    ASSERT_TRUE(deal.has_value()) << deal.error();
    EXPECT_EQ(deal->id(), "elm-1");
}

TEST_F(DealCodecFileTest, LoadMalformedFile) {
    {
        std::ofstream out(testFile);
        out << "{ not json";
    }

    auto deal = DealCodec::loadFromFile(testFile);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("Failed to parse"), std::string::npos);
}

TEST_F(DealCodecFileTest, LoadMissingFile) {
    auto deal = DealCodec::loadFromFile(testFile);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("Failed to open"), std::string::npos);
}
