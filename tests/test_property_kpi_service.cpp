#include <gtest/gtest.h>
#include "PropertyKPIService.hpp"

using namespace realestate;

namespace {

Date makeDate(int y, unsigned m, unsigned d) {
    return Date{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

TransactionRecord makeRecord(std::string propertyId,
                             Date date,
                             TransactionType type,
                             std::string category,
                             double amount) {
    TransactionRecord record;
    record.propertyId = std::move(propertyId);
    record.date = date;
    record.type = type;
    record.category = std::move(category);
    record.amount = amount;
    return record;
}

} // namespace

class PropertyKPIServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        PropertyFacts elm;
        elm.propertyId = "elm";
        elm.purchaseDate = makeDate(2024, 1, 1);
        elm.purchasePrice = 200000.0;
        elm.downPayment = 40000.0;
        elm.closingCosts = 5000.0;

        PropertyFacts oak;
        oak.propertyId = "oak";
        oak.purchasePrice = 150000.0;

        properties = {elm, oak};

        // Три месяца: аренда 2000, ремонт 500, ипотека 1000
        for (unsigned month = 1; month <= 3; ++month) {
            ledger.push_back(makeRecord("elm", makeDate(2024, month, 5),
                                        TransactionType::Income, "Rent", 2000.0));
            ledger.push_back(makeRecord("elm", makeDate(2024, month, 10),
                                        TransactionType::Expense, "Repairs", 500.0));
            ledger.push_back(makeRecord("elm", makeDate(2024, month, 1),
                                        TransactionType::Expense, "Mortgage", 1000.0));
        }
    }

    std::vector<PropertyFacts> properties;
    std::vector<TransactionRecord> ledger;
};

// ============================================================================
// ТЕСТЫ: Основные показатели
// ============================================================================

TEST_F(PropertyKPIServiceTest, ThreeMonthsOfOperations) {
    PropertyKPIService service(properties);

    auto result = service.calculateKpis("elm", ledger,
                                        makeDate(2024, 1, 1), makeDate(2024, 3, 31),
                                        makeDate(2024, 3, 31));

    EXPECT_EQ(result.monthsObserved, 3);
    EXPECT_DOUBLE_EQ(result.totalIncome.monthly, 2000.0);
    EXPECT_DOUBLE_EQ(result.totalExpenses.monthly, 500.0);
    EXPECT_DOUBLE_EQ(result.netOperatingIncome.monthly, 1500.0);
    EXPECT_DOUBLE_EQ(result.netOperatingIncome.annual, 18000.0);

    ASSERT_TRUE(result.capRate.has_value());
    EXPECT_NEAR(*result.capRate, 9.0, 1e-9);

    EXPECT_DOUBLE_EQ(result.monthlyDebtService, 1000.0);
    EXPECT_DOUBLE_EQ(result.monthlyCashFlow, 500.0);
    EXPECT_DOUBLE_EQ(result.cashInvested, 45000.0);

    ASSERT_TRUE(result.cashOnCashReturn.has_value());
    EXPECT_NEAR(*result.cashOnCashReturn, 500.0 * 12.0 / 45000.0 * 100.0, 1e-9);
    ASSERT_TRUE(result.debtServiceCoverageRatio.has_value());
    EXPECT_DOUBLE_EQ(*result.debtServiceCoverageRatio, 1.5);

    EXPECT_TRUE(result.metadata.hasCompleteHistory);
    EXPECT_EQ(result.metadata.confidence, ConfidenceLevel::High);
    EXPECT_FALSE(result.metadata.refinance.hasRefinanced);
}

TEST_F(PropertyKPIServiceTest, MonthsWithoutActivityAreNotAveraged) {
    std::vector<TransactionRecord> records = {
        makeRecord("elm", makeDate(2024, 1, 5), TransactionType::Income, "Rent", 2000.0),
        makeRecord("elm", makeDate(2024, 3, 5), TransactionType::Income, "Rent", 2000.0)
    };

    PropertyKPIService service(properties);
    auto result = service.calculateKpis("elm", records,
                                        makeDate(2024, 1, 1), makeDate(2024, 3, 31),
                                        makeDate(2024, 3, 31));

    EXPECT_EQ(result.monthsObserved, 2);
    EXPECT_DOUBLE_EQ(result.totalIncome.monthly, 2000.0);
    EXPECT_DOUBLE_EQ(result.totalIncome.annual, 24000.0);
}

TEST_F(PropertyKPIServiceTest, NonOperatingCategoriesExcluded) {
    ledger.push_back(makeRecord("elm", makeDate(2024, 2, 15),
                                TransactionType::Income, "Security Deposit", 2000.0));
    ledger.push_back(makeRecord("elm", makeDate(2024, 2, 20),
                                TransactionType::Expense, "Capital Expenditures", 8000.0));

    PropertyKPIService service(properties);
    auto result = service.calculateKpis("elm", ledger,
                                        makeDate(2024, 1, 1), makeDate(2024, 3, 31),
                                        makeDate(2024, 3, 31));

    EXPECT_DOUBLE_EQ(result.totalIncome.monthly, 2000.0);
    EXPECT_DOUBLE_EQ(result.totalExpenses.monthly, 500.0);
}

TEST_F(PropertyKPIServiceTest, WindowBoundsAreInclusive) {
    PropertyKPIService service(properties);

    auto result = service.calculateKpis("elm", ledger,
                                        makeDate(2024, 2, 1), makeDate(2024, 2, 5),
                                        makeDate(2024, 2, 5));

    EXPECT_EQ(result.monthsObserved, 1);
    EXPECT_DOUBLE_EQ(result.totalIncome.monthly, 2000.0);
    EXPECT_DOUBLE_EQ(result.totalExpenses.monthly, 0.0);
    EXPECT_DOUBLE_EQ(result.monthlyDebtService, 1000.0);
}

TEST_F(PropertyKPIServiceTest, OtherPropertiesIgnored) {
    ledger.push_back(makeRecord("oak", makeDate(2024, 1, 5),
                                TransactionType::Income, "Rent", 99999.0));

    PropertyKPIService service(properties);
    auto result = service.calculateKpis("elm", ledger,
                                        makeDate(2024, 1, 1), makeDate(2024, 3, 31),
                                        makeDate(2024, 3, 31));

    EXPECT_DOUBLE_EQ(result.totalIncome.monthly, 2000.0);
}

// ============================================================================
// ТЕСТЫ: Полнота истории и уверенность
// ============================================================================

TEST_F(PropertyKPIServiceTest, StaleLedgerIsLowConfidence) {
    PropertyKPIService service(properties);

    auto result = service.calculateKpis("elm", ledger,
                                        makeDate(2024, 1, 1), makeDate(2024, 6, 30),
                                        makeDate(2024, 6, 30));

    EXPECT_FALSE(result.metadata.hasCompleteHistory);
    EXPECT_EQ(result.metadata.confidence, ConfidenceLevel::Low);
    EXPECT_EQ(toString(result.metadata.confidence), "low");
}

TEST_F(PropertyKPIServiceTest, LateFirstRecordIsIncomplete) {
    PropertyKPIService service(properties);

    std::vector<TransactionRecord> records = {
        makeRecord("elm", makeDate(2024, 2, 15), TransactionType::Income, "Rent", 2000.0)
    };

    EXPECT_FALSE(service.hasCompleteHistory(records, makeDate(2024, 1, 1), makeDate(2024, 2, 20)));
    EXPECT_TRUE(service.hasCompleteHistory(records, makeDate(2024, 1, 20), makeDate(2024, 2, 20)));
    EXPECT_FALSE(service.hasCompleteHistory({}, makeDate(2024, 1, 1), makeDate(2024, 2, 20)));
}

// ============================================================================
// ТЕСТЫ: Рефинансирование
// ============================================================================

TEST_F(PropertyKPIServiceTest, MortgageChangeDetectedAsRefinance) {
    ledger.push_back(makeRecord("elm", makeDate(2024, 4, 1),
                                TransactionType::Expense, "Mortgage", 900.0));

    PropertyKPIService service(properties);
    auto info = service.detectRefinance(ledger);

    EXPECT_TRUE(info.hasRefinanced);
    EXPECT_DOUBLE_EQ(info.originalDebtService, 1000.0);
    EXPECT_DOUBLE_EQ(info.currentDebtService, 900.0);
}

TEST_F(PropertyKPIServiceTest, SubCentDifferencesAreNotRefinance) {
    std::vector<TransactionRecord> records = {
        makeRecord("elm", makeDate(2024, 1, 1), TransactionType::Expense, "Mortgage", 1013.37),
        makeRecord("elm", makeDate(2024, 2, 1), TransactionType::Expense, "Mortgage", 1013.371)
    };

    PropertyKPIService service(properties);
    EXPECT_FALSE(service.detectRefinance(records).hasRefinanced);
}

TEST_F(PropertyKPIServiceTest, PaymentsAfterReportDateIgnoredForRefinance) {
    ledger.push_back(makeRecord("elm", makeDate(2025, 6, 1),
                                TransactionType::Expense, "Mortgage", 800.0));

    PropertyKPIService service(properties);
    auto dashboard = service.kpiDashboard("elm", ledger, makeDate(2024, 3, 31));

    const auto& refinance = dashboard.sinceAcquisition.metadata.refinance;
    EXPECT_FALSE(refinance.hasRefinanced);
    EXPECT_DOUBLE_EQ(refinance.currentDebtService, 1000.0);
    EXPECT_FALSE(dashboard.yearToDate.metadata.refinance.hasRefinanced);
}

// ============================================================================
// ТЕСТЫ: Дашборд
// ============================================================================

TEST_F(PropertyKPIServiceTest, DashboardWindows) {
    PropertyKPIService service(properties);

    auto dashboard = service.kpiDashboard("elm", ledger, makeDate(2024, 3, 31));

    EXPECT_EQ(dashboard.yearToDate.monthsObserved, 3);
    EXPECT_EQ(dashboard.sinceAcquisition.monthsObserved, 3);
    EXPECT_TRUE(dashboard.hasCompleteHistory);
    EXPECT_NEAR(*dashboard.sinceAcquisition.capRate, 9.0, 1e-9);
}

TEST_F(PropertyKPIServiceTest, YearToDateStartsInJanuary) {
    ledger.push_back(makeRecord("elm", makeDate(2023, 12, 5),
                                TransactionType::Income, "Rent", 2000.0));

    PropertyKPIService service(properties);
    auto dashboard = service.kpiDashboard("elm", ledger, makeDate(2024, 3, 31));

    EXPECT_EQ(dashboard.yearToDate.monthsObserved, 3);
}

TEST_F(PropertyKPIServiceTest, UnknownPropertyGivesEmptyResults) {
    PropertyKPIService service(properties);

    auto dashboard = service.kpiDashboard("nowhere", ledger, makeDate(2024, 3, 31));

    EXPECT_FALSE(dashboard.hasCompleteHistory);
    EXPECT_EQ(dashboard.yearToDate.monthsObserved, 0);
    ASSERT_TRUE(dashboard.yearToDate.capRate.has_value());
    EXPECT_DOUBLE_EQ(*dashboard.yearToDate.capRate, 0.0);
    EXPECT_EQ(dashboard.sinceAcquisition.metadata.confidence, ConfidenceLevel::Low);
}

TEST_F(PropertyKPIServiceTest, MissingPurchaseDateLeavesSinceAcquisitionEmpty) {
    ledger.push_back(makeRecord("oak", makeDate(2024, 3, 1),
                                TransactionType::Income, "Rent", 1500.0));

    PropertyKPIService service(properties);
    auto dashboard = service.kpiDashboard("oak", ledger, makeDate(2024, 3, 31));

    EXPECT_EQ(dashboard.yearToDate.monthsObserved, 1);
    EXPECT_EQ(dashboard.sinceAcquisition.monthsObserved, 0);
    EXPECT_FALSE(dashboard.hasCompleteHistory);

    // Без вложений доходность на вложенный капитал не определена
    EXPECT_FALSE(dashboard.yearToDate.cashOnCashReturn.has_value());
}

TEST_F(PropertyKPIServiceTest, CustomMortgageCategory) {
    KpiCategoryRules rules = KpiCategoryRules::defaults();
    rules.mortgageCategory = "Loan Payment";

    ledger.push_back(makeRecord("elm", makeDate(2024, 3, 20),
                                TransactionType::Expense, "Loan Payment", 300.0));

    PropertyKPIService service(properties, rules);
    auto result = service.calculateKpis("elm", ledger,
                                        makeDate(2024, 3, 1), makeDate(2024, 3, 31),
                                        makeDate(2024, 3, 31));

    // "Mortgage" теперь обычный операционный расход
    EXPECT_DOUBLE_EQ(result.monthlyDebtService, 300.0);
    EXPECT_DOUBLE_EQ(result.totalExpenses.monthly, 1500.0);
}
