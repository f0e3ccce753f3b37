#pragma once

#include "DateUtils.hpp"
#include "Ledger.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// Данные объекта, нужные для KPI
// ═══════════════════════════════════════════════════════════════════════════════

struct PropertyFacts {
    std::string propertyId;
    std::optional<Date> purchaseDate;
    double purchasePrice = 0.0;
    double downPayment = 0.0;
    double closingCosts = 0.0;
    double renovationCosts = 0.0;
    double marketingCosts = 0.0;
    double holdingCosts = 0.0;

    double totalInvestment() const noexcept
    {
        return downPayment + closingCosts + renovationCosts + marketingCosts + holdingCosts;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// KpiCategoryRules - категории, не относящиеся к операционной деятельности
// ═══════════════════════════════════════════════════════════════════════════════

struct KpiCategoryRules {
    std::set<std::string, std::less<>> nonOperatingExpenseCategories;
    std::set<std::string, std::less<>> nonOperatingIncomeCategories;
    std::string mortgageCategory = "Mortgage";

    // Стандартные наборы категорий
    static KpiCategoryRules defaults();

    bool isOperatingExpense(std::string_view category) const;
    bool isOperatingIncome(std::string_view category) const;
    bool isMortgage(std::string_view category) const noexcept { return category == mortgageCategory; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Результат KPI
// ═══════════════════════════════════════════════════════════════════════════════

struct PeriodAmount {
    double monthly = 0.0;
    double annual = 0.0;
};

enum class ConfidenceLevel {
    Low,
    High
};

std::string_view toString(ConfidenceLevel level) noexcept;

struct RefinanceInfo {
    bool hasRefinanced = false;
    double originalDebtService = 0.0;
    double currentDebtService = 0.0;
};

struct KpiMetadata {
    bool hasCompleteHistory = false;
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    RefinanceInfo refinance;
};

struct KpiResult {
    PeriodAmount netOperatingIncome;
    PeriodAmount totalIncome;
    PeriodAmount totalExpenses;

    std::optional<double> capRate;           // %
    std::optional<double> cashOnCashReturn;  // %
    std::optional<double> debtServiceCoverageRatio;

    double cashInvested = 0.0;
    double monthlyDebtService = 0.0;
    double monthlyCashFlow = 0.0;
    int monthsObserved = 0;

    KpiMetadata metadata;

    // Нулевой результат для пустого окна
    static KpiResult empty();
};

struct KpiDashboard {
    KpiResult yearToDate;
    KpiResult sinceAcquisition;
    bool hasCompleteHistory = false;
};

// ═══════════════════════════════════════════════════════════════════════════════
// PropertyKPIService - фактические показатели объекта по журналу операций
// ═══════════════════════════════════════════════════════════════════════════════

class PropertyKPIService {
public:
    static constexpr int kMaxStartGapDays = 30;
    static constexpr int kMaxEndGapDays = 45;

    explicit PropertyKPIService(
        const std::vector<PropertyFacts>& properties,
        KpiCategoryRules rules = KpiCategoryRules::defaults());

    // YTD и с момента покупки, "сегодня" - системная дата
    KpiDashboard kpiDashboard(
        std::string_view propertyId,
        const std::vector<TransactionRecord>& ledger) const;

    KpiDashboard kpiDashboard(
        std::string_view propertyId,
        const std::vector<TransactionRecord>& ledger,
        Date today) const;

    // KPI за окно [start, end] включительно
    KpiResult calculateKpis(
        std::string_view propertyId,
        const std::vector<TransactionRecord>& ledger,
        Date start,
        Date end,
        Date today) const;

    // Первая операция не позже 30 дней от начала окна,
    // последняя - не раньше 45 дней до today
    bool hasCompleteHistory(
        const std::vector<TransactionRecord>& records,
        Date windowStart,
        Date today) const;

    // Смена суммы ипотечного платежа означает рефинансирование
    RefinanceInfo detectRefinance(const std::vector<TransactionRecord>& records) const;

    const PropertyFacts* findProperty(std::string_view propertyId) const;

    const KpiCategoryRules& rules() const noexcept { return rules_; }

private:
    struct MonthlyAverages {
        double income = 0.0;
        double operatingExpenses = 0.0;
        double mortgage = 0.0;
        int months = 0;
    };

    MonthlyAverages averageMonthly(const std::vector<TransactionRecord>& records) const;

    std::vector<TransactionRecord> filterWindow(
        std::string_view propertyId,
        const std::vector<TransactionRecord>& ledger,
        Date start,
        Date end) const;

    std::map<std::string, PropertyFacts, std::less<>> properties_;
    KpiCategoryRules rules_;
};

} // namespace realestate
