#include "PropertyKPIService.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// KpiCategoryRules
// ═══════════════════════════════════════════════════════════════════════════════

KpiCategoryRules KpiCategoryRules::defaults()
{
    KpiCategoryRules rules;

    rules.nonOperatingExpenseCategories = {
        "Asset Acquisition",
        "Capital Expenditures",
        "Bank/Financial Fees",
        "Legal/Professional Fees",
        "Marketing/Advertising",
        "Mortgage"
    };

    rules.nonOperatingIncomeCategories = {
        "Security Deposit",
        "Loan Repayment",
        "Insurance Refund",
        "Escrow Refund"
    };

    rules.mortgageCategory = "Mortgage";
    return rules;
}

bool KpiCategoryRules::isOperatingExpense(std::string_view category) const
{
    return !isMortgage(category) &&
           !nonOperatingExpenseCategories.contains(category);
}

bool KpiCategoryRules::isOperatingIncome(std::string_view category) const
{
    return !nonOperatingIncomeCategories.contains(category);
}

std::string_view toString(ConfidenceLevel level) noexcept
{
    return level == ConfidenceLevel::High ? "high" : "low";
}

KpiResult KpiResult::empty()
{
    KpiResult result;
    result.capRate = 0.0;
    result.cashOnCashReturn = 0.0;
    result.debtServiceCoverageRatio = 0.0;
    result.metadata.hasCompleteHistory = false;
    result.metadata.confidence = ConfidenceLevel::Low;
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// PropertyKPIService
// ═══════════════════════════════════════════════════════════════════════════════

PropertyKPIService::PropertyKPIService(
    const std::vector<PropertyFacts>& properties,
    KpiCategoryRules rules)
    : rules_(std::move(rules))
{
    for (const auto& property : properties) {
        properties_[property.propertyId] = property;
    }
}

const PropertyFacts* PropertyKPIService::findProperty(std::string_view propertyId) const
{
    auto it = properties_.find(propertyId);
    return it != properties_.end() ? &it->second : nullptr;
}

std::vector<TransactionRecord> PropertyKPIService::filterWindow(
    std::string_view propertyId,
    const std::vector<TransactionRecord>& ledger,
    Date start,
    Date end) const
{
    std::vector<TransactionRecord> records;
    for (const auto& record : ledger) {
        if (record.propertyId == propertyId &&
            record.date >= start && record.date <= end) {
            records.push_back(record);
        }
    }

    std::sort(records.begin(), records.end(),
        [](const auto& a, const auto& b) { return a.date < b.date; });

    return records;
}

PropertyKPIService::MonthlyAverages PropertyKPIService::averageMonthly(
    const std::vector<TransactionRecord>& records) const
{
    struct MonthTotals {
        double income = 0.0;
        double operatingExpenses = 0.0;
        double mortgage = 0.0;
    };

    // Месяцы без учитываемых операций не входят в знаменатель
    std::map<std::string, MonthTotals> months;

    for (const auto& record : records) {
        if (record.type == TransactionType::Income) {
            if (rules_.isOperatingIncome(record.category)) {
                months[monthKey(record.date)].income += record.amount;
            }
        } else if (rules_.isMortgage(record.category)) {
            months[monthKey(record.date)].mortgage += record.amount;
        } else if (rules_.isOperatingExpense(record.category)) {
            months[monthKey(record.date)].operatingExpenses += record.amount;
        }
    }

    MonthlyAverages averages;
    averages.months = static_cast<int>(months.size());
    if (averages.months == 0) {
        return averages;
    }

    for (const auto& [key, totals] : months) {
        averages.income += totals.income;
        averages.operatingExpenses += totals.operatingExpenses;
        averages.mortgage += totals.mortgage;
    }

    averages.income /= averages.months;
    averages.operatingExpenses /= averages.months;
    averages.mortgage /= averages.months;

    return averages;
}

bool PropertyKPIService::hasCompleteHistory(
    const std::vector<TransactionRecord>& records,
    Date windowStart,
    Date today) const
{
    if (records.empty()) {
        return false;
    }

    auto [first, last] = std::minmax_element(records.begin(), records.end(),
        [](const auto& a, const auto& b) { return a.date < b.date; });

    auto startGap = (first->date - windowStart).count();
    auto endGap = (today - last->date).count();

    return startGap <= kMaxStartGapDays && endGap <= kMaxEndGapDays;
}

RefinanceInfo PropertyKPIService::detectRefinance(
    const std::vector<TransactionRecord>& records) const
{
    std::vector<const TransactionRecord*> payments;
    for (const auto& record : records) {
        if (record.type == TransactionType::Expense && rules_.isMortgage(record.category)) {
            payments.push_back(&record);
        }
    }

    RefinanceInfo info;
    if (payments.empty()) {
        return info;
    }

    std::stable_sort(payments.begin(), payments.end(),
        [](const auto* a, const auto* b) { return a->date < b->date; });

    // Суммы сравниваются с точностью до цента
    std::set<long long> distinctAmounts;
    for (const auto* payment : payments) {
        distinctAmounts.insert(std::llround(payment->amount * 100.0));
    }

    info.hasRefinanced = distinctAmounts.size() > 1;
    info.originalDebtService = payments.front()->amount;
    info.currentDebtService = payments.back()->amount;

    return info;
}

KpiResult PropertyKPIService::calculateKpis(
    std::string_view propertyId,
    const std::vector<TransactionRecord>& ledger,
    Date start,
    Date end,
    Date today) const
{
    const auto* property = findProperty(propertyId);
    if (!property) {
        std::cout << "⚠ Property not found: " << propertyId << std::endl;
        return KpiResult::empty();
    }

    auto records = filterWindow(propertyId, ledger, start, end);
    if (records.empty()) {
        return KpiResult::empty();
    }

    auto averages = averageMonthly(records);
    if (averages.months == 0) {
        return KpiResult::empty();
    }

    double noi = averages.income - averages.operatingExpenses;
    double cashFlow = noi - averages.mortgage;

    KpiResult result;
    result.netOperatingIncome = {noi, noi * 12.0};
    result.totalIncome = {averages.income, averages.income * 12.0};
    result.totalExpenses = {averages.operatingExpenses, averages.operatingExpenses * 12.0};
    result.monthlyDebtService = averages.mortgage;
    result.monthlyCashFlow = cashFlow;
    result.monthsObserved = averages.months;

    if (property->purchasePrice > 0.0) {
        result.capRate = noi * 12.0 / property->purchasePrice * 100.0;
    }

    result.cashInvested = property->totalInvestment();
    if (result.cashInvested > 0.0) {
        result.cashOnCashReturn = cashFlow * 12.0 / result.cashInvested * 100.0;
    }

    if (averages.mortgage > 0.0) {
        result.debtServiceCoverageRatio = noi / averages.mortgage;
    }

    result.metadata.hasCompleteHistory = hasCompleteHistory(records, start, today);
    result.metadata.confidence = result.metadata.hasCompleteHistory
        ? ConfidenceLevel::High
        : ConfidenceLevel::Low;

    // Платежи после отчётной даты не учитываются
    auto propertyRecords = filterWindow(propertyId, ledger, Date::min(), today);
    result.metadata.refinance = detectRefinance(propertyRecords);

    return result;
}

KpiDashboard PropertyKPIService::kpiDashboard(
    std::string_view propertyId,
    const std::vector<TransactionRecord>& ledger) const
{
    return kpiDashboard(propertyId, ledger, realestate::today());
}

KpiDashboard PropertyKPIService::kpiDashboard(
    std::string_view propertyId,
    const std::vector<TransactionRecord>& ledger,
    Date today) const
{
    KpiDashboard dashboard{KpiResult::empty(), KpiResult::empty(), false};

    const auto* property = findProperty(propertyId);
    if (!property) {
        std::cout << "⚠ Property not found: " << propertyId << std::endl;
        return dashboard;
    }

    std::chrono::year_month_day ymd{today};
    Date yearStart{ymd.year() / std::chrono::January / 1};
    dashboard.yearToDate = calculateKpis(propertyId, ledger, yearStart, today, today);

    if (!property->purchaseDate) {
        std::cout << "⚠ Property " << propertyId
                  << " has no purchase date, since-acquisition KPIs are empty" << std::endl;
        return dashboard;
    }

    dashboard.sinceAcquisition =
        calculateKpis(propertyId, ledger, *property->purchaseDate, today, today);
    dashboard.hasCompleteHistory = dashboard.sinceAcquisition.metadata.hasCompleteHistory;

    return dashboard;
}

} // namespace realestate
