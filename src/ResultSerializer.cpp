#include "ResultSerializer.hpp"
#include <cmath>

namespace realestate {

std::optional<double> ResultSerializer::sanitize(double value) noexcept
{
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> ResultSerializer::sanitize(const std::optional<double>& value) noexcept
{
    return value ? sanitize(*value) : std::nullopt;
}

json ResultSerializer::number(double value)
{
    auto clean = sanitize(value);
    return clean ? json(*clean) : json(nullptr);
}

json ResultSerializer::number(const std::optional<double>& value)
{
    auto clean = sanitize(value);
    return clean ? json(*clean) : json(nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════════
// KPI
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

json periodToJson(const PeriodAmount& amount)
{
    return {
        {"monthly", ResultSerializer::number(amount.monthly)},
        {"annual", ResultSerializer::number(amount.annual)}
    };
}

} // namespace

json ResultSerializer::toJson(const KpiResult& result)
{
    json j;
    j["net_operating_income"] = periodToJson(result.netOperatingIncome);
    j["total_income"] = periodToJson(result.totalIncome);
    j["total_expenses"] = periodToJson(result.totalExpenses);
    j["cap_rate"] = number(result.capRate);
    j["cash_on_cash_return"] = number(result.cashOnCashReturn);
    j["debt_service_coverage_ratio"] = number(result.debtServiceCoverageRatio);
    j["cash_invested"] = number(result.cashInvested);
    j["monthly_debt_service"] = number(result.monthlyDebtService);
    j["monthly_cash_flow"] = number(result.monthlyCashFlow);
    j["months_observed"] = result.monthsObserved;

    const auto& refinance = result.metadata.refinance;
    j["metadata"] = {
        {"has_complete_history", result.metadata.hasCompleteHistory},
        {"confidence_level", std::string(realestate::toString(result.metadata.confidence))},
        {"refinance_info", {
            {"has_refinanced", refinance.hasRefinanced},
            {"original_debt_service", number(refinance.originalDebtService)},
            {"current_debt_service", number(refinance.currentDebtService)}
        }}
    };

    return j;
}

json ResultSerializer::toJson(const KpiDashboard& dashboard)
{
    json j;
    j["year_to_date"] = toJson(dashboard.yearToDate);
    j["since_acquisition"] = toJson(dashboard.sinceAcquisition);
    j["metadata"] = {{"has_complete_history", dashboard.hasCompleteHistory}};
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Анализ сделки
// ═══════════════════════════════════════════════════════════════════════════════

json ResultSerializer::toJson(const AnalysisResult& result)
{
    json j;
    j["analysis_type"] = std::string(realestate::toString(result.strategy));
    j["monthly_income"] = number(result.monthlyIncome);
    j["monthly_operating_expenses"] = number(result.monthlyOperatingExpenses);
    j["monthly_debt_service"] = number(result.monthlyDebtService);
    j["monthly_noi"] = number(result.monthlyNoi);
    j["monthly_cash_flow"] = number(result.monthlyCashFlow);
    j["annual_cash_flow"] = number(result.annualCashFlow);
    j["total_cash_invested"] = number(result.totalCashInvested);
    j["cash_on_cash_return"] = number(result.cashOnCashReturn);
    j["cap_rate"] = number(result.capRate);
    j["expense_ratio"] = number(result.expenseRatio);
    j["breakeven_occupancy"] = number(result.breakevenOccupancy);
    j["debt_service_coverage_ratio"] = number(result.debtServiceCoverageRatio);
    j["gross_rent_multiplier"] = number(result.grossRentMultiplier);
    j["price_per_unit"] = number(result.pricePerUnit);
    j["occupancy_rate"] = number(result.occupancyRate);
    j["total_rent_credits"] = number(result.totalRentCredits);
    j["effective_purchase_price"] = number(result.effectivePurchasePrice);

    if (result.balloon) {
        j["balloon"] = {
            {"pre_balloon_payment", number(result.balloon->preBalloonPayment)},
            {"post_balloon_payment", number(result.balloon->postBalloonPayment)},
            {"payment_difference", number(result.balloon->paymentDifference)},
            {"refinance_costs", number(result.balloon->refinanceCosts)}
        };
    } else {
        j["balloon"] = nullptr;
    }

    return j;
}

json ResultSerializer::toJson(const OfferBreakdown& offer)
{
    json j;
    j["maximum_offer"] = number(offer.maximumOffer);
    j["estimated_value"] = number(offer.estimatedValue);
    j["ltv_percentage"] = number(offer.ltvPercent);
    j["loan_amount"] = number(offer.loanAmount);
    j["renovation_costs"] = number(offer.renovationCosts);
    j["closing_costs"] = number(offer.closingCosts);
    j["monthly_holding_cost"] = number(offer.monthlyHoldingCost);
    j["holding_months"] = offer.holdingMonths;
    j["total_holding_cost"] = number(offer.totalHoldingCost);
    j["target_cash_left"] = number(offer.targetCashLeft);
    j["carry_loan"] = offer.carryLoan
        ? json(std::string(realestate::toString(*offer.carryLoan)))
        : json(nullptr);
    j["clamped"] = offer.clamped;
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// График погашения
// ═══════════════════════════════════════════════════════════════════════════════

json ResultSerializer::toJson(const AmortizationRow& row)
{
    return {
        {"month", row.month},
        {"payment", number(row.payment)},
        {"principal", number(row.principal)},
        {"interest", number(row.interest)},
        {"balance", number(row.balance)},
        {"cumulative_interest", number(row.cumulativeInterest)},
        {"cumulative_principal", number(row.cumulativePrincipal)}
    };
}

json ResultSerializer::toJson(const std::vector<AmortizationRow>& rows)
{
    json j = json::array();
    for (const auto& row : rows) {
        j.push_back(toJson(row));
    }
    return j;
}

} // namespace realestate
