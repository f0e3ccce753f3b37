#include "MaximumOfferCalculator.hpp"
#include <cmath>

namespace realestate {

double MaximumOfferCalculator::loanToValuePercent(const Deal& deal) noexcept
{
    if (const auto* brrrr = deal.termsAs<BrrrrTerms>()) {
        if (brrrr->refinanceLtvPercent) {
            return *brrrr->refinanceLtvPercent;
        }
    }

    const auto& balloon = deal.core().balloon;
    if (balloon.hasBalloonPayment && balloon.refinanceLtvPercent) {
        return *balloon.refinanceLtvPercent;
    }

    return kDefaultLtvPercent;
}

std::optional<LoanSlot> MaximumOfferCalculator::carryLoanSlot(const Deal& deal) noexcept
{
    LoanSlot slot = deal.strategy() == StrategyType::Brrrr
        ? LoanSlot::Initial
        : LoanSlot::Loan1;

    if (!deal.core().loans.at(slot)) {
        return std::nullopt;
    }
    return slot;
}

double MaximumOfferCalculator::monthlyHoldingCost(const Deal& deal) noexcept
{
    const auto& e = deal.core().expenses;

    double cost = e.propertyTaxesAnnual / 12.0
                + e.insuranceAnnual / 12.0
                + e.utilities
                + e.hoaMonthly;

    if (auto slot = carryLoanSlot(deal)) {
        cost += LoanModel::monthlyInterestCarry(*deal.core().loans.at(*slot));
    }

    return cost;
}

std::expected<OfferBreakdown, std::string> MaximumOfferCalculator::maxOffer(
    double estimatedValue,
    const Deal& deal,
    double targetCashLeft)
{
    if (!std::isfinite(estimatedValue) || estimatedValue < 0.0) {
        return std::unexpected("estimated_value must be a non-negative number");
    }

    if (!std::isfinite(targetCashLeft)) {
        return std::unexpected("target_cash_left must be a finite number");
    }

    OfferBreakdown result;
    result.estimatedValue = estimatedValue;
    result.targetCashLeft = targetCashLeft;
    result.ltvPercent = loanToValuePercent(deal);
    result.loanAmount = estimatedValue * result.ltvPercent / 100.0;

    result.renovationCosts = deal.renovationCosts();
    result.closingCosts = deal.core().acquisition.closingCosts;

    result.carryLoan = carryLoanSlot(deal);
    result.monthlyHoldingCost = monthlyHoldingCost(deal);
    result.holdingMonths = deal.renovationDurationMonths();
    result.totalHoldingCost = result.monthlyHoldingCost * result.holdingMonths;

    double offer = result.loanAmount
                 - result.renovationCosts
                 - result.closingCosts
                 - result.totalHoldingCost
                 + result.targetCashLeft;

    result.clamped = offer < 0.0;
    result.maximumOffer = result.clamped ? 0.0 : offer;

    return result;
}

std::expected<OfferBreakdown, std::string> MaximumOfferCalculator::maxOfferFromArv(
    const Deal& deal,
    double targetCashLeft)
{
    const auto& arv = deal.core().rehab.afterRepairValue;
    if (!arv) {
        return std::unexpected(
            "after_repair_value is required when no estimated_value is supplied");
    }
    return maxOffer(*arv, deal, targetCashLeft);
}

} // namespace realestate
