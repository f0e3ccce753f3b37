#include "AnalysisEngine.hpp"
#include <algorithm>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// Доходы и расходы
// ═══════════════════════════════════════════════════════════════════════════════

double AnalysisEngine::monthlyIncome(const Deal& deal) noexcept
{
    if (const auto* mf = deal.termsAs<MultiFamilyTerms>()) {
        double income = mf->otherIncome;
        for (const auto& unit : mf->unitTypes) {
            income += unit.rent * unit.count;
        }
        return income;
    }

    if (const auto* pad = deal.termsAs<PadSplitTerms>()) {
        return pad->roomCount.value_or(0) * pad->averageRoomRent.value_or(0.0);
    }

    return deal.monthlyRent();
}

double AnalysisEngine::monthlyOperatingExpenses(const Deal& deal) noexcept
{
    const auto& e = deal.core().expenses;
    double income = monthlyIncome(deal);

    double fixed = e.propertyTaxesAnnual / 12.0
                 + e.insuranceAnnual / 12.0
                 + e.hoaMonthly
                 + e.utilities
                 + e.internet
                 + e.cleaning
                 + e.pestControl
                 + e.landscaping;

    double percent = e.managementPercent
                   + e.capexPercent
                   + e.vacancyPercent
                   + e.repairsPercent;

    if (const auto* pad = deal.termsAs<PadSplitTerms>()) {
        percent += pad->platformPercent.value_or(0.0);
    }

    if (const auto* mf = deal.termsAs<MultiFamilyTerms>()) {
        fixed += mf->commonAreaMaintenance
               + mf->elevatorMaintenance
               + mf->staffPayroll
               + mf->trashRemoval
               + mf->commonUtilities;
    }

    return fixed + income * percent / 100.0;
}

std::vector<AnalysisEngine::ServicedLoan> AnalysisEngine::servicedLoans(const Deal& deal)
{
    const auto& core = deal.core();
    std::vector<ServicedLoan> loans;

    for (auto slot : kAllLoanSlots) {
        const auto& loan = core.loans.at(slot);
        if (!loan) {
            continue;
        }

        // Рефинансирование только у BRRRR, balloon - только при флаге
        if (slot == LoanSlot::Refinance && deal.strategy() != StrategyType::Brrrr) {
            continue;
        }
        if (slot == LoanSlot::BalloonRefinance && !core.balloon.hasBalloonPayment) {
            continue;
        }

        loans.emplace_back(slot, &*loan);
    }

    return loans;
}

double AnalysisEngine::monthlyDebtService(const Deal& deal)
{
    double total = 0.0;
    for (const auto& [slot, loan] : servicedLoans(deal)) {
        total += LoanModel::monthlyPayment(*loan);
    }
    return total;
}

double AnalysisEngine::monthlyNoi(const Deal& deal) noexcept
{
    return monthlyIncome(deal) - monthlyOperatingExpenses(deal);
}

double AnalysisEngine::monthlyCashFlow(const Deal& deal)
{
    return monthlyNoi(deal) - monthlyDebtService(deal);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Доходность
// ═══════════════════════════════════════════════════════════════════════════════

double AnalysisEngine::totalCashInvested(const Deal& deal)
{
    const auto& a = deal.core().acquisition;

    double total = a.closingCosts
                 + a.cashToSeller
                 + a.assignmentFee
                 + a.marketingCosts
                 + a.furnishingCosts
                 + deal.renovationCosts();

    for (const auto& [slot, loan] : servicedLoans(deal)) {
        total += loan->upfrontCash();
    }

    if (const auto* lease = deal.termsAs<LeaseOptionTerms>()) {
        total += lease->optionConsiderationFee.value_or(0.0);
    }

    return total;
}

double AnalysisEngine::cashOnCashReturn(const Deal& deal)
{
    double invested = totalCashInvested(deal);
    if (invested <= 0.0) {
        return 0.0;
    }
    return monthlyCashFlow(deal) * 12.0 / invested * 100.0;
}

double AnalysisEngine::capRate(const Deal& deal) noexcept
{
    if (deal.purchasePrice() <= 0.0) {
        return 0.0;
    }
    return monthlyNoi(deal) * 12.0 / deal.purchasePrice() * 100.0;
}

std::optional<double> AnalysisEngine::debtServiceCoverageRatio(const Deal& deal)
{
    double debt = monthlyDebtService(deal);
    if (debt <= 0.0) {
        return std::nullopt;
    }
    return monthlyNoi(deal) / debt;
}

double AnalysisEngine::expenseRatio(const Deal& deal) noexcept
{
    double income = monthlyIncome(deal);
    if (income <= 0.0) {
        return 0.0;
    }
    return monthlyOperatingExpenses(deal) / income * 100.0;
}

std::optional<double> AnalysisEngine::grossRentMultiplier(const Deal& deal) noexcept
{
    double annualIncome = monthlyIncome(deal) * 12.0;
    if (annualIncome <= 0.0) {
        return std::nullopt;
    }
    return deal.purchasePrice() / annualIncome;
}

double AnalysisEngine::breakevenOccupancy(const Deal& deal)
{
    double income = monthlyIncome(deal);
    if (income <= 0.0) {
        return 0.0;
    }
    return (monthlyOperatingExpenses(deal) + monthlyDebtService(deal)) / income * 100.0;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Показатели отдельных стратегий
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<double> AnalysisEngine::pricePerUnit(const Deal& deal) noexcept
{
    const auto* mf = deal.termsAs<MultiFamilyTerms>();
    if (!mf || mf->totalUnits.value_or(0) <= 0) {
        return std::nullopt;
    }
    return deal.purchasePrice() / *mf->totalUnits;
}

std::optional<double> AnalysisEngine::occupancyRate(const Deal& deal) noexcept
{
    const auto* mf = deal.termsAs<MultiFamilyTerms>();
    if (!mf || mf->totalUnits.value_or(0) <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(mf->occupiedUnits.value_or(0)) / *mf->totalUnits * 100.0;
}

std::optional<double> AnalysisEngine::totalRentCredits(const Deal& deal) noexcept
{
    const auto* lease = deal.termsAs<LeaseOptionTerms>();
    if (!lease) {
        return std::nullopt;
    }

    double credits = deal.monthlyRent()
                   * lease->monthlyRentCreditPercent.value_or(0.0) / 100.0
                   * lease->optionTermMonths.value_or(0);

    if (lease->rentCreditCap) {
        credits = std::min(credits, *lease->rentCreditCap);
    }
    return credits;
}

std::optional<double> AnalysisEngine::effectivePurchasePrice(const Deal& deal) noexcept
{
    const auto* lease = deal.termsAs<LeaseOptionTerms>();
    if (!lease) {
        return std::nullopt;
    }

    double price = lease->strikePrice.value_or(0.0)
                 - lease->optionConsiderationFee.value_or(0.0)
                 - totalRentCredits(deal).value_or(0.0);

    return std::max(0.0, price);
}

std::optional<BalloonComparison> AnalysisEngine::balloonComparison(const Deal& deal)
{
    const auto& core = deal.core();
    if (!core.balloon.hasBalloonPayment || !core.loans.balloonRefinance) {
        return std::nullopt;
    }

    BalloonComparison result;
    for (auto slot : {LoanSlot::Initial, LoanSlot::Loan1, LoanSlot::Loan2, LoanSlot::Loan3}) {
        if (const auto& loan = core.loans.at(slot)) {
            result.preBalloonPayment += LoanModel::monthlyPayment(*loan);
        }
    }

    const auto& refinance = *core.loans.balloonRefinance;
    result.postBalloonPayment = LoanModel::monthlyPayment(refinance);
    result.paymentDifference = result.postBalloonPayment - result.preBalloonPayment;
    result.refinanceCosts = refinance.upfrontCash();

    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Полный анализ
// ═══════════════════════════════════════════════════════════════════════════════

AnalysisResult AnalysisEngine::analyze(const Deal& deal)
{
    AnalysisResult result;
    result.strategy = deal.strategy();

    result.monthlyIncome = monthlyIncome(deal);
    result.monthlyOperatingExpenses = monthlyOperatingExpenses(deal);
    result.monthlyDebtService = monthlyDebtService(deal);
    result.monthlyNoi = result.monthlyIncome - result.monthlyOperatingExpenses;
    result.monthlyCashFlow = result.monthlyNoi - result.monthlyDebtService;
    result.annualCashFlow = result.monthlyCashFlow * 12.0;
    result.totalCashInvested = totalCashInvested(deal);

    result.cashOnCashReturn = cashOnCashReturn(deal);
    result.capRate = capRate(deal);
    result.expenseRatio = expenseRatio(deal);
    result.breakevenOccupancy = breakevenOccupancy(deal);
    result.debtServiceCoverageRatio = debtServiceCoverageRatio(deal);
    result.grossRentMultiplier = grossRentMultiplier(deal);

    result.pricePerUnit = pricePerUnit(deal);
    result.occupancyRate = occupancyRate(deal);
    result.totalRentCredits = totalRentCredits(deal);
    result.effectivePurchasePrice = effectivePurchasePrice(deal);

    result.balloon = balloonComparison(deal);

    return result;
}

} // namespace realestate
