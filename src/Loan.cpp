#include "Loan.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// LoanSpec
// ═══════════════════════════════════════════════════════════════════════════════

LoanSpec::LoanSpec(std::string name,
                   double principal,
                   double annualRate,
                   int termMonths,
                   double downPayment,
                   double closingCosts,
                   bool interestOnly)
    : name_(std::move(name))
    , principal_(principal)
    , annualRate_(annualRate)
    , termMonths_(termMonths)
    , downPayment_(downPayment)
    , closingCosts_(closingCosts)
    , interestOnly_(interestOnly)
{
}

std::expected<LoanSpec, std::string> LoanSpec::create(
    std::string_view name,
    double principal,
    double annualRatePercent,
    int termMonths,
    double downPayment,
    double closingCosts,
    bool interestOnly)
{
    if (!std::isfinite(principal) || principal < 0.0) {
        return std::unexpected("amount must be a non-negative number");
    }

    if (!std::isfinite(annualRatePercent) ||
        annualRatePercent < 0.0 || annualRatePercent > 100.0) {
        std::ostringstream oss;
        oss << "interest_rate must be between 0 and 100, got " << annualRatePercent;
        return std::unexpected(oss.str());
    }

    if (termMonths <= 0) {
        return std::unexpected(
            "term must be positive, got " + std::to_string(termMonths));
    }

    if (!std::isfinite(downPayment) || downPayment < 0.0) {
        return std::unexpected("down_payment must be a non-negative number");
    }

    if (!std::isfinite(closingCosts) || closingCosts < 0.0) {
        return std::unexpected("closing_costs must be a non-negative number");
    }

    return LoanSpec(std::string(name.empty() ? "Loan" : name),
                    principal,
                    annualRatePercent,
                    termMonths,
                    downPayment,
                    closingCosts,
                    interestOnly);
}

// ═══════════════════════════════════════════════════════════════════════════════
// LoanModel
// ═══════════════════════════════════════════════════════════════════════════════

double LoanModel::monthlyPayment(const LoanSpec& loan) noexcept
{
    if (loan.isInterestOnly()) {
        return monthlyInterestCarry(loan);
    }

    double r = loan.monthlyRate();
    if (r == 0.0) {
        return loan.principal() / static_cast<double>(loan.termMonths());
    }

    double factor = std::pow(1.0 + r, loan.termMonths());
    return loan.principal() * (r * factor) / (factor - 1.0);
}

double LoanModel::monthlyInterestCarry(const LoanSpec& loan) noexcept
{
    return loan.principal() * (loan.annualRate() / 12.0 / 100.0);
}

double LoanModel::remainingBalance(const LoanSpec& loan, int paymentsMade) noexcept
{
    if (paymentsMade <= 0) {
        return loan.principal();
    }

    if (paymentsMade >= loan.termMonths()) {
        return 0.0;
    }

    // Тело interest-only кредита гасится одним платежом в конце срока
    if (loan.isInterestOnly()) {
        return loan.principal();
    }

    double r = loan.monthlyRate();
    if (r == 0.0) {
        double paid = loan.principal() * paymentsMade / loan.termMonths();
        return std::max(0.0, loan.principal() - paid);
    }

    double factorN = std::pow(1.0 + r, loan.termMonths());
    double factorP = std::pow(1.0 + r, paymentsMade);
    double balance = loan.principal() * (factorN - factorP) / (factorN - 1.0);

    return std::max(0.0, balance);
}

} // namespace realestate
