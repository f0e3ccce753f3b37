#include "AmortizationScheduler.hpp"
#include <algorithm>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// AmortizationSchedule::Iterator
// ═══════════════════════════════════════════════════════════════════════════════

AmortizationSchedule::Iterator::Iterator(const AmortizationSchedule* schedule)
    : schedule_(schedule)
    , done_(false)
{
    row_.payment = schedule_->payment_;
    row_.balance = schedule_->principal_;
    advance();
}

void AmortizationSchedule::Iterator::advance()
{
    int nextMonth = row_.month + 1;
    if (nextMonth > schedule_->termMonths_) {
        done_ = true;
        return;
    }

    double interest = row_.balance * schedule_->monthlyRate_;
    double principalPaid = schedule_->payment_ - interest;
    double balance = row_.balance - principalPaid;

    bool lastRow = (nextMonth == schedule_->termMonths_);
    if (!schedule_->interestOnly_ && lastRow) {
        // Остаток в последнем месяце - погрешность округления
        balance = 0.0;
    }

    row_.month = nextMonth;
    row_.interest = interest;
    row_.principal = principalPaid;
    row_.balance = std::max(0.0, balance);
    row_.cumulativeInterest += interest;
    row_.cumulativePrincipal += principalPaid;
}

AmortizationSchedule::Iterator& AmortizationSchedule::Iterator::operator++()
{
    if (!done_) {
        advance();
    }
    return *this;
}

AmortizationSchedule::Iterator AmortizationSchedule::Iterator::operator++(int)
{
    Iterator tmp = *this;
    ++(*this);
    return tmp;
}

bool AmortizationSchedule::Iterator::operator==(const Iterator& other) const noexcept
{
    if (done_ || other.done_) {
        return done_ == other.done_;
    }
    return schedule_ == other.schedule_ && row_.month == other.row_.month;
}

// ═══════════════════════════════════════════════════════════════════════════════
// AmortizationSchedule
// ═══════════════════════════════════════════════════════════════════════════════

AmortizationSchedule::AmortizationSchedule(double principal,
                                           double monthlyRate,
                                           int termMonths,
                                           double payment,
                                           bool interestOnly) noexcept
    : principal_(principal)
    , monthlyRate_(monthlyRate)
    , termMonths_(termMonths)
    , payment_(payment)
    , interestOnly_(interestOnly)
{
}

AmortizationSchedule::Iterator AmortizationSchedule::begin() const
{
    return Iterator(this);
}

std::vector<AmortizationRow> AmortizationSchedule::take(std::size_t count) const
{
    std::vector<AmortizationRow> rows;
    rows.reserve(std::min(count, size()));

    for (auto it = begin(); it != end() && rows.size() < count; ++it) {
        rows.push_back(*it);
    }

    return rows;
}

std::vector<AmortizationRow> AmortizationSchedule::toVector() const
{
    return take(size());
}

std::optional<AmortizationRow> AmortizationSchedule::rowAt(int month) const
{
    if (month < 1 || month > termMonths_) {
        return std::nullopt;
    }

    for (const auto& row : *this) {
        if (row.month == month) {
            return row;
        }
    }

    return std::nullopt;
}

double AmortizationSchedule::balanceAfter(int monthsElapsed) const
{
    if (monthsElapsed <= 0) {
        return principal_;
    }

    auto row = rowAt(std::min(monthsElapsed, termMonths_));
    return row ? row->balance : 0.0;
}

// ═══════════════════════════════════════════════════════════════════════════════
// AmortizationScheduler
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<AmortizationSchedule, std::string> AmortizationScheduler::schedule(
    const LoanSpec& loan)
{
    if (loan.principal() <= 0.0) {
        return std::unexpected("loan_amount must be positive to build a schedule");
    }

    if (loan.annualRate() < 0.0) {
        return std::unexpected("interest_rate cannot be negative");
    }

    if (loan.termMonths() <= 0) {
        return std::unexpected("term must be positive");
    }

    return AmortizationSchedule(loan.principal(),
                                loan.monthlyRate(),
                                loan.termMonths(),
                                LoanModel::monthlyPayment(loan),
                                loan.isInterestOnly());
}

std::vector<AmortizationRow> AmortizationScheduler::combine(
    const std::vector<AmortizationSchedule>& schedules)
{
    std::size_t longest = 0;
    for (const auto& schedule : schedules) {
        longest = std::max(longest, schedule.size());
    }

    std::vector<AmortizationRow> combined(longest);
    for (std::size_t i = 0; i < longest; ++i) {
        combined[i].month = static_cast<int>(i) + 1;
    }

    for (const auto& schedule : schedules) {
        AmortizationRow last{};
        std::size_t index = 0;

        for (const auto& row : schedule) {
            auto& target = combined[index++];
            target.payment += row.payment;
            target.principal += row.principal;
            target.interest += row.interest;
            target.balance += row.balance;
            target.cumulativeInterest += row.cumulativeInterest;
            target.cumulativePrincipal += row.cumulativePrincipal;
            last = row;
        }

        // Погашенный кредит: только накопленные суммы
        for (; index < longest; ++index) {
            combined[index].cumulativeInterest += last.cumulativeInterest;
            combined[index].cumulativePrincipal += last.cumulativePrincipal;
        }
    }

    return combined;
}

} // namespace realestate
