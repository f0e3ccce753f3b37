#pragma once

#include "Loan.hpp"
#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace realestate {

// Одна строка графика погашения
struct AmortizationRow {
    int month = 0;
    double payment = 0.0;
    double principal = 0.0;
    double interest = 0.0;
    double balance = 0.0;
    double cumulativeInterest = 0.0;
    double cumulativePrincipal = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// AmortizationSchedule - ленивая последовательность строк графика
//
// Строки вычисляются при обходе, каждый begin() начинает с первого месяца.
// Повторный обход даёт ту же последовательность.
// ═══════════════════════════════════════════════════════════════════════════════

class AmortizationSchedule {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = AmortizationRow;
        using difference_type = std::ptrdiff_t;
        using pointer = const AmortizationRow*;
        using reference = const AmortizationRow&;

        // Итератор конца
        Iterator() = default;

        reference operator*() const noexcept { return row_; }
        pointer operator->() const noexcept { return &row_; }

        Iterator& operator++();
        Iterator operator++(int);

        bool operator==(const Iterator& other) const noexcept;

    private:
        friend class AmortizationSchedule;

        explicit Iterator(const AmortizationSchedule* schedule);

        void advance();

        const AmortizationSchedule* schedule_ = nullptr;
        AmortizationRow row_{};
        bool done_ = true;
    };

    Iterator begin() const;
    Iterator end() const noexcept { return Iterator{}; }

    std::size_t size() const noexcept { return static_cast<std::size_t>(termMonths_); }
    double payment() const noexcept { return payment_; }
    double principal() const noexcept { return principal_; }
    bool isInterestOnly() const noexcept { return interestOnly_; }

    // Первые count строк (например, до текущего месяца)
    std::vector<AmortizationRow> take(std::size_t count) const;

    // Полный график
    std::vector<AmortizationRow> toVector() const;

    // Строка за конкретный месяц (1..term)
    std::optional<AmortizationRow> rowAt(int month) const;

    // Остаток долга после monthsElapsed платежей
    double balanceAfter(int monthsElapsed) const;

private:
    friend class AmortizationScheduler;

    AmortizationSchedule(double principal,
                         double monthlyRate,
                         int termMonths,
                         double payment,
                         bool interestOnly) noexcept;

    double principal_;
    double monthlyRate_;
    int termMonths_;
    double payment_;
    bool interestOnly_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// AmortizationScheduler
// ═══════════════════════════════════════════════════════════════════════════════

class AmortizationScheduler {
public:
    // Ошибка, если сумма <= 0, ставка < 0 или срок <= 0
    static std::expected<AmortizationSchedule, std::string> schedule(
        const LoanSpec& loan);

    // Суммарный график по нескольким кредитам, длиной в самый длинный срок.
    // Кредит после погашения даёт нулевой платёж и остаток, накопленные
    // суммы сохраняются.
    static std::vector<AmortizationRow> combine(
        const std::vector<AmortizationSchedule>& schedules);
};

} // namespace realestate
