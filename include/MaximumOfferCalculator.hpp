#pragma once

#include "Deal.hpp"
#include <expected>
#include <optional>
#include <string>

namespace realestate {

// Максимальная цена предложения и все промежуточные величины
struct OfferBreakdown {
    double maximumOffer = 0.0;
    double estimatedValue = 0.0;
    double ltvPercent = 0.0;
    double loanAmount = 0.0;
    double renovationCosts = 0.0;
    double closingCosts = 0.0;
    double monthlyHoldingCost = 0.0;
    int holdingMonths = 0;
    double totalHoldingCost = 0.0;
    double targetCashLeft = 0.0;
    std::optional<LoanSlot> carryLoan;  // кредит, проценты по которому входят в удержание
    bool clamped = false;               // расчётная цена была отрицательной
};

// ═══════════════════════════════════════════════════════════════════════════════
// MaximumOfferCalculator (MAO)
//
// offer = value * LTV - ремонт - закрытие - удержание + targetCashLeft,
// не меньше нуля.
// ═══════════════════════════════════════════════════════════════════════════════

class MaximumOfferCalculator {
public:
    static constexpr double kDefaultLtvPercent = 75.0;
    static constexpr double kDefaultTargetCashLeft = 10000.0;

    static std::expected<OfferBreakdown, std::string> maxOffer(
        double estimatedValue,
        const Deal& deal,
        double targetCashLeft = kDefaultTargetCashLeft);

    // Оценка по after_repair_value сделки
    static std::expected<OfferBreakdown, std::string> maxOfferFromArv(
        const Deal& deal,
        double targetCashLeft = kDefaultTargetCashLeft);

    // LTV: рефинансирование BRRRR, затем balloon, иначе 75%
    static double loanToValuePercent(const Deal& deal) noexcept;

    // Кредит, финансирующий период удержания: initial у BRRRR, loan1 у остальных
    static std::optional<LoanSlot> carryLoanSlot(const Deal& deal) noexcept;

    // Налоги/12 + страховка/12 + коммунальные + HOA + проценты по кредиту удержания
    static double monthlyHoldingCost(const Deal& deal) noexcept;
};

} // namespace realestate
