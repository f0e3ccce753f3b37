#pragma once

#include "Deal.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace realestate {

// Сравнение платежей до и после рефинансирования balloon-кредита
struct BalloonComparison {
    double preBalloonPayment = 0.0;
    double postBalloonPayment = 0.0;
    double paymentDifference = 0.0;
    double refinanceCosts = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// AnalysisResult - сводка всех показателей сделки
// ═══════════════════════════════════════════════════════════════════════════════

struct AnalysisResult {
    StrategyType strategy = StrategyType::LongTermRental;

    double monthlyIncome = 0.0;
    double monthlyOperatingExpenses = 0.0;
    double monthlyDebtService = 0.0;
    double monthlyNoi = 0.0;
    double monthlyCashFlow = 0.0;
    double annualCashFlow = 0.0;
    double totalCashInvested = 0.0;

    double cashOnCashReturn = 0.0;    // %
    double capRate = 0.0;             // %
    double expenseRatio = 0.0;        // %
    double breakevenOccupancy = 0.0;  // %

    std::optional<double> debtServiceCoverageRatio;
    std::optional<double> grossRentMultiplier;

    // MultiFamily
    std::optional<double> pricePerUnit;
    std::optional<double> occupancyRate;

    // LeaseOption
    std::optional<double> totalRentCredits;
    std::optional<double> effectivePurchasePrice;

    std::optional<BalloonComparison> balloon;
};

// ═══════════════════════════════════════════════════════════════════════════════
// AnalysisEngine - расчёт показателей сделки
//
// Все методы - чистые функции над проверенной сделкой. Деление на ноль
// даёт 0 или отсутствующее значение, исключений нет.
// ═══════════════════════════════════════════════════════════════════════════════

class AnalysisEngine {
public:
    using ServicedLoan = std::pair<LoanSlot, const LoanSpec*>;

    // Валовый доход в месяц: аренда, сумма по типам квартир или комнаты PadSplit
    static double monthlyIncome(const Deal& deal) noexcept;

    // Операционные расходы в месяц (без платежей по кредитам)
    static double monthlyOperatingExpenses(const Deal& deal) noexcept;

    // Кредиты, обслуживаемые при данной стратегии
    static std::vector<ServicedLoan> servicedLoans(const Deal& deal);

    static double monthlyDebtService(const Deal& deal);

    static double monthlyNoi(const Deal& deal) noexcept;

    static double monthlyCashFlow(const Deal& deal);

    // Собственные вложения: взносы и расходы по кредитам, закрытие сделки,
    // ремонт, мебель, маркетинг, выплаты продавцу, assignment fee и
    // (LeaseOption) плата за опцион
    static double totalCashInvested(const Deal& deal);

    static double cashOnCashReturn(const Deal& deal);

    static double capRate(const Deal& deal) noexcept;

    static std::optional<double> debtServiceCoverageRatio(const Deal& deal);

    static double expenseRatio(const Deal& deal) noexcept;

    static std::optional<double> grossRentMultiplier(const Deal& deal) noexcept;

    static double breakevenOccupancy(const Deal& deal);

    static std::optional<double> pricePerUnit(const Deal& deal) noexcept;

    static std::optional<double> occupancyRate(const Deal& deal) noexcept;

    static std::optional<double> totalRentCredits(const Deal& deal) noexcept;

    static std::optional<double> effectivePurchasePrice(const Deal& deal) noexcept;

    static std::optional<BalloonComparison> balloonComparison(const Deal& deal);

    static AnalysisResult analyze(const Deal& deal);
};

} // namespace realestate
