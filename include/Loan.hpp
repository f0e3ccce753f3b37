#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// LoanSpec - параметры одного кредита (неизменяемые после создания)
// ═══════════════════════════════════════════════════════════════════════════════

class LoanSpec {
public:
    /**
     * @brief Создать кредит с проверкой параметров
     *
     * @param name Название кредита (для отчётов)
     * @param principal Сумма кредита, >= 0
     * @param annualRatePercent Годовая ставка в процентах, [0, 100]
     * @param termMonths Срок в месяцах, > 0
     * @param downPayment Первоначальный взнос, >= 0
     * @param closingCosts Расходы на оформление, >= 0
     * @param interestOnly Платежи только по процентам
     * @return LoanSpec или ошибка с именем поля
     */
    static std::expected<LoanSpec, std::string> create(
        std::string_view name,
        double principal,
        double annualRatePercent,
        int termMonths,
        double downPayment = 0.0,
        double closingCosts = 0.0,
        bool interestOnly = false);

    const std::string& name() const noexcept { return name_; }
    double principal() const noexcept { return principal_; }
    double annualRate() const noexcept { return annualRate_; }
    int termMonths() const noexcept { return termMonths_; }
    double downPayment() const noexcept { return downPayment_; }
    double closingCosts() const noexcept { return closingCosts_; }
    bool isInterestOnly() const noexcept { return interestOnly_; }

    // Месячная ставка в долях (4.5% годовых -> 0.00375)
    double monthlyRate() const noexcept { return annualRate_ / 12.0 / 100.0; }

    // Собственные деньги, вложенные при получении кредита
    double upfrontCash() const noexcept { return downPayment_ + closingCosts_; }

private:
    LoanSpec(std::string name,
             double principal,
             double annualRate,
             int termMonths,
             double downPayment,
             double closingCosts,
             bool interestOnly);

    std::string name_;
    double principal_;
    double annualRate_;
    int termMonths_;
    double downPayment_;
    double closingCosts_;
    bool interestOnly_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// LoanModel - расчёт платежей по кредиту
// ═══════════════════════════════════════════════════════════════════════════════

class LoanModel {
public:
    // Ежемесячный платёж:
    //   interest-only: P * rate / 1200
    //   ставка 0:      P / n
    //   иначе:         P * r(1+r)^n / ((1+r)^n - 1)
    static double monthlyPayment(const LoanSpec& loan) noexcept;

    // Проценты за месяц при обслуживании только процентов
    static double monthlyInterestCarry(const LoanSpec& loan) noexcept;

    // Остаток долга после paymentsMade платежей
    static double remainingBalance(const LoanSpec& loan, int paymentsMade) noexcept;
};

} // namespace realestate
