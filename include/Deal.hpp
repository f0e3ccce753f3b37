#pragma once

#include "DateUtils.hpp"
#include "Loan.hpp"
#include <array>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// Типы стратегий и слоты кредитов
// ═══════════════════════════════════════════════════════════════════════════════

enum class StrategyType {
    LongTermRental,
    Brrrr,
    LeaseOption,
    MultiFamily,
    PadSplit
};

// "LTR", "BRRRR", "LeaseOption", "MultiFamily", "PadSplit"
std::string_view toString(StrategyType type) noexcept;
std::expected<StrategyType, std::string> parseStrategyType(std::string_view name);

enum class LoanSlot {
    Initial,
    Refinance,
    Loan1,
    Loan2,
    Loan3,
    BalloonRefinance
};

inline constexpr std::array<LoanSlot, 6> kAllLoanSlots = {
    LoanSlot::Initial,
    LoanSlot::Refinance,
    LoanSlot::Loan1,
    LoanSlot::Loan2,
    LoanSlot::Loan3,
    LoanSlot::BalloonRefinance
};

// Префикс полей слота: "initial", "refinance", "loan1".."loan3", "balloon_refinance"
std::string_view toString(LoanSlot slot) noexcept;

struct LoanSlots {
    std::optional<LoanSpec> initial;
    std::optional<LoanSpec> refinance;
    std::optional<LoanSpec> loan1;
    std::optional<LoanSpec> loan2;
    std::optional<LoanSpec> loan3;
    std::optional<LoanSpec> balloonRefinance;

    const std::optional<LoanSpec>& at(LoanSlot slot) const noexcept;
    std::optional<LoanSpec>& at(LoanSlot slot) noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Общие поля сделки
// ═══════════════════════════════════════════════════════════════════════════════

struct PropertyDetails {
    std::string address;
    std::string propertyType;
    std::optional<int> squareFootage;
    std::optional<double> lotSize;
    std::optional<int> yearBuilt;
    std::optional<int> bedrooms;
    std::optional<double> bathrooms;
};

// Годовые налоги и страховка, остальные фиксированные статьи - в месяц.
// Процентные статьи считаются от валового дохода.
struct OperatingExpenses {
    double propertyTaxesAnnual = 0.0;
    double insuranceAnnual = 0.0;
    double hoaMonthly = 0.0;
    double utilities = 0.0;
    double internet = 0.0;
    double cleaning = 0.0;
    double pestControl = 0.0;
    double landscaping = 0.0;

    double managementPercent = 0.0;
    double capexPercent = 0.0;
    double vacancyPercent = 0.0;
    double repairsPercent = 0.0;
};

struct AcquisitionCosts {
    double closingCosts = 0.0;
    double cashToSeller = 0.0;
    double assignmentFee = 0.0;
    double marketingCosts = 0.0;
    double furnishingCosts = 0.0;
};

struct RehabPlan {
    std::optional<double> afterRepairValue;
    std::optional<double> renovationCosts;
    std::optional<int> durationMonths;
};

struct BalloonTerms {
    bool hasBalloonPayment = false;
    std::optional<Date> dueDate;
    std::optional<double> refinanceLtvPercent;
};

struct DealCore {
    std::string id;
    std::string userId;
    std::string name;
    PropertyDetails property;

    double purchasePrice = 0.0;
    std::optional<double> monthlyRent;

    AcquisitionCosts acquisition;
    RehabPlan rehab;
    OperatingExpenses expenses;
    LoanSlots loans;
    BalloonTerms balloon;

    std::string notes;
    std::string createdAt;
    std::string updatedAt;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Поля конкретных стратегий
// ═══════════════════════════════════════════════════════════════════════════════

struct LongTermRentalTerms {};

struct BrrrrTerms {
    // LTV рефинансирования, по умолчанию 75%
    std::optional<double> refinanceLtvPercent;
};

struct LeaseOptionTerms {
    std::optional<double> optionConsiderationFee;
    std::optional<int> optionTermMonths;
    std::optional<double> strikePrice;
    std::optional<double> monthlyRentCreditPercent;
    std::optional<double> rentCreditCap;
};

struct UnitType {
    std::string name;
    int count = 0;
    double rent = 0.0;
    std::optional<int> squareFootage;
};

struct MultiFamilyTerms {
    std::optional<int> totalUnits;
    std::optional<int> occupiedUnits;
    int floors = 0;
    std::vector<UnitType> unitTypes;
    double otherIncome = 0.0;

    // Ежемесячные расходы многоквартирного дома
    double commonAreaMaintenance = 0.0;
    double elevatorMaintenance = 0.0;
    double staffPayroll = 0.0;
    double trashRemoval = 0.0;
    double commonUtilities = 0.0;
};

struct PadSplitTerms {
    std::optional<int> roomCount;
    std::optional<double> averageRoomRent;
    std::optional<double> platformPercent;
};

using StrategyTerms = std::variant<
    LongTermRentalTerms,
    BrrrrTerms,
    LeaseOptionTerms,
    MultiFamilyTerms,
    PadSplitTerms>;

// ═══════════════════════════════════════════════════════════════════════════════
// Deal - проверенная сделка
//
// Создаётся только через create(), который проверяет обязательные поля
// стратегии и согласованность полей. Расчёты только читают сделку.
// ═══════════════════════════════════════════════════════════════════════════════

class Deal {
public:
    static constexpr std::size_t kMaxNotesLength = 1000;

    static std::expected<Deal, std::string> create(DealCore core, StrategyTerms terms);

    StrategyType strategy() const noexcept;
    const DealCore& core() const noexcept { return core_; }
    const StrategyTerms& terms() const noexcept { return terms_; }

    template<typename T>
    const T* termsAs() const noexcept { return std::get_if<T>(&terms_); }

    const std::string& id() const noexcept { return core_.id; }
    const std::string& name() const noexcept { return core_.name; }
    double purchasePrice() const noexcept { return core_.purchasePrice; }
    double monthlyRent() const noexcept { return core_.monthlyRent.value_or(0.0); }
    double renovationCosts() const noexcept { return core_.rehab.renovationCosts.value_or(0.0); }
    int renovationDurationMonths() const noexcept { return core_.rehab.durationMonths.value_or(0); }

    // Копия с новой меткой updated_at (created_at заполняется, если пуст).
    // Вызывается слоем хранения при сохранении.
    Deal withUpdatedTimestamp(std::string_view timestamp) const;

private:
    Deal(DealCore core, StrategyTerms terms);

    DealCore core_;
    StrategyTerms terms_;
};

} // namespace realestate
