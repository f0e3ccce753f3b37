#include "Deal.hpp"
#include <cmath>
#include <sstream>
#include <type_traits>
#include <utility>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// Перечисления
// ═══════════════════════════════════════════════════════════════════════════════

std::string_view toString(StrategyType type) noexcept
{
    switch (type) {
        case StrategyType::LongTermRental: return "LTR";
        case StrategyType::Brrrr:          return "BRRRR";
        case StrategyType::LeaseOption:    return "LeaseOption";
        case StrategyType::MultiFamily:    return "MultiFamily";
        case StrategyType::PadSplit:       return "PadSplit";
    }
    return "Unknown";
}

std::expected<StrategyType, std::string> parseStrategyType(std::string_view name)
{
    if (name == "LTR") return StrategyType::LongTermRental;
    if (name == "BRRRR") return StrategyType::Brrrr;
    if (name == "LeaseOption") return StrategyType::LeaseOption;
    if (name == "MultiFamily") return StrategyType::MultiFamily;
    if (name == "PadSplit") return StrategyType::PadSplit;

    return std::unexpected(
        "analysis_type '" + std::string(name) +
        "' is not supported (expected LTR, BRRRR, LeaseOption, MultiFamily or PadSplit)");
}

std::string_view toString(LoanSlot slot) noexcept
{
    switch (slot) {
        case LoanSlot::Initial:          return "initial";
        case LoanSlot::Refinance:        return "refinance";
        case LoanSlot::Loan1:            return "loan1";
        case LoanSlot::Loan2:            return "loan2";
        case LoanSlot::Loan3:            return "loan3";
        case LoanSlot::BalloonRefinance: return "balloon_refinance";
    }
    return "unknown";
}

const std::optional<LoanSpec>& LoanSlots::at(LoanSlot slot) const noexcept
{
    switch (slot) {
        case LoanSlot::Initial:          return initial;
        case LoanSlot::Refinance:        return refinance;
        case LoanSlot::Loan1:            return loan1;
        case LoanSlot::Loan2:            return loan2;
        case LoanSlot::Loan3:            return loan3;
        case LoanSlot::BalloonRefinance: return balloonRefinance;
    }
    return initial;
}

std::optional<LoanSpec>& LoanSlots::at(LoanSlot slot) noexcept
{
    switch (slot) {
        case LoanSlot::Initial:          return initial;
        case LoanSlot::Refinance:        return refinance;
        case LoanSlot::Loan1:            return loan1;
        case LoanSlot::Loan2:            return loan2;
        case LoanSlot::Loan3:            return loan3;
        case LoanSlot::BalloonRefinance: return balloonRefinance;
    }
    return initial;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Проверки полей
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

using Check = std::expected<void, std::string>;

Check requireNonNegative(double value, std::string_view field)
{
    if (!std::isfinite(value) || value < 0.0) {
        return std::unexpected(std::string(field) + " must be a non-negative number");
    }
    return {};
}

Check requireOptionalNonNegative(const std::optional<double>& value, std::string_view field)
{
    if (value) {
        return requireNonNegative(*value, field);
    }
    return {};
}

Check requirePercent(double value, std::string_view field)
{
    if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
        std::ostringstream oss;
        oss << field << " must be between 0 and 100, got " << value;
        return std::unexpected(oss.str());
    }
    return {};
}

std::string missing(std::string_view field, StrategyType type)
{
    return std::string(field) + " is required for " + std::string(toString(type)) + " analysis";
}

Check validateCore(const DealCore& core)
{
    if (core.name.empty()) {
        return std::unexpected("analysis_name is required");
    }

    if (core.property.address.empty()) {
        return std::unexpected("address is required");
    }

    if (core.notes.size() > Deal::kMaxNotesLength) {
        return std::unexpected("notes cannot exceed " +
                               std::to_string(Deal::kMaxNotesLength) + " characters");
    }

    const std::pair<double, std::string_view> money[] = {
        {core.purchasePrice, "purchase_price"},
        {core.acquisition.closingCosts, "closing_costs"},
        {core.acquisition.cashToSeller, "cash_to_seller"},
        {core.acquisition.assignmentFee, "assignment_fee"},
        {core.acquisition.marketingCosts, "marketing_costs"},
        {core.acquisition.furnishingCosts, "furnishing_costs"},
        {core.expenses.propertyTaxesAnnual, "property_taxes"},
        {core.expenses.insuranceAnnual, "insurance"},
        {core.expenses.hoaMonthly, "hoa_coa_coop"},
        {core.expenses.utilities, "utilities"},
        {core.expenses.internet, "internet"},
        {core.expenses.cleaning, "cleaning"},
        {core.expenses.pestControl, "pest_control"},
        {core.expenses.landscaping, "landscaping"},
    };
    for (const auto& [value, field] : money) {
        if (auto check = requireNonNegative(value, field); !check) {
            return check;
        }
    }

    const std::pair<double, std::string_view> percents[] = {
        {core.expenses.managementPercent, "management_fee_percentage"},
        {core.expenses.capexPercent, "capex_percentage"},
        {core.expenses.vacancyPercent, "vacancy_percentage"},
        {core.expenses.repairsPercent, "repairs_percentage"},
    };
    for (const auto& [value, field] : percents) {
        if (auto check = requirePercent(value, field); !check) {
            return check;
        }
    }

    if (auto check = requireOptionalNonNegative(core.monthlyRent, "monthly_rent"); !check) {
        return check;
    }
    if (auto check = requireOptionalNonNegative(core.rehab.afterRepairValue, "after_repair_value"); !check) {
        return check;
    }
    if (auto check = requireOptionalNonNegative(core.rehab.renovationCosts, "renovation_costs"); !check) {
        return check;
    }
    if (core.rehab.durationMonths && *core.rehab.durationMonths < 0) {
        return std::unexpected("renovation_duration cannot be negative");
    }

    if (core.balloon.hasBalloonPayment && core.balloon.refinanceLtvPercent) {
        double ltv = *core.balloon.refinanceLtvPercent;
        if (!(ltv > 0.0 && ltv <= 100.0)) {
            return std::unexpected(
                "balloon_refinance_ltv_percentage must be greater than 0 and at most 100");
        }
    }

    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Проверки по стратегиям
// ─────────────────────────────────────────────────────────────────────────────

Check validateTerms(const DealCore& core, const LongTermRentalTerms&)
{
    if (!core.monthlyRent) {
        return std::unexpected(missing("monthly_rent", StrategyType::LongTermRental));
    }
    return {};
}

Check validateTerms(const DealCore& core, const BrrrrTerms& terms)
{
    const auto type = StrategyType::Brrrr;

    if (!core.monthlyRent) {
        return std::unexpected(missing("monthly_rent", type));
    }
    if (!core.rehab.afterRepairValue) {
        return std::unexpected(missing("after_repair_value", type));
    }
    if (!core.rehab.renovationCosts) {
        return std::unexpected(missing("renovation_costs", type));
    }
    if (!core.rehab.durationMonths) {
        return std::unexpected(missing("renovation_duration", type));
    }

    if (terms.refinanceLtvPercent) {
        double ltv = *terms.refinanceLtvPercent;
        if (!(ltv > 0.0 && ltv <= 100.0)) {
            return std::unexpected(
                "refinance_ltv_percentage must be greater than 0 and at most 100");
        }
    }

    return {};
}

Check validateTerms(const DealCore& core, const LeaseOptionTerms& terms)
{
    const auto type = StrategyType::LeaseOption;

    if (!core.monthlyRent) {
        return std::unexpected(missing("monthly_rent", type));
    }
    if (!terms.optionConsiderationFee) {
        return std::unexpected(missing("option_consideration_fee", type));
    }
    if (!terms.optionTermMonths) {
        return std::unexpected(missing("option_term_months", type));
    }
    if (!terms.strikePrice) {
        return std::unexpected(missing("strike_price", type));
    }
    if (!terms.monthlyRentCreditPercent) {
        return std::unexpected(missing("monthly_rent_credit_percentage", type));
    }
    if (!terms.rentCreditCap) {
        return std::unexpected(missing("rent_credit_cap", type));
    }

    if (auto check = requireNonNegative(*terms.optionConsiderationFee, "option_consideration_fee"); !check) {
        return check;
    }
    if (*terms.optionTermMonths <= 0) {
        return std::unexpected("option_term_months must be positive");
    }
    if (auto check = requirePercent(*terms.monthlyRentCreditPercent, "monthly_rent_credit_percentage"); !check) {
        return check;
    }
    if (auto check = requireNonNegative(*terms.rentCreditCap, "rent_credit_cap"); !check) {
        return check;
    }
    if (!(*terms.strikePrice > core.purchasePrice)) {
        return std::unexpected("strike_price must be greater than purchase_price");
    }

    return {};
}

Check validateTerms(const DealCore&, const MultiFamilyTerms& terms)
{
    const auto type = StrategyType::MultiFamily;

    if (!terms.totalUnits) {
        return std::unexpected(missing("total_units", type));
    }
    if (!terms.occupiedUnits) {
        return std::unexpected(missing("occupied_units", type));
    }
    if (terms.unitTypes.empty()) {
        return std::unexpected(missing("unit_types", type));
    }

    if (*terms.totalUnits <= 0) {
        return std::unexpected("total_units must be positive");
    }
    if (*terms.occupiedUnits < 0) {
        return std::unexpected("occupied_units cannot be negative");
    }
    if (*terms.occupiedUnits > *terms.totalUnits) {
        return std::unexpected("occupied_units cannot exceed total_units");
    }
    if (terms.floors < 0) {
        return std::unexpected("floors cannot be negative");
    }

    long long unitCount = 0;
    for (const auto& unit : terms.unitTypes) {
        if (unit.count <= 0) {
            return std::unexpected("unit_types count must be positive");
        }
        if (auto check = requireNonNegative(unit.rent, "unit_types rent"); !check) {
            return check;
        }
        unitCount += unit.count;
    }
    if (unitCount > *terms.totalUnits) {
        return std::unexpected("unit_types counts cannot exceed total_units");
    }

    const std::pair<double, std::string_view> money[] = {
        {terms.otherIncome, "other_income"},
        {terms.commonAreaMaintenance, "common_area_maintenance"},
        {terms.elevatorMaintenance, "elevator_maintenance"},
        {terms.staffPayroll, "staff_payroll"},
        {terms.trashRemoval, "trash_removal"},
        {terms.commonUtilities, "common_utilities"},
    };
    for (const auto& [value, field] : money) {
        if (auto check = requireNonNegative(value, field); !check) {
            return check;
        }
    }

    return {};
}

Check validateTerms(const DealCore&, const PadSplitTerms& terms)
{
    const auto type = StrategyType::PadSplit;

    if (!terms.roomCount) {
        return std::unexpected(missing("room_count", type));
    }
    if (!terms.averageRoomRent) {
        return std::unexpected(missing("average_room_rent", type));
    }
    if (!terms.platformPercent) {
        return std::unexpected(missing("padsplit_platform_percentage", type));
    }

    if (*terms.roomCount <= 0) {
        return std::unexpected("room_count must be positive");
    }
    if (auto check = requireNonNegative(*terms.averageRoomRent, "average_room_rent"); !check) {
        return check;
    }
    return requirePercent(*terms.platformPercent, "padsplit_platform_percentage");
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Deal
// ═══════════════════════════════════════════════════════════════════════════════

Deal::Deal(DealCore core, StrategyTerms terms)
    : core_(std::move(core))
    , terms_(std::move(terms))
{
}

std::expected<Deal, std::string> Deal::create(DealCore core, StrategyTerms terms)
{
    if (auto check = validateCore(core); !check) {
        return std::unexpected(check.error());
    }

    auto termsCheck = std::visit(
        [&core](const auto& t) { return validateTerms(core, t); },
        terms);
    if (!termsCheck) {
        return std::unexpected(termsCheck.error());
    }

    return Deal(std::move(core), std::move(terms));
}

StrategyType Deal::strategy() const noexcept
{
    return std::visit([](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, BrrrrTerms>) {
            return StrategyType::Brrrr;
        } else if constexpr (std::is_same_v<T, LeaseOptionTerms>) {
            return StrategyType::LeaseOption;
        } else if constexpr (std::is_same_v<T, MultiFamilyTerms>) {
            return StrategyType::MultiFamily;
        } else if constexpr (std::is_same_v<T, PadSplitTerms>) {
            return StrategyType::PadSplit;
        } else {
            return StrategyType::LongTermRental;
        }
    }, terms_);
}

Deal Deal::withUpdatedTimestamp(std::string_view timestamp) const
{
    Deal updated = *this;
    updated.core_.updatedAt = std::string(timestamp);
    if (updated.core_.createdAt.empty()) {
        updated.core_.createdAt = std::string(timestamp);
    }
    return updated;
}

} // namespace realestate
