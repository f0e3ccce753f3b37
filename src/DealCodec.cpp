#include "DealCodec.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <utility>

namespace realestate {

namespace {

// ═══════════════════════════════════════════════════════════════════════════════
// FieldReader - чтение полей с запоминанием первой ошибки
// ═══════════════════════════════════════════════════════════════════════════════

class FieldReader {
public:
    explicit FieldReader(const json& j, std::string prefix = "")
        : j_(j), prefix_(std::move(prefix)) {}

    std::optional<double> number(std::string_view key)
    {
        const json* value = find(key);
        if (!value) {
            return std::nullopt;
        }

        if (value->is_number()) {
            return value->get<double>();
        }

        if (value->is_string()) {
            std::string text = trim(value->get<std::string>());
            if (text.empty()) {
                return std::nullopt;
            }
            try {
                std::size_t idx = 0;
                double parsed = std::stod(text, &idx);
                if (idx == text.size() && std::isfinite(parsed)) {
                    return parsed;
                }
            } catch (const std::exception& e) {
                fail(field(key) + " must be numeric (" + e.what() + ")");
                return std::nullopt;
            }
        }

        fail(field(key) + " must be numeric");
        return std::nullopt;
    }

    double money(std::string_view key)
    {
        return number(key).value_or(0.0);
    }

    std::optional<int> integer(std::string_view key)
    {
        auto value = number(key);
        if (!value) {
            return std::nullopt;
        }
        if (std::floor(*value) != *value) {
            fail(field(key) + " must be a whole number");
            return std::nullopt;
        }
        if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
            fail(field(key) + " is out of range");
            return std::nullopt;
        }
        return static_cast<int>(*value);
    }

    bool flag(std::string_view key)
    {
        const json* value = find(key);
        if (!value) {
            return false;
        }

        if (value->is_boolean()) {
            return value->get<bool>();
        }
        if (value->is_number()) {
            return value->get<double>() != 0.0;
        }
        if (value->is_string()) {
            std::string text = trim(value->get<std::string>());
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            if (text == "true" || text == "1" || text == "yes" || text == "on") {
                return true;
            }
            if (text.empty() || text == "false" || text == "0" ||
                text == "no" || text == "off") {
                return false;
            }
        }

        fail(field(key) + " must be a boolean");
        return false;
    }

    std::string text(std::string_view key)
    {
        const json* value = find(key);
        if (!value) {
            return "";
        }
        if (value->is_string()) {
            return value->get<std::string>();
        }
        fail(field(key) + " must be a string");
        return "";
    }

    const json* find(std::string_view key) const
    {
        auto it = j_.find(std::string(key));
        if (it == j_.end() || it->is_null()) {
            return nullptr;
        }
        return &(*it);
    }

    void fail(std::string message)
    {
        if (!error_) {
            error_ = std::move(message);
        }
    }

    const std::optional<std::string>& error() const noexcept { return error_; }

private:
    std::string field(std::string_view key) const
    {
        return prefix_ + std::string(key);
    }

    static std::string trim(const std::string& s)
    {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    const json& j_;
    std::string prefix_;
    std::optional<std::string> error_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Чтение составных частей
// ─────────────────────────────────────────────────────────────────────────────

std::optional<LoanSpec> readLoan(FieldReader& reader, LoanSlot slot)
{
    std::string prefix = std::string(toString(slot)) + "_loan_";

    auto amount = reader.number(prefix + "amount");
    if (!amount || *amount <= 0.0) {
        return std::nullopt;
    }

    auto rate = reader.number(prefix + "interest_rate");
    if (!rate) {
        reader.fail(prefix + "interest_rate is required when " + prefix + "amount is set");
        return std::nullopt;
    }

    int term = reader.integer(prefix + "term").value_or(360);
    double downPayment = reader.money(prefix + "down_payment");
    double closingCosts = reader.money(prefix + "closing_costs");
    bool interestOnly = reader.flag(std::string(toString(slot)) + "_interest_only");

    std::string name = reader.text(prefix + "name");
    if (name.empty()) {
        name = std::string(toString(slot));
    }

    auto loan = LoanSpec::create(name, *amount, *rate, term,
                                 downPayment, closingCosts, interestOnly);
    if (!loan) {
        reader.fail(prefix + loan.error());
        return std::nullopt;
    }

    return *loan;
}

std::vector<UnitType> readUnitTypes(FieldReader& reader)
{
    std::vector<UnitType> units;

    const json* raw = reader.find("unit_types");
    if (!raw) {
        return units;
    }

    // unit_types может храниться как JSON-строка
    json parsed;
    if (raw->is_string()) {
        if (raw->get<std::string>().empty()) {
            return units;
        }
        parsed = json::parse(raw->get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) {
            reader.fail("unit_types must be valid JSON");
            return units;
        }
    } else {
        parsed = *raw;
    }

    if (!parsed.is_array()) {
        reader.fail("unit_types must be an array");
        return units;
    }

    for (std::size_t i = 0; i < parsed.size(); ++i) {
        const auto& item = parsed[i];
        std::string prefix = "unit_types[" + std::to_string(i) + "]";

        if (!item.is_object()) {
            reader.fail(prefix + " must be an object");
            return units;
        }

        FieldReader unitReader(item, prefix + ".");
        UnitType unit;
        unit.name = unitReader.text("type");
        if (unit.name.empty()) {
            unit.name = unitReader.text("name");
        }
        unit.count = unitReader.integer("count").value_or(0);
        unit.rent = unitReader.money("rent");
        unit.squareFootage = unitReader.integer("square_footage");

        if (unitReader.error()) {
            reader.fail(*unitReader.error());
            return units;
        }

        units.push_back(std::move(unit));
    }

    return units;
}

StrategyTerms readTerms(FieldReader& reader, StrategyType type)
{
    switch (type) {
        case StrategyType::Brrrr: {
            BrrrrTerms terms;
            terms.refinanceLtvPercent = reader.number("refinance_ltv_percentage");
            return terms;
        }
        case StrategyType::LeaseOption: {
            LeaseOptionTerms terms;
            terms.optionConsiderationFee = reader.number("option_consideration_fee");
            terms.optionTermMonths = reader.integer("option_term_months");
            terms.strikePrice = reader.number("strike_price");
            terms.monthlyRentCreditPercent = reader.number("monthly_rent_credit_percentage");
            terms.rentCreditCap = reader.number("rent_credit_cap");
            return terms;
        }
        case StrategyType::MultiFamily: {
            MultiFamilyTerms terms;
            terms.totalUnits = reader.integer("total_units");
            terms.occupiedUnits = reader.integer("occupied_units");
            terms.floors = reader.integer("floors").value_or(0);
            terms.unitTypes = readUnitTypes(reader);
            terms.otherIncome = reader.money("other_income");
            terms.commonAreaMaintenance = reader.money("common_area_maintenance");
            terms.elevatorMaintenance = reader.money("elevator_maintenance");
            terms.staffPayroll = reader.money("staff_payroll");
            terms.trashRemoval = reader.money("trash_removal");
            terms.commonUtilities = reader.money("common_utilities");
            return terms;
        }
        case StrategyType::PadSplit: {
            PadSplitTerms terms;
            terms.roomCount = reader.integer("room_count");
            terms.averageRoomRent = reader.number("average_room_rent");
            terms.platformPercent = reader.number("padsplit_platform_percentage");
            return terms;
        }
        case StrategyType::LongTermRental:
            break;
    }
    return LongTermRentalTerms{};
}

// ─────────────────────────────────────────────────────────────────────────────
// Запись
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value)
{
    if (value) {
        j[key] = *value;
    }
}

void writeTerms(json& j, const StrategyTerms& terms)
{
    if (const auto* brrrr = std::get_if<BrrrrTerms>(&terms)) {
        putOptional(j, "refinance_ltv_percentage", brrrr->refinanceLtvPercent);
    } else if (const auto* lease = std::get_if<LeaseOptionTerms>(&terms)) {
        putOptional(j, "option_consideration_fee", lease->optionConsiderationFee);
        putOptional(j, "option_term_months", lease->optionTermMonths);
        putOptional(j, "strike_price", lease->strikePrice);
        putOptional(j, "monthly_rent_credit_percentage", lease->monthlyRentCreditPercent);
        putOptional(j, "rent_credit_cap", lease->rentCreditCap);
    } else if (const auto* mf = std::get_if<MultiFamilyTerms>(&terms)) {
        putOptional(j, "total_units", mf->totalUnits);
        putOptional(j, "occupied_units", mf->occupiedUnits);
        j["floors"] = mf->floors;
        j["other_income"] = mf->otherIncome;
        j["common_area_maintenance"] = mf->commonAreaMaintenance;
        j["elevator_maintenance"] = mf->elevatorMaintenance;
        j["staff_payroll"] = mf->staffPayroll;
        j["trash_removal"] = mf->trashRemoval;
        j["common_utilities"] = mf->commonUtilities;

        json units = json::array();
        for (const auto& unit : mf->unitTypes) {
            json u;
            u["type"] = unit.name;
            u["count"] = unit.count;
            u["rent"] = unit.rent;
            putOptional(u, "square_footage", unit.squareFootage);
            units.push_back(u);
        }
        j["unit_types"] = units;
    } else if (const auto* pad = std::get_if<PadSplitTerms>(&terms)) {
        putOptional(j, "room_count", pad->roomCount);
        putOptional(j, "average_room_rent", pad->averageRoomRent);
        putOptional(j, "padsplit_platform_percentage", pad->platformPercent);
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// DealCodec
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<Deal, std::string> DealCodec::fromJson(const json& j)
{
    if (!j.is_object()) {
        return std::unexpected("Deal record must be a JSON object");
    }

    try {
        FieldReader reader(j);

        std::string typeName = reader.text("analysis_type");
        if (typeName.empty()) {
            return std::unexpected(
                reader.error() ? *reader.error() : std::string("analysis_type is required"));
        }

        auto type = parseStrategyType(typeName);
        if (!type) {
            return std::unexpected(type.error());
        }

        DealCore core;
        core.id = reader.text("id");
        core.userId = reader.text("user_id");
        core.name = reader.text("analysis_name");

        core.property.address = reader.text("address");
        core.property.propertyType = reader.text("property_type");
        core.property.squareFootage = reader.integer("square_footage");
        core.property.lotSize = reader.number("lot_size");
        core.property.yearBuilt = reader.integer("year_built");
        core.property.bedrooms = reader.integer("bedrooms");
        core.property.bathrooms = reader.number("bathrooms");

        auto purchasePrice = reader.number("purchase_price");
        if (!purchasePrice && !reader.error()) {
            return std::unexpected("purchase_price is required");
        }
        core.purchasePrice = purchasePrice.value_or(0.0);
        core.monthlyRent = reader.number("monthly_rent");

        core.acquisition.closingCosts = reader.money("closing_costs");
        core.acquisition.cashToSeller = reader.money("cash_to_seller");
        core.acquisition.assignmentFee = reader.money("assignment_fee");
        core.acquisition.marketingCosts = reader.money("marketing_costs");
        core.acquisition.furnishingCosts = reader.money("furnishing_costs");

        core.rehab.afterRepairValue = reader.number("after_repair_value");
        core.rehab.renovationCosts = reader.number("renovation_costs");
        core.rehab.durationMonths = reader.integer("renovation_duration");

        core.expenses.propertyTaxesAnnual = reader.money("property_taxes");
        core.expenses.insuranceAnnual = reader.money("insurance");
        core.expenses.hoaMonthly = reader.money("hoa_coa_coop");
        core.expenses.utilities = reader.money("utilities");
        core.expenses.internet = reader.money("internet");
        core.expenses.cleaning = reader.money("cleaning");
        core.expenses.pestControl = reader.money("pest_control");
        core.expenses.landscaping = reader.money("landscaping");
        core.expenses.managementPercent = reader.money("management_fee_percentage");
        core.expenses.capexPercent = reader.money("capex_percentage");
        core.expenses.vacancyPercent = reader.money("vacancy_percentage");
        core.expenses.repairsPercent = reader.money("repairs_percentage");

        for (auto slot : kAllLoanSlots) {
            core.loans.at(slot) = readLoan(reader, slot);
        }

        core.balloon.hasBalloonPayment = reader.flag("has_balloon_payment");
        core.balloon.refinanceLtvPercent = reader.number("balloon_refinance_ltv_percentage");
        std::string dueDate = reader.text("balloon_due_date");
        if (!dueDate.empty()) {
            auto parsed = parseDate(dueDate);
            if (!parsed) {
                return std::unexpected("balloon_due_date: " + parsed.error());
            }
            core.balloon.dueDate = *parsed;
        }

        core.notes = reader.text("notes");
        core.createdAt = reader.text("created_at");
        core.updatedAt = reader.text("updated_at");

        StrategyTerms terms = readTerms(reader, *type);

        if (reader.error()) {
            return std::unexpected(*reader.error());
        }

        return Deal::create(std::move(core), std::move(terms));

    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid deal record: ") + e.what());
    }
}

json DealCodec::toJson(const Deal& deal)
{
    const auto& core = deal.core();

    json j;
    j["id"] = core.id;
    j["user_id"] = core.userId;
    j["analysis_type"] = std::string(toString(deal.strategy()));
    j["analysis_name"] = core.name;

    j["address"] = core.property.address;
    j["property_type"] = core.property.propertyType;
    putOptional(j, "square_footage", core.property.squareFootage);
    putOptional(j, "lot_size", core.property.lotSize);
    putOptional(j, "year_built", core.property.yearBuilt);
    putOptional(j, "bedrooms", core.property.bedrooms);
    putOptional(j, "bathrooms", core.property.bathrooms);

    j["purchase_price"] = core.purchasePrice;
    putOptional(j, "monthly_rent", core.monthlyRent);

    j["closing_costs"] = core.acquisition.closingCosts;
    j["cash_to_seller"] = core.acquisition.cashToSeller;
    j["assignment_fee"] = core.acquisition.assignmentFee;
    j["marketing_costs"] = core.acquisition.marketingCosts;
    j["furnishing_costs"] = core.acquisition.furnishingCosts;

    putOptional(j, "after_repair_value", core.rehab.afterRepairValue);
    putOptional(j, "renovation_costs", core.rehab.renovationCosts);
    putOptional(j, "renovation_duration", core.rehab.durationMonths);

    j["property_taxes"] = core.expenses.propertyTaxesAnnual;
    j["insurance"] = core.expenses.insuranceAnnual;
    j["hoa_coa_coop"] = core.expenses.hoaMonthly;
    j["utilities"] = core.expenses.utilities;
    j["internet"] = core.expenses.internet;
    j["cleaning"] = core.expenses.cleaning;
    j["pest_control"] = core.expenses.pestControl;
    j["landscaping"] = core.expenses.landscaping;
    j["management_fee_percentage"] = core.expenses.managementPercent;
    j["capex_percentage"] = core.expenses.capexPercent;
    j["vacancy_percentage"] = core.expenses.vacancyPercent;
    j["repairs_percentage"] = core.expenses.repairsPercent;

    for (auto slot : kAllLoanSlots) {
        const auto& loan = core.loans.at(slot);
        if (!loan) {
            continue;
        }
        std::string prefix = std::string(toString(slot)) + "_loan_";
        j[prefix + "name"] = loan->name();
        j[prefix + "amount"] = loan->principal();
        j[prefix + "interest_rate"] = loan->annualRate();
        j[prefix + "term"] = loan->termMonths();
        j[prefix + "down_payment"] = loan->downPayment();
        j[prefix + "closing_costs"] = loan->closingCosts();
        j[std::string(toString(slot)) + "_interest_only"] = loan->isInterestOnly();
    }

    j["has_balloon_payment"] = core.balloon.hasBalloonPayment;
    if (core.balloon.dueDate) {
        j["balloon_due_date"] = formatDate(*core.balloon.dueDate);
    }
    putOptional(j, "balloon_refinance_ltv_percentage", core.balloon.refinanceLtvPercent);

    writeTerms(j, deal.terms());

    j["notes"] = core.notes;
    j["created_at"] = core.createdAt;
    j["updated_at"] = core.updatedAt;

    return j;
}

std::expected<Deal, std::string> DealCodec::loadFromFile(
    const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file) {
        return std::unexpected("Failed to open deal file: " + path.string());
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected("Failed to parse deal file: " + path.string());
    }

    return fromJson(j);
}

} // namespace realestate
