#include "PropertyCatalog.hpp"
#include <fstream>

namespace realestate {

std::expected<PropertyFacts, std::string> PropertyCatalog::propertyFromJson(const json& j)
{
    try {
        PropertyFacts facts;
        facts.propertyId = j.at("property_id").get<std::string>();
        if (facts.propertyId.empty()) {
            return std::unexpected("property_id cannot be empty");
        }

        std::string purchaseDate = j.value("purchase_date", "");
        if (!purchaseDate.empty()) {
            auto date = parseDate(purchaseDate);
            if (!date) {
                return std::unexpected("purchase_date of " + facts.propertyId +
                                       ": " + date.error());
            }
            facts.purchaseDate = *date;
        }

        facts.purchasePrice = j.value("purchase_price", 0.0);
        facts.downPayment = j.value("down_payment", 0.0);
        facts.closingCosts = j.value("closing_costs", 0.0);
        facts.renovationCosts = j.value("renovation_costs", 0.0);
        facts.marketingCosts = j.value("marketing_costs", 0.0);
        facts.holdingCosts = j.value("holding_costs", 0.0);

        return facts;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Invalid property record: ") + e.what());
    }
}

std::expected<PropertyCatalogData, std::string> PropertyCatalog::fromJson(const json& j)
{
    PropertyCatalogData data;

    const json* list = &j;
    if (j.is_object()) {
        if (!j.contains("properties")) {
            return std::unexpected("Property catalog must contain 'properties'");
        }
        list = &j.at("properties");

        if (j.contains("kpi_rules")) {
            try {
                const auto& rules = j.at("kpi_rules");
                if (rules.contains("non_operating_expense_categories")) {
                    data.rules.nonOperatingExpenseCategories.clear();
                    for (const auto& c : rules.at("non_operating_expense_categories")) {
                        data.rules.nonOperatingExpenseCategories.insert(c.get<std::string>());
                    }
                }
                if (rules.contains("non_operating_income_categories")) {
                    data.rules.nonOperatingIncomeCategories.clear();
                    for (const auto& c : rules.at("non_operating_income_categories")) {
                        data.rules.nonOperatingIncomeCategories.insert(c.get<std::string>());
                    }
                }
                data.rules.mortgageCategory =
                    rules.value("mortgage_category", data.rules.mortgageCategory);
            } catch (const std::exception& e) {
                return std::unexpected(std::string("Invalid kpi_rules: ") + e.what());
            }
        }
    }

    if (!list->is_array()) {
        return std::unexpected("Property catalog 'properties' must be an array");
    }

    for (const auto& item : *list) {
        auto facts = propertyFromJson(item);
        if (!facts) {
            return std::unexpected(facts.error());
        }
        data.properties.push_back(std::move(*facts));
    }

    return data;
}

std::expected<PropertyCatalogData, std::string> PropertyCatalog::loadFromFile(
    const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file) {
        return std::unexpected("Failed to open property catalog: " + path.string());
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected("Failed to parse property catalog: " + path.string());
    }

    return fromJson(j);
}

} // namespace realestate
