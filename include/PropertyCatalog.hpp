#pragma once

#include "PropertyKPIService.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace realestate {

using json = nlohmann::json;

// Объекты и правила категорий, загруженные из одного файла
struct PropertyCatalogData {
    std::vector<PropertyFacts> properties;
    KpiCategoryRules rules = KpiCategoryRules::defaults();
};

// ═══════════════════════════════════════════════════════════════════════════════
// PropertyCatalog - список объектов для PropertyKPIService
//
// Формат: массив объектов или { "properties": [...], "kpi_rules": {...} }
// ═══════════════════════════════════════════════════════════════════════════════

class PropertyCatalog {
public:
    static std::expected<PropertyCatalogData, std::string> fromJson(const json& j);

    static std::expected<PropertyCatalogData, std::string> loadFromFile(
        const std::filesystem::path& path);

    static std::expected<PropertyFacts, std::string> propertyFromJson(const json& j);
};

} // namespace realestate
