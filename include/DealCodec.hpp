#pragma once

#include "Deal.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace realestate {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════════
// DealCodec - чтение и запись сделки в JSON
//
// Поля записи повторяют плоскую схему анализа: analysis_type, purchase_price,
// monthly_rent, <slot>_loan_amount и т.д. Числа принимаются как числом, так и
// строкой; пустая строка и null означают отсутствие значения.
// ═══════════════════════════════════════════════════════════════════════════════

class DealCodec {
public:
    static std::expected<Deal, std::string> fromJson(const json& j);

    static json toJson(const Deal& deal);

    static std::expected<Deal, std::string> loadFromFile(
        const std::filesystem::path& path);
};

} // namespace realestate
