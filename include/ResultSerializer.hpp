#pragma once

#include "AmortizationScheduler.hpp"
#include "AnalysisEngine.hpp"
#include "MaximumOfferCalculator.hpp"
#include "PropertyKPIService.hpp"
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace realestate {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════════
// ResultSerializer - вывод результатов в JSON
//
// Все денежные значения проходят через sanitize(): бесконечность и NaN
// превращаются в null, потребитель никогда не видит нечисловых значений.
// ═══════════════════════════════════════════════════════════════════════════════

class ResultSerializer {
public:
    static std::optional<double> sanitize(double value) noexcept;
    static std::optional<double> sanitize(const std::optional<double>& value) noexcept;

    // Число или null
    static json number(double value);
    static json number(const std::optional<double>& value);

    static json toJson(const KpiResult& result);
    static json toJson(const KpiDashboard& dashboard);
    static json toJson(const AnalysisResult& result);
    static json toJson(const OfferBreakdown& offer);
    static json toJson(const AmortizationRow& row);
    static json toJson(const std::vector<AmortizationRow>& rows);
};

} // namespace realestate
