#pragma once

#include "IDealRepository.hpp"
#include <filesystem>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// DealRepository - один JSON-файл на сделку: <dir>/<id>.json
// ═══════════════════════════════════════════════════════════════════════════════

class DealRepository : public IDealRepository {
public:
    // Пустой путь: $REALESTATE_DATA_DIR/deals или ~/.realestate/deals
    explicit DealRepository(const std::string& dealsDir = "");
    ~DealRepository() override = default;

    std::expected<Deal, std::string> saveDeal(const Deal& deal) override;

    std::expected<Deal, std::string> getDeal(std::string_view id) override;

    std::expected<std::vector<std::string>, std::string> listDeals(
        std::string_view userFilter = "") override;

    std::expected<void, std::string> deleteDeal(std::string_view id) override;

    const std::filesystem::path& directory() const noexcept { return dealsDir_; }

    // Каталог данных приложения
    static std::filesystem::path defaultDataDirectory();

private:
    std::filesystem::path dealsDir_;

    std::filesystem::path getDealFilePath(std::string_view id) const;
};

} // namespace realestate
