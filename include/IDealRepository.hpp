#pragma once

#include "Deal.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace realestate {

// ═══════════════════════════════════════════════════════════════════════════════
// Deal Repository Interface
// ═══════════════════════════════════════════════════════════════════════════════

class IDealRepository {
public:
    virtual ~IDealRepository() = default;

    // Создать или перезаписать запись, проставив метки времени.
    // Возвращает сохранённую версию.
    virtual std::expected<Deal, std::string> saveDeal(const Deal& deal) = 0;

    virtual std::expected<Deal, std::string> getDeal(std::string_view id) = 0;

    // Идентификаторы сделок, при непустом userFilter - только этого пользователя
    virtual std::expected<std::vector<std::string>, std::string> listDeals(
        std::string_view userFilter = "") = 0;

    virtual std::expected<void, std::string> deleteDeal(std::string_view id) = 0;

    // Disable copy
    IDealRepository(const IDealRepository&) = delete;
    IDealRepository& operator=(const IDealRepository&) = delete;

protected:
    IDealRepository() = default;
};

} // namespace realestate
