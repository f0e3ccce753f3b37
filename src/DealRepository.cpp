#include "DealRepository.hpp"
#include "DealCodec.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace realestate {

std::filesystem::path DealRepository::defaultDataDirectory()
{
    if (const char* dataDir = std::getenv("REALESTATE_DATA_DIR")) {
        return std::filesystem::path(dataDir);
    }

    const char* homeDir = std::getenv("HOME");
    if (!homeDir) {
        homeDir = ".";
    }
    return std::filesystem::path(homeDir) / ".realestate";
}

DealRepository::DealRepository(const std::string& dealsDir)
{
    if (dealsDir.empty()) {
        dealsDir_ = defaultDataDirectory() / "deals";
    } else {
        dealsDir_ = dealsDir;
    }

    // Создаем директорию если не существует
    std::error_code ec;
    std::filesystem::create_directories(dealsDir_, ec);
    if (ec) {
        std::cerr << "⚠ Cannot create deals directory " << dealsDir_
                  << ": " << ec.message() << std::endl;
    }
}

std::filesystem::path DealRepository::getDealFilePath(std::string_view id) const
{
    return dealsDir_ / (std::string(id) + ".json");
}

std::expected<Deal, std::string> DealRepository::saveDeal(const Deal& deal)
{
    if (deal.id().empty()) {
        return std::unexpected("Deal id cannot be empty");
    }

    if (deal.id().find_first_of("/\\") != std::string::npos) {
        return std::unexpected("Deal id cannot contain path separators: " + deal.id());
    }

    auto filePath = getDealFilePath(deal.id());

    try {
        Deal stamped = deal.withUpdatedTimestamp(currentTimestamp());

        std::ofstream file(filePath);
        if (!file) {
            return std::unexpected("Failed to write deal file: " + filePath.string());
        }

        file << DealCodec::toJson(stamped).dump(2);
        file.close();

        std::cout << "✓ Deal '" << deal.id() << "' saved" << std::endl;
        return stamped;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to save deal: ") + e.what());
    }
}

std::expected<Deal, std::string> DealRepository::getDeal(std::string_view id)
{
    auto filePath = getDealFilePath(id);

    if (!std::filesystem::exists(filePath)) {
        return std::unexpected("Deal '" + std::string(id) + "' not found");
    }

    return DealCodec::loadFromFile(filePath);
}

std::expected<std::vector<std::string>, std::string> DealRepository::listDeals(
    std::string_view userFilter)
{
    std::vector<std::string> deals;

    try {
        if (!std::filesystem::exists(dealsDir_)) {
            return deals;  // Пустой список
        }

        for (const auto& entry : std::filesystem::directory_iterator(dealsDir_)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                continue;
            }

            std::string id = entry.path().stem().string();

            if (!userFilter.empty()) {
                auto deal = DealCodec::loadFromFile(entry.path());
                if (!deal) {
                    std::cout << "⚠ Skipping unreadable deal " << id
                              << ": " << deal.error() << std::endl;
                    continue;
                }
                if (deal->core().userId != userFilter) {
                    continue;
                }
            }

            deals.push_back(id);
        }

        std::sort(deals.begin(), deals.end());
        return deals;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to list deals: ") + e.what());
    }
}

std::expected<void, std::string> DealRepository::deleteDeal(std::string_view id)
{
    auto filePath = getDealFilePath(id);

    if (!std::filesystem::exists(filePath)) {
        return std::unexpected("Deal '" + std::string(id) + "' not found");
    }

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
    if (ec) {
        return std::unexpected("Failed to delete deal: " + ec.message());
    }

    std::cout << "✓ Deal '" << id << "' deleted" << std::endl;
    return {};
}

} // namespace realestate
