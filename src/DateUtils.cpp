#include "DateUtils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace realestate {

std::expected<Date, std::string> parseDate(std::string_view dateStr)
{
    std::tm tm = {};
    std::istringstream iss{std::string(dateStr)};
    iss >> std::get_time(&tm, "%Y-%m-%d");

    if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
        return std::unexpected("Failed to parse date: " + std::string(dateStr) +
                               ". Expected format: YYYY-MM-DD");
    }

    std::chrono::year_month_day ymd{
        std::chrono::year{tm.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};

    if (!ymd.ok()) {
        return std::unexpected("Invalid calendar date: " + std::string(dateStr));
    }

    return Date{ymd};
}

std::string formatDate(const Date& date)
{
    std::chrono::year_month_day ymd{date};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

std::string monthKey(const Date& date)
{
    std::chrono::year_month_day ymd{date};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month());
    return oss.str();
}

Date today()
{
    return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

std::string currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace realestate
