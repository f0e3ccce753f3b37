#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace realestate {

// Календарная дата без времени
using Date = std::chrono::sys_days;

// Разбор даты в формате YYYY-MM-DD
std::expected<Date, std::string> parseDate(std::string_view dateStr);

// Дата в формате YYYY-MM-DD
std::string formatDate(const Date& date);

// Ключ месяца в формате YYYY-MM
std::string monthKey(const Date& date);

// Текущая дата (UTC)
Date today();

// Метка времени для записей: YYYY-MM-DD HH:MM:SS (локальное время)
std::string currentTimestamp();

} // namespace realestate
