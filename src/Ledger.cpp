#include "Ledger.hpp"
#include <algorithm>
#include <cctype>

namespace realestate {

std::string_view toString(TransactionType type) noexcept
{
    return type == TransactionType::Income ? "income" : "expense";
}

std::expected<TransactionType, std::string> parseTransactionType(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "income") {
        return TransactionType::Income;
    }
    if (lower == "expense") {
        return TransactionType::Expense;
    }

    return std::unexpected("Unknown transaction type: '" + std::string(name) +
                           "' (expected income or expense)");
}

} // namespace realestate
