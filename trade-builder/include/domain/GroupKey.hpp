#pragma once

#include <string>
#include <tuple>

namespace tradebook::domain {

/**
 * @brief Ключ независимой группы сопоставления: (счёт, тикер)
 */
struct GroupKey {
    std::string accountId;
    std::string symbol;

    GroupKey() = default;

    GroupKey(const std::string& accountId, const std::string& symbol)
        : accountId(accountId), symbol(symbol) {}

    std::string toString() const {
        return accountId + "/" + symbol;
    }

    bool operator==(const GroupKey& other) const {
        return accountId == other.accountId && symbol == other.symbol;
    }

    bool operator!=(const GroupKey& other) const {
        return !(*this == other);
    }

    bool operator<(const GroupKey& other) const {
        return std::tie(accountId, symbol) < std::tie(other.accountId, other.symbol);
    }
};

} // namespace tradebook::domain
