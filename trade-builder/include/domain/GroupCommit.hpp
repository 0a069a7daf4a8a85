#pragma once

#include "GroupKey.hpp"
#include "Trade.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace tradebook::domain {

/**
 * @brief Привязка ордера к сделке
 */
struct OrderTag {
    std::string orderId;
    std::string tradeId;
};

/**
 * @brief Всё, что нужно записать для одной группы одной транзакцией
 *
 * Сделки записываются целиком (upsert по id), затем ордера получают
 * usedInTrade = true и tradeId. Для ордера разворота tradeId указывает
 * на последнюю из двух сделок.
 */
struct GroupCommit {
    std::string userId;
    GroupKey key;
    std::vector<Trade> trades;
    std::vector<OrderTag> tags;

    static GroupCommit fromTrades(const std::string& userId, const GroupKey& key, std::vector<Trade> trades) {
        GroupCommit commit;
        commit.userId = userId;
        commit.key = key;
        for (const Trade& trade : trades) {
            for (const std::string& orderId : trade.ordersInTrade) {
                auto it = std::find_if(commit.tags.begin(), commit.tags.end(),
                    [&orderId](const OrderTag& tag) { return tag.orderId == orderId; });
                if (it == commit.tags.end()) {
                    commit.tags.push_back(OrderTag{orderId, trade.id});
                } else {
                    it->tradeId = trade.id;
                }
            }
        }
        commit.trades = std::move(trades);
        return commit;
    }
};

} // namespace tradebook::domain
