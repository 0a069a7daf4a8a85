#include "domain/matching/OrderSequencer.hpp"

#include <algorithm>
#include <iostream>
#include <tuple>
#include <unordered_map>

namespace tradebook::domain::matching {

std::optional<SkipReason> OrderSequencer::validate(const Order& order) {
    if (order.accountId.empty() || order.symbol.empty()) {
        return SkipReason::MISSING_INSTRUMENT;
    }
    if (order.isCancelled()) {
        return SkipReason::CANCELLED;
    }
    if (!order.executedAt) {
        return SkipReason::MISSING_EXECUTION_TIME;
    }
    if (!order.quantity.isPositive()) {
        return SkipReason::NON_POSITIVE_QUANTITY;
    }
    if (order.price.isNegative()) {
        return SkipReason::NEGATIVE_PRICE;
    }
    if (order.commission.isNegative() || order.fees.isNegative()) {
        return SkipReason::NEGATIVE_CHARGES;
    }
    return std::nullopt;
}

bool OrderSequencer::executesBefore(const Order& a, const Order& b) {
    return std::tie(*a.executedAt, a.sequence, a.id) < std::tie(*b.executedAt, b.sequence, b.id);
}

SequencedOrders OrderSequencer::sequence(const std::vector<Order>& orders) {
    SequencedOrders result;

    // Среди копий одного id побеждает копия с наименьшим sequence
    std::unordered_map<std::string, size_t> winners;
    for (size_t i = 0; i < orders.size(); ++i) {
        auto [it, inserted] = winners.emplace(orders[i].id, i);
        if (!inserted && orders[i].sequence < orders[it->second].sequence) {
            it->second = i;
        }
    }

    for (size_t i = 0; i < orders.size(); ++i) {
        const Order& order = orders[i];

        std::optional<SkipReason> reason;
        if (winners.at(order.id) != i) {
            reason = SkipReason::DUPLICATE;
        } else {
            reason = validate(order);
        }

        if (reason) {
            std::cerr << "[OrderSequencer] Skipping order " << order.id
                      << " (" << order.accountId << "/" << order.symbol << "): "
                      << toString(*reason) << std::endl;
            result.skipped.push_back(SkippedOrder{order.id, order.accountId, order.symbol, *reason});
            continue;
        }

        result.groups[GroupKey(order.accountId, order.symbol)].push_back(order);
    }

    for (auto& [key, group] : result.groups) {
        std::sort(group.begin(), group.end(), executesBefore);
    }

    return result;
}

} // namespace tradebook::domain::matching
