#pragma once

#include "domain/Order.hpp"
#include "domain/GroupKey.hpp"
#include "domain/Diagnostics.hpp"
#include <map>
#include <vector>
#include <optional>

namespace tradebook::domain::matching {

/**
 * @brief Результат секвенсора: упорядоченные группы и отсеянные ордера
 *
 * Группы лежат в std::map, поэтому обходятся в лексикографическом
 * порядке ключа (счёт, тикер).
 */
struct SequencedOrders {
    std::map<GroupKey, std::vector<Order>> groups;
    std::vector<SkippedOrder> skipped;

    size_t orderCount() const {
        size_t count = 0;
        for (const auto& [key, orders] : groups) {
            count += orders.size();
        }
        return count;
    }
};

/**
 * @brief Проверяет, дедуплицирует и упорядочивает исполнения пользователя
 *
 * Внутри группы порядок полный: executedAt, затем sequence, затем id.
 * Некорректный ордер не прерывает работу, а попадает в skipped
 * и пишется в лог.
 */
class OrderSequencer {
public:
    static SequencedOrders sequence(const std::vector<Order>& orders);

    /**
     * @brief Причина, по которой ордер нельзя сопоставлять (без проверки дубликатов)
     */
    static std::optional<SkipReason> validate(const Order& order);

    /**
     * @brief Строгий порядок исполнений внутри группы
     */
    static bool executesBefore(const Order& a, const Order& b);
};

} // namespace tradebook::domain::matching
