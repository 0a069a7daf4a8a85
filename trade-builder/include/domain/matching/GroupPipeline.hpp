#pragma once

#include "domain/Order.hpp"
#include "domain/Trade.hpp"
#include "domain/GroupKey.hpp"
#include "domain/Diagnostics.hpp"
#include "domain/TradingCalendar.hpp"
#include "domain/matching/PositionMatcher.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tradebook::domain::matching {

/**
 * @brief Параметры построения, общие для всех групп пользователя
 */
struct PipelineContext {
    std::string userId;
    TradingCalendar calendar;
    MatcherOptions matcherOptions;
    std::function<std::string()> idGenerator;
};

/**
 * @brief Итог обработки одной группы: либо сделки, либо проблема
 */
struct GroupOutcome {
    GroupKey key;
    std::vector<Trade> trades;
    std::optional<GroupProblem> problem;

    bool ok() const {
        return !problem.has_value();
    }
};

/**
 * @brief Sequencer output -> PositionMatcher -> TradeAggregator для одной группы
 *
 * Чистая функция: не обращается к хранилищам. Если передана открытая
 * сделка (continuation), её аллокации сначала проигрываются заново, так
 * что автомат оказывается ровно в том состоянии, в котором его оставила
 * бы полная пересборка. Первая получившаяся сделка сохраняет id
 * продолжаемой.
 *
 * Исключения не выходят наружу: они превращаются в GroupProblem,
 * и частично построенные сделки отбрасываются.
 */
class GroupPipeline {
public:
    static GroupOutcome run(const GroupKey& key,
                            const std::vector<Order>& orders,
                            const std::optional<Trade>& continuation,
                            const PipelineContext& context);

    static Execution toExecution(const Order& order);
    static Execution toExecution(const Trade& trade, const OrderAllocation& allocation);
};

} // namespace tradebook::domain::matching
