#include "domain/matching/GroupPipeline.hpp"
#include "domain/matching/TradeAggregator.hpp"
#include "domain/exceptions/TradeBookException.hpp"

#include <iostream>

namespace tradebook::domain::matching {

namespace {

void feed(PositionMatcher& matcher, TradeAggregator& aggregator, const Execution& execution) {
    for (const MatchEvent& event : matcher.apply(execution)) {
        aggregator.consume(event);
    }
}

void replay(const Trade& trade, PositionMatcher& matcher, TradeAggregator& aggregator) {
    if (!trade.isOpen()) {
        throw ReconciliationRequiredException("trade " + trade.id + " is not open and cannot be continued");
    }
    if (trade.allocations.empty() || trade.allocations.front().role != AllocationRole::ENTRY) {
        throw ReconciliationRequiredException("open trade " + trade.id + " has no opening allocation");
    }

    aggregator.reuseIdForNextTrade(trade.id);
    for (const OrderAllocation& allocation : trade.allocations) {
        if (!allocation.quantity.isPositive()) {
            throw ReconciliationRequiredException(
                "open trade " + trade.id + " has a non-positive allocation for order " + allocation.orderId);
        }
        feed(matcher, aggregator, GroupPipeline::toExecution(trade, allocation));
    }

    const Trade* rebuilt = aggregator.current();
    if (rebuilt == nullptr || rebuilt->id != trade.id
        || rebuilt->side != trade.side
        || rebuilt->openQuantity != trade.openQuantity
        || rebuilt->closeQuantity != trade.closeQuantity
        || matcher.openQuantity() != trade.remainingQuantity()) {
        throw ReconciliationRequiredException(
            "open trade " + trade.id + " does not replay to its recorded position");
    }
}

} // namespace

Execution GroupPipeline::toExecution(const Order& order) {
    Execution execution;
    execution.orderId = order.id;
    execution.side = order.side;
    execution.quantity = order.quantity;
    execution.orderQuantity = order.quantity;
    execution.price = order.price;
    execution.commission = order.commission;
    execution.fees = order.fees;
    execution.executedAt = *order.executedAt;
    return execution;
}

Execution GroupPipeline::toExecution(const Trade& trade, const OrderAllocation& allocation) {
    Execution execution;
    execution.orderId = allocation.orderId;
    execution.side = allocation.role == AllocationRole::ENTRY ? trade.entrySide() : opposite(trade.entrySide());
    execution.quantity = allocation.quantity;
    execution.orderQuantity = allocation.orderQuantity;
    execution.price = allocation.price;
    execution.commission = allocation.commission;
    execution.fees = allocation.fees;
    execution.executedAt = allocation.executedAt;
    return execution;
}

GroupOutcome GroupPipeline::run(const GroupKey& key,
                                const std::vector<Order>& orders,
                                const std::optional<Trade>& continuation,
                                const PipelineContext& context) {
    GroupOutcome outcome;
    outcome.key = key;

    try {
        for (const Order& order : orders) {
            if (GroupKey(order.accountId, order.symbol) != key) {
                throw SequencerContractViolation("order " + order.id + " does not belong to group " + key.toString());
            }
            if (!order.executedAt) {
                throw SequencerContractViolation("order " + order.id + " has no execution time");
            }
        }
        if (continuation && continuation->key() != key) {
            throw SequencerContractViolation(
                "trade " + continuation->id + " does not belong to group " + key.toString());
        }
        if (orders.empty() && !continuation) {
            return outcome;
        }

        TradeContext tradeContext;
        tradeContext.userId = context.userId;
        tradeContext.assetClass = continuation ? continuation->assetClass : orders.front().assetClass;
        tradeContext.calendar = context.calendar;
        tradeContext.idGenerator = context.idGenerator;

        TradeAggregator aggregator(key, tradeContext);
        PositionMatcher matcher(key, context.matcherOptions);

        if (continuation) {
            // Сохранённая сделка уже прошла проверки при первом построении
            MatcherOptions permissive = context.matcherOptions;
            permissive.allowShortFromFlat = true;
            matcher.setOptions(permissive);
            replay(*continuation, matcher, aggregator);
            matcher.setOptions(context.matcherOptions);

            // Инкрементальный режим предполагает дописывание в конец истории
            const Timestamp& lastReplayed = continuation->allocations.back().executedAt;
            if (!orders.empty() && *orders.front().executedAt < lastReplayed) {
                throw ReconciliationRequiredException(
                    "order " + orders.front().id + " executed before the last fill of open trade "
                    + continuation->id + ", a full rebuild is required");
            }
        }

        for (const Order& order : orders) {
            feed(matcher, aggregator, toExecution(order));
        }

        outcome.trades = aggregator.takeTrades();
    } catch (const ReconciliationRequiredException& e) {
        std::cerr << "[GroupPipeline] " << key.toString() << ": " << e.what() << std::endl;
        outcome.trades.clear();
        outcome.problem = GroupProblem(key, ProblemKind::RECONCILIATION_REQUIRED, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[GroupPipeline] " << key.toString() << " failed: " << e.what() << std::endl;
        outcome.trades.clear();
        outcome.problem = GroupProblem(key, ProblemKind::GROUP_FAILURE, e.what());
    }

    return outcome;
}

} // namespace tradebook::domain::matching
