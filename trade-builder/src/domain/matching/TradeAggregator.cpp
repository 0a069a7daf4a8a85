#include "domain/matching/TradeAggregator.hpp"
#include "domain/exceptions/TradeBookException.hpp"

namespace tradebook::domain::matching {

TradeAggregator::TradeAggregator(GroupKey key, TradeContext context)
    : key_(std::move(key)), context_(std::move(context)) {}

void TradeAggregator::reuseIdForNextTrade(const std::string& id) {
    reservedId_ = id;
}

const Trade* TradeAggregator::current() const {
    return current_ ? &*current_ : nullptr;
}

std::vector<Trade> TradeAggregator::takeTrades() {
    std::vector<Trade> trades = std::move(finished_);
    finished_.clear();
    if (current_) {
        trades.push_back(std::move(*current_));
        current_.reset();
    }
    return trades;
}

void TradeAggregator::consume(const MatchEvent& event) {
    switch (event.type) {
        case MatchEventType::OPEN:
        case MatchEventType::FLIP:
            startTrade(event);
            break;
        case MatchEventType::SCALE_IN:
            addEntry(event);
            break;
        case MatchEventType::SCALE_OUT:
            addExit(event);
            break;
        case MatchEventType::CLOSE:
            closeTrade(event);
            break;
    }
}

Trade& TradeAggregator::requireCurrent(const MatchEvent& event) {
    if (!current_) {
        throw SequencerContractViolation(
            toString(event.type) + " for order " + event.orderId + " in "
            + key_.toString() + " without an open trade");
    }
    if (current_->side != event.positionSide) {
        throw SequencerContractViolation(
            toString(event.type) + " for order " + event.orderId
            + " does not match the side of trade " + current_->id);
    }
    return *current_;
}

void TradeAggregator::startTrade(const MatchEvent& event) {
    if (current_) {
        throw SequencerContractViolation(
            toString(event.type) + " for order " + event.orderId + " in "
            + key_.toString() + " while trade " + current_->id + " is still open");
    }

    Trade trade;
    if (reservedId_) {
        trade.id = *reservedId_;
        reservedId_.reset();
    } else {
        trade.id = context_.idGenerator();
    }
    trade.userId = context_.userId;
    trade.accountId = key_.accountId;
    trade.symbol = key_.symbol;
    trade.assetClass = context_.assetClass;
    trade.side = event.positionSide;
    trade.status = TradeStatus::OPEN;
    trade.entryAt = event.executedAt;
    trade.marketSession = context_.calendar.classifySession(event.executedAt);
    trade.holdingPeriod = HoldingPeriod::INTRADAY;

    current_ = std::move(trade);
    addEntry(event);
}

void TradeAggregator::addEntry(const MatchEvent& event) {
    Trade& trade = requireCurrent(event);
    const Decimal notional = event.quantity * event.price;

    trade.openQuantity += event.quantity;
    trade.costBasis += notional;
    trade.openCost += notional;
    trade.openCharges += event.commission + event.fees;
    trade.commissionsTotal += event.commission;
    trade.feesTotal += event.fees;
    trade.avgEntryPrice = trade.costBasis / trade.openQuantity;

    attachOrder(event.orderId);
    trade.allocations.push_back(OrderAllocation{
        event.orderId, AllocationRole::ENTRY, event.quantity, event.orderQuantity,
        event.price, event.commission, event.fees, event.executedAt});
}

void TradeAggregator::addExit(const MatchEvent& event) {
    Trade& trade = requireCurrent(event);
    const Decimal remaining = trade.remainingQuantity();
    if (event.quantity > remaining) {
        throw SequencerContractViolation(
            "exit of " + event.quantity.toString() + " exceeds remaining "
            + remaining.toString() + " in trade " + trade.id);
    }

    const Decimal exitNotional = event.quantity * event.price;
    const Decimal releasedCharges = (event.quantity == remaining)
        ? trade.openCharges
        : trade.openCharges.mulDiv(event.quantity, remaining);

    const Decimal gross = exitNotional - event.releasedCost;
    const Decimal directional = trade.side == TradeSide::LONG ? gross : -gross;

    trade.realizedPnl += directional - releasedCharges - event.commission - event.fees;
    trade.closeQuantity += event.quantity;
    trade.proceeds += exitNotional;
    trade.openCost -= event.releasedCost;
    trade.openCharges -= releasedCharges;
    trade.commissionsTotal += event.commission;
    trade.feesTotal += event.fees;

    attachOrder(event.orderId);
    trade.allocations.push_back(OrderAllocation{
        event.orderId, AllocationRole::EXIT, event.quantity, event.orderQuantity,
        event.price, event.commission, event.fees, event.executedAt});
}

void TradeAggregator::closeTrade(const MatchEvent& event) {
    Trade& trade = requireCurrent(event);
    if (!trade.remainingQuantity().isZero()) {
        throw SequencerContractViolation(
            "CLOSE for trade " + trade.id + " with remaining quantity "
            + trade.remainingQuantity().toString());
    }

    trade.status = TradeStatus::CLOSED;
    trade.avgExitPrice = trade.proceeds / trade.closeQuantity;
    trade.exitAt = event.executedAt;
    trade.timeInTradeSeconds = trade.entryAt.secondsUntil(event.executedAt);
    trade.holdingPeriod = context_.calendar.classifyHolding(trade.entryAt, event.executedAt);
    trade.openCost = Decimal();
    trade.openCharges = Decimal();

    finished_.push_back(std::move(trade));
    current_.reset();
}

void TradeAggregator::attachOrder(const std::string& orderId) {
    Trade& trade = *current_;
    if (!trade.containsOrder(orderId)) {
        trade.ordersInTrade.push_back(orderId);
        trade.executionsCount = static_cast<int>(trade.ordersInTrade.size());
    }
}

} // namespace tradebook::domain::matching
