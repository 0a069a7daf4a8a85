#include "domain/matching/PositionMatcher.hpp"
#include "domain/exceptions/TradeBookException.hpp"

namespace tradebook::domain::matching {

namespace {

TradeSide sideOf(PositionState state) {
    return state == PositionState::SHORT_OPEN ? TradeSide::SHORT : TradeSide::LONG;
}

OrderSide openingSide(PositionState state) {
    return state == PositionState::SHORT_OPEN ? OrderSide::SELL : OrderSide::BUY;
}

} // namespace

PositionMatcher::PositionMatcher(GroupKey key, MatcherOptions options)
    : key_(std::move(key)), options_(options) {}

Decimal PositionMatcher::basis() const {
    if (quantity_.isZero()) {
        return Decimal();
    }
    return openCost_ / quantity_;
}

MatchEvent PositionMatcher::makeEvent(MatchEventType type, const Execution& execution, TradeSide side) const {
    MatchEvent event;
    event.type = type;
    event.orderId = execution.orderId;
    event.positionSide = side;
    event.orderQuantity = execution.orderQuantity;
    event.price = execution.price;
    event.executedAt = execution.executedAt;
    return event;
}

void PositionMatcher::open(const Execution& execution, const Decimal& quantity,
                           const Decimal& commission, const Decimal& fees,
                           bool split, MatchEventType type, std::vector<MatchEvent>& events) {
    if (type != MatchEventType::SCALE_IN) {
        state_ = execution.side == OrderSide::BUY ? PositionState::LONG_OPEN : PositionState::SHORT_OPEN;
    }

    quantity_ += quantity;
    openCost_ += quantity * execution.price;

    MatchEvent event = makeEvent(type, execution, sideOf(state_));
    event.quantity = quantity;
    event.commission = commission;
    event.fees = fees;
    event.split = split;
    events.push_back(event);
}

std::vector<MatchEvent> PositionMatcher::apply(const Execution& execution) {
    if (!execution.quantity.isPositive()) {
        throw SequencerContractViolation(
            "order " + execution.orderId + " in " + key_.toString()
            + " has non-positive quantity " + execution.quantity.toString());
    }

    std::vector<MatchEvent> events;

    if (state_ == PositionState::FLAT) {
        if (execution.side == OrderSide::SELL && !options_.allowShortFromFlat) {
            throw ReconciliationRequiredException(
                "sell order " + execution.orderId + " in " + key_.toString()
                + " has no open position to close");
        }
        open(execution, execution.quantity, execution.commission, execution.fees,
             false, MatchEventType::OPEN, events);
        return events;
    }

    if (execution.side == openingSide(state_)) {
        open(execution, execution.quantity, execution.commission, execution.fees,
             false, MatchEventType::SCALE_IN, events);
        return events;
    }

    // Встречное исполнение: закрываем не больше открытого объёма
    const TradeSide closingSide = sideOf(state_);
    const Decimal closed = min(execution.quantity, quantity_);
    const bool flips = execution.quantity > quantity_;

    Decimal closeCommission = execution.commission;
    Decimal closeFees = execution.fees;
    if (flips) {
        closeCommission = execution.commission.mulDiv(closed, execution.quantity);
        closeFees = execution.fees.mulDiv(closed, execution.quantity);
    }

    const Decimal released = (closed == quantity_) ? openCost_ : openCost_.mulDiv(closed, quantity_);

    MatchEvent scaleOut = makeEvent(MatchEventType::SCALE_OUT, execution, closingSide);
    scaleOut.quantity = closed;
    scaleOut.commission = closeCommission;
    scaleOut.fees = closeFees;
    scaleOut.releasedCost = released;
    scaleOut.split = flips;
    events.push_back(scaleOut);

    quantity_ -= closed;
    openCost_ -= released;

    if (!quantity_.isZero()) {
        return events;
    }

    state_ = PositionState::FLAT;
    openCost_ = Decimal();
    events.push_back(makeEvent(MatchEventType::CLOSE, execution, closingSide));

    if (flips) {
        open(execution, execution.quantity - closed,
             execution.commission - closeCommission, execution.fees - closeFees,
             true, MatchEventType::FLIP, events);
    }
    return events;
}

} // namespace tradebook::domain::matching
