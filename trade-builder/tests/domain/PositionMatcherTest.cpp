#include <gtest/gtest.h>
#include "domain/matching/PositionMatcher.hpp"
#include "domain/exceptions/TradeBookException.hpp"
#include "mocks/OrderBuilder.hpp"

using namespace tradebook::domain;
using namespace tradebook::domain::matching;
using tradebook::tests::dec;

class PositionMatcherTest : public ::testing::Test {
protected:
    PositionMatcher matcher{GroupKey("acc-1", "AAPL")};
    Timestamp at = Timestamp::fromString("2024-03-04T15:00:00Z");

    Execution exec(const std::string& id, OrderSide side, const std::string& qty,
                   const std::string& price, const std::string& commission = "0") {
        Execution e;
        e.orderId = id;
        e.side = side;
        e.quantity = dec(qty);
        e.orderQuantity = dec(qty);
        e.price = dec(price);
        e.commission = dec(commission);
        e.executedAt = at;
        at = at.addMinutes(1);
        return e;
    }

    std::vector<MatchEventType> typesOf(const std::vector<MatchEvent>& events) {
        std::vector<MatchEventType> types;
        for (const auto& e : events) {
            types.push_back(e.type);
        }
        return types;
    }
};

// ================================================================
// OPEN / SCALE / CLOSE
// ================================================================

TEST_F(PositionMatcherTest, BuyFromFlatOpensLong) {
    auto events = matcher.apply(exec("b1", OrderSide::BUY, "100", "10"));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, MatchEventType::OPEN);
    EXPECT_EQ(events[0].positionSide, TradeSide::LONG);
    EXPECT_EQ(matcher.state(), PositionState::LONG_OPEN);
    EXPECT_EQ(matcher.openQuantity(), dec("100"));
    EXPECT_EQ(matcher.basis(), dec("10"));
}

TEST_F(PositionMatcherTest, ScaleInUsesWeightedBasis) {
    matcher.apply(exec("b1", OrderSide::BUY, "100", "10"));
    auto events = matcher.apply(exec("b2", OrderSide::BUY, "50", "13"));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, MatchEventType::SCALE_IN);
    EXPECT_EQ(matcher.openCost(), dec("1650"));
    EXPECT_EQ(matcher.basis(), dec("11"));
}

TEST_F(PositionMatcherTest, PartialExitReleasesProportionalCost) {
    matcher.apply(exec("b1", OrderSide::BUY, "100", "10"));
    matcher.apply(exec("b2", OrderSide::BUY, "50", "13"));

    auto events = matcher.apply(exec("s1", OrderSide::SELL, "60", "12"));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, MatchEventType::SCALE_OUT);
    EXPECT_EQ(events[0].quantity, dec("60"));
    EXPECT_EQ(events[0].releasedCost, dec("660"));
    EXPECT_EQ(matcher.openQuantity(), dec("90"));
    EXPECT_EQ(matcher.basis(), dec("11"));
}

TEST_F(PositionMatcherTest, ExactCloseIsNotAFlip) {
    matcher.apply(exec("b1", OrderSide::BUY, "100", "10"));

    auto events = matcher.apply(exec("s1", OrderSide::SELL, "100", "11", "1"));

    EXPECT_EQ(typesOf(events), (std::vector<MatchEventType>{MatchEventType::SCALE_OUT, MatchEventType::CLOSE}));
    EXPECT_FALSE(events[0].split);
    EXPECT_EQ(events[0].commission, dec("1"));
    EXPECT_EQ(events[0].releasedCost, dec("1000"));
    EXPECT_TRUE(matcher.isFlat());
    EXPECT_TRUE(matcher.openCost().isZero());
}

// ================================================================
// FLIP
// ================================================================

TEST_F(PositionMatcherTest, OversizedExitFlipsPosition) {
    matcher.apply(exec("b1", OrderSide::BUY, "100", "10"));

    auto events = matcher.apply(exec("s1", OrderSide::SELL, "150", "12", "3"));

    ASSERT_EQ(typesOf(events), (std::vector<MatchEventType>{
        MatchEventType::SCALE_OUT, MatchEventType::CLOSE, MatchEventType::FLIP}));

    const auto& closing = events[0];
    EXPECT_EQ(closing.positionSide, TradeSide::LONG);
    EXPECT_EQ(closing.quantity, dec("100"));
    EXPECT_EQ(closing.orderQuantity, dec("150"));
    EXPECT_EQ(closing.commission, dec("2"));
    EXPECT_TRUE(closing.split);

    const auto& opening = events[2];
    EXPECT_EQ(opening.positionSide, TradeSide::SHORT);
    EXPECT_EQ(opening.quantity, dec("50"));
    EXPECT_EQ(opening.commission, dec("1"));
    EXPECT_TRUE(opening.split);

    EXPECT_EQ(matcher.state(), PositionState::SHORT_OPEN);
    EXPECT_EQ(matcher.openQuantity(), dec("50"));
    EXPECT_EQ(matcher.basis(), dec("12"));
}

TEST_F(PositionMatcherTest, FlipChargeSharesSumToOrderCharges) {
    matcher.apply(exec("b1", OrderSide::BUY, "3", "10"));

    auto events = matcher.apply(exec("s1", OrderSide::SELL, "7", "10", "1"));

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].commission + events[2].commission, dec("1"));
    EXPECT_EQ(events[0].quantity + events[2].quantity, dec("7"));
}

TEST_F(PositionMatcherTest, ShortSideMirrorsLong) {
    matcher.apply(exec("s1", OrderSide::SELL, "100", "20"));
    EXPECT_EQ(matcher.state(), PositionState::SHORT_OPEN);

    auto events = matcher.apply(exec("b1", OrderSide::BUY, "130", "18"));

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].positionSide, TradeSide::SHORT);
    EXPECT_EQ(events[0].releasedCost, dec("2000"));
    EXPECT_EQ(events[2].positionSide, TradeSide::LONG);
    EXPECT_EQ(matcher.state(), PositionState::LONG_OPEN);
    EXPECT_EQ(matcher.openQuantity(), dec("30"));
}

// ================================================================
// ERRORS
// ================================================================

TEST_F(PositionMatcherTest, SellFromFlatRequiresReconciliationWhenShortsDisallowed) {
    MatcherOptions options;
    options.allowShortFromFlat = false;
    PositionMatcher strict(GroupKey("acc-1", "AAPL"), options);

    EXPECT_THROW(strict.apply(exec("s1", OrderSide::SELL, "10", "5")), ReconciliationRequiredException);
    EXPECT_TRUE(strict.isFlat());
}

TEST_F(PositionMatcherTest, NonPositiveQuantityViolatesContract) {
    EXPECT_THROW(matcher.apply(exec("b1", OrderSide::BUY, "0", "5")), SequencerContractViolation);
    EXPECT_THROW(matcher.apply(exec("b2", OrderSide::BUY, "-1", "5")), SequencerContractViolation);
}
