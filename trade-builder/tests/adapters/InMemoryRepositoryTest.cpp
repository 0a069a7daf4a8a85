#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTradeRepository.hpp"
#include "domain/matching/GroupPipeline.hpp"
#include "utils/UuidGenerator.hpp"
#include "mocks/OrderBuilder.hpp"

using namespace tradebook::domain;
using namespace tradebook::adapters::secondary;
using tradebook::tests::OrderBuilder;

class InMemoryRepositoryTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryOrderRepository> orders;
    std::shared_ptr<InMemoryTradeRepository> trades;

    void SetUp() override {
        orders = std::make_shared<InMemoryOrderRepository>();
        trades = std::make_shared<InMemoryTradeRepository>(orders);
    }

    Trade openTrade(const std::string& id, const std::string& orderId, const std::string& symbol = "AAPL") {
        Trade trade;
        trade.id = id;
        trade.userId = "user-1";
        trade.accountId = "acc-1";
        trade.symbol = symbol;
        trade.ordersInTrade = {orderId};
        return trade;
    }
};

// ================================================================
// ORDERS
// ================================================================

TEST_F(InMemoryRepositoryTest, FetchesInImportOrder) {
    orders->save(OrderBuilder("c").buy("1").at("1").sequence(30));
    orders->save(OrderBuilder("a").buy("1").at("1").sequence(10));
    orders->save(OrderBuilder("b").buy("1").at("1").sequence(20));
    orders->save(OrderBuilder("other").buy("1").at("1").user("user-2"));

    auto all = orders->fetchAllOrders("user-1");

    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "a");
    EXPECT_EQ(all[1].id, "b");
    EXPECT_EQ(all[2].id, "c");
    EXPECT_EQ(orders->findUserIds(), (std::vector<std::string>{"user-1", "user-2"}));
}

TEST_F(InMemoryRepositoryTest, FindByIdsSkipsMissingAndRepeated) {
    orders->save(OrderBuilder("a").buy("1").at("1"));
    orders->save(OrderBuilder("b").buy("1").at("1"));

    auto found = orders->findByIds("user-1", {"a", "missing", "b", "a"});

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].id, "a");
    EXPECT_EQ(found[1].id, "b");
}

TEST_F(InMemoryRepositoryTest, FindByIdsIgnoresOtherUsersOrders) {
    orders->save(OrderBuilder("a").buy("1").at("1"));
    orders->save(OrderBuilder("foreign").buy("1").at("1").user("user-2"));

    auto found = orders->findByIds("user-1", {"a", "foreign"});

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, "a");
    EXPECT_EQ(orders->findByIds("user-2", {"foreign"}).size(), 1u);
}

TEST_F(InMemoryRepositoryTest, ApplyTagsIsAllOrNothing) {
    orders->save(OrderBuilder("a").buy("1").at("1"));
    orders->save(OrderBuilder("foreign").buy("1").at("1").user("user-2"));

    EXPECT_THROW(orders->applyTags("user-1", {{"a", "t-1"}, {"foreign", "t-1"}}), AtomicityFailureException);
    EXPECT_FALSE(orders->findById("a")->usedInTrade);

    orders->applyTags("user-1", {{"a", "t-1"}});
    EXPECT_TRUE(orders->findById("a")->usedInTrade);
    EXPECT_EQ(orders->findById("a")->tradeId, std::string("t-1"));
    EXPECT_TRUE(orders->fetchUnconsumedOrders("user-1").empty());
}

// ================================================================
// TRADES
// ================================================================

TEST_F(InMemoryRepositoryTest, CommitGroupWritesTradesAndTags) {
    orders->save(OrderBuilder("a").buy("1").at("1"));

    auto commit = GroupCommit::fromTrades("user-1", GroupKey("acc-1", "AAPL"), {openTrade("t-1", "a")});
    trades->commitGroup(commit);

    EXPECT_TRUE(trades->findById("t-1").has_value());
    EXPECT_EQ(trades->findOpenTrades("user-1").size(), 1u);
    EXPECT_EQ(orders->findById("a")->tradeId, std::string("t-1"));
}

TEST_F(InMemoryRepositoryTest, CommitGroupRollsBackOnUnknownOrder) {
    orders->save(OrderBuilder("a").buy("1").at("1"));

    Trade trade = openTrade("t-1", "a");
    trade.ordersInTrade.push_back("ghost");
    auto commit = GroupCommit::fromTrades("user-1", GroupKey("acc-1", "AAPL"), {trade});

    EXPECT_THROW(trades->commitGroup(commit), AtomicityFailureException);
    EXPECT_EQ(trades->size(), 0u);
    EXPECT_FALSE(orders->findById("a")->usedInTrade);
}

TEST_F(InMemoryRepositoryTest, CommitGroupRejectsTradeOfAnotherGroup) {
    orders->save(OrderBuilder("a").buy("1").at("1"));

    auto commit = GroupCommit::fromTrades("user-1", GroupKey("acc-1", "AAPL"), {openTrade("t-1", "a", "MSFT")});

    EXPECT_THROW(trades->commitGroup(commit), AtomicityFailureException);
    EXPECT_EQ(trades->size(), 0u);
}

TEST_F(InMemoryRepositoryTest, CommitGroupReplacesTradeWithSameId) {
    orders->save(OrderBuilder("a").buy("1").at("1"));
    orders->save(OrderBuilder("b").sell("1").at("2"));

    trades->commitGroup(GroupCommit::fromTrades("user-1", GroupKey("acc-1", "AAPL"), {openTrade("t-1", "a")}));

    Trade closed = openTrade("t-1", "a");
    closed.ordersInTrade.push_back("b");
    closed.status = TradeStatus::CLOSED;
    trades->commitGroup(GroupCommit::fromTrades("user-1", GroupKey("acc-1", "AAPL"), {closed}));

    EXPECT_EQ(trades->size(), 1u);
    EXPECT_TRUE(trades->findOpenTrades("user-1").empty());
    EXPECT_TRUE(trades->findById("t-1")->isClosed());
}

TEST_F(InMemoryRepositoryTest, ResetUserTouchesOnlyThatUser) {
    orders->save(OrderBuilder("a").buy("1").at("1"));
    orders->save(OrderBuilder("x").buy("1").at("1").user("user-2"));
    trades->commitGroup(GroupCommit::fromTrades("user-1", GroupKey("acc-1", "AAPL"), {openTrade("t-1", "a")}));

    Trade foreign = openTrade("t-2", "x");
    foreign.userId = "user-2";
    trades->commitGroup(GroupCommit::fromTrades("user-2", GroupKey("acc-1", "AAPL"), {foreign}));

    trades->resetUser("user-1");

    EXPECT_TRUE(trades->findByUserId("user-1").empty());
    EXPECT_EQ(trades->findByUserId("user-2").size(), 1u);
    EXPECT_FALSE(orders->findById("a")->usedInTrade);
    EXPECT_FALSE(orders->findById("a")->tradeId.has_value());
    EXPECT_TRUE(orders->findById("x")->usedInTrade);
}

TEST_F(InMemoryRepositoryTest, FlipOrderTaggedWithLastTrade) {
    Trade first = openTrade("t-1", "a");
    first.ordersInTrade.push_back("flip");
    Trade second = openTrade("t-2", "flip");

    auto commit = GroupCommit::fromTrades("user-1", GroupKey("acc-1", "AAPL"), {first, second});

    ASSERT_EQ(commit.tags.size(), 2u);
    EXPECT_EQ(commit.tags[0].orderId, "a");
    EXPECT_EQ(commit.tags[0].tradeId, "t-1");
    EXPECT_EQ(commit.tags[1].orderId, "flip");
    EXPECT_EQ(commit.tags[1].tradeId, "t-2");
}
