#include <gtest/gtest.h>
#include "domain/matching/GroupPipeline.hpp"
#include "utils/UuidGenerator.hpp"
#include "mocks/OrderBuilder.hpp"
#include "mocks/TradeAssertions.hpp"

using namespace tradebook::domain;
using namespace tradebook::domain::matching;
using tradebook::tests::OrderBuilder;
using tradebook::tests::dec;
using tradebook::tests::expectSameReconstruction;

class GroupPipelineTest : public ::testing::Test {
protected:
    GroupKey key{"acc-1", "AAPL"};
    PipelineContext context;

    void SetUp() override {
        context.userId = "user-1";
        context.idGenerator = tradebook::utils::UuidGenerator::sequential("t");
    }

    std::vector<Order> slice(const std::vector<Order>& orders, size_t from, size_t to) {
        return std::vector<Order>(orders.begin() + from, orders.begin() + to);
    }

    /**
     * @brief Собрать префикс, затем продолжить его открытую сделку остатком
     */
    std::vector<Trade> buildInTwoSteps(const std::vector<Order>& orders, size_t split) {
        auto first = GroupPipeline::run(key, slice(orders, 0, split), std::nullopt, context);
        EXPECT_TRUE(first.ok());

        std::vector<Trade> trades;
        std::optional<Trade> open;
        for (auto& trade : first.trades) {
            if (trade.isOpen()) {
                open = trade;
            } else {
                trades.push_back(trade);
            }
        }

        auto second = GroupPipeline::run(key, slice(orders, split, orders.size()), open, context);
        EXPECT_TRUE(second.ok());
        if (open) {
            EXPECT_FALSE(second.trades.empty());
            if (!second.trades.empty()) {
                EXPECT_EQ(second.trades.front().id, open->id);
            }
        }
        trades.insert(trades.end(), second.trades.begin(), second.trades.end());
        return trades;
    }
};

// ================================================================
// FULL BUILD
// ================================================================

TEST_F(GroupPipelineTest, EmptyGroupProducesNothing) {
    auto outcome = GroupPipeline::run(key, {}, std::nullopt, context);

    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.trades.empty());
}

TEST_F(GroupPipelineTest, AssetClassTakenFromOrders) {
    auto outcome = GroupPipeline::run(key, {
        OrderBuilder("b1").buy("1").at("3").assetClass(AssetClass::OPTION),
    }, std::nullopt, context);

    ASSERT_EQ(outcome.trades.size(), 1u);
    EXPECT_EQ(outcome.trades[0].assetClass, AssetClass::OPTION);
}

// ================================================================
// CONTINUATION
// ================================================================

TEST_F(GroupPipelineTest, ContinuationMatchesFullBuild) {
    std::vector<Order> orders = {
        OrderBuilder("b1").buy("100").at("10").commission("1").on("2024-03-04T15:00:00Z"),
        OrderBuilder("s1").sell("40").at("12").commission("0.3").on("2024-03-04T15:10:00Z"),
        OrderBuilder("b2").buy("20").at("11").fees("0.07").on("2024-03-04T15:20:00Z"),
        OrderBuilder("s2").sell("80").at("9").commission("0.7").on("2024-03-04T15:30:00Z"),
    };

    auto full = GroupPipeline::run(key, orders, std::nullopt, context);
    ASSERT_TRUE(full.ok());

    for (size_t split = 1; split < orders.size(); ++split) {
        SCOPED_TRACE("split at " + std::to_string(split));
        expectSameReconstruction(buildInTwoSteps(orders, split), full.trades);
    }
}

TEST_F(GroupPipelineTest, ContinuationAfterFlipMatchesFullBuild) {
    std::vector<Order> orders = {
        OrderBuilder("b1").buy("100").at("10").commission("1").on("2024-03-04T15:00:00Z"),
        OrderBuilder("s1").sell("150").at("12").commission("3").on("2024-03-04T15:10:00Z"),
        OrderBuilder("s2").sell("10").at("12.5").on("2024-03-04T15:20:00Z"),
        OrderBuilder("b2").buy("60").at("11").commission("0.6").on("2024-03-04T15:30:00Z"),
    };

    auto full = GroupPipeline::run(key, orders, std::nullopt, context);
    ASSERT_TRUE(full.ok());
    ASSERT_EQ(full.trades.size(), 2u);

    expectSameReconstruction(buildInTwoSteps(orders, 2), full.trades);
    expectSameReconstruction(buildInTwoSteps(orders, 3), full.trades);
}

TEST_F(GroupPipelineTest, ContinuationWithoutNewOrdersReturnsSameTrade) {
    auto first = GroupPipeline::run(key, {
        OrderBuilder("b1").buy("10").at("10"),
    }, std::nullopt, context);
    ASSERT_EQ(first.trades.size(), 1u);

    auto second = GroupPipeline::run(key, {}, first.trades[0], context);

    ASSERT_TRUE(second.ok());
    ASSERT_EQ(second.trades.size(), 1u);
    EXPECT_EQ(second.trades[0].id, first.trades[0].id);
    expectSameReconstruction(second.trades[0], first.trades[0]);
}

TEST_F(GroupPipelineTest, LateOrderRequiresReconciliation) {
    auto first = GroupPipeline::run(key, {
        OrderBuilder("b1").buy("10").at("10").on("2024-03-04T15:00:00Z"),
        OrderBuilder("b2").buy("10").at("10").on("2024-03-04T15:30:00Z"),
    }, std::nullopt, context);
    ASSERT_EQ(first.trades.size(), 1u);

    auto second = GroupPipeline::run(key, {
        OrderBuilder("late").sell("5").at("11").on("2024-03-04T15:10:00Z"),
    }, first.trades[0], context);

    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.problem->kind, ProblemKind::RECONCILIATION_REQUIRED);
    EXPECT_TRUE(second.trades.empty());
}

TEST_F(GroupPipelineTest, TamperedContinuationRequiresReconciliation) {
    auto first = GroupPipeline::run(key, {
        OrderBuilder("b1").buy("10").at("10"),
    }, std::nullopt, context);
    ASSERT_EQ(first.trades.size(), 1u);

    Trade tampered = first.trades[0];
    tampered.openQuantity = dec("12");

    auto second = GroupPipeline::run(key, {}, tampered, context);

    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.problem->kind, ProblemKind::RECONCILIATION_REQUIRED);
}

TEST_F(GroupPipelineTest, ClosedContinuationRequiresReconciliation) {
    auto first = GroupPipeline::run(key, {
        OrderBuilder("b1").buy("10").at("10"),
        OrderBuilder("s1").sell("10").at("10"),
    }, std::nullopt, context);
    ASSERT_EQ(first.trades.size(), 1u);

    auto second = GroupPipeline::run(key, {}, first.trades[0], context);

    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.problem->kind, ProblemKind::RECONCILIATION_REQUIRED);
}

// ================================================================
// FAILURES
// ================================================================

TEST_F(GroupPipelineTest, ForeignOrderFailsGroup) {
    auto outcome = GroupPipeline::run(key, {
        OrderBuilder("b1").buy("10").at("10"),
        OrderBuilder("x1").buy("10").at("10").symbol("MSFT"),
    }, std::nullopt, context);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.problem->kind, ProblemKind::GROUP_FAILURE);
    EXPECT_EQ(outcome.problem->key(), key);
    EXPECT_TRUE(outcome.trades.empty());
}

TEST_F(GroupPipelineTest, SellFromFlatWithShortsDisallowed) {
    context.matcherOptions.allowShortFromFlat = false;

    auto outcome = GroupPipeline::run(key, {
        OrderBuilder("s1").sell("10").at("10"),
    }, std::nullopt, context);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.problem->kind, ProblemKind::RECONCILIATION_REQUIRED);
}

TEST_F(GroupPipelineTest, ContinuedShortAllowedEvenWhenShortsDisallowed) {
    auto first = GroupPipeline::run(key, {
        OrderBuilder("s1").sell("10").at("10").on("2024-03-04T15:00:00Z"),
    }, std::nullopt, context);
    ASSERT_EQ(first.trades.size(), 1u);

    context.matcherOptions.allowShortFromFlat = false;
    auto second = GroupPipeline::run(key, {
        OrderBuilder("b1").buy("10").at("9").on("2024-03-04T15:10:00Z"),
    }, first.trades[0], context);

    ASSERT_TRUE(second.ok());
    ASSERT_EQ(second.trades.size(), 1u);
    EXPECT_TRUE(second.trades[0].isClosed());
    EXPECT_EQ(second.trades[0].realizedPnl, dec("10"));
}
