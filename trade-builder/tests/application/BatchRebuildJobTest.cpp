#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/BatchRebuildJob.hpp"
#include "domain/exceptions/TradeBookException.hpp"
#include "mocks/MockTradeRebuildService.hpp"
#include <stdexcept>

using namespace tradebook::domain;
using tradebook::application::BatchRebuildJob;
using tradebook::application::CancellationToken;
using tradebook::settings::RebuildSettings;
using tradebook::tests::MockTradeRebuildService;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;

class BatchRebuildJobTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockTradeRebuildService>> service;
    std::shared_ptr<RebuildSettings> settings;

    void SetUp() override {
        service = std::make_shared<NiceMock<MockTradeRebuildService>>();
        settings = std::make_shared<RebuildSettings>();
        settings->setUserWorkers(2);

        ON_CALL(*service, rebuild(_, _)).WillByDefault([](const std::string& userId, RebuildScope scope) {
            RebuildResult result;
            result.userId = userId;
            result.scope = scope;
            return result;
        });
    }

    static RebuildResult withProblem(const std::string& userId, ProblemKind kind) {
        RebuildResult result;
        result.userId = userId;
        result.problems.emplace_back(GroupKey("acc-1", "AAPL"), kind, "problem");
        return result;
    }
};

// ================================================================
// HAPPY PATH
// ================================================================

TEST_F(BatchRebuildJobTest, RebuildsEveryUserInInputOrder) {
    EXPECT_CALL(*service, rebuild(_, Eq(RebuildScope::FULL))).Times(5);

    BatchRebuildJob job(service, settings);
    auto report = job.run({"u1", "u2", "u3", "u4", "u5"}, RebuildScope::FULL);

    ASSERT_EQ(report.results.size(), 5u);
    for (size_t i = 0; i < report.results.size(); ++i) {
        EXPECT_EQ(report.results[i].userId, "u" + std::to_string(i + 1));
    }
    EXPECT_FALSE(report.cancelled);
    EXPECT_TRUE(report.usersSkipped.empty());
    EXPECT_FALSE(report.requiresAttention());
}

TEST_F(BatchRebuildJobTest, EmptyUserList) {
    EXPECT_CALL(*service, rebuild(_, _)).Times(0);

    BatchRebuildJob job(service, settings);
    auto report = job.run({}, RebuildScope::INCREMENTAL);

    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(report.tradesWritten(), 0u);
}

// ================================================================
// FAILURES
// ================================================================

TEST_F(BatchRebuildJobTest, UserFailureDoesNotAbortBatch) {
    EXPECT_CALL(*service, rebuild(_, _)).Times(AnyNumber());
    EXPECT_CALL(*service, rebuild("u2", _))
        .WillOnce(Throw(RebuildInProgressException("u2")));
    EXPECT_CALL(*service, rebuild("u3", _))
        .WillOnce(Throw(std::runtime_error("db down")));

    BatchRebuildJob job(service, settings);
    auto report = job.run({"u1", "u2", "u3", "u4"}, RebuildScope::INCREMENTAL);

    EXPECT_EQ(report.results.size(), 2u);
    ASSERT_EQ(report.failedUsers.size(), 2u);
    EXPECT_EQ(report.failedUsers.count("u2"), 1u);
    EXPECT_EQ(report.failedUsers.at("u3"), "db down");
    EXPECT_TRUE(report.requiresAttention());
}

TEST_F(BatchRebuildJobTest, AttentionFollowsProblemKind) {
    EXPECT_CALL(*service, rebuild("u1", _))
        .WillOnce(Invoke([](const std::string& userId, RebuildScope) {
            return withProblem(userId, ProblemKind::GROUP_FAILURE);
        }));

    BatchRebuildJob job(service, settings);
    EXPECT_FALSE(job.run({"u1"}, RebuildScope::INCREMENTAL).requiresAttention());

    EXPECT_CALL(*service, rebuild("u2", _))
        .WillOnce(Invoke([](const std::string& userId, RebuildScope) {
            return withProblem(userId, ProblemKind::ATOMICITY_FAILURE);
        }));
    EXPECT_TRUE(job.run({"u2"}, RebuildScope::INCREMENTAL).requiresAttention());
}

// ================================================================
// CANCELLATION
// ================================================================

TEST_F(BatchRebuildJobTest, CancelledBeforeStartRunsNothing) {
    EXPECT_CALL(*service, rebuild(_, _)).Times(0);
    CancellationToken token;
    token.cancel();

    BatchRebuildJob job(service, settings);
    auto report = job.run({"u1", "u2"}, RebuildScope::FULL, token);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.usersSkipped, (std::vector<std::string>{"u1", "u2"}));
}

TEST_F(BatchRebuildJobTest, CancellationStopsBetweenBatches) {
    settings->setUserWorkers(1);
    CancellationToken token;

    // Отмена приходит во время первого пользователя: он доводится до конца
    EXPECT_CALL(*service, rebuild("u1", _))
        .WillOnce(Invoke([&token](const std::string& userId, RebuildScope scope) {
            token.cancel();
            RebuildResult result;
            result.userId = userId;
            result.scope = scope;
            return result;
        }));
    EXPECT_CALL(*service, rebuild("u2", _)).Times(0);
    EXPECT_CALL(*service, rebuild("u3", _)).Times(0);

    BatchRebuildJob job(service, settings);
    auto report = job.run({"u1", "u2", "u3"}, RebuildScope::INCREMENTAL, token);

    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].userId, "u1");
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.usersSkipped, (std::vector<std::string>{"u2", "u3"}));
}
