#pragma once

#include "ports/output/ITradeRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTradeRepository.hpp"
#include <gmock/gmock.h>
#include <memory>

namespace tradebook::tests {

/**
 * @brief gmock-обёртка над InMemoryTradeRepository
 *
 * По умолчанию все вызовы уходят в настоящее in-memory хранилище,
 * тест переопределяет только нужные (например, сбой commitGroup).
 */
class MockTradeRepository : public ports::output::ITradeRepository {
public:
    explicit MockTradeRepository(std::shared_ptr<adapters::secondary::InMemoryOrderRepository> orders)
        : fake_(std::make_shared<adapters::secondary::InMemoryTradeRepository>(std::move(orders)))
    {
        using ::testing::_;
        ON_CALL(*this, findOpenTrades(_)).WillByDefault([this](const std::string& userId) {
            return fake_->findOpenTrades(userId);
        });
        ON_CALL(*this, findByUserId(_)).WillByDefault([this](const std::string& userId) {
            return fake_->findByUserId(userId);
        });
        ON_CALL(*this, findById(_)).WillByDefault([this](const std::string& id) {
            return fake_->findById(id);
        });
        ON_CALL(*this, commitGroup(_)).WillByDefault([this](const domain::GroupCommit& commit) {
            fake_->commitGroup(commit);
        });
        ON_CALL(*this, resetUser(_)).WillByDefault([this](const std::string& userId) {
            fake_->resetUser(userId);
        });
    }

    MOCK_METHOD(std::vector<domain::Trade>, findOpenTrades, (const std::string& userId), (override));
    MOCK_METHOD(std::vector<domain::Trade>, findByUserId, (const std::string& userId), (override));
    MOCK_METHOD(std::optional<domain::Trade>, findById, (const std::string& id), (override));
    MOCK_METHOD(void, commitGroup, (const domain::GroupCommit& commit), (override));
    MOCK_METHOD(void, resetUser, (const std::string& userId), (override));

    adapters::secondary::InMemoryTradeRepository& fake() { return *fake_; }

private:
    std::shared_ptr<adapters::secondary::InMemoryTradeRepository> fake_;
};

} // namespace tradebook::tests
