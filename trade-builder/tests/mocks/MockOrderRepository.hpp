#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include <gmock/gmock.h>
#include <memory>

namespace tradebook::tests {

/**
 * @brief gmock-обёртка над InMemoryOrderRepository (сбои чтения)
 */
class MockOrderRepository : public ports::output::IOrderRepository {
public:
    explicit MockOrderRepository(std::shared_ptr<adapters::secondary::InMemoryOrderRepository> fake)
        : fake_(std::move(fake))
    {
        using ::testing::_;
        ON_CALL(*this, save(_)).WillByDefault([this](const domain::Order& order) {
            fake_->save(order);
        });
        ON_CALL(*this, findById(_)).WillByDefault([this](const std::string& id) {
            return fake_->findById(id);
        });
        ON_CALL(*this, findByIds(_, _)).WillByDefault(
            [this](const std::string& userId, const std::vector<std::string>& ids) {
                return fake_->findByIds(userId, ids);
            });
        ON_CALL(*this, fetchUnconsumedOrders(_)).WillByDefault([this](const std::string& userId) {
            return fake_->fetchUnconsumedOrders(userId);
        });
        ON_CALL(*this, fetchAllOrders(_)).WillByDefault([this](const std::string& userId) {
            return fake_->fetchAllOrders(userId);
        });
        ON_CALL(*this, findUserIds()).WillByDefault([this]() {
            return fake_->findUserIds();
        });
    }

    MOCK_METHOD(void, save, (const domain::Order& order), (override));
    MOCK_METHOD(std::optional<domain::Order>, findById, (const std::string& id), (override));
    MOCK_METHOD(std::vector<domain::Order>, findByIds,
                (const std::string& userId, const std::vector<std::string>& ids), (override));
    MOCK_METHOD(std::vector<domain::Order>, fetchUnconsumedOrders, (const std::string& userId), (override));
    MOCK_METHOD(std::vector<domain::Order>, fetchAllOrders, (const std::string& userId), (override));
    MOCK_METHOD(std::vector<std::string>, findUserIds, (), (override));

private:
    std::shared_ptr<adapters::secondary::InMemoryOrderRepository> fake_;
};

} // namespace tradebook::tests
