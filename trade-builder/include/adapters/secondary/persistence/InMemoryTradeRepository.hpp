#pragma once

#include "ports/output/ITradeRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <tuple>

namespace tradebook::adapters::secondary {

/**
 * @brief In-memory хранилище сделок
 *
 * Делит ордера с InMemoryOrderRepository, чтобы commitGroup() и
 * resetUser() меняли сделки и привязки ордеров под одной блокировкой.
 * Привязки проверяются до любой записи, поэтому неудачный коммит
 * не оставляет следов.
 */
class InMemoryTradeRepository : public ports::output::ITradeRepository {
public:
    explicit InMemoryTradeRepository(std::shared_ptr<InMemoryOrderRepository> orders)
        : orders_(std::move(orders)) {}

    std::vector<domain::Trade> findOpenTrades(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Trade> result;
        for (const auto& [id, trade] : trades_) {
            if (trade.userId == userId && trade.isOpen()) {
                result.push_back(trade);
            }
        }
        return result;
    }

    std::vector<domain::Trade> findByUserId(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Trade> result;
        for (const auto& [id, trade] : trades_) {
            if (trade.userId == userId) {
                result.push_back(trade);
            }
        }
        std::sort(result.begin(), result.end(), [](const domain::Trade& a, const domain::Trade& b) {
            return std::tie(a.accountId, a.symbol, a.entryAt, a.id)
                 < std::tie(b.accountId, b.symbol, b.entryAt, b.id);
        });
        return result;
    }

    std::optional<domain::Trade> findById(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trades_.find(id);
        if (it == trades_.end()) return std::nullopt;
        return it->second;
    }

    void commitGroup(const domain::GroupCommit& commit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& trade : commit.trades) {
            if (trade.userId != commit.userId || trade.key() != commit.key) {
                throw domain::AtomicityFailureException(
                    "trade " + trade.id + " does not belong to " + commit.key.toString());
            }
        }
        orders_->applyTags(commit.userId, commit.tags);
        for (const auto& trade : commit.trades) {
            trades_[trade.id] = trade;
        }
    }

    void resetUser(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = trades_.begin(); it != trades_.end();) {
            if (it->second.userId == userId) {
                it = trades_.erase(it);
            } else {
                ++it;
            }
        }
        orders_->clearTags(userId);
    }

    // Test helpers
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return trades_.size();
    }

private:
    std::shared_ptr<InMemoryOrderRepository> orders_;
    mutable std::mutex mutex_;
    std::map<std::string, domain::Trade> trades_;
};

} // namespace tradebook::adapters::secondary
