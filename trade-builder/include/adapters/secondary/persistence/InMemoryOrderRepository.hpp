#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "domain/GroupCommit.hpp"
#include "domain/exceptions/TradeBookException.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <set>

namespace tradebook::adapters::secondary {

/**
 * @brief In-memory реализация репозитория исполнений
 *
 * Используется в тестах. Привязки ордеров к сделкам
 * меняет только InMemoryTradeRepository через applyTags()/clearTags(),
 * обе операции применяются целиком или не применяются.
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    void save(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_[order.id] = order;
    }

    std::optional<domain::Order> findById(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(id);
        if (it == orders_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Order> findByIds(const std::string& userId,
                                         const std::vector<std::string>& ids) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Order> result;
        std::set<std::string> seen;
        for (const auto& id : ids) {
            auto it = orders_.find(id);
            if (it != orders_.end() && it->second.userId == userId && seen.insert(id).second) {
                result.push_back(it->second);
            }
        }
        return result;
    }

    std::vector<domain::Order> fetchUnconsumedOrders(const std::string& userId) override {
        return collect([&userId](const domain::Order& o) {
            return o.userId == userId && !o.usedInTrade;
        });
    }

    std::vector<domain::Order> fetchAllOrders(const std::string& userId) override {
        return collect([&userId](const domain::Order& o) {
            return o.userId == userId;
        });
    }

    std::vector<std::string> findUserIds() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> users;
        for (const auto& [id, order] : orders_) {
            users.insert(order.userId);
        }
        return std::vector<std::string>(users.begin(), users.end());
    }

    /**
     * @brief Привязать ордера к сделкам (всё или ничего)
     *
     * @throws domain::AtomicityFailureException если ордер не найден
     *         или принадлежит другому пользователю
     */
    void applyTags(const std::string& userId, const std::vector<domain::OrderTag>& tags) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& tag : tags) {
            auto it = orders_.find(tag.orderId);
            if (it == orders_.end() || it->second.userId != userId) {
                throw domain::AtomicityFailureException(
                    "order " + tag.orderId + " not found for user " + userId);
            }
        }
        for (const auto& tag : tags) {
            auto& order = orders_[tag.orderId];
            order.usedInTrade = true;
            order.tradeId = tag.tradeId;
        }
    }

    /**
     * @brief Снять привязку со всех ордеров пользователя
     */
    void clearTags(const std::string& userId) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, order] : orders_) {
            if (order.userId == userId) {
                order.usedInTrade = false;
                order.tradeId.reset();
            }
        }
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.size();
    }

private:
    template <typename Predicate>
    std::vector<domain::Order> collect(Predicate predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Order> result;
        for (const auto& [id, order] : orders_) {
            if (predicate(order)) {
                result.push_back(order);
            }
        }
        // Порядок импорта
        std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
                return a.sequence < b.sequence || (a.sequence == b.sequence && a.id < b.id);
            });
        return result;
    }

    mutable std::mutex mutex_;
    std::map<std::string, domain::Order> orders_;
};

} // namespace tradebook::adapters::secondary
