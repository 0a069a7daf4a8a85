#pragma once

#include "domain/Order.hpp"
#include <string>
#include <optional>
#include <vector>

namespace tradebook::ports::output {

/**
 * @brief Интерфейс репозитория исполнений
 *
 * Output Port. Ордера пишет импорт, пересборка их только читает.
 * Флаги usedInTrade/tradeId меняются через ITradeRepository
 * в одной транзакции со сделками.
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Сохранить ордер (импорт, тесты)
     */
    virtual void save(const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findById(const std::string& id) = 0;

    /**
     * @brief Найти ордера пользователя по списку ID
     *
     * Отсутствующие и чужие ордера пропускаются.
     */
    virtual std::vector<domain::Order> findByIds(const std::string& userId,
                                                 const std::vector<std::string>& ids) = 0;

    /**
     * @brief Ордера пользователя с usedInTrade = false
     */
    virtual std::vector<domain::Order> fetchUnconsumedOrders(const std::string& userId) = 0;

    /**
     * @brief Все ордера пользователя (для полной пересборки)
     */
    virtual std::vector<domain::Order> fetchAllOrders(const std::string& userId) = 0;

    /**
     * @brief Пользователи, у которых есть хотя бы один ордер
     */
    virtual std::vector<std::string> findUserIds() = 0;
};

} // namespace tradebook::ports::output
