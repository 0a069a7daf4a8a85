#pragma once

#include "domain/Trade.hpp"
#include "domain/GroupCommit.hpp"
#include <string>
#include <optional>
#include <vector>

namespace tradebook::ports::output {

/**
 * @brief Интерфейс хранилища сделок
 *
 * Output Port. Обе пишущие операции атомарны: либо применяются
 * целиком, либо не применяются вовсе.
 */
class ITradeRepository {
public:
    virtual ~ITradeRepository() = default;

    virtual std::vector<domain::Trade> findOpenTrades(const std::string& userId) = 0;

    virtual std::vector<domain::Trade> findByUserId(const std::string& userId) = 0;

    virtual std::optional<domain::Trade> findById(const std::string& id) = 0;

    /**
     * @brief Записать сделки группы и привязать к ним ордера
     *
     * @throws domain::AtomicityFailureException если запись не удалась;
     *         в этом случае ничего не изменено
     */
    virtual void commitGroup(const domain::GroupCommit& commit) = 0;

    /**
     * @brief Удалить все сделки пользователя и снять привязку со всех его ордеров
     *
     * @throws domain::AtomicityFailureException если сброс не удался
     */
    virtual void resetUser(const std::string& userId) = 0;
};

} // namespace tradebook::ports::output
