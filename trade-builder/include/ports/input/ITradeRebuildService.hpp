#pragma once

#include "domain/RebuildResult.hpp"
#include "domain/enums/RebuildScope.hpp"
#include <string>

namespace tradebook::ports::input {

/**
 * @brief Интерфейс пересборки сделок пользователя
 *
 * Input Port. Ни один метод не бросает единого исключения, скрывающего,
 * какая группа упала: проблемы групп возвращаются в RebuildResult.
 */
class ITradeRebuildService {
public:
    virtual ~ITradeRebuildService() = default;

    /**
     * @brief Инкрементальная пересборка: только ордера с usedInTrade = false
     *
     * Открытая сделка группы продолжается, закрытые не трогаются.
     * Повторный вызов без новых ордеров возвращает пустой список сделок.
     *
     * @throws domain::RebuildInProgressException если пользователь уже пересобирается
     */
    virtual domain::RebuildResult processUserOrders(const std::string& userId) = 0;

    /**
     * @brief Полная пересборка с нуля
     *
     * @throws domain::RebuildInProgressException если пользователь уже пересобирается
     * @throws domain::AtomicityFailureException если не удалось сбросить сделки
     */
    virtual domain::RebuildResult rebuildAllTrades(const std::string& userId) = 0;

    virtual domain::RebuildResult rebuild(const std::string& userId, domain::RebuildScope scope) = 0;
};

} // namespace tradebook::ports::input
