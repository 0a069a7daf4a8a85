#pragma once

#include "enums/OrderSide.hpp"
#include "enums/AssetClass.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace tradebook::domain {

/**
 * @brief Исполнение у брокера (fill), как его записал импорт
 *
 * После записи не меняется. Исключение: usedInTrade и tradeId,
 * которые выставляет только RebuildController в той же транзакции,
 * что и сделки.
 */
struct Order {
    std::string id;                          ///< Идентификатор ордера
    std::string userId;                      ///< Владелец
    std::string accountId;                   ///< Брокерский счёт
    std::string symbol;                      ///< Тикер инструмента
    AssetClass assetClass = AssetClass::EQUITY;
    OrderSide side = OrderSide::BUY;         ///< BUY / SELL
    Decimal quantity;                        ///< Исполненное количество (> 0)
    Decimal price;                           ///< Цена исполнения
    Decimal commission;                      ///< Комиссия брокера
    Decimal fees;                            ///< Биржевые и регуляторные сборы
    std::optional<Timestamp> executedAt;     ///< Время исполнения
    std::optional<Timestamp> cancelledAt;    ///< Время отмены (отменённые не сопоставляются)
    int64_t sequence = 0;                    ///< Порядковый номер при импорте
    bool usedInTrade = false;                ///< Привязан к сделке
    std::optional<std::string> tradeId;      ///< Последняя сделка, в которую попал ордер

    Order() = default;

    Order(
        const std::string& id,
        const std::string& userId,
        const std::string& accountId,
        const std::string& symbol,
        OrderSide side,
        const Decimal& quantity,
        const Decimal& price,
        const Timestamp& executedAt
    ) : id(id), userId(userId), accountId(accountId), symbol(symbol),
        side(side), quantity(quantity), price(price), executedAt(executedAt) {}

    /**
     * @brief Стоимость исполнения без комиссий
     */
    Decimal notional() const {
        return quantity * price;
    }

    Decimal charges() const {
        return commission + fees;
    }

    bool isCancelled() const {
        return cancelledAt.has_value();
    }
};

} // namespace tradebook::domain
