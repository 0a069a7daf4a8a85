#pragma once

#include "enums/AssetClass.hpp"
#include "enums/TradeSide.hpp"
#include "enums/TradeStatus.hpp"
#include "enums/HoldingPeriod.hpp"
#include "enums/MarketSession.hpp"
#include "enums/OrderSide.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "GroupKey.hpp"
#include "OrderAllocation.hpp"
#include <string>
#include <vector>
#include <optional>
#include <algorithm>

namespace tradebook::domain {

/**
 * @brief Восстановленная позиция: от первого открывающего исполнения до полного закрытия
 *
 * Полностью выводится из ордеров. Записи сделок создаются и заменяются
 * целиком, поля по отдельности не правятся.
 *
 * Для OPEN сделки avgExitPrice и exitAt пусты, realizedPnl покрывает
 * только закрытую часть. Средняя цена частичных выходов доступна через
 * partialExitPrice().
 */
struct Trade {
    std::string id;
    std::string userId;
    std::string accountId;
    std::string symbol;
    AssetClass assetClass = AssetClass::EQUITY;
    TradeSide side = TradeSide::LONG;                ///< Направление открывающей ноги
    TradeStatus status = TradeStatus::OPEN;

    Decimal openQuantity;                            ///< Сумма ENTRY аллокаций
    Decimal closeQuantity;                           ///< Сумма EXIT аллокаций
    Decimal avgEntryPrice;
    std::optional<Decimal> avgExitPrice;             ///< Только для CLOSED
    Decimal realizedPnl;
    Decimal commissionsTotal;
    Decimal feesTotal;
    int executionsCount = 0;                         ///< Число различных ордеров

    Decimal costBasis;                               ///< Сумма стоимости входов
    Decimal proceeds;                                ///< Сумма стоимости выходов
    Decimal openCost;                                ///< Себестоимость ещё открытого объёма
    Decimal openCharges;                             ///< Комиссии входов, ещё не списанные в P&L

    Timestamp entryAt;
    std::optional<Timestamp> exitAt;                 ///< Только для CLOSED
    std::optional<int64_t> timeInTradeSeconds;       ///< Только для CLOSED
    HoldingPeriod holdingPeriod = HoldingPeriod::INTRADAY;
    MarketSession marketSession = MarketSession::REGULAR;

    std::vector<std::string> ordersInTrade;          ///< Порядок появления, без повторов
    std::vector<OrderAllocation> allocations;

    GroupKey key() const {
        return GroupKey(accountId, symbol);
    }

    bool isOpen() const {
        return status == TradeStatus::OPEN;
    }

    bool isClosed() const {
        return status == TradeStatus::CLOSED;
    }

    Decimal remainingQuantity() const {
        return openQuantity - closeQuantity;
    }

    /**
     * @brief Средняя цена уже исполненных выходов (для OPEN сделки с частичным закрытием)
     */
    std::optional<Decimal> partialExitPrice() const {
        if (closeQuantity.isZero()) {
            return std::nullopt;
        }
        return proceeds / closeQuantity;
    }

    /**
     * @brief Сторона ордера, которая открывает или наращивает эту сделку
     */
    OrderSide entrySide() const {
        return side == TradeSide::LONG ? OrderSide::BUY : OrderSide::SELL;
    }

    bool containsOrder(const std::string& orderId) const {
        return std::find(ordersInTrade.begin(), ordersInTrade.end(), orderId) != ordersInTrade.end();
    }
};

} // namespace tradebook::domain
