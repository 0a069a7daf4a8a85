#pragma once

#include "enums/MatchEventType.hpp"
#include "enums/OrderSide.hpp"
#include "enums/TradeSide.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>

namespace tradebook::domain {

/**
 * @brief Исполнение на входе автомата позиции
 *
 * Строится из ордера целиком или из сохранённой аллокации при
 * продолжении открытой сделки.
 */
struct Execution {
    std::string orderId;
    OrderSide side = OrderSide::BUY;
    Decimal quantity;
    Decimal orderQuantity;    ///< Объём исходного ордера (больше quantity для аллокации разворота)
    Decimal price;
    Decimal commission;
    Decimal fees;
    Timestamp executedAt;
};

/**
 * @brief Событие автомата позиции
 *
 * Для OPEN, SCALE_IN, FLIP quantity это открываемый объём, для SCALE_OUT
 * закрываемый. CLOSE несёт только время. commission/fees это доля
 * комиссий ордера, приходящаяся на эту ногу.
 */
struct MatchEvent {
    MatchEventType type = MatchEventType::OPEN;
    std::string orderId;
    TradeSide positionSide = TradeSide::LONG;   ///< Сторона позиции, к которой относится событие
    Decimal quantity;
    Decimal orderQuantity;
    Decimal price;
    Decimal commission;
    Decimal fees;
    Decimal releasedCost;                       ///< Себестоимость закрытого объёма (SCALE_OUT)
    Timestamp executedAt;
    bool split = false;                         ///< Нога разделённого ордера
};

} // namespace tradebook::domain
