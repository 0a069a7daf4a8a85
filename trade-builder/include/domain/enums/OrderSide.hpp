#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Сторона исполненного ордера
 */
enum class OrderSide {
    BUY,  ///< Покупка
    SELL  ///< Продажа
};

inline std::string toString(OrderSide value) {
    switch (value) {
        case OrderSide::BUY:  return "BUY";
        case OrderSide::SELL: return "SELL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderSide orderSideFromString(const std::string& str) {
    if (str == "BUY")  return OrderSide::BUY;
    if (str == "SELL") return OrderSide::SELL;
    throw std::invalid_argument("Unknown OrderSide: " + str);
}

inline OrderSide opposite(OrderSide side) {
    return side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
}

} // namespace tradebook::domain
