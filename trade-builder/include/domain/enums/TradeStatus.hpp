#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Статус сделки
 */
enum class TradeStatus {
    OPEN,   ///< Позиция ещё не закрыта
    CLOSED  ///< Позиция закрыта полностью
};

inline std::string toString(TradeStatus value) {
    switch (value) {
        case TradeStatus::OPEN:   return "OPEN";
        case TradeStatus::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TradeStatus tradeStatusFromString(const std::string& str) {
    if (str == "OPEN")   return TradeStatus::OPEN;
    if (str == "CLOSED") return TradeStatus::CLOSED;
    throw std::invalid_argument("Unknown TradeStatus: " + str);
}

} // namespace tradebook::domain
