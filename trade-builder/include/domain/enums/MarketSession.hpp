#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Торговая сессия момента входа
 */
enum class MarketSession {
    PRE_MARKET,  ///< До открытия
    REGULAR,     ///< Основная сессия
    AFTER_HOURS  ///< После закрытия
};

inline std::string toString(MarketSession value) {
    switch (value) {
        case MarketSession::PRE_MARKET:  return "PRE_MARKET";
        case MarketSession::REGULAR:     return "REGULAR";
        case MarketSession::AFTER_HOURS: return "AFTER_HOURS";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline MarketSession marketSessionFromString(const std::string& str) {
    if (str == "PRE_MARKET")  return MarketSession::PRE_MARKET;
    if (str == "REGULAR")     return MarketSession::REGULAR;
    if (str == "AFTER_HOURS") return MarketSession::AFTER_HOURS;
    throw std::invalid_argument("Unknown MarketSession: " + str);
}

} // namespace tradebook::domain
