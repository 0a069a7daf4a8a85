#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Направление сделки (позиции)
 */
enum class TradeSide {
    LONG,  ///< Длинная позиция
    SHORT  ///< Короткая позиция
};

inline std::string toString(TradeSide value) {
    switch (value) {
        case TradeSide::LONG:  return "LONG";
        case TradeSide::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TradeSide tradeSideFromString(const std::string& str) {
    if (str == "LONG")  return TradeSide::LONG;
    if (str == "SHORT") return TradeSide::SHORT;
    throw std::invalid_argument("Unknown TradeSide: " + str);
}

} // namespace tradebook::domain
