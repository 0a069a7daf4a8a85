#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Классификация срока удержания
 */
enum class HoldingPeriod {
    INTRADAY, ///< Внутри дня
    MULTIDAY  ///< Переходит через границу дня
};

inline std::string toString(HoldingPeriod value) {
    switch (value) {
        case HoldingPeriod::INTRADAY: return "INTRADAY";
        case HoldingPeriod::MULTIDAY: return "MULTIDAY";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline HoldingPeriod holdingPeriodFromString(const std::string& str) {
    if (str == "INTRADAY") return HoldingPeriod::INTRADAY;
    if (str == "MULTIDAY") return HoldingPeriod::MULTIDAY;
    throw std::invalid_argument("Unknown HoldingPeriod: " + str);
}

} // namespace tradebook::domain
