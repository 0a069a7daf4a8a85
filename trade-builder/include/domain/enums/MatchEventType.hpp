#pragma once

#include <string>

namespace tradebook::domain {

/**
 * @brief События автомата позиции
 */
enum class MatchEventType {
    OPEN,       ///< Открытие из FLAT
    SCALE_IN,   ///< Наращивание в ту же сторону
    SCALE_OUT,  ///< Частичное или полное закрытие объёма
    CLOSE,      ///< Позиция стала FLAT
    FLIP        ///< Открытие противоположной позиции остатком того же ордера
};

inline std::string toString(MatchEventType value) {
    switch (value) {
        case MatchEventType::OPEN:      return "OPEN";
        case MatchEventType::SCALE_IN:  return "SCALE_IN";
        case MatchEventType::SCALE_OUT: return "SCALE_OUT";
        case MatchEventType::CLOSE:     return "CLOSE";
        case MatchEventType::FLIP:      return "FLIP";
    }
    return "UNKNOWN";
}

} // namespace tradebook::domain
