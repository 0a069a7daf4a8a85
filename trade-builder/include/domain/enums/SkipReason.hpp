#pragma once

#include <string>

namespace tradebook::domain {

/**
 * @brief Причина исключения ордера из сопоставления
 */
enum class SkipReason {
    MISSING_EXECUTION_TIME,  ///< Нет времени исполнения
    NON_POSITIVE_QUANTITY,   ///< Количество <= 0
    NEGATIVE_PRICE,          ///< Цена < 0
    CANCELLED,               ///< Ордер отменён
    NEGATIVE_CHARGES,        ///< Отрицательная комиссия или сбор
    MISSING_INSTRUMENT,      ///< Пустой счёт или тикер
    DUPLICATE                ///< Повтор уже встреченного id
};

inline std::string toString(SkipReason value) {
    switch (value) {
        case SkipReason::MISSING_EXECUTION_TIME: return "MISSING_EXECUTION_TIME";
        case SkipReason::NON_POSITIVE_QUANTITY:  return "NON_POSITIVE_QUANTITY";
        case SkipReason::NEGATIVE_PRICE:         return "NEGATIVE_PRICE";
        case SkipReason::CANCELLED:              return "CANCELLED";
        case SkipReason::NEGATIVE_CHARGES:       return "NEGATIVE_CHARGES";
        case SkipReason::MISSING_INSTRUMENT:     return "MISSING_INSTRUMENT";
        case SkipReason::DUPLICATE:              return "DUPLICATE";
    }
    return "UNKNOWN";
}

} // namespace tradebook::domain
