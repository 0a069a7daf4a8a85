#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Роль ордера внутри сделки
 */
enum class AllocationRole {
    ENTRY, ///< Открытие или наращивание позиции
    EXIT   ///< Частичное или полное закрытие
};

inline std::string toString(AllocationRole value) {
    switch (value) {
        case AllocationRole::ENTRY: return "ENTRY";
        case AllocationRole::EXIT:  return "EXIT";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AllocationRole allocationRoleFromString(const std::string& str) {
    if (str == "ENTRY") return AllocationRole::ENTRY;
    if (str == "EXIT")  return AllocationRole::EXIT;
    throw std::invalid_argument("Unknown AllocationRole: " + str);
}

} // namespace tradebook::domain
