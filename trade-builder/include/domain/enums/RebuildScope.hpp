#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Режим пересборки
 */
enum class RebuildScope {
    INCREMENTAL, ///< Только неиспользованные ордера
    FULL         ///< Полная пересборка с нуля
};

inline std::string toString(RebuildScope value) {
    switch (value) {
        case RebuildScope::INCREMENTAL: return "INCREMENTAL";
        case RebuildScope::FULL:        return "FULL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline RebuildScope rebuildScopeFromString(const std::string& str) {
    if (str == "INCREMENTAL") return RebuildScope::INCREMENTAL;
    if (str == "FULL")        return RebuildScope::FULL;
    throw std::invalid_argument("Unknown RebuildScope: " + str);
}

} // namespace tradebook::domain
