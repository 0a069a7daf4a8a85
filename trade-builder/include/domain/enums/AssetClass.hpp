#pragma once

#include <string>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Класс инструмента
 */
enum class AssetClass {
    EQUITY,  ///< Акции
    OPTION,  ///< Опционы
    OTHER    ///< Прочие инструменты
};

inline std::string toString(AssetClass value) {
    switch (value) {
        case AssetClass::EQUITY: return "EQUITY";
        case AssetClass::OPTION: return "OPTION";
        case AssetClass::OTHER:  return "OTHER";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки (неизвестные классы брокера сводятся к OTHER)
 */
inline AssetClass assetClassFromString(const std::string& str) {
    if (str == "EQUITY") return AssetClass::EQUITY;
    if (str == "OPTION") return AssetClass::OPTION;
    return AssetClass::OTHER;
}

} // namespace tradebook::domain
