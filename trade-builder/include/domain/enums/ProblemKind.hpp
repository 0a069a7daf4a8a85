#pragma once

#include <string>

namespace tradebook::domain {

/**
 * @brief Вид проблемы, остановившей обработку группы (счёт, тикер)
 */
enum class ProblemKind {
    GROUP_FAILURE,            ///< Исключение внутри конвейера группы
    RECONCILIATION_REQUIRED,  ///< История ордеров не согласуется с позицией
    ATOMICITY_FAILURE         ///< Запись группы откатилась
};

inline std::string toString(ProblemKind value) {
    switch (value) {
        case ProblemKind::GROUP_FAILURE:           return "GROUP_FAILURE";
        case ProblemKind::RECONCILIATION_REQUIRED: return "RECONCILIATION_REQUIRED";
        case ProblemKind::ATOMICITY_FAILURE:       return "ATOMICITY_FAILURE";
    }
    return "UNKNOWN";
}

} // namespace tradebook::domain
