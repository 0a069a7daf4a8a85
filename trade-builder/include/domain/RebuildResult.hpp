#pragma once

#include "enums/RebuildScope.hpp"
#include "Trade.hpp"
#include "Diagnostics.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace tradebook::domain {

/**
 * @brief Итог пересборки одного пользователя
 *
 * trades содержит только созданные или обновлённые в этом запуске
 * сделки. Группы с проблемами перечислены в problems, их сделки
 * не записывались.
 */
struct RebuildResult {
    std::string userId;
    RebuildScope scope = RebuildScope::INCREMENTAL;
    std::vector<Trade> trades;
    std::vector<SkippedOrder> skippedOrders;
    std::vector<GroupProblem> problems;
    Timestamp startedAt;
    Timestamp finishedAt;

    bool hasProblems() const {
        return !problems.empty();
    }

    /**
     * @brief Есть ли группы, требующие сверки истории ордеров
     */
    bool requiresReconciliation() const {
        return std::any_of(problems.begin(), problems.end(), [](const GroupProblem& p) {
            return p.kind == ProblemKind::RECONCILIATION_REQUIRED;
        });
    }

    /**
     * @brief Есть ли проблемы, о которых нужно явно сообщить вызывающему
     *
     * Сверка и откат записи не исправляются повторным запуском сами по себе
     * (откат можно повторить, но молча считать успехом нельзя).
     */
    bool requiresAttention() const {
        return std::any_of(problems.begin(), problems.end(), [](const GroupProblem& p) {
            return p.kind == ProblemKind::RECONCILIATION_REQUIRED
                || p.kind == ProblemKind::ATOMICITY_FAILURE;
        });
    }

    size_t openTradesCount() const {
        return static_cast<size_t>(std::count_if(trades.begin(), trades.end(),
            [](const Trade& t) { return t.isOpen(); }));
    }
};

} // namespace tradebook::domain
