#pragma once

#include "enums/SkipReason.hpp"
#include "enums/ProblemKind.hpp"
#include "GroupKey.hpp"
#include <string>

namespace tradebook::domain {

/**
 * @brief Ордер, исключённый секвенсором (предупреждение, не ошибка)
 */
struct SkippedOrder {
    std::string orderId;
    std::string accountId;
    std::string symbol;
    SkipReason reason = SkipReason::MISSING_EXECUTION_TIME;
};

/**
 * @brief Проблема, из-за которой группа не дала сделок
 */
struct GroupProblem {
    std::string accountId;
    std::string symbol;
    ProblemKind kind = ProblemKind::GROUP_FAILURE;
    std::string message;

    GroupProblem() = default;

    GroupProblem(const GroupKey& key, ProblemKind kind, const std::string& message)
        : accountId(key.accountId), symbol(key.symbol), kind(kind), message(message) {}

    GroupKey key() const {
        return GroupKey(accountId, symbol);
    }
};

} // namespace tradebook::domain
