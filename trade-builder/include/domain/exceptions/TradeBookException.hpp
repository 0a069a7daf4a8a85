#pragma once

#include <stdexcept>
#include <string>

namespace tradebook::domain {

/**
 * @brief Базовое исключение пересборки сделок
 */
class TradeBookException : public std::runtime_error {
public:
    explicit TradeBookException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief В автомат позиции попал ордер, который секвенсор должен был отсеять
 *
 * Дефект вызывающего кода. Фатально для группы.
 */
class SequencerContractViolation : public TradeBookException {
public:
    explicit SequencerContractViolation(const std::string& message)
        : TradeBookException("Sequencer contract violation: " + message) {}
};

/**
 * @brief История ордеров не объясняет текущую позицию
 *
 * Фатально для группы: сделка не строится, чтобы не исказить P&L.
 */
class ReconciliationRequiredException : public TradeBookException {
public:
    explicit ReconciliationRequiredException(const std::string& message)
        : TradeBookException("Reconciliation required: " + message) {}
};

/**
 * @brief Запись группы не удалась и была откачена целиком
 *
 * Ордера группы остались непривязанными, операцию можно повторить.
 */
class AtomicityFailureException : public TradeBookException {
public:
    explicit AtomicityFailureException(const std::string& message)
        : TradeBookException("Atomicity failure: " + message) {}
};

/**
 * @brief Пересборка этого пользователя уже выполняется
 */
class RebuildInProgressException : public TradeBookException {
public:
    explicit RebuildInProgressException(const std::string& userId)
        : TradeBookException("Rebuild already in progress for user " + userId),
          userId_(userId) {}

    const std::string& userId() const { return userId_; }

private:
    std::string userId_;
};

} // namespace tradebook::domain
