#pragma once

#include "domain/MatchEvent.hpp"
#include "domain/GroupKey.hpp"
#include "domain/Decimal.hpp"
#include <string>
#include <vector>

namespace tradebook::domain::matching {

/**
 * @brief Состояние позиции группы
 */
enum class PositionState {
    FLAT,
    LONG_OPEN,
    SHORT_OPEN
};

inline std::string toString(PositionState state) {
    switch (state) {
        case PositionState::FLAT:       return "FLAT";
        case PositionState::LONG_OPEN:  return "LONG_OPEN";
        case PositionState::SHORT_OPEN: return "SHORT_OPEN";
    }
    return "UNKNOWN";
}

struct MatcherOptions {
    /// Разрешено ли открывать короткую позицию продажей из FLAT
    bool allowShortFromFlat = true;
};

/**
 * @brief Автомат позиции одной группы (счёт, тикер)
 *
 * FLAT -> LONG_OPEN / SHORT_OPEN -> ... Держит открытый объём и его
 * себестоимость (openCost). Средняя цена всегда выводится из этих
 * двух сумм, а не пересчитывается из предыдущей средней.
 *
 * Исполнение против позиции больше её объёма делится на закрывающую
 * и открывающую ноги: SCALE_OUT, CLOSE, FLIP. Ровно равный объём это
 * обычное закрытие без разворота.
 */
class PositionMatcher {
public:
    explicit PositionMatcher(GroupKey key, MatcherOptions options = MatcherOptions());

    /**
     * @brief Применить исполнение и вернуть порождённые события
     * @throws SequencerContractViolation для quantity <= 0
     * @throws ReconciliationRequiredException если продажа из FLAT запрещена
     */
    std::vector<MatchEvent> apply(const Execution& execution);

    PositionState state() const { return state_; }
    bool isFlat() const { return state_ == PositionState::FLAT; }
    const Decimal& openQuantity() const { return quantity_; }
    const Decimal& openCost() const { return openCost_; }

    /**
     * @brief Средняя цена открытого объёма (0 для FLAT)
     */
    Decimal basis() const;

    const GroupKey& key() const { return key_; }

    const MatcherOptions& options() const { return options_; }
    void setOptions(const MatcherOptions& options) { options_ = options; }

private:
    void open(const Execution& execution, const Decimal& quantity,
              const Decimal& commission, const Decimal& fees,
              bool split, MatchEventType type, std::vector<MatchEvent>& events);

    MatchEvent makeEvent(MatchEventType type, const Execution& execution, TradeSide side) const;

    GroupKey key_;
    MatcherOptions options_;
    PositionState state_ = PositionState::FLAT;
    Decimal quantity_;
    Decimal openCost_;
};

} // namespace tradebook::domain::matching
