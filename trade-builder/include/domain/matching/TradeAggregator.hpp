#pragma once

#include "domain/Trade.hpp"
#include "domain/MatchEvent.hpp"
#include "domain/GroupKey.hpp"
#include "domain/TradingCalendar.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tradebook::domain::matching {

/**
 * @brief Всё, что агрегатору нужно знать помимо событий
 */
struct TradeContext {
    std::string userId;
    AssetClass assetClass = AssetClass::EQUITY;
    TradingCalendar calendar;
    std::function<std::string()> idGenerator;
};

/**
 * @brief Сворачивает события автомата одной группы в сделки
 *
 * OPEN и FLIP начинают новую сделку, SCALE_IN и SCALE_OUT дополняют
 * текущую, CLOSE её завершает. Реализованный P&L считается по каждому
 * закрываемому срезу:
 *   (стоимость выхода - списанная себестоимость) * знак стороны
 *   - пропорциональная доля комиссий входа - комиссии ноги выхода
 */
class TradeAggregator {
public:
    TradeAggregator(GroupKey key, TradeContext context);

    /**
     * @throws SequencerContractViolation если событие не согласуется с текущей сделкой
     */
    void consume(const MatchEvent& event);

    /**
     * @brief Следующая открытая сделка получит этот id вместо сгенерированного
     */
    void reuseIdForNextTrade(const std::string& id);

    const Trade* current() const;

    /**
     * @brief Все сделки в порядке построения, последняя может быть OPEN
     */
    std::vector<Trade> takeTrades();

private:
    void startTrade(const MatchEvent& event);
    void addEntry(const MatchEvent& event);
    void addExit(const MatchEvent& event);
    void closeTrade(const MatchEvent& event);
    void attachOrder(const std::string& orderId);
    Trade& requireCurrent(const MatchEvent& event);

    GroupKey key_;
    TradeContext context_;
    std::optional<std::string> reservedId_;
    std::optional<Trade> current_;
    std::vector<Trade> finished_;
};

} // namespace tradebook::domain::matching
