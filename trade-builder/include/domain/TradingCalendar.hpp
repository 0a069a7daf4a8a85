#pragma once

#include "enums/HoldingPeriod.hpp"
#include "enums/MarketSession.hpp"
#include "Timestamp.hpp"
#include <string>
#include <stdexcept>
#include <cstdint>

namespace tradebook::domain {

/**
 * @brief Способ классификации срока удержания
 */
enum class HoldingPeriodMode {
    CALENDAR_DAY,   ///< INTRADAY, если вход и выход в один биржевой день
    ELAPSED         ///< INTRADAY, если прошло не больше порога
};

inline std::string toString(HoldingPeriodMode mode) {
    return mode == HoldingPeriodMode::CALENDAR_DAY ? "CALENDAR_DAY" : "ELAPSED";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline HoldingPeriodMode holdingPeriodModeFromString(const std::string& str) {
    if (str == "CALENDAR_DAY") return HoldingPeriodMode::CALENDAR_DAY;
    if (str == "ELAPSED")      return HoldingPeriodMode::ELAPSED;
    throw std::invalid_argument("Unknown HoldingPeriodMode: " + str);
}

/**
 * @brief Календарь биржи: фиксированное смещение от UTC и основная сессия 09:30-16:00
 *
 * Переход на летнее время не учитывается.
 */
class TradingCalendar {
public:
    static constexpr int REGULAR_OPEN_MINUTE = 9 * 60 + 30;
    static constexpr int REGULAR_CLOSE_MINUTE = 16 * 60;
    static constexpr int DEFAULT_UTC_OFFSET_MINUTES = -300;
    static constexpr int64_t DEFAULT_INTRADAY_THRESHOLD_SECONDS = 86400;

    TradingCalendar() = default;

    TradingCalendar(int utcOffsetMinutes, HoldingPeriodMode mode, int64_t intradayThresholdSeconds)
        : utcOffsetMinutes_(utcOffsetMinutes), mode_(mode),
          intradayThresholdSeconds_(intradayThresholdSeconds) {}

    HoldingPeriod classifyHolding(const Timestamp& entryAt, const Timestamp& exitAt) const {
        if (mode_ == HoldingPeriodMode::ELAPSED) {
            return entryAt.secondsUntil(exitAt) <= intradayThresholdSeconds_
                ? HoldingPeriod::INTRADAY : HoldingPeriod::MULTIDAY;
        }
        return entryAt.localDayNumber(utcOffsetMinutes_) == exitAt.localDayNumber(utcOffsetMinutes_)
            ? HoldingPeriod::INTRADAY : HoldingPeriod::MULTIDAY;
    }

    MarketSession classifySession(const Timestamp& at) const {
        int minute = at.localMinuteOfDay(utcOffsetMinutes_);
        if (minute < REGULAR_OPEN_MINUTE) {
            return MarketSession::PRE_MARKET;
        }
        if (minute < REGULAR_CLOSE_MINUTE) {
            return MarketSession::REGULAR;
        }
        return MarketSession::AFTER_HOURS;
    }

    int utcOffsetMinutes() const { return utcOffsetMinutes_; }
    HoldingPeriodMode mode() const { return mode_; }
    int64_t intradayThresholdSeconds() const { return intradayThresholdSeconds_; }

private:
    int utcOffsetMinutes_ = DEFAULT_UTC_OFFSET_MINUTES;
    HoldingPeriodMode mode_ = HoldingPeriodMode::CALENDAR_DAY;
    int64_t intradayThresholdSeconds_ = DEFAULT_INTRADAY_THRESHOLD_SECONDS;
};

} // namespace tradebook::domain
