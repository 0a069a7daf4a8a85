// include/settings/RebuildSettings.hpp
#pragma once

#include "domain/TradingCalendar.hpp"
#include <string>
#include <cstdlib>
#include <cstdint>
#include <stdexcept>

namespace tradebook::settings {

/**
 * @brief Настройки пересборки сделок
 *
 * Читает параметры из переменных окружения:
 * - TRADEBOOK_GROUP_WORKERS: потоков на группы одного пользователя (4)
 * - TRADEBOOK_USER_WORKERS: пользователей параллельно в пакетной задаче (2)
 * - TRADEBOOK_HOLDING_PERIOD_MODE: CALENDAR_DAY или ELAPSED
 * - TRADEBOOK_INTRADAY_THRESHOLD_SECONDS: порог для ELAPSED (86400)
 * - TRADEBOOK_EXCHANGE_UTC_OFFSET_MINUTES: смещение биржи от UTC (-300)
 * - TRADEBOOK_ALLOW_SHORT_FROM_FLAT: разрешать шорт продажей из FLAT (true)
 *
 * Некорректное значение бросает std::invalid_argument при старте.
 * Число потоков ограничено MAX_WORKERS.
 * Сеттеры нужны тестам и CLI.
 */
class RebuildSettings {
public:
    static constexpr int64_t MAX_WORKERS = 1024;

    RebuildSettings() {
        groupWorkers_ = parseWorkers("TRADEBOOK_GROUP_WORKERS", getEnvOrDefault("TRADEBOOK_GROUP_WORKERS", "4"));
        userWorkers_ = parseWorkers("TRADEBOOK_USER_WORKERS", getEnvOrDefault("TRADEBOOK_USER_WORKERS", "2"));
        holdingPeriodMode_ = domain::holdingPeriodModeFromString(
            getEnvOrDefault("TRADEBOOK_HOLDING_PERIOD_MODE", "CALENDAR_DAY"));
        intradayThresholdSeconds_ = parsePositive("TRADEBOOK_INTRADAY_THRESHOLD_SECONDS",
            getEnvOrDefault("TRADEBOOK_INTRADAY_THRESHOLD_SECONDS", "86400"));
        int64_t offset = parseInteger("TRADEBOOK_EXCHANGE_UTC_OFFSET_MINUTES",
            getEnvOrDefault("TRADEBOOK_EXCHANGE_UTC_OFFSET_MINUTES", "-300"));
        if (offset < -14 * 60 || offset > 14 * 60) {
            throw std::invalid_argument("TRADEBOOK_EXCHANGE_UTC_OFFSET_MINUTES out of range");
        }
        utcOffsetMinutes_ = static_cast<int>(offset);
        allowShortFromFlat_ = parseBool("TRADEBOOK_ALLOW_SHORT_FROM_FLAT",
            getEnvOrDefault("TRADEBOOK_ALLOW_SHORT_FROM_FLAT", "true"));
    }

    int getGroupWorkers() const { return groupWorkers_; }
    int getUserWorkers() const { return userWorkers_; }
    domain::HoldingPeriodMode getHoldingPeriodMode() const { return holdingPeriodMode_; }
    int64_t getIntradayThresholdSeconds() const { return intradayThresholdSeconds_; }
    int getUtcOffsetMinutes() const { return utcOffsetMinutes_; }
    bool isShortFromFlatAllowed() const { return allowShortFromFlat_; }

    domain::TradingCalendar calendar() const {
        return domain::TradingCalendar(utcOffsetMinutes_, holdingPeriodMode_, intradayThresholdSeconds_);
    }

    void setGroupWorkers(int value) { groupWorkers_ = value; }
    void setUserWorkers(int value) { userWorkers_ = value; }
    void setHoldingPeriodMode(domain::HoldingPeriodMode value) { holdingPeriodMode_ = value; }
    void setIntradayThresholdSeconds(int64_t value) { intradayThresholdSeconds_ = value; }
    void setUtcOffsetMinutes(int value) { utcOffsetMinutes_ = value; }
    void setShortFromFlatAllowed(bool value) { allowShortFromFlat_ = value; }

private:
    int groupWorkers_;
    int userWorkers_;
    domain::HoldingPeriodMode holdingPeriodMode_;
    int64_t intradayThresholdSeconds_;
    int utcOffsetMinutes_;
    bool allowShortFromFlat_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static int64_t parseInteger(const char* name, const std::string& text) {
        size_t consumed = 0;
        int64_t value = 0;
        try {
            value = std::stoll(text, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not an integer: " + text);
        }
        if (consumed != text.size()) {
            throw std::invalid_argument(std::string(name) + " is not an integer: " + text);
        }
        return value;
    }

    static int64_t parsePositive(const char* name, const std::string& text) {
        int64_t value = parseInteger(name, text);
        if (value <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive: " + text);
        }
        return value;
    }

    static int parseWorkers(const char* name, const std::string& text) {
        int64_t value = parsePositive(name, text);
        if (value > MAX_WORKERS) {
            throw std::invalid_argument(std::string(name) + " must not exceed "
                                        + std::to_string(MAX_WORKERS) + ": " + text);
        }
        return static_cast<int>(value);
    }

    static bool parseBool(const char* name, const std::string& text) {
        if (text == "true" || text == "1") return true;
        if (text == "false" || text == "0") return false;
        throw std::invalid_argument(std::string(name) + " must be true or false: " + text);
    }
};

} // namespace tradebook::settings
