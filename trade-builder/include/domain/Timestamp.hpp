#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace tradebook::domain {

/**
 * @brief Момент времени в UTC с точностью до микросекунды
 *
 * Разбирает и печатает ISO 8601. Проекции на "торговый день" и
 * "минуту дня" принимают смещение биржи от UTC в минутах.
 */
struct Timestamp {
    using Clock = std::chrono::system_clock;
    using Micros = std::chrono::microseconds;

    std::chrono::time_point<Clock, Micros> value;

    Timestamp() : value(std::chrono::time_point_cast<Micros>(Clock::now())) {}

    explicit Timestamp(std::chrono::time_point<Clock, Micros> tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp();
    }

    static Timestamp fromUnixMicros(int64_t micros) {
        return Timestamp(std::chrono::time_point<Clock, Micros>(Micros(micros)));
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return fromUnixMicros(seconds * 1000000);
    }

    /**
     * @brief Разобрать ISO 8601: "2024-03-01T14:30:00Z", "2024-03-01T14:30:00.250+03:00"
     *
     * Без суффикса зоны время считается UTC. Допускается пробел вместо 'T'.
     * @throws std::invalid_argument если строка не разобрана
     */
    static Timestamp fromString(const std::string& iso) {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        int consumed = 0;
        char sep = 0;
        if (std::sscanf(iso.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                        &year, &month, &day, &sep, &hour, &minute, &second, &consumed) != 7
            || (sep != 'T' && sep != ' ')) {
            throw std::invalid_argument("Invalid timestamp: " + iso);
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
            throw std::invalid_argument("Invalid timestamp: " + iso);
        }

        size_t pos = static_cast<size_t>(consumed);
        int64_t micros = 0;
        if (pos < iso.size() && iso[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < iso.size() && iso[pos] >= '0' && iso[pos] <= '9') {
                if (digits < 6) {
                    micros = micros * 10 + (iso[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                throw std::invalid_argument("Invalid timestamp: " + iso);
            }
            for (int i = digits; i < 6; ++i) {
                micros *= 10;
            }
        }

        int64_t offsetSeconds = 0;
        if (pos < iso.size()) {
            char zone = iso[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            } else if (zone == '+' || zone == '-') {
                int offHours = 0, offMinutes = 0, offConsumed = 0;
                if (std::sscanf(iso.c_str() + pos + 1, "%2d:%2d%n", &offHours, &offMinutes, &offConsumed) != 2) {
                    throw std::invalid_argument("Invalid timestamp offset: " + iso);
                }
                offsetSeconds = (offHours * 3600 + offMinutes * 60) * (zone == '-' ? -1 : 1);
                pos += 1 + static_cast<size_t>(offConsumed);
            }
        }
        if (pos != iso.size()) {
            throw std::invalid_argument("Invalid timestamp: " + iso);
        }

        int64_t seconds = daysFromCivil(year, month, day) * 86400
                        + hour * 3600 + minute * 60 + second - offsetSeconds;
        return fromUnixMicros(seconds * 1000000 + micros);
    }

    /**
     * @brief ISO 8601 в UTC; дробная часть печатается, только если она есть
     */
    std::string toString() const {
        int64_t micros = toUnixMicros();
        int64_t seconds = floorDiv(micros, 1000000);
        int64_t fraction = micros - seconds * 1000000;
        int64_t days = floorDiv(seconds, 86400);
        int64_t secondOfDay = seconds - days * 86400;

        int year = 0, month = 0, day = 0;
        civilFromDays(days, year, month, day);

        char buffer[40];
        if (fraction == 0) {
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                          year, month, day,
                          static_cast<int>(secondOfDay / 3600),
                          static_cast<int>(secondOfDay % 3600 / 60),
                          static_cast<int>(secondOfDay % 60));
        } else {
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06dZ",
                          year, month, day,
                          static_cast<int>(secondOfDay / 3600),
                          static_cast<int>(secondOfDay % 3600 / 60),
                          static_cast<int>(secondOfDay % 60),
                          static_cast<int>(fraction));
        }
        return buffer;
    }

    int64_t toUnixMicros() const {
        return value.time_since_epoch().count();
    }

    int64_t toUnixSeconds() const {
        return floorDiv(toUnixMicros(), 1000000);
    }

    /**
     * @brief Номер календарного дня (от 1970-01-01) в зоне со смещением utcOffsetMinutes
     */
    int64_t localDayNumber(int utcOffsetMinutes) const {
        return floorDiv(toUnixSeconds() + utcOffsetMinutes * 60, 86400);
    }

    /**
     * @brief Минута внутри дня [0, 1440) в зоне со смещением utcOffsetMinutes
     */
    int localMinuteOfDay(int utcOffsetMinutes) const {
        int64_t local = toUnixSeconds() + utcOffsetMinutes * 60;
        return static_cast<int>((local - floorDiv(local, 86400) * 86400) / 60);
    }

    /**
     * @brief Целых секунд от this до other (отрицательно, если other раньше)
     */
    int64_t secondsUntil(const Timestamp& other) const {
        return std::chrono::duration_cast<std::chrono::seconds>(other.value - value).count();
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addMinutes(int64_t minutes) const {
        return Timestamp(value + std::chrono::minutes(minutes));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    static int64_t floorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
    }

    // Алгоритмы days_from_civil / civil_from_days (пролептический григорианский календарь)
    static int64_t daysFromCivil(int64_t y, int m, int d) {
        y -= m <= 2 ? 1 : 0;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const int64_t yoe = y - era * 400;
        const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    static void civilFromDays(int64_t z, int& year, int& month, int& day) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const int64_t doe = z - era * 146097;
        const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const int64_t mp = (5 * doy + 2) / 153;
        day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
    }
};

} // namespace tradebook::domain
