#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include "hedge_ngin/core/types.hpp"

namespace hedge_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date
 */
inline long long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

/**
 * @brief Parse a "YYYY-MM-DD" date into a UTC-midnight timestamp
 * @return nullopt when the string is not a valid calendar date
 */
inline std::optional<Timestamp> parse_date(const std::string& text) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char trailing = '\0';
    if (text.size() != 10 ||
        std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &trailing) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }

    static const unsigned days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    unsigned limit = days_in_month[m - 1] + ((m == 2 && leap) ? 1 : 0);
    if (d > limit) {
        return std::nullopt;
    }

    return Timestamp(std::chrono::hours(24 * days_from_civil(y, m, d)));
}

/**
 * @brief Format a timestamp as "YYYY-MM-DD" (UTC)
 */
inline std::string format_date(const Timestamp& ts) {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    safe_gmtime(&time_c, &result);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as ISO-8601 UTC with milliseconds
 */
inline std::string format_iso8601(const Timestamp& ts) {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch())
                  .count() % 1000;
    if (ms < 0) {
        ms += 1000;
    }
    std::tm result;
    safe_gmtime(&time_c, &result);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &result);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%03lldZ", buffer, static_cast<long long>(ms));
    return std::string(full);
}

/**
 * @brief Truncate a timestamp to its UTC calendar day
 */
inline Timestamp to_utc_day(const Timestamp& ts) {
    auto days = std::chrono::duration_cast<std::chrono::hours>(ts.time_since_epoch()).count();
    long long day_index = days >= 0 ? days / 24 : (days - 23) / 24;
    return Timestamp(std::chrono::hours(24 * day_index));
}

inline Timestamp add_days(const Timestamp& ts, int days) {
    return ts + std::chrono::hours(24 * days);
}

}  // namespace core
}  // namespace hedge_ngin
