// include/divcap/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include "divcap/core/types.hpp"

namespace divcap {
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
 * @brief Broken-down calendar date
 */
struct CivilDate {
    int year{1970};
    unsigned month{1};
    unsigned day{1};
};

// Days since 1970-01-01 for a proleptic Gregorian date
inline int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

/**
 * @brief Build a trading date (UTC midnight) from calendar fields
 */
inline Timestamp make_date(int year, unsigned month, unsigned day) {
    return Timestamp(std::chrono::hours(24 * days_from_civil(year, month, day)));
}

inline int64_t days_since_epoch(const Timestamp& ts) {
    auto hours = std::chrono::duration_cast<std::chrono::hours>(ts.time_since_epoch()).count();
    // floor division keeps pre-1970 dates on the right day
    return hours >= 0 ? hours / 24 : (hours - 23) / 24;
}

inline CivilDate to_civil(const Timestamp& ts) {
    return civil_from_days(days_since_epoch(ts));
}

/**
 * @brief Truncate a timestamp to UTC midnight of its calendar day
 */
inline Timestamp to_date(const Timestamp& ts) {
    return Timestamp(std::chrono::hours(24 * days_since_epoch(ts)));
}

inline Timestamp add_days(const Timestamp& ts, int64_t days) {
    return ts + std::chrono::hours(24 * days);
}

/**
 * @brief Day of week, 0 = Sunday ... 6 = Saturday
 */
inline unsigned weekday(const Timestamp& ts) {
    int64_t z = days_since_epoch(ts);
    return static_cast<unsigned>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

inline std::string format_date(const Timestamp& ts) {
    CivilDate c = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month, c.day);
    return std::string(buffer);
}

/**
 * @brief Parse a "YYYY-MM-DD" date
 * @return The date, or std::nullopt if the text is not a valid calendar date
 */
inline std::optional<Timestamp> parse_date(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char trailing = '\0';
    if (std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing) != 3) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    Timestamp ts = make_date(year, month, day);
    CivilDate check = to_civil(ts);
    if (check.month != month || check.day != day) {
        return std::nullopt;
    }
    return ts;
}

}  // namespace core
}  // namespace divcap
