// include/allocsim/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <string>
#include <vector>
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {
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
 * Calendar dates in allocsim are UTC midnights, so every date field
 * extraction goes through this function.
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
 * @brief Year / month / day triple of a calendar date
 */
struct CivilDate {
    int year;
    int month;  // 1-12
    int day;    // 1-31
};

/**
 * @brief Build the UTC-midnight timestamp of a calendar date
 * @param year Gregorian year
 * @param month Month 1-12
 * @param day Day of month 1-31
 */
Timestamp make_date(int year, int month, int day);

/**
 * @brief Truncate a timestamp to its UTC-midnight date
 */
Timestamp to_date(const Timestamp& ts);

/**
 * @brief Split a timestamp into its UTC calendar fields
 */
CivilDate to_civil(const Timestamp& ts);

/**
 * @brief Weekday of a date, 0 = Sunday ... 6 = Saturday
 */
int weekday(const Timestamp& ts);

/**
 * @brief Whole days between two dates (negative when to < from)
 */
long days_between(const Timestamp& from, const Timestamp& to);

/**
 * @brief Format a date as YYYY-MM-DD
 */
std::string format_date(const Timestamp& ts);

/**
 * @brief Parse a YYYY-MM-DD string
 * @return The UTC-midnight timestamp or INVALID_ARGUMENT
 */
Result<Timestamp> parse_date(const std::string& text);

/**
 * @brief All Monday-Friday dates in [start, end]
 *
 * A simple trading calendar without holidays.
 */
std::vector<Timestamp> weekday_calendar(const Timestamp& start, const Timestamp& end);

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

}  // namespace core
}  // namespace allocsim
