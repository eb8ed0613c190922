// src/core/time_utils.cpp

#include "allocsim/core/time_utils.hpp"
#include <cstdio>

namespace allocsim {
namespace core {

namespace {

constexpr long SECONDS_PER_DAY = 86400;

// Days since 1970-01-01 of a proleptic Gregorian date (H. Hinnant's algorithm)
long days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = static_cast<long>(y) - era * 400;
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

long days_since_epoch(const Timestamp& ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    long days = static_cast<long>(secs / SECONDS_PER_DAY);
    if (secs % SECONDS_PER_DAY < 0) {
        --days;
    }
    return days;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[month - 1];
}

}  // namespace

Timestamp make_date(int year, int month, int day) {
    return Timestamp(std::chrono::seconds(days_from_civil(year, month, day) * SECONDS_PER_DAY));
}

Timestamp to_date(const Timestamp& ts) {
    return Timestamp(std::chrono::seconds(days_since_epoch(ts) * SECONDS_PER_DAY));
}

CivilDate to_civil(const Timestamp& ts) {
    std::time_t t = static_cast<std::time_t>(days_since_epoch(ts) * SECONDS_PER_DAY);
    std::tm tm{};
    safe_gmtime(&t, &tm);
    return CivilDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

int weekday(const Timestamp& ts) {
    // 1970-01-01 was a Thursday
    long days = days_since_epoch(ts);
    long wd = (days + 4) % 7;
    return static_cast<int>(wd < 0 ? wd + 7 : wd);
}

long days_between(const Timestamp& from, const Timestamp& to) {
    return days_since_epoch(to) - days_since_epoch(from);
}

std::string format_date(const Timestamp& ts) {
    CivilDate c = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", c.year, c.month, c.day);
    return std::string(buffer);
}

Result<Timestamp> parse_date(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    char trailing = '\0';
    if (text.size() != 10 ||
        std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) != 3) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Expected a YYYY-MM-DD date, got '" + text + "'",
                                     "TimeUtils");
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Date out of range: '" + text + "'", "TimeUtils");
    }
    return make_date(year, month, day);
}

std::vector<Timestamp> weekday_calendar(const Timestamp& start, const Timestamp& end) {
    std::vector<Timestamp> dates;
    const Timestamp last = to_date(end);
    for (Timestamp day = to_date(start); day <= last; day += std::chrono::hours(24)) {
        int wd = weekday(day);
        if (wd != 0 && wd != 6) {
            dates.push_back(day);
        }
    }
    return dates;
}

}  // namespace core
}  // namespace allocsim
