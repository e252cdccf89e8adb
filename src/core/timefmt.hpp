#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

/**
 * @brief Wall-clock formatting helpers (local time)
 *
 * All formatting goes through localtime_r so the log store and alert
 * e-mails agree on the operator's time zone.
 */
namespace timefmt {

using wall_clock = std::chrono::system_clock;

inline std::tm local_tm(wall_clock::time_point tp) {
    std::time_t t = wall_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

inline std::string format(wall_clock::time_point tp, const char* fmt) {
    std::tm tm = local_tm(tp);
    std::ostringstream os;
    os << std::put_time(&tm, fmt);
    return os.str();
}

/// ISO-8601 with milliseconds and UTC offset, e.g. 2024-03-01T14:05:09.123+0100
inline std::string iso8601(wall_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::tm tm = local_tm(tp);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms
       << std::put_time(&tm, "%z");
    return os.str();
}

/// Timestamp used in alert subjects and bodies: MM-DD-YYYY HH:MM:SS
inline std::string human(wall_clock::time_point tp) {
    return format(tp, "%m-%d-%Y %H:%M:%S");
}

/// Calendar day of a time point, used to roll the log file
inline int day_key(wall_clock::time_point tp) {
    std::tm tm = local_tm(tp);
    return (tm.tm_year + 1900) * 10000 + (tm.tm_mon + 1) * 100 + tm.tm_mday;
}

} // namespace timefmt
