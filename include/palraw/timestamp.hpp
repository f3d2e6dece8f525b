/**
 * @file timestamp.hpp
 * @brief Calendar and timestamp types used for recording times.
 */

#ifndef PALRAW_TIMESTAMP_HPP
#define PALRAW_TIMESTAMP_HPP

#include <chrono>
#include <cstdio>
#include <string>

namespace palraw {

/// Header start/stop time, whole seconds, no time zone
using DateTime = std::chrono::sys_seconds;

/// Per-sample timestamp
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

/**
 * @brief Format a timestamp as "YYYY-MM-DD HH:MM:SS[.ffffff]".
 *
 * The fraction is omitted for whole seconds, written with microsecond
 * precision when exact, and with nanosecond precision otherwise.
 */
inline std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;

    const auto day = floor<days>(ts);
    const year_month_day ymd{day};
    const hh_mm_ss<nanoseconds> tod{ts - day};
    const long long ns = tod.subseconds().count();

    char buf[48];
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d",
                          static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                          static_cast<int>(tod.minutes().count()),
                          static_cast<int>(tod.seconds().count()));
    if (ns != 0 && n > 0) {
        if (ns % 1000 == 0) {
            std::snprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n), ".%06lld",
                          ns / 1000);
        } else {
            std::snprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n), ".%09lld", ns);
        }
    }
    return buf;
}

/**
 * @brief Format a duration as "[-]D days, HH:MM:SS".
 *
 * Negative durations keep the day count negative and the clock part
 * positive, e.g. -1 hour is "-1 days, 23:00:00".
 */
inline std::string format_duration(std::chrono::seconds duration) {
    using namespace std::chrono;

    const auto whole_days = floor<days>(duration);
    const hh_mm_ss<seconds> tod{duration - whole_days};

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lld days, %02d:%02d:%02d",
                  static_cast<long long>(whole_days.count()),
                  static_cast<int>(tod.hours().count()), static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));
    return buf;
}

} // namespace palraw

#endif // PALRAW_TIMESTAMP_HPP
