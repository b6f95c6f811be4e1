#pragma once

#include "tsnorm/detail/time_math.hpp"
#include "tsnorm/types.hpp"

#include <compare>

#include <cstdint>

namespace tsnorm {

/**
 * Origin of a format's native timestamp space.
 *
 * Epochs are compile-time constants declared once per format and never
 * mutated. Dates are proleptic Gregorian.
 */
struct Epoch {
    int year{1970};
    int month{1};
    int day{1};

    constexpr auto operator<=>(const Epoch&) const noexcept = default;
};

/// The POSIX epoch, 1970-01-01
inline constexpr Epoch posix_epoch{1970, 1, 1};

/// Calendar date produced by the day-count conversions
struct CalendarDate {
    int64_t year{0};
    int month{0};
    int day{0};

    constexpr auto operator<=>(const CalendarDate&) const noexcept = default;
};

/// Time of day with the number of whole days carried out of the second count
struct TimeOfDay {
    int64_t days{0};
    int hours{0};
    int minutes{0};
    int seconds{0};

    constexpr auto operator<=>(const TimeOfDay&) const noexcept = default;
};

/**
 * Proleptic Gregorian leap year rule: divisible by 4, not by 100 unless
 * divisible by 400. Applied uniformly, no Julian cutover.
 */
constexpr bool is_leap_year(int64_t year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr int days_in_year(int64_t year) noexcept { return is_leap_year(year) ? 366 : 365; }

/**
 * Number of days in a month.
 *
 * @param year Year, used for February only
 * @param month Month in [1, 12]
 * @return Days in the month, or 0 when month is out of range
 */
constexpr int days_in_month(int64_t year, int month) noexcept {
    constexpr int table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return table[month - 1];
}

namespace detail {

/**
 * Days from 1970-01-01 to the given civil date.
 *
 * Algorithm from Howard Hinnant's date library (public domain). Computes in
 * 400-year eras starting on March 1 so the leap day is the last day of the
 * computational year.
 */
constexpr int64_t days_from_civil(int64_t year, int month, int day) noexcept {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yoe = year - era * 400;                                   // [0, 399]
    const int64_t mp = (month + 9) % 12;                                    // March == 0
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;                       // [0, 365]
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;              // [0, 146096]
    return era * 146097 + doe - 719468;
}

/// Inverse of days_from_civil()
constexpr CalendarDate civil_from_days(int64_t days) noexcept {
    days += 719468; // Shift to March 1, 0000
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;                                // [0, 146096]
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);            // [0, 365]
    const int64_t mp = (5 * doy + 2) / 153;                                 // [0, 11]
    const int day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return CalendarDate{year, month, day};
}

} // namespace detail

/**
 * Day count from an epoch to a date.
 *
 * Callers pass range-checked month and day values; the arithmetic does not
 * reject dates such as February 30.
 *
 * @return Number of days, negative when the date precedes the epoch
 */
constexpr int64_t days_since_epoch(const Epoch& epoch, int64_t year, int month,
                                   int day) noexcept {
    return detail::days_from_civil(year, month, day) -
           detail::days_from_civil(epoch.year, epoch.month, epoch.day);
}

/**
 * Date that lies a number of days after an epoch.
 *
 * Exact inverse of days_since_epoch() for every day count, including
 * negative counts of signed formats.
 */
constexpr CalendarDate date_from_days(const Epoch& epoch, int64_t day_count) noexcept {
    return detail::civil_from_days(
        detail::days_from_civil(epoch.year, epoch.month, epoch.day) + day_count);
}

constexpr int64_t seconds_of_day(int hours, int minutes, int seconds) noexcept {
    return hours * seconds_per_hour + minutes * seconds_per_minute + seconds;
}

/**
 * Split a second count into whole days and a time of day.
 *
 * Uses floor semantics so a negative count borrows from the day count:
 * -1 -> {days: -1, 23:59:59}.
 */
constexpr TimeOfDay time_from_seconds(int64_t total_seconds) noexcept {
    auto [days, remainder] = detail::floor_divmod(total_seconds, seconds_per_day);
    const int hours = static_cast<int>(remainder / seconds_per_hour);
    remainder %= seconds_per_hour;
    const int minutes = static_cast<int>(remainder / seconds_per_minute);
    const int seconds = static_cast<int>(remainder % seconds_per_minute);
    return TimeOfDay{days, hours, minutes, seconds};
}

/**
 * Seconds between an epoch and 1970-01-01.
 *
 * Positive for epochs before 1970, so adding it to a POSIX second count
 * yields seconds since the epoch.
 */
constexpr int64_t epoch_to_posix_seconds(const Epoch& epoch) noexcept {
    return -detail::days_from_civil(epoch.year, epoch.month, epoch.day) * seconds_per_day;
}

/// Seconds since 1970-01-01 00:00:00 for a set of date and time elements
constexpr int64_t posix_seconds_from_elements(int64_t year, int month, int day, int hours,
                                              int minutes, int seconds) noexcept {
    return detail::days_from_civil(year, month, day) * seconds_per_day +
           seconds_of_day(hours, minutes, seconds);
}

static_assert(epoch_to_posix_seconds(Epoch{1, 1, 1}) == 62'135'596'800);
static_assert(epoch_to_posix_seconds(posix_epoch) == 0);

} // namespace tsnorm
