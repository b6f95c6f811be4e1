// include/tsnorm/detail/date_time_string.hpp
#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/detail/time_math.hpp"
#include "tsnorm/types.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <cstdint>
#include <cstdio>

namespace tsnorm::detail {

/**
 * Validated elements of a date and time string.
 *
 * Optional components the string did not carry are zero, except the
 * fraction and the time zone offset which stay empty so callers can tell
 * "absent" from "zero".
 */
struct DateTimeElements {
    int year{0};
    int month{0};
    int day{0};
    int hours{0};
    int minutes{0};
    int seconds{0};
    std::optional<int> nanoseconds;      ///< Fraction of second
    std::optional<int> time_zone_offset; ///< Minutes from UTC

    constexpr bool operator==(const DateTimeElements&) const noexcept = default;
};

constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

/// Read count decimal digits at offset, or -1 when any of them is not a digit
constexpr int read_digits(std::string_view text, size_t offset, size_t count) noexcept {
    if (offset + count > text.size()) {
        return -1;
    }
    int value = 0;
    for (size_t i = offset; i < offset + count; ++i) {
        if (!is_digit(text[i])) {
            return -1;
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

/**
 * Parse a "[+-]hh:mm" time zone offset that must end the string.
 *
 * @return Signed offset in minutes
 */
inline ParseResult<int> parse_time_zone_offset(std::string_view text) noexcept {
    if (text.size() != 6 || (text[0] != '+' && text[0] != '-') || text[3] != ':') {
        return make_parse_error(ParseErrorCode::invalid_format);
    }
    const int hours = read_digits(text, 1, 2);
    const int minutes = read_digits(text, 4, 2);
    if (hours < 0 || minutes < 0) {
        return make_parse_error(ParseErrorCode::invalid_format);
    }
    if (hours > 23 || minutes > 59) {
        return make_parse_error(ParseErrorCode::time_zone_out_of_range);
    }
    const int offset = hours * static_cast<int>(minutes_per_hour) + minutes;
    return text[0] == '-' ? -offset : offset;
}

/**
 * Scan a date and time string.
 *
 * Grammar:  YYYY-MM-DD[ hh:mm:ss[.fff|.ffffff]][+-hh:mm]
 *
 * The fraction of second is 3 (milliseconds) or 6 (microseconds) digits.
 * A format may additionally accept the width it renders itself, so that
 * its own output reads back exactly (7 digits for 100 ns ticks, 9 for
 * nanoseconds). The time zone offset may follow either the date or the
 * time of day.
 *
 * The scan is O(length) and allocation free.
 *
 * @param text Date and time string
 * @param native_fraction_width Extra fraction width accepted, 0 for none
 * @return Validated elements or the reason the string was rejected
 */
inline ParseResult<DateTimeElements> parse_date_time_string(
    std::string_view text, int native_fraction_width = 0) noexcept {
    DateTimeElements elements{};

    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return make_parse_error(ParseErrorCode::invalid_format);
    }
    elements.year = read_digits(text, 0, 4);
    elements.month = read_digits(text, 5, 2);
    elements.day = read_digits(text, 8, 2);
    if (elements.year < 0 || elements.month < 0 || elements.day < 0) {
        return make_parse_error(ParseErrorCode::invalid_format);
    }

    size_t offset = 10;
    if (offset < text.size() && text[offset] == ' ') {
        ++offset;
        if (offset + 8 > text.size() || text[offset + 2] != ':' || text[offset + 5] != ':') {
            return make_parse_error(ParseErrorCode::invalid_format);
        }
        elements.hours = read_digits(text, offset, 2);
        elements.minutes = read_digits(text, offset + 3, 2);
        elements.seconds = read_digits(text, offset + 6, 2);
        if (elements.hours < 0 || elements.minutes < 0 || elements.seconds < 0) {
            return make_parse_error(ParseErrorCode::invalid_format);
        }
        offset += 8;

        if (offset < text.size() && text[offset] == '.') {
            ++offset;
            size_t end = offset;
            while (end < text.size() && is_digit(text[end])) {
                ++end;
            }
            const int width = static_cast<int>(end - offset);
            if (width == 0) {
                return make_parse_error(ParseErrorCode::invalid_format);
            }
            if (width != 3 && width != 6 && (width != native_fraction_width || width > 9)) {
                return make_parse_error(ParseErrorCode::unsupported_fraction);
            }
            elements.nanoseconds = read_digits(text, offset, static_cast<size_t>(width)) *
                                   static_cast<int>(pow10(9 - width));
            offset = end;
        }
    }

    if (offset < text.size()) {
        auto time_zone_offset = parse_time_zone_offset(text.substr(offset));
        if (!time_zone_offset) {
            return make_parse_error(time_zone_offset.error().code);
        }
        elements.time_zone_offset = *time_zone_offset;
    }

    if (elements.year < 1 || elements.year > max_year) {
        return make_parse_error(ParseErrorCode::year_out_of_range);
    }
    if (elements.month < 1 || elements.month > 12) {
        return make_parse_error(ParseErrorCode::month_out_of_range);
    }
    if (elements.day < 1 || elements.day > days_in_month(elements.year, elements.month)) {
        return make_parse_error(ParseErrorCode::day_out_of_range);
    }
    if (elements.hours > 23 || elements.minutes > 59 || elements.seconds > 59) {
        return make_parse_error(ParseErrorCode::time_out_of_range);
    }
    return elements;
}

/**
 * Render "YYYY-MM-DD hh:mm:ss[.f...]".
 *
 * @param fraction Sub-second value already expressed in fraction_width digits
 * @param fraction_width Number of fraction digits, 0 for none
 * @param separator Character between date and time, ' ' or 'T'
 */
inline std::string format_date_time(const CalendarDate& date, const TimeOfDay& time,
                                    uint64_t fraction, int fraction_width, char separator = ' ') {
    char buffer[48];
    int length = std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d%c%02d:%02d:%02d",
                               static_cast<int>(date.year), date.month, date.day, separator,
                               time.hours, time.minutes, time.seconds);
    if (fraction_width > 0) {
        length += std::snprintf(buffer + length, sizeof(buffer) - static_cast<size_t>(length),
                                ".%0*llu", fraction_width,
                                static_cast<unsigned long long>(fraction));
    }
    return std::string(buffer, static_cast<size_t>(length));
}

/// ISO 8601 zone designator: "Z" for UTC, otherwise "+hh:mm" or "-hh:mm"
inline std::string format_time_zone_designator(int time_zone_offset) {
    if (time_zone_offset == 0) {
        return "Z";
    }
    const int64_t offset = time_zone_offset;
    const int64_t magnitude = offset < 0 ? -offset : offset;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%c%02lld:%02lld", offset < 0 ? '-' : '+',
                  static_cast<long long>(magnitude / minutes_per_hour),
                  static_cast<long long>(magnitude % minutes_per_hour));
    return std::string(buffer);
}

} // namespace tsnorm::detail
