#pragma once

#include <cstdint>

namespace tsnorm {

// Calendar and clock constants
inline constexpr int64_t seconds_per_minute = 60;
inline constexpr int64_t seconds_per_hour = 3600;
inline constexpr int64_t seconds_per_day = 86400;
inline constexpr int64_t minutes_per_hour = 60;
inline constexpr int64_t milliseconds_per_second = 1'000;
inline constexpr int64_t microseconds_per_second = 1'000'000;
inline constexpr int64_t nanoseconds_per_second = 1'000'000'000;

/// Highest year any format may render or parse
inline constexpr int max_year = 9999;

/// Largest time zone distance from UTC in minutes (23:59)
inline constexpr int max_time_zone_offset = 23 * 60 + 59;

/**
 * Declared sub-second resolution of a date and time format
 */
enum class Precision : uint8_t {
    seconds = 0,
    two_seconds,
    hundred_milliseconds,
    milliseconds,
    microseconds,
    hundred_nanoseconds,
    nanoseconds
};

/**
 * @brief Get human-readable name of a precision
 * @param p The precision
 * @return Static string with the precision name
 */
constexpr const char* precision_string(Precision p) noexcept {
    switch (p) {
        case Precision::seconds:
            return "seconds";
        case Precision::two_seconds:
            return "2 seconds";
        case Precision::hundred_milliseconds:
            return "100 milliseconds";
        case Precision::milliseconds:
            return "milliseconds";
        case Precision::microseconds:
            return "microseconds";
        case Precision::hundred_nanoseconds:
            return "100 nanoseconds";
        case Precision::nanoseconds:
            return "nanoseconds";
    }
    return "unknown";
}

/**
 * @brief Number of fraction digits rendered for a precision
 *
 * Seconds and two-second formats render no fraction at all.
 */
constexpr int fraction_digits(Precision p) noexcept {
    switch (p) {
        case Precision::seconds:
        case Precision::two_seconds:
            return 0;
        case Precision::hundred_milliseconds:
            return 1;
        case Precision::milliseconds:
            return 3;
        case Precision::microseconds:
            return 6;
        case Precision::hundred_nanoseconds:
            return 7;
        case Precision::nanoseconds:
            return 9;
    }
    return 0;
}

/**
 * Reasons a date and time value can be rejected on input
 */
enum class ParseErrorCode : uint8_t {
    invalid_format = 0,     ///< String does not match the date and time grammar
    unsupported_fraction,   ///< Fraction of second is not 3 or 6 digits
    year_out_of_range,      ///< Year outside what the format supports
    month_out_of_range,     ///< Month outside 1-12
    day_out_of_range,       ///< Day of month outside the month's length
    time_out_of_range,      ///< Hours, minutes or seconds outside their range
    time_zone_out_of_range, ///< Time zone offset hours or minutes out of range
    timestamp_out_of_range, ///< Resulting native value outside the format's range
    unknown_format,         ///< Class name not present in the format registry
    invalid_field           ///< Serialized field missing or of the wrong type
};

/**
 * @brief Get human-readable description of a parse error code
 * @param code The error code
 * @return Static string describing the error
 */
constexpr const char* parse_error_string(ParseErrorCode code) noexcept {
    switch (code) {
        case ParseErrorCode::invalid_format:
            return "Invalid date and time string";
        case ParseErrorCode::unsupported_fraction:
            return "Unsupported fraction of second size";
        case ParseErrorCode::year_out_of_range:
            return "Unsupported year value";
        case ParseErrorCode::month_out_of_range:
            return "Month value out of bounds";
        case ParseErrorCode::day_out_of_range:
            return "Day of month value out of bounds";
        case ParseErrorCode::time_out_of_range:
            return "Time of day value out of bounds";
        case ParseErrorCode::time_zone_out_of_range:
            return "Time zone offset value out of bounds";
        case ParseErrorCode::timestamp_out_of_range:
            return "Timestamp value out of bounds";
        case ParseErrorCode::unknown_format:
            return "Unsupported date and time class name";
        case ParseErrorCode::invalid_field:
            return "Missing or invalid date and time field";
    }
    return "Unknown error";
}

} // namespace tsnorm
