#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/decimal.hpp"
#include "tsnorm/detail/date_time_string.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/field.hpp"
#include "tsnorm/types.hpp"

#include <compare>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cstdint>

namespace tsnorm {

/**
 * Abstract date and time value.
 *
 * DateTimeValues is the runtime face of every format: it carries the state
 * all formats share (precision, time zone offset, local time flag) and the
 * memoized normalized timestamp, and declares the string and field contract
 * each format implements.
 *
 * ## Normalized timestamp
 * Seconds since 1970-01-01 00:00:00 UTC as an exact Decimal. Computed on
 * first read and cached. Every operation that replaces the native value or
 * the time zone offset calls invalidate(), so a read after a mutation never
 * observes a stale value.
 *
 * ## Error channels
 * - Input rejection: copy_from_*() return ParseResult<void>; on failure the
 *   instance keeps its previous state.
 * - Output degradation: copy_to_*() and accessors return std::nullopt when
 *   the value is absent or outside the format's range. They never throw.
 *
 * ## Thread safety
 * No internal locking. Concurrent reads of one instance are safe once the
 * normalized timestamp has been read; mutation requires exclusive access.
 */
class DateTimeValues {
public:
    virtual ~DateTimeValues() = default;

    /// Name the format is registered under in the Factory
    [[nodiscard]] virtual std::string_view class_name() const noexcept = 0;

    /// Polymorphic copy
    [[nodiscard]] virtual std::unique_ptr<DateTimeValues> clone() const = 0;

    Precision precision() const noexcept { return precision_; }

    /// Offset from UTC in minutes, 0 when UTC or not specified
    int time_zone_offset() const noexcept { return time_zone_offset_; }

    /**
     * Replace the time zone offset.
     *
     * @param minutes Offset from UTC, positive east of Greenwich
     * @return ParseError(time_zone_out_of_range) when the format cannot
     *         represent the offset; the value is then unchanged
     */
    ParseResult<void> set_time_zone_offset(int minutes) noexcept {
        if (!accepts_time_zone_offset(minutes)) {
            return make_parse_error(ParseErrorCode::time_zone_out_of_range);
        }
        time_zone_offset_ = minutes;
        invalidate();
        return {};
    }

    /// Largest offset distance in minutes the format can represent
    virtual int max_time_zone_offset() const noexcept { return tsnorm::max_time_zone_offset; }

    bool accepts_time_zone_offset(int minutes) const noexcept {
        return minutes >= -max_time_zone_offset() && minutes <= max_time_zone_offset();
    }

    /// True when the native value is local time rather than UTC
    bool is_local_time() const noexcept { return is_local_time_; }
    void set_is_local_time(bool local) noexcept { is_local_time_ = local; }

    /**
     * Normalized timestamp.
     *
     * @return Seconds since the POSIX epoch with the fraction the format
     *         resolves, or nullopt when it cannot be determined
     */
    std::optional<Decimal> normalized_timestamp() const {
        if (!normalized_timestamp_) {
            normalized_timestamp_ = compute_normalized_timestamp();
        }
        return normalized_timestamp_;
    }

    /**
     * Copy a date and time string into the native value.
     *
     * @param time_string "YYYY-MM-DD[ hh:mm:ss[.fff|.ffffff]][+-hh:mm]"
     * @return Empty result on success, ParseError otherwise
     */
    virtual ParseResult<void> copy_from_date_time_string(std::string_view time_string) = 0;

    /**
     * Copy the native value to "YYYY-MM-DD hh:mm:ss[.f...]".
     *
     * The fraction width is fixed by the format's precision.
     */
    [[nodiscard]] virtual std::optional<std::string> copy_to_date_time_string() const = 0;

    /// ISO 8601 rendering: "YYYY-MM-DDThh:mm:ss[.f...]" plus "Z" or "+hh:mm"
    [[nodiscard]] std::optional<std::string> copy_to_date_time_string_iso8601() const {
        auto text = copy_to_date_time_string();
        if (!text || text->size() < 19 || (*text)[10] != ' ') {
            return std::nullopt;
        }
        (*text)[10] = 'T';
        *text += detail::format_time_zone_designator(time_zone_offset_);
        return text;
    }

    /// Calendar date of the native value, without time zone correction
    [[nodiscard]] virtual std::optional<CalendarDate> get_date() const = 0;

    /// Time of day of the native value, without time zone correction
    [[nodiscard]] virtual std::optional<TimeOfDay> get_time_of_day() const = 0;

    /// Whole seconds since the POSIX epoch, rounded toward negative infinity
    [[nodiscard]] std::optional<int64_t> copy_to_posix_timestamp() const {
        auto normalized = normalized_timestamp();
        if (!normalized) {
            return std::nullopt;
        }
        return narrow(normalized->floor());
    }

    /// Microseconds since the POSIX epoch, rounded toward negative infinity
    [[nodiscard]] std::optional<int64_t> copy_to_posix_microseconds() const {
        auto normalized = normalized_timestamp();
        if (!normalized) {
            return std::nullopt;
        }
        return narrow(normalized->rescaled(6));
    }

    /**
     * Named fields sufficient to reconstruct this value.
     *
     * The format's native fields, followed by "time_zone_offset" when it is
     * not 0 and "is_local_time" when it is set.
     */
    [[nodiscard]] FieldList fields() const {
        FieldList result = native_fields();
        if (time_zone_offset_ != 0) {
            result.push_back({"time_zone_offset", static_cast<int64_t>(time_zone_offset_)});
        }
        if (is_local_time_) {
            result.push_back({"is_local_time", true});
        }
        return result;
    }

    /**
     * Restore the value from named fields.
     *
     * Fields not present keep their default. Nothing is modified when any
     * field is malformed.
     */
    ParseResult<void> copy_from_fields(const FieldList& fields) {
        int time_zone_offset = 0;
        bool is_local_time = false;
        if (const auto* value = find_field(fields, "time_zone_offset")) {
            auto minutes = field_as<int>(*value);
            if (!minutes) {
                return make_parse_error(ParseErrorCode::invalid_field);
            }
            if (!accepts_time_zone_offset(*minutes)) {
                return make_parse_error(ParseErrorCode::time_zone_out_of_range);
            }
            time_zone_offset = *minutes;
        }
        if (const auto* value = find_field(fields, "is_local_time")) {
            auto local = field_as<bool>(*value);
            if (!local) {
                return make_parse_error(ParseErrorCode::invalid_field);
            }
            is_local_time = *local;
        }

        auto result = copy_from_native_fields(fields);
        if (!result) {
            return result;
        }
        time_zone_offset_ = time_zone_offset;
        is_local_time_ = is_local_time;
        invalidate();
        return {};
    }

protected:
    explicit DateTimeValues(Precision precision, int time_zone_offset = 0) noexcept
        : precision_(precision),
          time_zone_offset_(time_zone_offset) {}

    DateTimeValues(const DateTimeValues&) = default;
    DateTimeValues& operator=(const DateTimeValues&) = default;

    /// Derive the normalized timestamp from the native value
    virtual std::optional<Decimal> compute_normalized_timestamp() const = 0;

    /// Format specific fields, excluding the time zone offset and flag
    virtual FieldList native_fields() const = 0;

    /// Restore format specific fields; must not modify state on failure
    virtual ParseResult<void> copy_from_native_fields(const FieldList& fields) = 0;

    /// Time zone offset correction in seconds, subtracted during normalization
    Decimal time_zone_correction() const noexcept {
        return Decimal(static_cast<int64_t>(time_zone_offset_) * seconds_per_minute);
    }

    /// Replace the time zone offset as part of a larger update
    void store_time_zone_offset(int minutes) noexcept { time_zone_offset_ = minutes; }

    /// Drop the cached normalized timestamp
    void invalidate() const noexcept { normalized_timestamp_.reset(); }

private:
    // 64-bit view of a widened count, nullopt when it does not fit
    static std::optional<int64_t> narrow(detail::int128_t value) noexcept {
        if (value < std::numeric_limits<int64_t>::min() ||
            value > std::numeric_limits<int64_t>::max()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }

    Precision precision_;
    int time_zone_offset_{0};
    bool is_local_time_{false};
    mutable std::optional<Decimal> normalized_timestamp_;
};

/**
 * Order two values by their normalized timestamps.
 *
 * @return unordered when either timestamp cannot be determined
 */
inline std::partial_ordering compare(const DateTimeValues& lhs, const DateTimeValues& rhs) {
    auto a = lhs.normalized_timestamp();
    auto b = rhs.normalized_timestamp();
    if (!a || !b) {
        return std::partial_ordering::unordered;
    }
    return *a <=> *b;
}

} // namespace tsnorm
