#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/date_time_values.hpp"
#include "tsnorm/decimal.hpp"
#include "tsnorm/detail/date_time_string.hpp"
#include "tsnorm/detail/time_math.hpp"
#include "tsnorm/types.hpp"

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <cstdint>

namespace tsnorm {

/**
 * Concept for format constant sets accepted by TickTime
 *
 * A tick format counts ticks of 1/ticks_per_second seconds since its epoch.
 * It declares nothing but constants; all behaviour lives in TickTime.
 */
template <typename F>
concept TickFormat = requires {
    typename F::timestamp_type;
    { F::class_name } -> std::convertible_to<std::string_view>;
    { F::epoch } -> std::convertible_to<Epoch>;
    { F::precision } -> std::convertible_to<Precision>;
    { F::ticks_per_second } -> std::convertible_to<uint64_t>;
    { F::min_timestamp } -> std::convertible_to<typename F::timestamp_type>;
    { F::max_timestamp } -> std::convertible_to<typename F::timestamp_type>;
} && std::is_integral_v<typename F::timestamp_type>;

/**
 * Shared engine for every tick-counting format.
 *
 * ## Normalization
 *   normalized = timestamp / ticks_per_second
 *                - epoch_to_posix_seconds(epoch)
 *                - time_zone_offset * 60
 *
 * ticks_per_second must be a power of ten so the division is a scale shift
 * of the Decimal and stays exact.
 *
 * ## Range
 * Native values outside [min_timestamp, max_timestamp], or whose date falls
 * outside years 1-9999, have no string form: output operations return
 * std::nullopt.
 *
 * @tparam Format Constant set describing the format
 */
template <TickFormat Format>
class TickTime : public DateTimeValues {
public:
    using format_type = Format;
    using timestamp_type = typename Format::timestamp_type;

    static constexpr std::string_view class_name_v = Format::class_name;
    static constexpr Epoch epoch = Format::epoch;
    static constexpr uint64_t ticks_per_second = Format::ticks_per_second;
    static constexpr timestamp_type min_timestamp = Format::min_timestamp;
    static constexpr timestamp_type max_timestamp = Format::max_timestamp;

    /// Seconds between the format's epoch and 1970-01-01
    static constexpr int64_t epoch_offset = epoch_to_posix_seconds(Format::epoch);

    /// Number of fraction digits of the native tick
    static constexpr int tick_scale = detail::exact_log10(Format::ticks_per_second);

    static_assert(tick_scale >= 0, "ticks_per_second must be a power of ten");
    static_assert(Format::min_timestamp <= Format::max_timestamp, "Invalid timestamp range");

    /// Value without a native timestamp
    TickTime() noexcept : DateTimeValues(Format::precision) {}

    explicit TickTime(timestamp_type timestamp) noexcept
        : DateTimeValues(Format::precision),
          timestamp_(timestamp) {}

    std::string_view class_name() const noexcept override { return Format::class_name; }

    std::unique_ptr<DateTimeValues> clone() const override {
        return std::make_unique<TickTime>(*this);
    }

    /// Native timestamp, or nullopt if not set
    std::optional<timestamp_type> timestamp() const noexcept { return timestamp_; }

    void set_timestamp(timestamp_type timestamp) noexcept {
        timestamp_ = timestamp;
        invalidate();
    }

    void reset_timestamp() noexcept {
        timestamp_.reset();
        invalidate();
    }

    /// True when value lies within the format's declared range
    static constexpr bool in_range(detail::int128_t value) noexcept {
        return value >= static_cast<detail::int128_t>(Format::min_timestamp) &&
               value <= static_cast<detail::int128_t>(Format::max_timestamp);
    }

    ParseResult<void> copy_from_date_time_string(std::string_view time_string) override {
        auto elements =
            detail::parse_date_time_string(time_string, fraction_digits(Format::precision));
        if (!elements) {
            return make_parse_error(elements.error().code);
        }

        const int64_t posix_seconds = posix_seconds_from_elements(
            elements->year, elements->month, elements->day, elements->hours, elements->minutes,
            elements->seconds);

        detail::int128_t ticks =
            static_cast<detail::int128_t>(posix_seconds + epoch_offset) * ticks_per_second;
        ticks += detail::nanoseconds_to_ticks(elements->nanoseconds.value_or(0),
                                              ticks_per_second);

        if (!in_range(ticks)) {
            return make_parse_error(ParseErrorCode::timestamp_out_of_range);
        }

        timestamp_ = static_cast<timestamp_type>(ticks);
        store_time_zone_offset(elements->time_zone_offset.value_or(0));
        invalidate();
        return {};
    }

    std::optional<std::string> copy_to_date_time_string() const override {
        auto parts = split();
        if (!parts) {
            return std::nullopt;
        }
        const int width = fraction_digits(Format::precision);
        const auto fraction = static_cast<uint64_t>(
            parts->remainder * static_cast<detail::int128_t>(detail::pow10(width)) /
            static_cast<detail::int128_t>(ticks_per_second));
        return detail::format_date_time(parts->date, parts->time, fraction, width);
    }

    std::optional<CalendarDate> get_date() const override {
        auto parts = split();
        if (!parts) {
            return std::nullopt;
        }
        return parts->date;
    }

    std::optional<TimeOfDay> get_time_of_day() const override {
        auto parts = split();
        if (!parts) {
            return std::nullopt;
        }
        return parts->time;
    }

protected:
    std::optional<Decimal> compute_normalized_timestamp() const override {
        if (!timestamp_) {
            return std::nullopt;
        }
        return Decimal::from_units<tick_scale>(static_cast<detail::int128_t>(*timestamp_)) -
               Decimal(epoch_offset) - time_zone_correction();
    }

    FieldList native_fields() const override {
        FieldList result;
        if (timestamp_) {
            if constexpr (std::is_signed_v<timestamp_type>) {
                result.push_back({"timestamp", static_cast<int64_t>(*timestamp_)});
            } else {
                result.push_back({"timestamp", static_cast<uint64_t>(*timestamp_)});
            }
        }
        return result;
    }

    ParseResult<void> copy_from_native_fields(const FieldList& fields) override {
        const auto* value = find_field(fields, "timestamp");
        if (!value) {
            timestamp_.reset();
            return {};
        }
        auto timestamp = field_as<timestamp_type>(*value);
        if (!timestamp) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        timestamp_ = *timestamp;
        return {};
    }

private:
    // Calendar breakdown of the native value
    struct Parts {
        CalendarDate date;
        TimeOfDay time;
        detail::int128_t remainder; // Sub-second ticks in [0, ticks_per_second)
    };

    // Widest second count that can still land inside years 1-9999 for any epoch
    static constexpr int64_t max_calendar_seconds = 2 * 10'000LL * 366 * seconds_per_day;

    std::optional<Parts> split() const noexcept {
        if (!timestamp_ || !in_range(*timestamp_)) {
            return std::nullopt;
        }
        auto [seconds, remainder] = detail::floor_divmod(
            static_cast<detail::int128_t>(*timestamp_),
            static_cast<detail::int128_t>(ticks_per_second));
        if (seconds > max_calendar_seconds || seconds < -max_calendar_seconds) {
            return std::nullopt;
        }

        const TimeOfDay time = time_from_seconds(static_cast<int64_t>(seconds));
        const CalendarDate date = date_from_days(Format::epoch, time.days);
        if (date.year < 1 || date.year > max_year) {
            return std::nullopt;
        }
        return Parts{date, TimeOfDay{0, time.hours, time.minutes, time.seconds}, remainder};
    }

    std::optional<timestamp_type> timestamp_;
};

} // namespace tsnorm
