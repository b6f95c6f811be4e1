#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/date_time_values.hpp"
#include "tsnorm/decimal.hpp"
#include "tsnorm/detail/date_time_string.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/detail/time_math.hpp"
#include "tsnorm/field.hpp"
#include "tsnorm/types.hpp"

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace tsnorm {

/**
 * Calendar elements of a TimeElements value.
 *
 * fraction counts units of the format's precision (milliseconds or
 * microseconds) and is 0 for whole-second formats.
 */
struct TimeElementsTuple {
    int year{0};
    int month{0};
    int day{0};
    int hours{0};
    int minutes{0};
    int seconds{0};
    int fraction{0};

    constexpr bool operator==(const TimeElementsTuple&) const noexcept = default;
};

/// Concept for the constant sets accepted by BasicTimeElements
template <typename F>
concept ElementsFormat = requires {
    { F::class_name } -> std::convertible_to<std::string_view>;
    { F::precision } -> std::convertible_to<Precision>;
};

/**
 * Date and time held as calendar elements rather than a tick count.
 *
 * Used for values recovered from text or from structures that store the
 * year, month, day and time of day separately. The serialized field
 * "time_elements_tuple" carries six elements, plus the fraction for the
 * millisecond and microsecond variants.
 *
 * @tparam Format Constant set naming the class and its precision
 */
template <ElementsFormat Format>
class BasicTimeElements : public DateTimeValues {
public:
    using format_type = Format;

    static constexpr std::string_view class_name_v = Format::class_name;

    /// Number of fraction digits carried by the fraction element
    static constexpr int fraction_width = fraction_digits(Format::precision);

    /// Number of elements in the serialized tuple
    static constexpr size_t tuple_size = fraction_width > 0 ? 7 : 6;

    static_assert(fraction_width == 0 || fraction_width == 3 || fraction_width == 6,
                  "TimeElements precision must be seconds, milliseconds or microseconds");

    BasicTimeElements() noexcept : DateTimeValues(Format::precision) {}

    /**
     * Build from calendar elements.
     *
     * @return The value, or ParseError naming the first element out of range
     */
    static ParseResult<BasicTimeElements> from_tuple(const TimeElementsTuple& tuple) {
        auto valid = validate(tuple);
        if (!valid) {
            return make_parse_error(valid.error().code);
        }
        BasicTimeElements result;
        result.elements_ = tuple;
        return result;
    }

    std::string_view class_name() const noexcept override { return Format::class_name; }

    std::unique_ptr<DateTimeValues> clone() const override {
        return std::make_unique<BasicTimeElements>(*this);
    }

    /// Calendar elements, or nullopt if not set
    std::optional<TimeElementsTuple> tuple() const noexcept { return elements_; }

    ParseResult<void> copy_from_date_time_string(std::string_view time_string) override {
        auto parsed = detail::parse_date_time_string(time_string, fraction_width);
        if (!parsed) {
            return make_parse_error(parsed.error().code);
        }
        const auto divisor = static_cast<int>(detail::pow10(9 - fraction_width));
        elements_ = TimeElementsTuple{parsed->year,
                                      parsed->month,
                                      parsed->day,
                                      parsed->hours,
                                      parsed->minutes,
                                      parsed->seconds,
                                      fraction_width > 0
                                          ? parsed->nanoseconds.value_or(0) / divisor
                                          : 0};
        store_time_zone_offset(parsed->time_zone_offset.value_or(0));
        invalidate();
        return {};
    }

    std::optional<std::string> copy_to_date_time_string() const override {
        if (!elements_) {
            return std::nullopt;
        }
        return detail::format_date_time(
            CalendarDate{elements_->year, elements_->month, elements_->day},
            TimeOfDay{0, elements_->hours, elements_->minutes, elements_->seconds},
            static_cast<uint64_t>(elements_->fraction), fraction_width);
    }

    std::optional<CalendarDate> get_date() const override {
        if (!elements_) {
            return std::nullopt;
        }
        return CalendarDate{elements_->year, elements_->month, elements_->day};
    }

    std::optional<TimeOfDay> get_time_of_day() const override {
        if (!elements_) {
            return std::nullopt;
        }
        return TimeOfDay{0, elements_->hours, elements_->minutes, elements_->seconds};
    }

protected:
    std::optional<Decimal> compute_normalized_timestamp() const override {
        if (!elements_) {
            return std::nullopt;
        }
        const int64_t seconds =
            posix_seconds_from_elements(elements_->year, elements_->month, elements_->day,
                                        elements_->hours, elements_->minutes, elements_->seconds);
        const auto units =
            static_cast<detail::int128_t>(seconds) *
                static_cast<detail::int128_t>(detail::pow10(fraction_width)) +
            elements_->fraction;
        return Decimal::from_units<fraction_width>(units) - time_zone_correction();
    }

    FieldList native_fields() const override {
        FieldList result;
        if (elements_) {
            std::vector<int64_t> items{elements_->year,    elements_->month,
                                       elements_->day,     elements_->hours,
                                       elements_->minutes, elements_->seconds};
            if constexpr (fraction_width > 0) {
                items.push_back(elements_->fraction);
            }
            result.push_back({"time_elements_tuple", std::move(items)});
        }
        return result;
    }

    ParseResult<void> copy_from_native_fields(const FieldList& fields) override {
        const auto* value = find_field(fields, "time_elements_tuple");
        if (!value) {
            elements_.reset();
            return {};
        }
        const auto* items = std::get_if<std::vector<int64_t>>(value);
        if (!items || items->size() != tuple_size) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        for (int64_t item : *items) {
            if (!std::in_range<int>(item)) {
                return make_parse_error(ParseErrorCode::invalid_field);
            }
        }

        TimeElementsTuple tuple{};
        tuple.year = static_cast<int>((*items)[0]);
        tuple.month = static_cast<int>((*items)[1]);
        tuple.day = static_cast<int>((*items)[2]);
        tuple.hours = static_cast<int>((*items)[3]);
        tuple.minutes = static_cast<int>((*items)[4]);
        tuple.seconds = static_cast<int>((*items)[5]);
        if constexpr (fraction_width > 0) {
            tuple.fraction = static_cast<int>((*items)[6]);
        }

        if (!validate(tuple)) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        elements_ = tuple;
        return {};
    }

private:
    static ParseResult<void> validate(const TimeElementsTuple& tuple) noexcept {
        if (tuple.year < 1 || tuple.year > max_year) {
            return make_parse_error(ParseErrorCode::year_out_of_range);
        }
        if (tuple.month < 1 || tuple.month > 12) {
            return make_parse_error(ParseErrorCode::month_out_of_range);
        }
        if (tuple.day < 1 || tuple.day > days_in_month(tuple.year, tuple.month)) {
            return make_parse_error(ParseErrorCode::day_out_of_range);
        }
        if (tuple.hours < 0 || tuple.hours > 23 || tuple.minutes < 0 || tuple.minutes > 59 ||
            tuple.seconds < 0 || tuple.seconds > 59) {
            return make_parse_error(ParseErrorCode::time_out_of_range);
        }
        if (tuple.fraction < 0 ||
            static_cast<uint64_t>(tuple.fraction) >= detail::pow10(fraction_width)) {
            return make_parse_error(ParseErrorCode::time_out_of_range);
        }
        return {};
    }

    std::optional<TimeElementsTuple> elements_;
};

namespace formats {

struct TimeElements {
    static constexpr std::string_view class_name = "TimeElements";
    static constexpr Precision precision = Precision::seconds;
};

struct TimeElementsMilliseconds {
    static constexpr std::string_view class_name = "TimeElementsInMilliseconds";
    static constexpr Precision precision = Precision::milliseconds;
};

struct TimeElementsMicroseconds {
    static constexpr std::string_view class_name = "TimeElementsInMicroseconds";
    static constexpr Precision precision = Precision::microseconds;
};

} // namespace formats

using TimeElements = BasicTimeElements<formats::TimeElements>;
using TimeElementsInMilliseconds = BasicTimeElements<formats::TimeElementsMilliseconds>;
using TimeElementsInMicroseconds = BasicTimeElements<formats::TimeElementsMicroseconds>;

} // namespace tsnorm
