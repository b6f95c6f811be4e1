#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/date_time_values.hpp"
#include "tsnorm/decimal.hpp"
#include "tsnorm/detail/date_time_string.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstdint>

namespace tsnorm {

/**
 * RFC 2579 DateAndTime elements as carried in SNMP.
 *
 * The time zone is expressed as a direction and an hours/minutes distance
 * from UTC; the date and time fields are local time.
 */
struct RFC2579Tuple {
    int year{0};
    int month{0};
    int day{0};
    int hours{0};
    int minutes{0};
    int seconds{0};
    int deciseconds{0};
    char direction_from_utc{'+'};
    int hours_from_utc{0};
    int minutes_from_utc{0};

    constexpr bool operator==(const RFC2579Tuple&) const noexcept = default;
};

/**
 * RFC 2579 date and time.
 *
 * Precision is 100 milliseconds. The time zone distance is folded into the
 * shared time zone offset so the two can never disagree:
 * ('+', 2, 0) <-> 120 minutes, ('-', 5, 30) <-> -330 minutes.
 */
class RFC2579DateTime : public DateTimeValues {
public:
    static constexpr std::string_view class_name_v = "RFC2579DateTime";
    static constexpr int max_supported_year = 65536;

    /// The tuple carries at most 13 hours 59 minutes from UTC
    static constexpr int max_utc_distance = 13 * 60 + 59;

    RFC2579DateTime() noexcept : DateTimeValues(Precision::hundred_milliseconds) {}

    /**
     * Build from a 10-field tuple.
     *
     * @return The value, or ParseError naming the first field out of range
     */
    static ParseResult<RFC2579DateTime> from_tuple(const RFC2579Tuple& tuple) {
        auto valid = validate(tuple);
        if (!valid) {
            return make_parse_error(valid.error().code);
        }
        RFC2579DateTime result;
        result.elements_ = Elements{tuple.year,    tuple.month,   tuple.day,        tuple.hours,
                                    tuple.minutes, tuple.seconds, tuple.deciseconds};
        const int distance = tuple.hours_from_utc * static_cast<int>(minutes_per_hour) +
                             tuple.minutes_from_utc;
        result.store_time_zone_offset(tuple.direction_from_utc == '-' ? -distance : distance);
        return result;
    }

    std::string_view class_name() const noexcept override { return class_name_v; }

    int max_time_zone_offset() const noexcept override { return max_utc_distance; }

    std::unique_ptr<DateTimeValues> clone() const override {
        return std::make_unique<RFC2579DateTime>(*this);
    }

    /// Full 10-field tuple, or nullopt if not set
    std::optional<RFC2579Tuple> tuple() const noexcept {
        if (!elements_) {
            return std::nullopt;
        }
        const int offset = time_zone_offset();
        const int distance = offset < 0 ? -offset : offset;
        return RFC2579Tuple{elements_->year,
                            elements_->month,
                            elements_->day,
                            elements_->hours,
                            elements_->minutes,
                            elements_->seconds,
                            elements_->deciseconds,
                            offset < 0 ? '-' : '+',
                            distance / static_cast<int>(minutes_per_hour),
                            distance % static_cast<int>(minutes_per_hour)};
    }

    ParseResult<void> copy_from_date_time_string(std::string_view time_string) override {
        auto parsed = detail::parse_date_time_string(time_string, 1);
        if (!parsed) {
            return make_parse_error(parsed.error().code);
        }
        const int time_zone_offset = parsed->time_zone_offset.value_or(0);
        if (!accepts_time_zone_offset(time_zone_offset)) {
            return make_parse_error(ParseErrorCode::time_zone_out_of_range);
        }
        elements_ = Elements{parsed->year,
                             parsed->month,
                             parsed->day,
                             parsed->hours,
                             parsed->minutes,
                             parsed->seconds,
                             parsed->nanoseconds.value_or(0) / 100'000'000};
        store_time_zone_offset(time_zone_offset);
        invalidate();
        return {};
    }

    std::optional<std::string> copy_to_date_time_string() const override {
        if (!elements_ || elements_->year < 1 || elements_->year > max_year) {
            return std::nullopt;
        }
        return detail::format_date_time(
            CalendarDate{elements_->year, elements_->month, elements_->day},
            TimeOfDay{0, elements_->hours, elements_->minutes, elements_->seconds},
            static_cast<uint64_t>(elements_->deciseconds), 1);
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
        return Decimal::from_units<1>(static_cast<detail::int128_t>(seconds) * 10 +
                                      elements_->deciseconds) -
               time_zone_correction();
    }

    /// Seven date and time elements; the time zone travels as time_zone_offset
    FieldList native_fields() const override {
        FieldList result;
        if (elements_) {
            result.push_back({"rfc2579_date_time_tuple",
                              std::vector<int64_t>{elements_->year, elements_->month,
                                                   elements_->day, elements_->hours,
                                                   elements_->minutes, elements_->seconds,
                                                   elements_->deciseconds}});
        }
        return result;
    }

    ParseResult<void> copy_from_native_fields(const FieldList& fields) override {
        const auto* value = find_field(fields, "rfc2579_date_time_tuple");
        if (!value) {
            elements_.reset();
            return {};
        }
        const auto* items = std::get_if<std::vector<int64_t>>(value);
        if (!items || items->size() != 7) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        for (int64_t item : *items) {
            if (item < 0 || item > max_supported_year) {
                return make_parse_error(ParseErrorCode::invalid_field);
            }
        }
        RFC2579Tuple tuple{};
        tuple.year = static_cast<int>((*items)[0]);
        tuple.month = static_cast<int>((*items)[1]);
        tuple.day = static_cast<int>((*items)[2]);
        tuple.hours = static_cast<int>((*items)[3]);
        tuple.minutes = static_cast<int>((*items)[4]);
        tuple.seconds = static_cast<int>((*items)[5]);
        tuple.deciseconds = static_cast<int>((*items)[6]);

        auto valid = validate(tuple);
        if (!valid) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        elements_ = Elements{tuple.year,    tuple.month,   tuple.day,        tuple.hours,
                             tuple.minutes, tuple.seconds, tuple.deciseconds};
        return {};
    }

private:
    struct Elements {
        int year;
        int month;
        int day;
        int hours;
        int minutes;
        int seconds;
        int deciseconds;
    };

    static ParseResult<void> validate(const RFC2579Tuple& tuple) noexcept {
        if (tuple.year < 0 || tuple.year > max_supported_year) {
            return make_parse_error(ParseErrorCode::year_out_of_range);
        }
        if (tuple.month < 1 || tuple.month > 12) {
            return make_parse_error(ParseErrorCode::month_out_of_range);
        }
        if (tuple.day < 1 || tuple.day > days_in_month(tuple.year, tuple.month)) {
            return make_parse_error(ParseErrorCode::day_out_of_range);
        }
        if (tuple.hours < 0 || tuple.hours > 23 || tuple.minutes < 0 || tuple.minutes > 59 ||
            tuple.seconds < 0 || tuple.seconds > 59 || tuple.deciseconds < 0 ||
            tuple.deciseconds > 9) {
            return make_parse_error(ParseErrorCode::time_out_of_range);
        }
        if ((tuple.direction_from_utc != '+' && tuple.direction_from_utc != '-') ||
            tuple.hours_from_utc < 0 || tuple.hours_from_utc > 13 ||
            tuple.minutes_from_utc < 0 || tuple.minutes_from_utc > 59) {
            return make_parse_error(ParseErrorCode::time_zone_out_of_range);
        }
        return {};
    }

    std::optional<Elements> elements_;
};

} // namespace tsnorm
