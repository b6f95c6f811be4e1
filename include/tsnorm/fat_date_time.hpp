#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/date_time_values.hpp"
#include "tsnorm/decimal.hpp"
#include "tsnorm/detail/bitfield.hpp"
#include "tsnorm/detail/date_time_string.hpp"
#include "tsnorm/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cstdint>

namespace tsnorm {

/**
 * FAT date and time.
 *
 * ## Layout
 * 32-bit value made of two 16-bit words:
 *
 *   date (bits 0-15)            time (bits 16-31)
 *   0-4   day of month (1-31)   16-20 seconds / 2 (0-29)
 *   5-8   month (1-12)          21-26 minutes (0-59)
 *   9-15  years since 1980      27-31 hours (0-23)
 *
 * ## Precision
 * Two seconds. Parsing truncates odd seconds.
 *
 * Packed values with a field out of range have no date: every output
 * operation returns std::nullopt for them.
 */
class FATDateTime : public DateTimeValues {
public:
    static constexpr std::string_view class_name_v = "FATDateTime";
    static constexpr Epoch epoch{1980, 1, 1};
    static constexpr int min_supported_year = 1980;
    static constexpr int max_supported_year = 1980 + 127;

    FATDateTime() noexcept : DateTimeValues(Precision::two_seconds) {}

    explicit FATDateTime(uint32_t fat_date_time) noexcept
        : DateTimeValues(Precision::two_seconds),
          fat_date_time_(fat_date_time) {}

    std::string_view class_name() const noexcept override { return class_name_v; }

    std::unique_ptr<DateTimeValues> clone() const override {
        return std::make_unique<FATDateTime>(*this);
    }

    /// Packed value, or nullopt if not set
    std::optional<uint32_t> fat_date_time() const noexcept { return fat_date_time_; }

    void set_fat_date_time(uint32_t fat_date_time) noexcept {
        fat_date_time_ = fat_date_time;
        invalidate();
    }

    ParseResult<void> copy_from_date_time_string(std::string_view time_string) override {
        auto elements = detail::parse_date_time_string(time_string);
        if (!elements) {
            return make_parse_error(elements.error().code);
        }
        if (elements->year < min_supported_year || elements->year > max_supported_year) {
            return make_parse_error(ParseErrorCode::year_out_of_range);
        }

        uint32_t value = 0;
        value = Fields::day::insert(value, static_cast<uint32_t>(elements->day));
        value = Fields::month::insert(value, static_cast<uint32_t>(elements->month));
        value = Fields::year::insert(
            value, static_cast<uint32_t>(elements->year - min_supported_year));
        value = Fields::half_seconds::insert(value, static_cast<uint32_t>(elements->seconds / 2));
        value = Fields::minutes::insert(value, static_cast<uint32_t>(elements->minutes));
        value = Fields::hours::insert(value, static_cast<uint32_t>(elements->hours));

        fat_date_time_ = value;
        store_time_zone_offset(elements->time_zone_offset.value_or(0));
        invalidate();
        return {};
    }

    std::optional<std::string> copy_to_date_time_string() const override {
        auto elements = decode();
        if (!elements) {
            return std::nullopt;
        }
        return detail::format_date_time(elements->date, elements->time, 0, 0);
    }

    std::optional<CalendarDate> get_date() const override {
        auto elements = decode();
        if (!elements) {
            return std::nullopt;
        }
        return elements->date;
    }

    std::optional<TimeOfDay> get_time_of_day() const override {
        auto elements = decode();
        if (!elements) {
            return std::nullopt;
        }
        return elements->time;
    }

protected:
    std::optional<Decimal> compute_normalized_timestamp() const override {
        auto elements = decode();
        if (!elements) {
            return std::nullopt;
        }
        const auto& [date, time] = *elements;
        return Decimal(posix_seconds_from_elements(date.year, date.month, date.day, time.hours,
                                                   time.minutes, time.seconds)) -
               time_zone_correction();
    }

    FieldList native_fields() const override {
        FieldList result;
        if (fat_date_time_) {
            result.push_back({"fat_date_time", static_cast<uint64_t>(*fat_date_time_)});
        }
        return result;
    }

    ParseResult<void> copy_from_native_fields(const FieldList& fields) override {
        const auto* value = find_field(fields, "fat_date_time");
        if (!value) {
            fat_date_time_.reset();
            return {};
        }
        auto packed = field_as<uint32_t>(*value);
        if (!packed) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        fat_date_time_ = *packed;
        return {};
    }

private:
    struct Fields {
        using day = detail::BitField<uint32_t, 0, 5>;
        using month = detail::BitField<uint32_t, 5, 4>;
        using year = detail::BitField<uint32_t, 9, 7>;
        using half_seconds = detail::BitField<uint32_t, 16, 5>;
        using minutes = detail::BitField<uint32_t, 21, 6>;
        using hours = detail::BitField<uint32_t, 27, 5>;
    };

    struct Elements {
        CalendarDate date;
        TimeOfDay time;
    };

    std::optional<Elements> decode() const noexcept {
        if (!fat_date_time_) {
            return std::nullopt;
        }
        const uint32_t value = *fat_date_time_;
        const int year = min_supported_year + static_cast<int>(Fields::year::extract(value));
        const int month = static_cast<int>(Fields::month::extract(value));
        const int day = static_cast<int>(Fields::day::extract(value));
        const int hours = static_cast<int>(Fields::hours::extract(value));
        const int minutes = static_cast<int>(Fields::minutes::extract(value));
        const int seconds = static_cast<int>(Fields::half_seconds::extract(value)) * 2;

        if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
            return std::nullopt;
        }
        if (hours > 23 || minutes > 59 || seconds > 59) {
            return std::nullopt;
        }
        return Elements{CalendarDate{year, month, day}, TimeOfDay{0, hours, minutes, seconds}};
    }

    std::optional<uint32_t> fat_date_time_;
};

} // namespace tsnorm
