#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/date_time_values.hpp"
#include "tsnorm/decimal.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/field.hpp"
#include "tsnorm/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tsnorm {

/**
 * Semantic date and time "Never".
 *
 * Stands in for a timestamp field whose stored value means the event never
 * happened, such as an account that never expires. It has no position on
 * the time line: the normalized timestamp, date and time of day are always
 * absent and compare() reports it as unordered. Its string form is the
 * word itself.
 *
 * It cannot be set from a date and time string.
 */
class Never : public DateTimeValues {
public:
    static constexpr std::string_view class_name_v = "Never";
    static constexpr std::string_view string_v = "Never";

    Never() noexcept : DateTimeValues(Precision::seconds) {}

    std::string_view class_name() const noexcept override { return class_name_v; }

    std::unique_ptr<DateTimeValues> clone() const override {
        return std::make_unique<Never>(*this);
    }

    ParseResult<void> copy_from_date_time_string(std::string_view) override {
        return make_parse_error(ParseErrorCode::invalid_format);
    }

    std::optional<std::string> copy_to_date_time_string() const override {
        return std::string(string_v);
    }

    std::optional<CalendarDate> get_date() const override { return std::nullopt; }

    std::optional<TimeOfDay> get_time_of_day() const override { return std::nullopt; }

protected:
    std::optional<Decimal> compute_normalized_timestamp() const override { return std::nullopt; }

    FieldList native_fields() const override {
        return FieldList{Field{"string", std::string(string_v)}};
    }

    ParseResult<void> copy_from_native_fields(const FieldList& fields) override {
        const auto* value = find_field(fields, "string");
        if (!value) {
            return {};
        }
        const auto* text = std::get_if<std::string>(value);
        if (!text || *text != string_v) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        return {};
    }
};

} // namespace tsnorm
