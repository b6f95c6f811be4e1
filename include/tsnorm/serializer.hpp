#pragma once

#include "tsnorm/date_time_values.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/factory.hpp"
#include "tsnorm/field.hpp"
#include "tsnorm/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstdint>

namespace tsnorm {

/**
 * JSON projection of date and time values.
 *
 * Shape:
 * @code
 *   {"__type__": "DateTimeValues", "__class_name__": "PosixTime",
 *    "timestamp": 1281643591}
 * @endcode
 *
 * The remaining keys are the fields() of the value. Deserialization
 * resolves "__class_name__" through a Factory.
 */
class Serializer {
public:
    static constexpr std::string_view type_name = "DateTimeValues";

    static nlohmann::json serialize(const DateTimeValues& value) {
        nlohmann::json json = nlohmann::json::object();
        json["__type__"] = std::string(type_name);
        json["__class_name__"] = std::string(value.class_name());
        for (const auto& field : value.fields()) {
            json[field.name] = to_json(field.value);
        }
        return json;
    }

    /**
     * Rebuild a value from its JSON projection.
     *
     * @param json Object produced by serialize()
     * @param factory Registry used to resolve the class name
     * @return The value, or ParseError(invalid_field / unknown_format)
     */
    static ParseResult<std::unique_ptr<DateTimeValues>>
    deserialize(const nlohmann::json& json, const Factory& factory = Factory::instance()) {
        if (!json.is_object()) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        auto type = json.find("__type__");
        if (type == json.end() || !type->is_string() ||
            type->get_ref<const std::string&>() != type_name) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }
        auto class_name = json.find("__class_name__");
        if (class_name == json.end() || !class_name->is_string()) {
            return make_parse_error(ParseErrorCode::invalid_field);
        }

        auto value = factory.create(class_name->get_ref<const std::string&>());
        if (!value) {
            return make_parse_error(value.error().code);
        }

        FieldList fields;
        for (auto it = json.begin(); it != json.end(); ++it) {
            if (it.key() == "__type__" || it.key() == "__class_name__") {
                continue;
            }
            auto field_value = from_json(it.value());
            if (!field_value) {
                return make_parse_error(field_value.error().code);
            }
            fields.push_back({it.key(), std::move(*field_value)});
        }

        auto restored = (*value)->copy_from_fields(fields);
        if (!restored) {
            return make_parse_error(restored.error().code);
        }
        return std::move(*value);
    }

private:
    static nlohmann::json to_json(const FieldValue& value) {
        return std::visit(
            [](const auto& v) -> nlohmann::json {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
                    nlohmann::json array = nlohmann::json::array();
                    for (int64_t item : v) {
                        array.push_back(item);
                    }
                    return array;
                } else {
                    return v;
                }
            },
            value);
    }

    static ParseResult<FieldValue> from_json(const nlohmann::json& json) {
        if (json.is_boolean()) {
            return FieldValue{std::in_place_type<bool>, json.get<bool>()};
        }
        if (json.is_number_unsigned()) {
            return FieldValue{std::in_place_type<uint64_t>, json.get<uint64_t>()};
        }
        if (json.is_number_integer()) {
            return FieldValue{std::in_place_type<int64_t>, json.get<int64_t>()};
        }
        if (json.is_string()) {
            return FieldValue{std::in_place_type<std::string>, json.get<std::string>()};
        }
        if (json.is_array()) {
            std::vector<int64_t> items;
            items.reserve(json.size());
            for (const auto& item : json) {
                if (item.is_number_unsigned()) {
                    auto u = item.get<uint64_t>();
                    if (!std::in_range<int64_t>(u)) {
                        return make_parse_error(ParseErrorCode::invalid_field);
                    }
                    items.push_back(static_cast<int64_t>(u));
                } else if (item.is_number_integer()) {
                    items.push_back(item.get<int64_t>());
                } else {
                    return make_parse_error(ParseErrorCode::invalid_field);
                }
            }
            return FieldValue{std::in_place_type<std::vector<int64_t>>, std::move(items)};
        }
        return make_parse_error(ParseErrorCode::invalid_field);
    }
};

} // namespace tsnorm
