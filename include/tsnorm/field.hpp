#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstdint>

namespace tsnorm {

/**
 * Value of a named date and time attribute.
 *
 * Covers every shape the projection needs: signed and unsigned native
 * counters, flags, strings and element tuples.
 */
using FieldValue = std::variant<int64_t, uint64_t, bool, std::string, std::vector<int64_t>>;

/**
 * Named attribute of a date and time value.
 *
 * The list of fields an instance reports is sufficient to reconstruct it
 * through the format registry.
 */
struct Field {
    std::string name;
    FieldValue value;

    bool operator==(const Field&) const = default;
};

using FieldList = std::vector<Field>;

/**
 * @brief Look up a field by name
 * @return Pointer to the field value, or nullptr when absent
 */
inline const FieldValue* find_field(const FieldList& fields, std::string_view name) noexcept {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [name](const Field& f) { return f.name == name; });
    return it == fields.end() ? nullptr : &it->value;
}

/**
 * @brief Read an integer field as T with range checking
 *
 * Accepts both signed and unsigned storage so values that went through a
 * JSON round trip (where non-negative numbers come back unsigned) are read
 * the same way as freshly produced ones.
 *
 * @return The value, or nullopt when the field holds another type or the
 *         value does not fit in T
 */
template <typename T>
    requires std::is_integral_v<T>
std::optional<T> field_as(const FieldValue& value) noexcept {
    if (const auto* s = std::get_if<int64_t>(&value)) {
        if (std::in_range<T>(*s)) {
            return static_cast<T>(*s);
        }
        return std::nullopt;
    }
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        if (std::in_range<T>(*u)) {
            return static_cast<T>(*u);
        }
        return std::nullopt;
    }
    return std::nullopt;
}

/// Specialization for flags, which are never stored as integers
template <>
inline std::optional<bool> field_as<bool>(const FieldValue& value) noexcept {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b;
    }
    return std::nullopt;
}

} // namespace tsnorm
