#pragma once
// Python helpers shared by the TSNORM bindings

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <tsnorm/decimal.hpp>
#include <tsnorm/detail/parse_result.hpp>

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace nb = nanobind;

namespace tsnorm_python {

// Exception type pointer (set during module init)
extern PyObject* parse_error_type;

/**
 * @brief Raise the module's ParseError with the error's message
 */
[[noreturn]] inline void raise_parse_error(const tsnorm::ParseError& error) {
    PyErr_SetString(parse_error_type, error.message());
    throw nb::python_error();
}

/**
 * @brief Unwrap a ParseResult, raising ParseError on failure
 */
template <typename T>
T unwrap(tsnorm::ParseResult<T>&& result) {
    if (!result.has_value()) {
        raise_parse_error(result.error());
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(*result);
    }
}

/**
 * @brief Convert an exact Decimal to decimal.Decimal without going through float
 */
inline nb::object to_python_decimal(const std::optional<tsnorm::Decimal>& value) {
    if (!value) {
        return nb::none();
    }
    nb::object decimal_type = nb::module_::import_("decimal").attr("Decimal");
    return decimal_type(value->to_string());
}

} // namespace tsnorm_python
