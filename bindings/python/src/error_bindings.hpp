#pragma once
// Error bindings: ParseErrorCode, ParseError exception

#include <nanobind/nanobind.h>

#include <tsnorm/types.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tsnorm_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ParseErrorCode enum
    // =========================================================================

    nb::enum_<tsnorm::ParseErrorCode>(m, "ParseErrorCode",
                                      "Reasons a date and time value can be rejected")
        .value("invalid_format", tsnorm::ParseErrorCode::invalid_format)
        .value("unsupported_fraction", tsnorm::ParseErrorCode::unsupported_fraction)
        .value("year_out_of_range", tsnorm::ParseErrorCode::year_out_of_range)
        .value("month_out_of_range", tsnorm::ParseErrorCode::month_out_of_range)
        .value("day_out_of_range", tsnorm::ParseErrorCode::day_out_of_range)
        .value("time_out_of_range", tsnorm::ParseErrorCode::time_out_of_range)
        .value("time_zone_out_of_range", tsnorm::ParseErrorCode::time_zone_out_of_range)
        .value("timestamp_out_of_range", tsnorm::ParseErrorCode::timestamp_out_of_range)
        .value("unknown_format", tsnorm::ParseErrorCode::unknown_format)
        .value("invalid_field", tsnorm::ParseErrorCode::invalid_field)
        .def("__str__", [](tsnorm::ParseErrorCode c) {
            return std::string(tsnorm::parse_error_string(c));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // ParseError - rejected date and time input
    auto parse_error = nb::exception<std::runtime_error>(m, "ParseError", PyExc_ValueError);
    parse_error_type = parse_error.ptr();
}

} // namespace tsnorm_python
