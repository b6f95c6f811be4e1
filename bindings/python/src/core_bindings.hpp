#pragma once
// Core bindings: Precision, Epoch, calendar helpers, constants

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <tsnorm/calendar.hpp>
#include <tsnorm/types.hpp>

#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace tsnorm_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<tsnorm::Precision>(m, "Precision", "Declared sub-second resolution of a format")
        .value("seconds", tsnorm::Precision::seconds)
        .value("two_seconds", tsnorm::Precision::two_seconds)
        .value("hundred_milliseconds", tsnorm::Precision::hundred_milliseconds)
        .value("milliseconds", tsnorm::Precision::milliseconds)
        .value("microseconds", tsnorm::Precision::microseconds)
        .value("hundred_nanoseconds", tsnorm::Precision::hundred_nanoseconds)
        .value("nanoseconds", tsnorm::Precision::nanoseconds)
        .def("__str__",
             [](tsnorm::Precision p) { return std::string(tsnorm::precision_string(p)); });

    // =========================================================================
    // Epoch
    // =========================================================================

    nb::class_<tsnorm::Epoch>(m, "Epoch", "Origin date of a format's timestamp space")
        .def(nb::init<>())
        .def("__init__",
             [](tsnorm::Epoch* self, int year, int month, int day) {
                 new (self) tsnorm::Epoch{year, month, day};
             },
             "year"_a, "month"_a, "day"_a)
        .def_ro("year", &tsnorm::Epoch::year)
        .def_ro("month", &tsnorm::Epoch::month)
        .def_ro("day", &tsnorm::Epoch::day)
        .def("__eq__", [](const tsnorm::Epoch& a, const tsnorm::Epoch& b) { return a == b; })
        .def("__repr__", [](const tsnorm::Epoch& e) {
            std::ostringstream oss;
            oss << "Epoch(" << e.year << ", " << e.month << ", " << e.day << ")";
            return oss.str();
        });

    // Calendar helpers
    m.def("is_leap_year", &tsnorm::is_leap_year, "Proleptic Gregorian leap year rule",
          "year"_a);
    m.def("days_in_month", &tsnorm::days_in_month, "Days in a month, 0 for an invalid month",
          "year"_a, "month"_a);
    m.def("epoch_to_posix_seconds", &tsnorm::epoch_to_posix_seconds,
          "Seconds between an epoch and 1970-01-01", "epoch"_a);

    // Constants
    m.attr("SECONDS_PER_DAY") = tsnorm::seconds_per_day;
    m.attr("MAX_YEAR") = tsnorm::max_year;
    m.attr("POSIX_EPOCH") = nb::cast(tsnorm::posix_epoch, nb::rv_policy::copy);
}

} // namespace tsnorm_python
