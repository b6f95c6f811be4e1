#pragma once
// DateTimeValues bindings: shared interface, tick formats, FAT, RFC 2579,
// time elements and Never

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/tuple.h>
#include <nanobind/stl/vector.h>

#include <tsnorm/fat_date_time.hpp>
#include <tsnorm/formats.hpp>
#include <tsnorm/rfc2579_date_time.hpp>
#include <tsnorm/semantic_time.hpp>
#include <tsnorm/time_elements.hpp>

#include "py_types.hpp"

#include <compare>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace tsnorm_python {

using PyRFC2579Tuple = std::tuple<int, int, int, int, int, int, int, std::string, int, int>;

/**
 * @brief Bind one tick-counting format
 *
 * The timestamp property maps "not set" to None in both directions.
 */
template <typename T>
void bind_tick_time(nb::module_& m, const char* doc) {
    using timestamp_type = typename T::timestamp_type;

    nb::class_<T, tsnorm::DateTimeValues>(m, std::string(T::class_name_v).c_str(), doc)
        .def(nb::init<>())
        .def(nb::init<timestamp_type>(), "timestamp"_a)
        .def_prop_rw(
            "timestamp", [](const T& self) { return self.timestamp(); },
            [](T& self, std::optional<timestamp_type> value) {
                if (value) {
                    self.set_timestamp(*value);
                } else {
                    self.reset_timestamp();
                }
            },
            nb::arg("value").none())
        .def_ro_static("ticks_per_second", &T::format_type::ticks_per_second)
        .def_ro_static("min_timestamp", &T::format_type::min_timestamp)
        .def_ro_static("max_timestamp", &T::format_type::max_timestamp);
}

/**
 * @brief Bind one calendar elements format
 *
 * from_tuple takes 6 integers, plus the fraction for the millisecond and
 * microsecond variants.
 */
template <typename T>
void bind_time_elements(nb::module_& m, const char* doc) {
    nb::class_<T, tsnorm::DateTimeValues>(m, std::string(T::class_name_v).c_str(), doc)
        .def(nb::init<>())
        .def_static(
            "from_tuple",
            [](const std::vector<int>& items) {
                if (items.size() != T::tuple_size) {
                    throw nb::value_error("time_elements_tuple has the wrong number of elements");
                }
                tsnorm::TimeElementsTuple tuple{items[0], items[1], items[2],
                                                items[3], items[4], items[5],
                                                T::tuple_size > 6 ? items[6] : 0};
                return unwrap(T::from_tuple(tuple));
            },
            "time_elements_tuple"_a)
        .def_ro_static("tuple_size", &T::tuple_size)
        .def_prop_ro("tuple", [](const T& self) -> nb::object {
            auto tuple = self.tuple();
            if (!tuple) {
                return nb::none();
            }
            if constexpr (T::tuple_size > 6) {
                return nb::make_tuple(tuple->year, tuple->month, tuple->day, tuple->hours,
                                      tuple->minutes, tuple->seconds, tuple->fraction);
            } else {
                return nb::make_tuple(tuple->year, tuple->month, tuple->day, tuple->hours,
                                      tuple->minutes, tuple->seconds);
            }
        });
}

inline nb::object date_to_python(const std::optional<tsnorm::CalendarDate>& date) {
    if (!date) {
        return nb::none();
    }
    return nb::make_tuple(date->year, date->month, date->day);
}

inline nb::object time_of_day_to_python(const std::optional<tsnorm::TimeOfDay>& time) {
    if (!time) {
        return nb::none();
    }
    return nb::make_tuple(time->hours, time->minutes, time->seconds);
}

inline void bind_date_time_values(nb::module_& m) {
    using tsnorm::DateTimeValues;

    // =========================================================================
    // DateTimeValues - shared interface
    // =========================================================================

    nb::class_<DateTimeValues>(m, "DateTimeValues",
                               "Date and time value in one of the supported formats")
        .def_prop_ro("class_name",
                     [](const DateTimeValues& self) { return std::string(self.class_name()); })
        .def_prop_ro("precision", &DateTimeValues::precision)
        .def_prop_rw(
            "time_zone_offset", &DateTimeValues::time_zone_offset,
            [](DateTimeValues& self, int minutes) { unwrap(self.set_time_zone_offset(minutes)); },
            "Offset from UTC in minutes, positive east of Greenwich; raises ParseError when "
            "out of range")
        .def_prop_rw("is_local_time", &DateTimeValues::is_local_time,
                     &DateTimeValues::set_is_local_time)
        .def_prop_ro(
            "normalized_timestamp",
            [](const DateTimeValues& self) {
                return to_python_decimal(self.normalized_timestamp());
            },
            "Seconds since 1970-01-01 00:00:00 UTC as decimal.Decimal, or None")
        .def(
            "copy_from_date_time_string",
            [](DateTimeValues& self, std::string_view text) {
                unwrap(self.copy_from_date_time_string(text));
            },
            "time_string"_a, "Parse YYYY-MM-DD[ hh:mm:ss[.ffffff][+-hh:mm]]; raises ParseError")
        .def("copy_to_date_time_string", &DateTimeValues::copy_to_date_time_string)
        .def("copy_to_date_time_string_iso8601",
             &DateTimeValues::copy_to_date_time_string_iso8601)
        .def("copy_to_posix_timestamp", &DateTimeValues::copy_to_posix_timestamp)
        .def("copy_to_posix_microseconds", &DateTimeValues::copy_to_posix_microseconds)
        .def("get_date",
             [](const DateTimeValues& self) { return date_to_python(self.get_date()); })
        .def("get_time_of_day",
             [](const DateTimeValues& self) {
                 return time_of_day_to_python(self.get_time_of_day());
             })
        .def("__eq__",
             [](const DateTimeValues& a, const DateTimeValues& b) {
                 return tsnorm::compare(a, b) == std::partial_ordering::equivalent;
             })
        .def("__lt__",
             [](const DateTimeValues& a, const DateTimeValues& b) {
                 return tsnorm::compare(a, b) == std::partial_ordering::less;
             })
        .def("__le__",
             [](const DateTimeValues& a, const DateTimeValues& b) {
                 auto order = tsnorm::compare(a, b);
                 return order == std::partial_ordering::less ||
                        order == std::partial_ordering::equivalent;
             })
        .def("__gt__",
             [](const DateTimeValues& a, const DateTimeValues& b) {
                 return tsnorm::compare(a, b) == std::partial_ordering::greater;
             })
        .def("__ge__",
             [](const DateTimeValues& a, const DateTimeValues& b) {
                 auto order = tsnorm::compare(a, b);
                 return order == std::partial_ordering::greater ||
                        order == std::partial_ordering::equivalent;
             })
        .def("__repr__", [](const DateTimeValues& self) {
            std::string repr(self.class_name());
            repr += "(";
            repr += self.copy_to_date_time_string().value_or("Not set");
            repr += ")";
            return repr;
        });

    // =========================================================================
    // Tick formats
    // =========================================================================

    bind_tick_time<tsnorm::DotNetDateTime>(m, ".NET DateTime ticks since 0001-01-01");
    bind_tick_time<tsnorm::Filetime>(m, "FILETIME, 100ns intervals since 1601-01-01");
    bind_tick_time<tsnorm::PosixTime>(m, "POSIX seconds since 1970-01-01");
    bind_tick_time<tsnorm::PosixTimeInMilliseconds>(m, "POSIX milliseconds");
    bind_tick_time<tsnorm::PosixTimeInMicroseconds>(m, "POSIX microseconds");
    bind_tick_time<tsnorm::PosixTimeInNanoseconds>(m, "POSIX nanoseconds");
    bind_tick_time<tsnorm::JavaTime>(m, "Java milliseconds since 1970-01-01");
    bind_tick_time<tsnorm::WebKitTime>(m, "WebKit microseconds since 1601-01-01");
    bind_tick_time<tsnorm::HFSTime>(m, "HFS seconds since 1904-01-01");
    bind_tick_time<tsnorm::UUIDTime>(m, "UUID version 1 100ns intervals since 1582-10-15");
    bind_tick_time<tsnorm::APFSTime>(m, "APFS nanoseconds since 1970-01-01");

    // =========================================================================
    // FATDateTime
    // =========================================================================

    nb::class_<tsnorm::FATDateTime, DateTimeValues>(m, "FATDateTime",
                                                    "FAT packed date and time, 2 second precision")
        .def(nb::init<>())
        .def(nb::init<uint32_t>(), "fat_date_time"_a)
        .def_prop_rw(
            "fat_date_time", [](const tsnorm::FATDateTime& self) { return self.fat_date_time(); },
            [](tsnorm::FATDateTime& self, uint32_t value) { self.set_fat_date_time(value); });

    // =========================================================================
    // RFC2579DateTime
    // =========================================================================

    nb::class_<tsnorm::RFC2579DateTime, DateTimeValues>(m, "RFC2579DateTime",
                                                        "RFC 2579 DateAndTime")
        .def(nb::init<>())
        .def_static(
            "from_tuple",
            [](const PyRFC2579Tuple& t) {
                const std::string& direction = std::get<7>(t);
                tsnorm::RFC2579Tuple tuple{std::get<0>(t), std::get<1>(t), std::get<2>(t),
                                           std::get<3>(t), std::get<4>(t), std::get<5>(t),
                                           std::get<6>(t),
                                           direction.size() == 1 ? direction[0] : '\0',
                                           std::get<8>(t), std::get<9>(t)};
                return unwrap(tsnorm::RFC2579DateTime::from_tuple(tuple));
            },
            "rfc2579_date_time_tuple"_a,
            "Build from (year, month, day, hours, minutes, seconds, deciseconds, "
            "direction_from_utc, hours_from_utc, minutes_from_utc)")
        .def_prop_ro("tuple", [](const tsnorm::RFC2579DateTime& self) -> nb::object {
            auto tuple = self.tuple();
            if (!tuple) {
                return nb::none();
            }
            return nb::make_tuple(tuple->year, tuple->month, tuple->day, tuple->hours,
                                  tuple->minutes, tuple->seconds, tuple->deciseconds,
                                  std::string(1, tuple->direction_from_utc),
                                  tuple->hours_from_utc, tuple->minutes_from_utc);
        });

    // =========================================================================
    // Time elements and Never
    // =========================================================================

    bind_time_elements<tsnorm::TimeElements>(m, "Calendar elements, whole seconds");
    bind_time_elements<tsnorm::TimeElementsInMilliseconds>(m, "Calendar elements, milliseconds");
    bind_time_elements<tsnorm::TimeElementsInMicroseconds>(m, "Calendar elements, microseconds");

    nb::class_<tsnorm::Never, DateTimeValues>(m, "Never",
                                              "Semantic value for an event that never happens")
        .def(nb::init<>());
}

} // namespace tsnorm_python
