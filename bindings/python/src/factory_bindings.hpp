#pragma once
// Factory and serializer bindings

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/unique_ptr.h>
#include <nanobind/stl/vector.h>

#include <nlohmann/json.hpp>
#include <tsnorm/factory.hpp>
#include <tsnorm/serializer.hpp>

#include "py_types.hpp"

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tsnorm_python {

inline void bind_factory(nb::module_& m) {
    // =========================================================================
    // Factory (module-level functions over the built-in registry)
    // =========================================================================

    m.def(
        "create",
        [](std::string_view class_name) {
            return unwrap(tsnorm::Factory::instance().create(class_name));
        },
        "class_name"_a, "Create an empty value of the named format; raises ParseError");

    m.def(
        "class_names", [] { return tsnorm::Factory::instance().class_names(); },
        "Sorted names of the registered formats");

    // =========================================================================
    // Serializer (dict form through the json module)
    // =========================================================================

    m.def(
        "serialize",
        [](const tsnorm::DateTimeValues& value) {
            std::string text = tsnorm::Serializer::serialize(value).dump();
            return nb::module_::import_("json").attr("loads")(text);
        },
        "value"_a, "JSON-compatible dict describing the value");

    m.def(
        "deserialize",
        [](nb::handle obj) {
            std::string text = nb::cast<std::string>(nb::module_::import_("json").attr("dumps")(obj));
            auto j = nlohmann::json::parse(text, nullptr, false);
            if (j.is_discarded()) {
                raise_parse_error(tsnorm::ParseError{tsnorm::ParseErrorCode::invalid_field});
            }
            return unwrap(tsnorm::Serializer::deserialize(j));
        },
        "json_dict"_a, "Rebuild a value from serialize() output; raises ParseError");
}

} // namespace tsnorm_python
