// TSNORM Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "date_time_values_bindings.hpp"
#include "error_bindings.hpp"
#include "factory_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace tsnorm_python {
PyObject* parse_error_type = nullptr;
} // namespace tsnorm_python

NB_MODULE(tsnorm, m) {
    m.doc() = "TSNORM - forensic date and time normalization";

    // 1. Core types (Precision, Epoch, calendar helpers) - no dependencies
    tsnorm_python::bind_core(m);

    // 2. Error types (sets parse_error_type)
    tsnorm_python::bind_errors(m);

    // 3. DateTimeValues and its formats - needs parse_error_type
    tsnorm_python::bind_date_time_values(m);

    // 4. Factory and serializer - needs the bound value classes
    tsnorm_python::bind_factory(m);
}
