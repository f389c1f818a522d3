// FLEXDISCO Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "listener_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace flexdisco_python {
PyObject* decode_error_type = nullptr;
PyObject* listener_io_error_type = nullptr;
} // namespace flexdisco_python

NB_MODULE(flexdisco, m) {
    m.doc() = "FLEXDISCO - radio discovery announcement listener";

    // Bind components in dependency order:
    // 1. Error types (sets decode_error_type, listener_io_error_type)
    flexdisco_python::bind_errors(m);

    // 2. Announcement record, decode/encode - needs decode_error_type
    flexdisco_python::bind_core(m);

    // 3. DiscoveryListener - needs record and error types
    flexdisco_python::bind_listener(m);
}
