#pragma once
// Error bindings: DecodeErrorCode, DiagnosticKind, SetupStage, exceptions

#include <nanobind/nanobind.h>

#include <flexdisco/flexdisco_io.hpp>

#include "py_types.hpp"

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace flexdisco_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<flexdisco::DecodeErrorCode>(m, "DecodeErrorCode",
                                          "Structural announcement decode failures")
        .value("none", flexdisco::DecodeErrorCode::none, "No error")
        .value("payload_too_short", flexdisco::DecodeErrorCode::payload_too_short,
               "Datagram shorter than the announcement header")
        .value("missing_separator", flexdisco::DecodeErrorCode::missing_separator,
               "Token has no '=' between key and value")
        .def("__str__", [](flexdisco::DecodeErrorCode c) {
            return std::string(flexdisco::decode_error_string(c));
        });

    nb::enum_<flexdisco::DiagnosticKind>(m, "DiagnosticKind",
                                         "Non-fatal notes produced while decoding")
        .value("unknown_field", flexdisco::DiagnosticKind::unknown_field,
               "Key is not part of the known schema")
        .value("duplicate_field", flexdisco::DiagnosticKind::duplicate_field,
               "Known key repeated; last value kept")
        .def("__str__", [](flexdisco::DiagnosticKind k) {
            return std::string(flexdisco::diagnostic_kind_string(k));
        });

    nb::enum_<flexdisco::SetupStage>(m, "SetupStage", "Socket setup step that failed")
        .value("create_socket", flexdisco::SetupStage::create_socket)
        .value("set_option", flexdisco::SetupStage::set_option)
        .value("resolve_address", flexdisco::SetupStage::resolve_address)
        .value("bind", flexdisco::SetupStage::bind)
        .value("connect", flexdisco::SetupStage::connect);

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // DecodeError - malformed announcement, raised from the decode paths
    auto decode_error = nb::steal(
        PyErr_NewException("flexdisco.DecodeError", PyExc_ValueError, nullptr));
    m.attr("DecodeError") = decode_error;
    decode_error_type = decode_error.ptr();

    // ListenerIOError - socket receive failure, inherits from OSError
    auto io_error = nb::steal(
        PyErr_NewException("flexdisco.ListenerIOError", PyExc_OSError, nullptr));
    m.attr("ListenerIOError") = io_error;
    listener_io_error_type = io_error.ptr();

    // SetupError - thrown by constructors when the socket cannot be set up
    nb::exception<flexdisco::SetupError>(m, "SetupError", PyExc_OSError);
}

} // namespace flexdisco_python
