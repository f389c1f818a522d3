#pragma once
// Python wrapper types for FLEXDISCO bindings

#include <nanobind/nanobind.h>

#include <flexdisco.hpp>

#include <optional>
#include <span>
#include <string>

namespace nb = nanobind;

namespace flexdisco_python {

// Exception type pointers (set during module init)
extern PyObject* decode_error_type;
extern PyObject* listener_io_error_type;

inline std::span<const uint8_t> as_span(const nb::bytes& data) {
    return {reinterpret_cast<const uint8_t*>(data.c_str()), data.size()};
}

/**
 * @brief Convert announcement text to str
 *
 * Radios send raw bytes; anything that is not valid UTF-8 becomes U+FFFD
 * instead of raising UnicodeDecodeError.
 */
inline nb::str to_py_str(const std::string& text) {
    PyObject* obj =
        PyUnicode_DecodeUTF8(text.data(), static_cast<Py_ssize_t>(text.size()), "replace");
    if (obj == nullptr) {
        throw nb::python_error();
    }
    return nb::steal<nb::str>(obj);
}

inline nb::object to_py_text(const std::optional<std::string>& value) {
    if (!value) {
        return nb::none();
    }
    return to_py_str(*value);
}

/**
 * @brief Raise DecodeError carrying the offending token
 */
[[noreturn]] inline void raise_decode_error(const flexdisco::DecodeError& err) {
    std::string msg = err.message();
    if (err.code == flexdisco::DecodeErrorCode::missing_separator) {
        msg += ": token " + std::to_string(err.token_index) + " '" + err.token + "'";
    }
    PyErr_SetObject(decode_error_type, to_py_str(msg).ptr());
    throw nb::python_error();
}

} // namespace flexdisco_python
