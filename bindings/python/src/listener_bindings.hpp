#pragma once
// Listener bindings: DiscoveryListener

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <flexdisco/flexdisco_io.hpp>

#include "py_types.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace nb = nanobind;
using namespace nb::literals;

namespace flexdisco_python {

inline void bind_listener(nb::module_& m) {
    nb::class_<flexdisco::DiscoveryListener>(m, "DiscoveryListener",
                                             "UDP listener for radio discovery announcements")
        .def(
            "__init__",
            [](flexdisco::DiscoveryListener* self, const std::string& bind_address, uint16_t port,
               int timeout_ms, bool reuse_address) {
                flexdisco::ListenerOptions options;
                options.reuse_address = reuse_address;
                new (self) flexdisco::DiscoveryListener(
                    bind_address, port, std::chrono::milliseconds(timeout_ms), options);
            },
            "Bind the discovery socket. Raises SetupError if setup fails.",
            "bind_address"_a = flexdisco::default_bind_address,
            "port"_a = flexdisco::default_discovery_port,
            "timeout_ms"_a = static_cast<int>(flexdisco::default_receive_timeout.count()),
            "reuse_address"_a = true)
        .def(
            "receive_one",
            [](flexdisco::DiscoveryListener& l) -> nb::object {
                auto result = [&]() {
                    nb::gil_scoped_release release;
                    return l.receive_one();
                }();

                if (!result.has_value()) {
                    const auto& err = result.error();
                    if (flexdisco::utils::is_decode_error(err)) {
                        raise_decode_error(std::get<flexdisco::DecodeError>(err));
                    }
                    const auto& io_err = std::get<flexdisco::utils::IOError>(err);
                    PyErr_SetString(listener_io_error_type, io_err.message());
                    throw nb::python_error();
                }

                // Timeout -> None
                if (!result->has_value()) {
                    return nb::none();
                }
                return nb::cast(std::move(**result));
            },
            "Wait for one announcement (blocks up to the timeout).\n\n"
            "Returns DeviceAnnouncement, or None on timeout.\n"
            "Raises DecodeError for malformed datagrams and ListenerIOError on socket errors.")
        .def(
            "set_timeout",
            [](flexdisco::DiscoveryListener& l, int timeout_ms) {
                if (!l.try_set_timeout(std::chrono::milliseconds(timeout_ms))) {
                    throw std::invalid_argument("Failed to set socket timeout");
                }
            },
            "Set receive timeout in milliseconds (must be positive)", "timeout_ms"_a)
        .def_prop_ro("socket_port", &flexdisco::DiscoveryListener::socket_port,
                     "Port the socket is bound to")
        .def_prop_ro("datagrams_received", &flexdisco::DiscoveryListener::datagrams_received)
        .def_prop_ro("announcements_decoded",
                     &flexdisco::DiscoveryListener::announcements_decoded)
        .def_prop_ro("decode_failures", &flexdisco::DiscoveryListener::decode_failures)
        .def_prop_ro("timeouts", &flexdisco::DiscoveryListener::timeouts)
        .def("__repr__", [](const flexdisco::DiscoveryListener& l) {
            std::ostringstream oss;
            oss << "DiscoveryListener(port=" << l.socket_port()
                << ", timeout_ms=" << l.receive_timeout().count() << ")";
            return oss.str();
        });
}

} // namespace flexdisco_python
