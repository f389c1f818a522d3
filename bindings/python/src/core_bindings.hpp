#pragma once
// Core bindings: AnnouncementField, DeviceAnnouncement, decode/encode, constants

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <flexdisco.hpp>

#include "py_types.hpp"

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace nb = nanobind;
using namespace nb::literals;

namespace flexdisco_python {

inline void bind_core(nb::module_& m) {
    // Constants
    m.attr("DEFAULT_DISCOVERY_PORT") = flexdisco::default_discovery_port;
    m.attr("ANNOUNCEMENT_HEADER_BYTES") = flexdisco::announcement_header_bytes;
    m.attr("DEFAULT_MAX_DATAGRAM_BYTES") = flexdisco::default_max_datagram_bytes;

    // =========================================================================
    // AnnouncementField
    // =========================================================================

    auto field_enum = nb::enum_<flexdisco::AnnouncementField>(
        m, "AnnouncementField", "Known fields of a discovery announcement");
    for (auto field : flexdisco::all_announcement_fields) {
        // field names are string literals, so data() is NUL terminated
        field_enum.value(flexdisco::field_name(field).data(), field);
    }

    // =========================================================================
    // UnrecognizedField / DecodeDiagnostic
    // =========================================================================

    nb::class_<flexdisco::UnrecognizedField>(m, "UnrecognizedField",
                                             "Key/value pair outside the known schema")
        .def_prop_ro("key", [](const flexdisco::UnrecognizedField& f) { return to_py_str(f.key); })
        .def_prop_ro("value",
                     [](const flexdisco::UnrecognizedField& f) { return to_py_str(f.value); })
        .def("__repr__", [](const flexdisco::UnrecognizedField& f) {
            return to_py_str("UnrecognizedField(" + f.key + "=" + f.value + ")");
        });

    nb::class_<flexdisco::DecodeDiagnostic>(m, "DecodeDiagnostic",
                                            "Non-fatal note produced while decoding")
        .def_ro("kind", &flexdisco::DecodeDiagnostic::kind)
        .def_prop_ro("key", [](const flexdisco::DecodeDiagnostic& d) { return to_py_str(d.key); })
        .def_prop_ro("value",
                     [](const flexdisco::DecodeDiagnostic& d) { return to_py_str(d.value); })
        .def_prop_ro("message", [](const flexdisco::DecodeDiagnostic& d) {
            return std::string(d.message());
        });

    // =========================================================================
    // DeviceAnnouncement
    // =========================================================================

    auto announcement = nb::class_<flexdisco::DeviceAnnouncement>(
        m, "DeviceAnnouncement", "Immutable record decoded from one discovery datagram");

    for (auto field : flexdisco::all_announcement_fields) {
        announcement.def_prop_ro(
            flexdisco::field_name(field).data(),
            [field](const flexdisco::DeviceAnnouncement& a) { return to_py_text(a.get(field)); });
    }

    announcement
        .def("get",
             [](const flexdisco::DeviceAnnouncement& a, flexdisco::AnnouncementField field) {
                 return to_py_text(a.get(field));
             },
             "Value of a known field, or None", "field"_a)
        .def_prop_ro("unrecognized_fields", &flexdisco::DeviceAnnouncement::unrecognized_fields,
                     "Pairs whose key is not a known field, in arrival order")
        .def_prop_ro("diagnostics", &flexdisco::DeviceAnnouncement::diagnostics,
                     "Notes collected while decoding")
        .def_prop_ro("recognized_field_count",
                     &flexdisco::DeviceAnnouncement::recognized_field_count)
        .def_prop_ro("control_port",
                     [](const flexdisco::DeviceAnnouncement& a) { return flexdisco::control_port(a); },
                     "'port' as an integer, or None")
        .def_prop_ro("is_available",
                     [](const flexdisco::DeviceAnnouncement& a) { return flexdisco::is_available(a); },
                     "True if status is 'Available'")
        .def("__eq__", [](const flexdisco::DeviceAnnouncement& a,
                          const flexdisco::DeviceAnnouncement& b) { return a == b; })
        .def("__repr__", [](const flexdisco::DeviceAnnouncement& a) {
            std::ostringstream oss;
            oss << "DeviceAnnouncement(";
            bool first = true;
            for (auto field : flexdisco::all_announcement_fields) {
                if (const auto& value = a.get(field)) {
                    oss << (first ? "" : ", ") << flexdisco::field_name(field) << "='" << *value
                        << "'";
                    first = false;
                }
            }
            if (!a.unrecognized_fields().empty()) {
                oss << (first ? "" : ", ") << "unrecognized=" << a.unrecognized_fields().size();
            }
            oss << ")";
            return to_py_str(oss.str());
        });

    // =========================================================================
    // Decode / encode
    // =========================================================================

    m.def(
        "decode_announcement",
        [](nb::bytes data, size_t header_bytes) {
            auto result = flexdisco::decode_announcement(as_span(data), header_bytes);
            if (!result.has_value()) {
                raise_decode_error(result.error());
            }
            return std::move(result).value();
        },
        "Decode one announcement datagram. Raises DecodeError on malformed input.", "data"_a,
        "header_bytes"_a = flexdisco::announcement_header_bytes);

    m.def(
        "encode_announcement",
        [](const flexdisco::DeviceAnnouncement& a) {
            auto result = flexdisco::encode_announcement(a);
            if (!result.has_value()) {
                throw std::invalid_argument(flexdisco::encode_error_string(result.error()));
            }
            return nb::bytes(reinterpret_cast<const char*>(result->data()), result->size());
        },
        "Encode an announcement with a zeroed header", "announcement"_a);
}

} // namespace flexdisco_python
