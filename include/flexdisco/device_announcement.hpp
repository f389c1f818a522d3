#pragma once

#include <array>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "types.hpp"

namespace flexdisco {

/**
 * @brief Known fields of a radio discovery announcement
 *
 * Enumerator order is the schema order used when encoding announcements.
 */
enum class AnnouncementField : uint8_t {
    requires_additional_license = 0,
    nickname,
    version,
    discovery_protocol_version,
    inuse_ip,
    model,
    max_licensed_version,
    serial,
    inuse_host,
    port,
    radio_license_id,
    ip,
    status,
    callsign,
    fpc_mac
};

inline constexpr size_t announcement_field_count = 15;

inline constexpr std::array<AnnouncementField, announcement_field_count> all_announcement_fields{
    AnnouncementField::requires_additional_license,
    AnnouncementField::nickname,
    AnnouncementField::version,
    AnnouncementField::discovery_protocol_version,
    AnnouncementField::inuse_ip,
    AnnouncementField::model,
    AnnouncementField::max_licensed_version,
    AnnouncementField::serial,
    AnnouncementField::inuse_host,
    AnnouncementField::port,
    AnnouncementField::radio_license_id,
    AnnouncementField::ip,
    AnnouncementField::status,
    AnnouncementField::callsign,
    AnnouncementField::fpc_mac};

namespace detail {

inline constexpr std::array<std::string_view, announcement_field_count> field_names{
    "requires_additional_license",
    "nickname",
    "version",
    "discovery_protocol_version",
    "inuse_ip",
    "model",
    "max_licensed_version",
    "serial",
    "inuse_host",
    "port",
    "radio_license_id",
    "ip",
    "status",
    "callsign",
    "fpc_mac"};

constexpr size_t field_index(AnnouncementField field) noexcept {
    return static_cast<size_t>(field);
}

} // namespace detail

/**
 * @brief Wire name of a known field (e.g. "inuse_ip")
 */
constexpr std::string_view field_name(AnnouncementField field) noexcept {
    return detail::field_names[detail::field_index(field)];
}

/**
 * @brief Look up a known field by its wire name
 *
 * Matching is case-sensitive: "Model" is not "model".
 *
 * @return The field, or std::nullopt if the name is not part of the schema
 */
constexpr std::optional<AnnouncementField> field_from_name(std::string_view name) noexcept {
    for (size_t i = 0; i < announcement_field_count; ++i) {
        if (detail::field_names[i] == name) {
            return all_announcement_fields[i];
        }
    }
    return std::nullopt;
}

/**
 * @brief Key/value pair observed in an announcement but not in the schema
 */
struct UnrecognizedField {
    std::string key;
    std::string value;

    bool operator==(const UnrecognizedField&) const = default;
};

/**
 * @brief Non-fatal note produced while decoding one announcement
 */
struct DecodeDiagnostic {
    DiagnosticKind kind;
    std::string key;
    std::string value; ///< Value carried by the token that triggered the note

    [[nodiscard]] const char* message() const noexcept { return diagnostic_kind_string(kind); }

    bool operator==(const DecodeDiagnostic&) const = default;
};

/**
 * @brief Decoded discovery announcement from a single datagram
 *
 * Every known field is an optional string: absent when the radio did not send
 * it. Values are kept exactly as received; interpretation (numbers, flags) is
 * left to the caller, see control_port() and friends below.
 *
 * Instances are immutable. They are produced by decode_announcement() or
 * assembled with DeviceAnnouncement::Builder.
 *
 * Example usage:
 * @code
 * auto result = flexdisco::decode_announcement(datagram);
 * if (result) {
 *     std::cout << result->model().value_or("?") << "\n";
 *     for (const auto& extra : result->unrecognized_fields()) {
 *         std::cout << extra.key << "=" << extra.value << "\n";
 *     }
 * }
 * @endcode
 */
class DeviceAnnouncement {
public:
    using FieldValue = std::optional<std::string>;

    class Builder;

    DeviceAnnouncement() = default;

    // ========================================================================
    // Known field accessors
    // ========================================================================

    [[nodiscard]] const FieldValue& get(AnnouncementField field) const noexcept {
        return fields_[detail::field_index(field)];
    }

    [[nodiscard]] bool has(AnnouncementField field) const noexcept {
        return get(field).has_value();
    }

    [[nodiscard]] const FieldValue& requires_additional_license() const noexcept {
        return get(AnnouncementField::requires_additional_license);
    }
    [[nodiscard]] const FieldValue& nickname() const noexcept {
        return get(AnnouncementField::nickname);
    }
    [[nodiscard]] const FieldValue& version() const noexcept {
        return get(AnnouncementField::version);
    }
    [[nodiscard]] const FieldValue& discovery_protocol_version() const noexcept {
        return get(AnnouncementField::discovery_protocol_version);
    }
    [[nodiscard]] const FieldValue& inuse_ip() const noexcept {
        return get(AnnouncementField::inuse_ip);
    }
    [[nodiscard]] const FieldValue& model() const noexcept {
        return get(AnnouncementField::model);
    }
    [[nodiscard]] const FieldValue& max_licensed_version() const noexcept {
        return get(AnnouncementField::max_licensed_version);
    }
    [[nodiscard]] const FieldValue& serial() const noexcept {
        return get(AnnouncementField::serial);
    }
    [[nodiscard]] const FieldValue& inuse_host() const noexcept {
        return get(AnnouncementField::inuse_host);
    }
    [[nodiscard]] const FieldValue& port() const noexcept {
        return get(AnnouncementField::port);
    }
    [[nodiscard]] const FieldValue& radio_license_id() const noexcept {
        return get(AnnouncementField::radio_license_id);
    }
    [[nodiscard]] const FieldValue& ip() const noexcept { return get(AnnouncementField::ip); }
    [[nodiscard]] const FieldValue& status() const noexcept {
        return get(AnnouncementField::status);
    }
    [[nodiscard]] const FieldValue& callsign() const noexcept {
        return get(AnnouncementField::callsign);
    }
    [[nodiscard]] const FieldValue& fpc_mac() const noexcept {
        return get(AnnouncementField::fpc_mac);
    }

    // ========================================================================
    // Schema drift
    // ========================================================================

    /**
     * @brief Pairs whose key is not a known field, in arrival order
     */
    [[nodiscard]] const std::vector<UnrecognizedField>& unrecognized_fields() const noexcept {
        return unrecognized_;
    }

    /**
     * @brief Notes collected while decoding (unknown or repeated keys)
     *
     * Only Builder::add() records diagnostics; set() and add_unrecognized() do not.
     */
    [[nodiscard]] const std::vector<DecodeDiagnostic>& diagnostics() const noexcept {
        return diagnostics_;
    }

    [[nodiscard]] size_t recognized_field_count() const noexcept {
        size_t count = 0;
        for (const auto& value : fields_) {
            if (value.has_value()) {
                ++count;
            }
        }
        return count;
    }

    /// True when the announcement carries no fields at all
    [[nodiscard]] bool empty() const noexcept {
        return recognized_field_count() == 0 && unrecognized_.empty();
    }

    /**
     * Field-for-field comparison of known and unrecognized fields.
     * Diagnostics are not compared.
     */
    bool operator==(const DeviceAnnouncement& other) const {
        return fields_ == other.fields_ && unrecognized_ == other.unrecognized_;
    }

private:
    std::array<FieldValue, announcement_field_count> fields_{};
    std::vector<UnrecognizedField> unrecognized_;
    std::vector<DecodeDiagnostic> diagnostics_;
};

/**
 * @brief Assembles a DeviceAnnouncement one key at a time
 *
 * Used by the decoder, and by code that wants to broadcast announcements.
 * build() on an rvalue builder moves the record out.
 */
class DeviceAnnouncement::Builder {
public:
    Builder() = default;

    /**
     * @brief Set a known field (replaces any previous value)
     */
    Builder& set(AnnouncementField field, std::string value) {
        record_.fields_[detail::field_index(field)] = std::move(value);
        return *this;
    }

    /**
     * @brief Route a raw key to a known field or to the unrecognized list
     *
     * Records an unknown_field diagnostic for keys outside the schema and a
     * duplicate_field diagnostic when a known key is seen again.
     */
    Builder& add(std::string key, std::string value) {
        if (auto field = field_from_name(key)) {
            auto& slot = record_.fields_[detail::field_index(*field)];
            if (slot.has_value()) {
                record_.diagnostics_.push_back(
                    DecodeDiagnostic{DiagnosticKind::duplicate_field, key, value});
            }
            slot = std::move(value);
        } else {
            record_.diagnostics_.push_back(
                DecodeDiagnostic{DiagnosticKind::unknown_field, key, value});
            record_.unrecognized_.push_back(UnrecognizedField{std::move(key), std::move(value)});
        }
        return *this;
    }

    /**
     * @brief Append a pair outside the schema without emitting a diagnostic
     */
    Builder& add_unrecognized(std::string key, std::string value) {
        record_.unrecognized_.push_back(UnrecognizedField{std::move(key), std::move(value)});
        return *this;
    }

    [[nodiscard]] DeviceAnnouncement build() const& { return record_; }
    [[nodiscard]] DeviceAnnouncement build() && { return std::move(record_); }

private:
    DeviceAnnouncement record_;
};

// ========================================================================
// Caller-side interpretation helpers
// ========================================================================

/**
 * @brief Status value a radio reports when no client is connected
 */
inline constexpr std::string_view available_status = "Available";

/**
 * @brief Parse a decimal port number
 *
 * The whole string must be digits and the value must fit in 0..65535;
 * "70000" is rejected rather than wrapped.
 */
[[nodiscard]] inline std::optional<uint16_t> parse_port(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    uint16_t value = 0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Interpret the "port" field as a TCP/UDP port number
 *
 * @return Port number, or std::nullopt if absent or not a number in 0..65535
 */
[[nodiscard]] inline std::optional<uint16_t> control_port(const DeviceAnnouncement& ann) noexcept {
    const auto& text = ann.port();
    return text ? parse_port(*text) : std::nullopt;
}

/**
 * @brief Interpret "requires_additional_license" as a flag
 *
 * Accepts "0"/"1" and "false"/"true".
 */
[[nodiscard]] inline std::optional<bool>
requires_additional_license(const DeviceAnnouncement& ann) noexcept {
    const auto& text = ann.requires_additional_license();
    if (!text) {
        return std::nullopt;
    }
    if (*text == "1" || *text == "true") {
        return true;
    }
    if (*text == "0" || *text == "false") {
        return false;
    }
    return std::nullopt;
}

/**
 * @brief True when the radio reports itself as free for a new client
 */
[[nodiscard]] inline bool is_available(const DeviceAnnouncement& ann) noexcept {
    return ann.status().has_value() && *ann.status() == available_status;
}

} // namespace flexdisco
