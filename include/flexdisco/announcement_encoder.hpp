#pragma once

#include <array>
#include <span>
#include <string_view>
#include <vector>

#include <cstdint>

#include "device_announcement.hpp"
#include "expected.hpp"
#include "types.hpp"

namespace flexdisco {

/**
 * Reasons an announcement cannot be put on the wire unambiguously.
 */
enum class EncodeError : uint8_t {
    key_not_encodable,  ///< Key contains ' ', '=' or NUL, or is a known field name
    value_not_encodable ///< Value contains ' ' or NUL
};

constexpr const char* encode_error_string(EncodeError err) noexcept {
    switch (err) {
        case EncodeError::key_not_encodable:
            return "Key contains a separator or names a known field";
        case EncodeError::value_not_encodable:
            return "Value contains a space or NUL byte";
        default:
            return "Unknown encode error";
    }
}

namespace detail {

inline constexpr std::array<uint8_t, announcement_header_bytes> zero_header{};

// A known field name would be decoded into that field, not the unrecognized list
constexpr bool encodable_key(std::string_view key) noexcept {
    return key.find_first_of(std::string_view(" =\0", 3)) == std::string_view::npos &&
           !field_from_name(key).has_value();
}

constexpr bool encodable_value(std::string_view value) noexcept {
    return value.find_first_of(std::string_view(" \0", 2)) == std::string_view::npos;
}

inline void append_token(std::vector<uint8_t>& out, bool& first, std::string_view key,
                         std::string_view value) {
    if (!first) {
        out.push_back(token_separator);
    }
    first = false;
    out.insert(out.end(), key.begin(), key.end());
    out.push_back(key_value_separator);
    out.insert(out.end(), value.begin(), value.end());
}

} // namespace detail

/**
 * @brief Serialize an announcement into datagram bytes
 *
 * Layout: header bytes, then known fields in schema order, then
 * unrecognized fields in their stored order, as space separated key=value
 * tokens. Absent fields are omitted. No padding is appended.
 *
 * @param ann Announcement to encode
 * @param header Opaque header placed in front of the text (default: 28 zero bytes)
 * @return Datagram bytes, or EncodeError if a key or value would not survive decoding
 */
[[nodiscard]] inline expected<std::vector<uint8_t>, EncodeError>
encode_announcement(const DeviceAnnouncement& ann,
                    std::span<const uint8_t> header = detail::zero_header) {
    std::vector<uint8_t> out(header.begin(), header.end());
    bool first = true;

    for (auto field : all_announcement_fields) {
        const auto& value = ann.get(field);
        if (!value) {
            continue;
        }
        if (!detail::encodable_value(*value)) {
            return make_unexpected(EncodeError::value_not_encodable);
        }
        detail::append_token(out, first, field_name(field), *value);
    }

    for (const auto& extra : ann.unrecognized_fields()) {
        if (!detail::encodable_key(extra.key)) {
            return make_unexpected(EncodeError::key_not_encodable);
        }
        if (!detail::encodable_value(extra.value)) {
            return make_unexpected(EncodeError::value_not_encodable);
        }
        detail::append_token(out, first, extra.key, extra.value);
    }

    return out;
}

} // namespace flexdisco
