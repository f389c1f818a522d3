#pragma once

#include <algorithm>
#include <span>
#include <string>

#include <cstddef>
#include <cstdint>

#include "detail/decode_result.hpp"
#include "device_announcement.hpp"
#include "types.hpp"

namespace flexdisco::detail {

/**
 * @brief Drop trailing NUL bytes that pad the payload to a word boundary
 */
[[nodiscard]] inline std::span<const uint8_t>
trim_padding(std::span<const uint8_t> body) noexcept {
    size_t end = body.size();
    while (end > 0 && body[end - 1] == 0x00) {
        --end;
    }
    return body.first(end);
}

inline std::string to_text(std::span<const uint8_t> bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/**
 * @brief Decode the announcement text that follows the header (internal implementation)
 *
 * This function:
 * 1. Validates the datagram is at least header_skip bytes long
 * 2. Splits the remaining bytes on ASCII space
 * 3. Splits each token on its first '=' and converts key and value to text
 * 4. Routes each pair to a known field or to the unrecognized list
 *
 * @param bytes Whole datagram, header included
 * @param header_skip Number of opaque header bytes in front of the text
 * @return DecodeResult<DeviceAnnouncement> with the record or error information
 */
[[nodiscard]] inline DecodeResult<DeviceAnnouncement>
decode_announcement_impl(std::span<const uint8_t> bytes, size_t header_skip) {
    if (bytes.size() < header_skip) {
        return make_decode_error(DecodeErrorCode::payload_too_short, bytes.size());
    }

    auto body = trim_padding(bytes.subspan(header_skip));
    DeviceAnnouncement::Builder builder;

    if (body.empty()) {
        return std::move(builder).build();
    }

    size_t start = 0;
    size_t index = 0;
    while (true) {
        auto rest = body.subspan(start);
        auto space = std::find(rest.begin(), rest.end(), token_separator);
        auto token = rest.first(static_cast<size_t>(space - rest.begin()));

        auto eq = std::find(token.begin(), token.end(), key_value_separator);
        if (eq == token.end()) {
            return make_decode_error(DecodeErrorCode::missing_separator, bytes.size(), index,
                                     header_skip + start, to_text(token));
        }

        auto key_len = static_cast<size_t>(eq - token.begin());
        builder.add(to_text(token.first(key_len)), to_text(token.subspan(key_len + 1)));

        if (space == rest.end()) {
            break;
        }
        start += token.size() + 1;
        ++index;
    }

    return std::move(builder).build();
}

} // namespace flexdisco::detail

// ==========
// Public API entry points
// ==========
namespace flexdisco {

/**
 * @brief Decode one announcement datagram
 *
 * The first header_skip bytes are opaque and skipped. The rest is a list of
 * space separated key=value tokens, optionally followed by NUL padding.
 * Unknown keys never fail the decode; they end up in
 * DeviceAnnouncement::unrecognized_fields() and diagnostics().
 *
 * Fails only when the datagram is shorter than the header or a token has no
 * '='. An empty body decodes to an empty announcement.
 *
 * @param bytes Whole datagram, header included
 * @param header_skip Header length (default: announcement_header_bytes)
 * @return DecodeResult<DeviceAnnouncement> containing the record or error information
 */
[[nodiscard]] inline DecodeResult<DeviceAnnouncement>
decode_announcement(std::span<const uint8_t> bytes,
                    size_t header_skip = announcement_header_bytes) {
    return detail::decode_announcement_impl(bytes, header_skip);
}

/**
 * @brief Reusable decoder bound to one header length
 *
 * Holds no state between calls; decode() is equivalent to
 * decode_announcement(bytes, header_bytes()).
 */
class AnnouncementDecoder {
public:
    explicit AnnouncementDecoder(size_t header_bytes = announcement_header_bytes) noexcept
        : header_bytes_(header_bytes) {}

    [[nodiscard]] DecodeResult<DeviceAnnouncement> decode(std::span<const uint8_t> bytes) const {
        return detail::decode_announcement_impl(bytes, header_bytes_);
    }

    [[nodiscard]] size_t header_bytes() const noexcept { return header_bytes_; }

private:
    size_t header_bytes_;
};

} // namespace flexdisco
