#pragma once

#include <string>

#include <cstddef>

#include "../types.hpp"

namespace flexdisco {

/**
 * @brief Error information from a failed announcement decode
 *
 * Carries enough context to find the offending bytes in the datagram. The
 * token text is copied, so the error stays valid after the receive buffer is
 * reused.
 */
struct DecodeError {
    DecodeErrorCode code{DecodeErrorCode::none};
    size_t payload_size{0};  ///< Size of the whole datagram in bytes
    size_t token_index{0};   ///< Zero-based index of the offending token
    size_t token_offset{0};  ///< Byte offset of the offending token in the datagram
    std::string token{};     ///< Offending token text (empty for payload_too_short)

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the decode error
     */
    [[nodiscard]] const char* message() const noexcept { return decode_error_string(code); }
};

} // namespace flexdisco
