#pragma once

#include <string>
#include <utility>

#include <cstddef>

#include "../expected.hpp"
#include "decode_error.hpp"

namespace flexdisco {

/**
 * @brief Result type for announcement decoding
 *
 * Alias for expected<T, DecodeError>. Holds either the decoded value or a
 * DecodeError describing the structural problem.
 *
 * Usage:
 * @code
 *   auto result = decode_announcement(datagram);
 *   if (result.has_value()) {
 *       auto model = result->model();
 *   } else {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type of the successfully decoded value
 */
template <typename T>
using DecodeResult = expected<T, DecodeError>;

/**
 * @brief Factory function for creating decode errors
 *
 * @param code The decode error code
 * @param payload_size Size of the datagram being decoded
 * @param token_index Index of the offending token (0 when not token related)
 * @param token_offset Byte offset of the offending token in the datagram
 * @param token Offending token text
 * @return unexpected<DecodeError> suitable for returning from decode functions
 */
inline auto make_decode_error(DecodeErrorCode code, size_t payload_size, size_t token_index = 0,
                              size_t token_offset = 0, std::string token = {}) {
    return unexpected(DecodeError{.code = code,
                                  .payload_size = payload_size,
                                  .token_index = token_index,
                                  .token_offset = token_offset,
                                  .token = std::move(token)});
}

} // namespace flexdisco
