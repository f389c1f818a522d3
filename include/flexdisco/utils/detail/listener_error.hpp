#pragma once

#include <type_traits>
#include <variant>

#include <cstddef>
#include <cstdint>

#include "../../detail/decode_error.hpp"

namespace flexdisco::utils {

/**
 * @brief Socket-level receive failure (distinct from decode errors)
 *
 * A receive timeout is not an IOError; the listener reports it as an empty
 * result instead.
 */
struct IOError {
    enum class Kind : uint8_t {
        receive_error,     ///< recvfrom() failed (errno_value says why)
        truncated_datagram ///< Datagram larger than the receive buffer
    };

    Kind kind;
    int errno_value{0};
    size_t datagram_size{0}; ///< Bytes the kernel reported for the datagram

    /**
     * @brief Get human-readable error message
     */
    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::receive_error:
                return "UDP receive error";
            case Kind::truncated_datagram:
                return "Datagram larger than receive buffer";
        }
        return "Unknown I/O error";
    }
};

/**
 * @brief Unified listener error type
 *
 * A variant that can represent:
 * - IOError: the receive itself failed
 * - DecodeError: a datagram arrived but is not a well-formed announcement
 *
 * Both are scoped to one receive_one() call; the listener stays usable.
 */
using ListenerError = std::variant<IOError, flexdisco::DecodeError>;

/**
 * @brief Check if error is an I/O error
 */
[[nodiscard]] inline bool is_io_error(const ListenerError& e) noexcept {
    return std::holds_alternative<IOError>(e);
}

/**
 * @brief Check if error is a decode error
 */
[[nodiscard]] inline bool is_decode_error(const ListenerError& e) noexcept {
    return std::holds_alternative<flexdisco::DecodeError>(e);
}

/**
 * @brief Get human-readable error message from any ListenerError
 */
[[nodiscard]] inline const char* error_message(const ListenerError& e) noexcept {
    return std::visit(
        [](auto&& err) -> const char* {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, IOError>) {
                return err.message();
            } else if constexpr (std::is_same_v<T, flexdisco::DecodeError>) {
                return err.message();
            }
            return "Unknown error";
        },
        e);
}

} // namespace flexdisco::utils
