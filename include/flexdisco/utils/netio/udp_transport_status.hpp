// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cerrno>
#include <cstdint>

namespace flexdisco::utils::netio {

/**
 * @brief Outcome of the most recent socket operation
 *
 * Updated by every receive/send call. A timeout is reported here as well as
 * in the return value, so callers polling in a loop can inspect it cheaply.
 */
struct UDPTransportStatus {
    enum class State : uint8_t {
        packet_ready, ///< Last operation moved a datagram
        timeout,      ///< Receive/send timed out (EAGAIN/EWOULDBLOCK)
        interrupted,  ///< Call interrupted by a signal (EINTR)
        socket_error  ///< Any other socket failure
    };

    State state{State::packet_ready};
    int errno_value{0};

    [[nodiscard]] bool ok() const noexcept { return state == State::packet_ready; }

    [[nodiscard]] const char* message() const noexcept {
        switch (state) {
            case State::packet_ready:
                return "Packet ready";
            case State::timeout:
                return "Timed out";
            case State::interrupted:
                return "Interrupted";
            case State::socket_error:
                return "Socket error";
        }
        return "Unknown transport state";
    }
};

/**
 * @brief Map errno to UDPTransportStatus::State
 *
 * @param err errno value
 * @return Corresponding transport state
 */
inline UDPTransportStatus::State map_errno_to_state(int err) noexcept {
    switch (err) {
        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
        case EWOULDBLOCK:
#endif
            return UDPTransportStatus::State::timeout;
        case EINTR:
            return UDPTransportStatus::State::interrupted;
        default:
            return UDPTransportStatus::State::socket_error;
    }
}

} // namespace flexdisco::utils::netio
