// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <unistd.h>

// Linux/POSIX socket headers
#include "flexdisco/announcement_decoder.hpp"
#include "flexdisco/device_announcement.hpp"
#include "flexdisco/expected.hpp"
#include "flexdisco/types.hpp"
#include "flexdisco/utils/detail/listener_error.hpp"
#include "flexdisco/utils/netio/setup_error.hpp"
#include "flexdisco/utils/netio/udp_transport_status.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace flexdisco::utils::netio {

/**
 * @brief Tunables for DiscoveryListener beyond address, port and timeout
 */
struct ListenerOptions {
    /// Set SO_REUSEADDR before binding. On Linux, UDP sockets that all set it
    /// may share a port; false requests an exclusive bind.
    /// A second listener on an occupied port fails to bind only with false.
    bool reuse_address{true};

    /// Opaque header length in front of the announcement text
    size_t header_bytes{announcement_header_bytes};

    /// Receive buffer size; larger datagrams are reported as truncated
    size_t max_datagram_bytes{default_max_datagram_bytes};
};

/**
 * @brief IPv4 source of a received datagram
 */
struct SenderEndpoint {
    std::string address;
    uint16_t port{0};

    bool operator==(const SenderEndpoint&) const = default;
};

/**
 * @brief UDP discovery announcement listener (Linux/POSIX)
 *
 * Binds a broadcast-capable UDP socket and decodes one announcement per
 * receive_one() call.
 *
 * Lifecycle:
 * - Construction creates, configures and binds the socket. Any failure throws
 *   SetupError and nothing is retried.
 * - Once constructed the listener stays bound until destroyed.
 *
 * Receive outcomes:
 * - Datagram decoded: value holding the DeviceAnnouncement
 * - Timeout: value holding std::nullopt (not an error)
 * - Malformed datagram: DecodeError, listener stays usable
 * - Socket failure: IOError, listener stays usable
 *
 * Blocking Mode:
 * - Always uses blocking sockets bounded by SO_RCVTIMEO
 * - Exactly one recvfrom() per receive_one() call
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 * - Safe to move between threads (move-only)
 *
 * Example usage:
 * @code
 * DiscoveryListener listener;  // 0.0.0.0:4992, 3 s timeout
 *
 * while (running) {
 *     auto result = listener.receive_one();
 *     if (!result) {
 *         std::cerr << error_message(result.error()) << "\n";
 *         continue;
 *     }
 *     if (*result) {
 *         const DeviceAnnouncement& radio = **result;
 *         std::cout << radio.model().value_or("?") << "\n";
 *     }
 * }
 * @endcode
 */
class DiscoveryListener {
public:
    using ReceiveResult = expected<std::optional<DeviceAnnouncement>, ListenerError>;

    /**
     * @brief Create, configure and bind the discovery socket
     *
     * @param bind_address IPv4 address to bind ("0.0.0.0" or "" = all interfaces)
     * @param port UDP port to bind (0 = any free port, see socket_port())
     * @param receive_timeout Upper bound for each receive_one() call; must be positive
     * @param options Address reuse, header length and buffer size
     * @throws SetupError if any setup step fails
     */
    explicit DiscoveryListener(const std::string& bind_address = default_bind_address,
                               uint16_t port = default_discovery_port,
                               std::chrono::milliseconds receive_timeout = default_receive_timeout,
                               ListenerOptions options = {})
        : socket_(-1),
          bound_port_(0),
          receive_timeout_(receive_timeout),
          decoder_(options.header_bytes),
          buffer_() {
        if (receive_timeout.count() <= 0) {
            throw SetupError(SetupStage::set_option, 0, "receive timeout must be positive");
        }
        if (options.max_datagram_bytes == 0) {
            throw SetupError(SetupStage::set_option, 0, "receive buffer size must be positive");
        }

        socket_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (socket_ < 0) {
            throw SetupError(SetupStage::create_socket, errno, "UDP");
        }

        int enable = 1;
        if (options.reuse_address &&
            ::setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
            fail(SetupStage::set_option, errno, "SO_REUSEADDR");
        }
        if (::setsockopt(socket_, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
            fail(SetupStage::set_option, errno, "SO_BROADCAST");
        }
        if (!apply_timeout(receive_timeout)) {
            fail(SetupStage::set_option, errno, "SO_RCVTIMEO");
        }

        struct sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (bind_address.empty()) {
            addr.sin_addr.s_addr = htonl(INADDR_ANY);
        } else if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
            fail(SetupStage::resolve_address, EINVAL, bind_address);
        }

        if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            fail(SetupStage::bind, errno, bind_address + ":" + std::to_string(port));
        }

        struct sockaddr_in bound {};
        socklen_t len = sizeof(bound);
        if (::getsockname(socket_, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
            bound_port_ = ntohs(bound.sin_port);
        } else {
            bound_port_ = port;
        }

        buffer_.resize(options.max_datagram_bytes);
    }

    /**
     * @brief Destructor closes socket
     */
    ~DiscoveryListener() {
        if (socket_ >= 0) {
            ::close(socket_);
        }
    }

    // Move-only (socket ownership)
    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    DiscoveryListener(DiscoveryListener&& other) noexcept
        : socket_(other.socket_),
          bound_port_(other.bound_port_),
          receive_timeout_(other.receive_timeout_),
          decoder_(other.decoder_),
          buffer_(std::move(other.buffer_)),
          last_sender_(std::move(other.last_sender_)),
          datagrams_received_(other.datagrams_received_),
          announcements_decoded_(other.announcements_decoded_),
          decode_failures_(other.decode_failures_),
          timeouts_(other.timeouts_),
          status_(other.status_) {
        other.socket_ = -1;
    }

    DiscoveryListener& operator=(DiscoveryListener&& other) noexcept {
        if (this != &other) {
            if (socket_ >= 0) {
                ::close(socket_);
            }

            socket_ = other.socket_;
            bound_port_ = other.bound_port_;
            receive_timeout_ = other.receive_timeout_;
            decoder_ = other.decoder_;
            buffer_ = std::move(other.buffer_);
            last_sender_ = std::move(other.last_sender_);
            datagrams_received_ = other.datagrams_received_;
            announcements_decoded_ = other.announcements_decoded_;
            decode_failures_ = other.decode_failures_;
            timeouts_ = other.timeouts_;
            status_ = other.status_;

            other.socket_ = -1;
        }
        return *this;
    }

    /**
     * @brief Wait for one datagram and decode it
     *
     * Blocks for at most receive_timeout(). Performs exactly one receive; a
     * malformed datagram is reported, not skipped.
     *
     * @return The announcement, std::nullopt on timeout, or a ListenerError
     */
    ReceiveResult receive_one() {
        struct sockaddr_in from {};
        socklen_t from_len = sizeof(from);

        // MSG_TRUNC makes recvfrom() report the real datagram length
        ssize_t received = ::recvfrom(socket_, buffer_.data(), buffer_.size(), MSG_TRUNC,
                                      reinterpret_cast<struct sockaddr*>(&from), &from_len);
        if (received < 0) {
            int err = errno;
            status_.state = map_errno_to_state(err);
            status_.errno_value = err;
            if (status_.state == UDPTransportStatus::State::timeout) {
                timeouts_++;
                return ReceiveResult{std::optional<DeviceAnnouncement>{}};
            }
            return make_unexpected(
                ListenerError{IOError{.kind = IOError::Kind::receive_error, .errno_value = err}});
        }

        datagrams_received_++;
        last_sender_ = to_endpoint(from);
        status_.state = UDPTransportStatus::State::packet_ready;
        status_.errno_value = 0;

        auto size = static_cast<size_t>(received);
        if (size > buffer_.size()) {
            return make_unexpected(ListenerError{IOError{.kind = IOError::Kind::truncated_datagram,
                                                         .errno_value = EMSGSIZE,
                                                         .datagram_size = size}});
        }

        auto decoded = decoder_.decode(std::span<const uint8_t>(buffer_.data(), size));
        if (!decoded) {
            decode_failures_++;
            return make_unexpected(ListenerError{std::move(decoded).error()});
        }

        announcements_decoded_++;
        return ReceiveResult{std::optional<DeviceAnnouncement>{std::move(*decoded)}};
    }

    /**
     * @brief Change the receive timeout
     *
     * @param timeout New timeout; must be positive
     * @return false if the value was rejected or setsockopt() failed
     */
    bool try_set_timeout(std::chrono::milliseconds timeout) noexcept {
        if (timeout.count() <= 0 || !apply_timeout(timeout)) {
            return false;
        }
        receive_timeout_ = timeout;
        return true;
    }

    [[nodiscard]] std::chrono::milliseconds receive_timeout() const noexcept {
        return receive_timeout_;
    }

    /**
     * @brief Port the socket is bound to (resolved when constructed with port 0)
     */
    [[nodiscard]] uint16_t socket_port() const noexcept { return bound_port_; }

    [[nodiscard]] int socket_fd() const noexcept { return socket_; }

    [[nodiscard]] bool is_open() const noexcept { return socket_ >= 0; }

    [[nodiscard]] size_t header_bytes() const noexcept { return decoder_.header_bytes(); }

    /**
     * @brief Source of the most recent datagram, if any arrived yet
     */
    [[nodiscard]] const std::optional<SenderEndpoint>& last_sender() const noexcept {
        return last_sender_;
    }

    [[nodiscard]] size_t datagrams_received() const noexcept { return datagrams_received_; }
    [[nodiscard]] size_t announcements_decoded() const noexcept { return announcements_decoded_; }
    [[nodiscard]] size_t decode_failures() const noexcept { return decode_failures_; }
    [[nodiscard]] size_t timeouts() const noexcept { return timeouts_; }

    /**
     * @brief Get transport status of the last receive
     */
    [[nodiscard]] const UDPTransportStatus& transport_status() const noexcept { return status_; }

private:
    [[noreturn]] void fail(SetupStage stage, int err, const std::string& detail) {
        ::close(socket_);
        socket_ = -1;
        throw SetupError(stage, err, detail);
    }

    bool apply_timeout(std::chrono::milliseconds timeout) noexcept {
        struct timeval tv {};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        return ::setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    }

    static SenderEndpoint to_endpoint(const struct sockaddr_in& from) {
        char text[INET_ADDRSTRLEN] = {};
        if (::inet_ntop(AF_INET, &from.sin_addr, text, sizeof(text)) == nullptr) {
            text[0] = '\0';
        }
        return SenderEndpoint{text, ntohs(from.sin_port)};
    }

    int socket_;                                ///< Socket file descriptor
    uint16_t bound_port_;                       ///< Port reported by getsockname()
    std::chrono::milliseconds receive_timeout_; ///< Current SO_RCVTIMEO
    AnnouncementDecoder decoder_;               ///< Header-aware decoder
    std::vector<uint8_t> buffer_;               ///< Receive scratch buffer
    std::optional<SenderEndpoint> last_sender_; ///< Source of last datagram
    size_t datagrams_received_{0};
    size_t announcements_decoded_{0};
    size_t decode_failures_{0};
    size_t timeouts_{0};
    UDPTransportStatus status_; ///< Transport status
};

} // namespace flexdisco::utils::netio
