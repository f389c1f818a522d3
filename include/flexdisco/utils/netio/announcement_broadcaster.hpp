// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <unistd.h>

// Linux/POSIX socket headers
#include "flexdisco/announcement_encoder.hpp"
#include "flexdisco/device_announcement.hpp"
#include "flexdisco/types.hpp"
#include "flexdisco/utils/netio/setup_error.hpp"
#include "flexdisco/utils/netio/udp_transport_status.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace flexdisco::utils::netio {

/**
 * @brief UDP announcement sender (Linux/POSIX)
 *
 * Puts discovery announcements on the wire the way a radio does. Used to
 * simulate radios and to drive DiscoveryListener in tests.
 *
 * A broadcaster either has a fixed peer (constructed with host and port,
 * send() without destination) or none (constructed with a local port, every
 * send() names its destination). SO_BROADCAST is always enabled, so the peer
 * or destination may be a broadcast address.
 *
 * Datagrams larger than mtu() are rejected before reaching the socket.
 *
 * Not thread-safe. Move-only.
 *
 * Example usage:
 * @code
 * AnnouncementBroadcaster radio("255.255.255.255", flexdisco::default_discovery_port);
 *
 * auto ann = DeviceAnnouncement::Builder{}
 *                .set(AnnouncementField::model, "FLEX-6600")
 *                .set(AnnouncementField::status, "Available")
 *                .build();
 * radio.send(ann);
 * @endcode
 */
class AnnouncementBroadcaster {
public:
    static constexpr size_t default_mtu = default_max_datagram_bytes;

    /**
     * @brief Create a broadcaster with a fixed peer
     *
     * @param host IPv4 literal (including broadcast addresses) or hostname
     * @param port Destination UDP port
     * @throws SetupError if the socket cannot be created, the host does not
     *         resolve, or connect() fails
     */
    AnnouncementBroadcaster(const std::string& host, uint16_t port) {
        open_socket();
        peer_ = lookup(host, port);
        if (::connect(socket_, reinterpret_cast<const sockaddr*>(&*peer_), sizeof(sockaddr_in)) <
            0) {
            fail(SetupStage::connect, errno, host + ":" + std::to_string(port));
        }
    }

    /**
     * @brief Create a broadcaster without a peer
     *
     * @param local_port Source port to bind (0 = any)
     * @throws SetupError if the socket cannot be created or bound
     */
    explicit AnnouncementBroadcaster(uint16_t local_port = 0) {
        open_socket();
        sockaddr_in local{};
        local.sin_family = AF_INET;
        local.sin_port = htons(local_port);
        local.sin_addr.s_addr = htonl(INADDR_ANY);
        if (::bind(socket_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
            fail(SetupStage::bind, errno, "port " + std::to_string(local_port));
        }
    }

    ~AnnouncementBroadcaster() { close_socket(); }

    AnnouncementBroadcaster(const AnnouncementBroadcaster&) = delete;
    AnnouncementBroadcaster& operator=(const AnnouncementBroadcaster&) = delete;

    AnnouncementBroadcaster(AnnouncementBroadcaster&& other) noexcept { take(other); }

    AnnouncementBroadcaster& operator=(AnnouncementBroadcaster&& other) noexcept {
        if (this != &other) {
            close_socket();
            take(other);
        }
        return *this;
    }

    /**
     * @brief Send a raw datagram to the fixed peer
     *
     * Fails with ENOTCONN when the broadcaster has no peer.
     */
    bool send(std::span<const uint8_t> bytes) noexcept {
        if (!peer_) {
            return reject(ENOTCONN);
        }
        return transmit(bytes, nullptr);
    }

    /**
     * @brief Send a raw datagram to dest
     */
    bool send(std::span<const uint8_t> bytes, const sockaddr_in& dest) noexcept {
        return transmit(bytes, &dest);
    }

    /**
     * @brief Encode an announcement and send it to the fixed peer
     *
     * Fails with EINVAL when the announcement cannot be encoded.
     */
    bool send(const DeviceAnnouncement& ann) {
        auto bytes = encode_announcement(ann);
        return bytes ? send(std::span<const uint8_t>(*bytes)) : reject(EINVAL);
    }

    bool send(const DeviceAnnouncement& ann, const sockaddr_in& dest) {
        auto bytes = encode_announcement(ann);
        return bytes ? transmit(*bytes, &dest) : reject(EINVAL);
    }

    void set_mtu(size_t mtu) noexcept { mtu_ = mtu; }
    [[nodiscard]] size_t mtu() const noexcept { return mtu_; }

    /**
     * @brief Set SO_SNDTIMEO
     *
     * @param milliseconds Timeout in milliseconds (0 = block indefinitely)
     */
    bool try_set_send_timeout(int milliseconds) noexcept {
        timeval tv{};
        tv.tv_sec = milliseconds / 1000;
        tv.tv_usec = (milliseconds % 1000) * 1000;
        return ::setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    }

    [[nodiscard]] bool has_peer() const noexcept { return peer_.has_value(); }
    [[nodiscard]] size_t announcements_sent() const noexcept { return announcements_sent_; }
    [[nodiscard]] size_t bytes_sent() const noexcept { return bytes_sent_; }
    [[nodiscard]] const UDPTransportStatus& transport_status() const noexcept { return status_; }

private:
    // One datagram out. dest == nullptr uses the connected peer.
    bool transmit(std::span<const uint8_t> bytes, const sockaddr_in* dest) noexcept {
        if (bytes.size() > mtu_) {
            return reject(EMSGSIZE);
        }

        ssize_t sent = dest == nullptr
                           ? ::send(socket_, bytes.data(), bytes.size(), 0)
                           : ::sendto(socket_, bytes.data(), bytes.size(), 0,
                                      reinterpret_cast<const sockaddr*>(dest), sizeof(*dest));
        if (sent < 0) {
            int err = errno;
            status_ = UDPTransportStatus{map_errno_to_state(err), err};
            return false;
        }
        if (static_cast<size_t>(sent) != bytes.size()) {
            return reject(EIO);
        }

        ++announcements_sent_;
        bytes_sent_ += bytes.size();
        status_ = UDPTransportStatus{};
        return true;
    }

    bool reject(int err) noexcept {
        status_ = UDPTransportStatus{UDPTransportStatus::State::socket_error, err};
        return false;
    }

    void open_socket() {
        socket_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (socket_ < 0) {
            throw SetupError(SetupStage::create_socket, errno, "UDP");
        }
        int enable = 1;
        if (::setsockopt(socket_, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
            fail(SetupStage::set_option, errno, "SO_BROADCAST");
        }
    }

    void close_socket() noexcept {
        if (socket_ >= 0) {
            ::close(socket_);
            socket_ = -1;
        }
    }

    void take(AnnouncementBroadcaster& other) noexcept {
        socket_ = std::exchange(other.socket_, -1);
        peer_ = std::exchange(other.peer_, std::nullopt);
        mtu_ = other.mtu_;
        announcements_sent_ = std::exchange(other.announcements_sent_, 0);
        bytes_sent_ = std::exchange(other.bytes_sent_, 0);
        status_ = other.status_;
    }

    [[noreturn]] void fail(SetupStage stage, int err, const std::string& detail) {
        close_socket();
        throw SetupError(stage, err, detail);
    }

    // IPv4 literals skip the resolver; "255.255.255.255" never needs DNS
    sockaddr_in lookup(const std::string& host, uint16_t port) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
            return addr;
        }

        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        addrinfo* found = nullptr;
        int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
        if (rc != 0 || found == nullptr) {
            fail(SetupStage::resolve_address, 0,
                 host + " (" + (rc != 0 ? ::gai_strerror(rc) : "no address") + ")");
        }
        addr.sin_addr = reinterpret_cast<const sockaddr_in*>(found->ai_addr)->sin_addr;
        ::freeaddrinfo(found);
        return addr;
    }

    int socket_{-1};
    std::optional<sockaddr_in> peer_; ///< Set when constructed with host and port
    size_t mtu_{default_mtu};
    size_t announcements_sent_{0};
    size_t bytes_sent_{0};
    UDPTransportStatus status_;
};

} // namespace flexdisco::utils::netio
