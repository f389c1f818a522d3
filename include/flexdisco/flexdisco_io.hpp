#pragma once

/**
 * @file flexdisco_io.hpp
 * @brief Convenience header for discovery socket I/O
 *
 * Primary types:
 * - DiscoveryListener: Binds the discovery port and returns one decoded
 *   announcement per receive_one() call (std::nullopt on timeout)
 * - AnnouncementBroadcaster: Sends announcements (radio simulation, tests)
 * - ListenerError: variant of IOError and DecodeError
 * - SetupError: thrown when a socket cannot be created or bound
 */

#include "../flexdisco.hpp"
#include "utils/detail/listener_error.hpp"
#include "utils/netio/announcement_broadcaster.hpp"
#include "utils/netio/discovery_listener.hpp"
#include "utils/netio/setup_error.hpp"
#include "utils/netio/udp_transport_status.hpp"

namespace flexdisco {

using utils::netio::AnnouncementBroadcaster;
using utils::netio::DiscoveryListener;
using utils::netio::ListenerOptions;
using utils::netio::SenderEndpoint;
using utils::netio::SetupError;
using utils::netio::SetupStage;

} // namespace flexdisco
