#pragma once

/**
 * @file flexdisco.hpp
 * @brief Main header for the radio discovery decoder
 *
 * Pure decoding and encoding, no sockets. For the UDP listener and
 * broadcaster include <flexdisco/flexdisco_io.hpp>.
 *
 * Primary types:
 * - DeviceAnnouncement: Immutable record of one discovery announcement
 * - AnnouncementDecoder / decode_announcement(): bytes -> DecodeResult<DeviceAnnouncement>
 * - encode_announcement(): DeviceAnnouncement -> datagram bytes
 */

#include "flexdisco/announcement_decoder.hpp"
#include "flexdisco/announcement_encoder.hpp"
#include "flexdisco/detail/decode_error.hpp"
#include "flexdisco/detail/decode_result.hpp"
#include "flexdisco/device_announcement.hpp"
#include "flexdisco/expected.hpp"
#include "flexdisco/types.hpp"
