#pragma once

#include <chrono>

#include <cstddef>
#include <cstdint>

namespace flexdisco {

// ========================================================================
// Protocol Constants
// ========================================================================

/// Well-known UDP port radios broadcast their announcements to
inline constexpr uint16_t default_discovery_port = 4992;

/// Opaque prefix in front of the key=value text of every announcement
inline constexpr size_t announcement_header_bytes = 28;

/// Receive buffer size used when none is configured (one Ethernet MTU)
inline constexpr size_t default_max_datagram_bytes = 1500;

/// Default receive timeout for a listener
inline constexpr std::chrono::milliseconds default_receive_timeout{3000};

/// Default IPv4 bind address (all interfaces)
inline constexpr const char* default_bind_address = "0.0.0.0";

inline constexpr uint8_t token_separator = ' ';
inline constexpr uint8_t key_value_separator = '=';

// ========================================================================
// Decode Errors
// ========================================================================

/**
 * Structural decode failures.
 *
 * Unknown keys are not in this list: they are never errors.
 */
enum class DecodeErrorCode : uint8_t {
    none = 0,
    payload_too_short, ///< Datagram shorter than the configured header length
    missing_separator  ///< Token has no '=' between key and value
};

/**
 * Convert DecodeErrorCode to human-readable string.
 */
constexpr const char* decode_error_string(DecodeErrorCode code) noexcept {
    switch (code) {
        case DecodeErrorCode::none:
            return "No error";
        case DecodeErrorCode::payload_too_short:
            return "Payload shorter than announcement header";
        case DecodeErrorCode::missing_separator:
            return "Token is missing the '=' separator";
        default:
            return "Unknown decode error";
    }
}

// ========================================================================
// Decode Diagnostics
// ========================================================================

/**
 * Non-fatal observations made while decoding an announcement.
 */
enum class DiagnosticKind : uint8_t {
    unknown_field,  ///< Key is not part of the known schema
    duplicate_field ///< Known key appeared more than once; last value kept
};

constexpr const char* diagnostic_kind_string(DiagnosticKind kind) noexcept {
    switch (kind) {
        case DiagnosticKind::unknown_field:
            return "Unknown field";
        case DiagnosticKind::duplicate_field:
            return "Duplicate field";
        default:
            return "Unknown diagnostic";
    }
}

} // namespace flexdisco
