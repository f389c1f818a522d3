// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>

#include <cstdint>
#include <cstring>

namespace flexdisco::utils::netio {

/**
 * @brief Step of socket setup that failed
 */
enum class SetupStage : uint8_t {
    create_socket,   ///< socket() failed
    set_option,      ///< setsockopt() failed or option value rejected
    resolve_address, ///< Address string could not be parsed/resolved
    bind,            ///< bind() failed (port in use, privilege, bad address)
    connect          ///< connect() failed
};

constexpr const char* setup_stage_string(SetupStage stage) noexcept {
    switch (stage) {
        case SetupStage::create_socket:
            return "create socket";
        case SetupStage::set_option:
            return "set socket option";
        case SetupStage::resolve_address:
            return "resolve address";
        case SetupStage::bind:
            return "bind";
        case SetupStage::connect:
            return "connect";
        default:
            return "unknown stage";
    }
}

/**
 * @brief Fatal socket setup failure thrown from constructors
 *
 * The object under construction is never usable after this is thrown, and
 * nothing is retried.
 */
class SetupError : public std::runtime_error {
public:
    SetupError(SetupStage stage, int errno_value, const std::string& detail)
        : std::runtime_error(format(stage, errno_value, detail)),
          stage_(stage),
          errno_value_(errno_value) {}

    [[nodiscard]] SetupStage stage() const noexcept { return stage_; }
    [[nodiscard]] int errno_value() const noexcept { return errno_value_; }

private:
    static std::string format(SetupStage stage, int errno_value, const std::string& detail) {
        std::string msg = std::string("Failed to ") + setup_stage_string(stage);
        if (!detail.empty()) {
            msg += " (" + detail + ")";
        }
        if (errno_value != 0) {
            msg += ": ";
            msg += std::strerror(errno_value);
        }
        return msg;
    }

    SetupStage stage_;
    int errno_value_;
};

} // namespace flexdisco::utils::netio
