// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "polling_policy.h"
#include "session_types.h"

#include <chrono>
#include <cstdint>

namespace forgefleet {

class Config;

struct ConnectionSettings {
    std::chrono::milliseconds legacy_timeout{10000};
    std::chrono::milliseconds new_timeout{15000};
    uint32_t discovery_passes = 3;
    std::chrono::milliseconds discovery_pass_timeout{2000};
    std::chrono::milliseconds discovery_timeout{10000};

    [[nodiscard]] std::chrono::milliseconds connect_timeout_for(DeviceType type) const {
        return type == DeviceType::NEW ? new_timeout : legacy_timeout;
    }
};

/**
 * @brief Tunables of the session layer
 *
 * Defaults match the values written by Config::default_config().
 */
struct SessionSettings {
    int port_start = 8181;
    int port_end = 8191;
    ConnectionSettings connection;
    PollingPolicy polling;

    /**
     * @brief Read settings, falling back to defaults per key
     *
     * Out-of-range values are clamped and logged; the port range itself is
     * validated by PortAllocator.
     */
    static SessionSettings from_config(Config& config);
};

} // namespace forgefleet
