// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "session_error.h"
#include "session_types.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace forgefleet {

struct ConnectRequest {
    std::string address;
    DeviceType device_type = DeviceType::LEGACY;
    std::optional<std::string> check_code; ///< Required for DeviceType::NEW
    std::chrono::milliseconds timeout{10000};
};

/// @brief What the device told us while the session was opened
struct ConnectResult {
    SessionHandle session = INVALID_SESSION_HANDLE;
    Capabilities capabilities;
    std::string name;
    std::string serial_number;
};

/**
 * @brief Device wire-protocol client, as seen by the session layer
 *
 * Calls block the calling thread. Implementations must honor the timeouts
 * they are given; callers still treat an overrun as a failure.
 * Must be safe to call concurrently for different sessions.
 */
class IDeviceTransport {
  public:
    virtual ~IDeviceTransport() = default;

    /**
     * @brief Open a session and validate the check code where required
     * @return CONNECT_TIMEOUT, CONNECT_REFUSED or INVALID_CHECK_CODE on failure
     */
    virtual SessionError connect(const ConnectRequest& request, ConnectResult& result) = 0;

    /**
     * @brief Fetch one status snapshot
     * @return TRANSIENT_POLL_FAILURE or FATAL_DEVICE_ERROR on failure
     */
    virtual SessionError poll(SessionHandle session, std::chrono::milliseconds timeout,
                              StatusSnapshot& snapshot) = 0;

    /// @brief Close a session; unknown handles are ignored
    virtual void disconnect(SessionHandle session) = 0;
};

/**
 * @brief One-shot network scan for supported printers
 *
 * Allows dependency injection of mock implementations for testing.
 */
class IDeviceDiscovery {
  public:
    virtual ~IDeviceDiscovery() = default;

    /**
     * @brief Run one discovery pass
     * @param timeout Upper bound for the pass
     * @param found Devices that answered during this pass
     */
    virtual SessionError scan(std::chrono::milliseconds timeout,
                              std::vector<DiscoveredDevice>& found) = 0;
};

} // namespace forgefleet
