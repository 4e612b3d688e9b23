// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_transport.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace forgefleet {

enum class MockConnectOutcome {
    ACCEPT,           ///< Session opens
    TIMEOUT,          ///< Waits out the request timeout, then CONNECT_TIMEOUT
    REFUSE,           ///< CONNECT_REFUSED immediately
    REJECT_CHECK_CODE ///< INVALID_CHECK_CODE regardless of the code sent
};

/**
 * @brief One simulated printer
 */
struct MockDevice {
    std::string name;
    std::string address;
    std::string serial_number;
    DeviceType device_type = DeviceType::LEGACY;
    std::string check_code; ///< Expected code for NEW devices, empty accepts any
    Capabilities capabilities;
    MockConnectOutcome connect_outcome = MockConnectOutcome::ACCEPT;
    std::chrono::milliseconds connect_delay{0};
    bool discoverable = true;
    uint32_t discoverable_after_passes = 0; ///< Hidden from the first N scans
    StatusSnapshot status;
    bool simulate_job = false; ///< Advance progress on every poll while PRINTING
};

/**
 * @brief Scriptable in-process device transport and discovery
 *
 * Stands in for the wire-protocol client in tests and in the simulation
 * binary. Addresses without a registered device behave as unreachable.
 *
 * Thread-safe; blocking delays are served outside the internal lock.
 */
class MockDeviceTransport : public IDeviceTransport, public IDeviceDiscovery {
  public:
    MockDeviceTransport() = default;
    ~MockDeviceTransport() override = default;

    // Non-copyable
    MockDeviceTransport(const MockDeviceTransport&) = delete;
    MockDeviceTransport& operator=(const MockDeviceTransport&) = delete;

    SessionError connect(const ConnectRequest& request, ConnectResult& result) override;
    SessionError poll(SessionHandle session, std::chrono::milliseconds timeout,
                      StatusSnapshot& snapshot) override;
    void disconnect(SessionHandle session) override;

    SessionError scan(std::chrono::milliseconds timeout,
                      std::vector<DiscoveredDevice>& found) override;

    // =========================================================================
    // Test Control Methods
    // =========================================================================

    void add_device(const MockDevice& device);
    void remove_device(const std::string& address);
    void set_connect_outcome(const std::string& address, MockConnectOutcome outcome);
    void set_connect_delay(const std::string& address, std::chrono::milliseconds delay);
    void set_status(const std::string& address, const StatusSnapshot& status);

    /// @brief Next `count` polls of the device fail transiently
    void fail_next_polls(const std::string& address, uint32_t count);

    /// @brief Every poll of the device fails with FATAL_DEVICE_ERROR
    void set_poll_fatal(const std::string& address, bool fatal);

    /// @brief Polls take this long; longer than the poll timeout means failure
    void set_poll_delay(const std::string& address, std::chrono::milliseconds delay);

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] size_t connect_attempts(const std::string& address) const;
    [[nodiscard]] size_t poll_count(const std::string& address) const;
    [[nodiscard]] size_t scan_count() const;
    [[nodiscard]] size_t open_session_count() const;
    [[nodiscard]] bool is_session_open(SessionHandle session) const;

    /// @brief Block until the device has been polled at least `count` times
    bool wait_for_polls(const std::string& address, size_t count,
                        std::chrono::milliseconds timeout);

    /**
     * @brief Build devices from the `/simulation/devices` config array
     *
     * Entries without a valid address or type are skipped with a warning.
     */
    static std::vector<MockDevice> devices_from_json(const json& devices);

  private:
    struct DeviceState {
        MockDevice device;
        uint32_t pending_failures = 0;
        bool fatal = false;
        std::chrono::milliseconds poll_delay{0};
        size_t connect_attempts = 0;
        size_t polls = 0;
    };

    DeviceState* find_locked(const std::string& address);
    const DeviceState* find_locked(const std::string& address) const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, DeviceState> devices_;
    std::map<std::string, size_t> unknown_connects_;
    std::map<SessionHandle, std::string> sessions_;
    SessionHandle next_session_ = 1;
    size_t scans_ = 0;
};

} // namespace forgefleet
