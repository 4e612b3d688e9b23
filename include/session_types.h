// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @file session_types.h
 * @brief Data model shared by the session layer
 *
 * PrinterContext is owned by ContextRegistry. Every other component works
 * with a ContextId and asks the registry for a snapshot copy when it needs
 * field values.
 */

namespace forgefleet {

/// @brief Opaque, stable identifier of one printer session
using ContextId = std::string;

/// @brief Opaque handle returned by the device transport for an open session
using SessionHandle = uint64_t;

/// @brief Handle value meaning "no transport session bound"
constexpr SessionHandle INVALID_SESSION_HANDLE = 0;

using Clock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

/**
 * @brief Supported device families
 *
 * NEW is the family that authorizes connections with a check code.
 */
enum class DeviceType {
    LEGACY, ///< Legacy TCP control API only
    NEW     ///< Dual API family, check code required
};

const char* device_type_to_string(DeviceType type);

/**
 * @brief Parse "legacy" / "new" (case-insensitive)
 * @return Parsed type, or nullopt for unrecognized strings
 */
std::optional<DeviceType> parse_device_type(const std::string& str);

/// @brief True if connecting to this family needs a check code
bool device_type_requires_check_code(DeviceType type);

/**
 * @brief Connection state of one PrinterContext
 */
enum class ConnectionState {
    CONNECTING,  ///< Created by a flow, not yet marked connected
    CONNECTED,   ///< Polling normally
    ERROR,       ///< Consecutive poll failures reached the threshold, or fatal error
    DISCONNECTED ///< Torn down (only seen in removal snapshots)
};

const char* connection_state_to_string(ConnectionState state);

/**
 * @brief Feature flags discovered from the device on connect
 */
struct Capabilities {
    bool camera = false;            ///< Built-in camera stream available
    bool led_control = false;       ///< Chamber light control
    bool filtration = false;        ///< Filtration fan control
    bool material_station = false;  ///< Multi-material station attached
    bool legacy_gcode = true;       ///< Raw G-code over the legacy channel

    bool operator==(const Capabilities& other) const {
        return camera == other.camera && led_control == other.led_control &&
               filtration == other.filtration && material_station == other.material_station &&
               legacy_gcode == other.legacy_gcode;
    }
    bool operator!=(const Capabilities& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Machine state as reported by a status poll
 */
enum class MachineState {
    READY,
    BUSY,
    PRINTING,
    PAUSED,
    HEATING,
    CALIBRATING,
    COMPLETED,
    ERROR,
    UNKNOWN
};

const char* machine_state_to_string(MachineState state);

/**
 * @brief One status poll result
 */
struct StatusSnapshot {
    MachineState machine_state = MachineState::UNKNOWN;
    std::string job_name;
    double progress = 0.0;    ///< 0.0 .. 1.0
    double nozzle_temp = 0.0; ///< Celsius
    double bed_temp = 0.0;    ///< Celsius
    WallClock::time_point polled_at{};

    /// @brief True while the device is working on a job (drives fast cadence)
    [[nodiscard]] bool is_job_active() const;
};

/**
 * @brief Durable record of one printer session
 *
 * Only ContextRegistry mutates these fields. Copies handed out by the
 * registry are snapshots taken under its lock.
 */
struct PrinterContext {
    ContextId id;
    std::string name;
    std::string address; ///< Unique key within the registry
    std::optional<std::string> serial_number;
    DeviceType device_type = DeviceType::LEGACY;
    ConnectionState connection_state = ConnectionState::CONNECTING;
    std::optional<uint16_t> camera_port;
    Capabilities capabilities;
    SessionHandle session = INVALID_SESSION_HANDLE;

    std::optional<StatusSnapshot> last_status;
    uint64_t status_sequence = 0; ///< Sequence of last_status, 0 before the first poll
    std::chrono::milliseconds cadence{0};
    uint32_t consecutive_failures = 0;
    bool is_active = false;

    WallClock::time_point created_at{};
    WallClock::time_point last_activity{};

    /// @brief Local camera proxy URL, empty when no port is leased
    [[nodiscard]] std::string camera_url() const;
};

/**
 * @brief Printer found by a discovery scan
 */
struct DiscoveredDevice {
    std::string name;
    std::string address;
    std::string serial_number;
    DeviceType device_type = DeviceType::LEGACY;

    /// Two candidates are the same device if they share an address
    bool operator==(const DiscoveredDevice& other) const {
        return address == other.address;
    }
};

} // namespace forgefleet
