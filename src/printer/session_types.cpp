// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_types.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace forgefleet {

const char* device_type_to_string(DeviceType type) {
    switch (type) {
    case DeviceType::LEGACY:
        return "legacy";
    case DeviceType::NEW:
        return "new";
    }
    return "unknown";
}

std::optional<DeviceType> parse_device_type(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "legacy")
        return DeviceType::LEGACY;
    if (lower == "new")
        return DeviceType::NEW;
    return std::nullopt;
}

bool device_type_requires_check_code(DeviceType type) {
    return type == DeviceType::NEW;
}

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::CONNECTING:
        return "connecting";
    case ConnectionState::CONNECTED:
        return "connected";
    case ConnectionState::ERROR:
        return "error";
    case ConnectionState::DISCONNECTED:
        return "disconnected";
    }
    return "unknown";
}

const char* machine_state_to_string(MachineState state) {
    switch (state) {
    case MachineState::READY:
        return "ready";
    case MachineState::BUSY:
        return "busy";
    case MachineState::PRINTING:
        return "printing";
    case MachineState::PAUSED:
        return "paused";
    case MachineState::HEATING:
        return "heating";
    case MachineState::CALIBRATING:
        return "calibrating";
    case MachineState::COMPLETED:
        return "completed";
    case MachineState::ERROR:
        return "error";
    case MachineState::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

bool StatusSnapshot::is_job_active() const {
    switch (machine_state) {
    case MachineState::PRINTING:
    case MachineState::PAUSED:
    case MachineState::HEATING:
    case MachineState::CALIBRATING:
    case MachineState::BUSY:
        return true;
    default:
        return false;
    }
}

std::string PrinterContext::camera_url() const {
    if (!camera_port) {
        return "";
    }
    return "http://localhost:" + std::to_string(*camera_port) + "/stream";
}

} // namespace forgefleet
