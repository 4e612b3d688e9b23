// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "saved_device_store.h"

#include "config.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

namespace forgefleet {

namespace {

// Throws json::type_error when a field has the wrong JSON type
std::optional<SavedDevice> parse_saved_device(const json& entry) {
    SavedDevice device;
    device.address = normalize_device_address(entry.value("address", ""));
    if (!is_valid_device_address(device.address)) {
        spdlog::warn("[SavedDevices] Skipping entry with invalid address '{}'",
                     entry.value("address", ""));
        return std::nullopt;
    }

    auto type = parse_device_type(entry.value("type", "legacy"));
    if (!type) {
        spdlog::warn("[SavedDevices] Skipping {}: unknown type '{}'", device.address,
                     entry.value("type", ""));
        return std::nullopt;
    }
    device.device_type = *type;
    device.serial_number = entry.value("serial", "");
    device.name = entry.value("name", device.address);
    device.last_connected = entry.value("last_connected", "");

    std::string code = entry.value("check_code", "");
    if (!code.empty()) {
        device.check_code = code;
    }
    return device;
}

} // namespace

ConfigSavedDeviceStore::ConfigSavedDeviceStore(Config& config) : config_(config) {}

std::vector<SavedDevice> ConfigSavedDeviceStore::saved_devices() const {
    std::vector<SavedDevice> result;

    json entries = config_.get<json>("/saved_printers", json::array());
    if (!entries.is_array()) {
        return result;
    }

    for (const auto& entry : entries) {
        if (!entry.is_object()) {
            spdlog::warn("[SavedDevices] Skipping non-object entry in /saved_printers");
            continue;
        }
        try {
            if (auto device = parse_saved_device(entry)) {
                result.push_back(*device);
            }
        } catch (const json::type_error& e) {
            spdlog::warn("[SavedDevices] Skipping entry with a mistyped field: {}", e.what());
        }
    }
    return result;
}

std::optional<SavedDevice> ConfigSavedDeviceStore::last_used() const {
    json last = config_.get<json>("/last_used_printer", "");
    if (!last.is_string()) {
        spdlog::warn("[SavedDevices] /last_used_printer is not a string, ignoring");
        return std::nullopt;
    }
    std::string key = last.get<std::string>();
    if (key.empty()) {
        return std::nullopt;
    }

    std::string as_address = normalize_device_address(key);
    for (const auto& device : saved_devices()) {
        if ((!device.serial_number.empty() && device.serial_number == key) ||
            device.address == as_address) {
            return device;
        }
    }

    spdlog::debug("[SavedDevices] Last used printer '{}' is no longer saved", key);
    return std::nullopt;
}

} // namespace forgefleet
