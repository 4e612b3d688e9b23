// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "session_types.h"

#include <optional>
#include <string>
#include <vector>

namespace forgefleet {

class Config;

/**
 * @brief A previously connected printer
 */
struct SavedDevice {
    std::string serial_number;
    std::string name;
    std::string address;
    DeviceType device_type = DeviceType::LEGACY;
    std::optional<std::string> check_code;
    std::string last_connected; ///< ISO 8601, informational
};

/**
 * @brief Read-only view of the saved printer list
 */
class ISavedDeviceStore {
  public:
    virtual ~ISavedDeviceStore() = default;

    /// @brief Saved devices in stored order
    virtual std::vector<SavedDevice> saved_devices() const = 0;

    /// @brief Device the user connected to last, if still saved
    virtual std::optional<SavedDevice> last_used() const = 0;
};

/**
 * @brief Saved printers kept in the application config
 *
 * Reads `/saved_printers` (array of objects with serial, name, address,
 * type, check_code, last_connected) and `/last_used_printer` (serial number
 * or address) on every call. Malformed entries are skipped.
 */
class ConfigSavedDeviceStore : public ISavedDeviceStore {
  public:
    explicit ConfigSavedDeviceStore(Config& config);

    std::vector<SavedDevice> saved_devices() const override;
    std::optional<SavedDevice> last_used() const override;

  private:
    Config& config_;
};

} // namespace forgefleet
