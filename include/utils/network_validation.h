// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace forgefleet {

/**
 * @brief Validate a printer address
 *
 * Accepts:
 * - Dotted IPv4 addresses with four 0-255 octets (e.g., "192.168.1.50")
 * - Hostnames (e.g., "printer.local", "ad5x-office")
 *
 * Anything made only of digits and dots is treated as an IPv4 attempt, so
 * "10.0.0" and "10.0.0.256" are rejected instead of passing as hostnames.
 *
 * @param address Address exactly as it will be used as registry key
 * @return true if valid, false otherwise
 */
bool is_valid_device_address(const std::string& address);

/**
 * @brief Canonical form of a user-entered address
 *
 * Trims surrounding whitespace and lowercases hostnames so "Printer.local "
 * and "printer.local" map to the same registry key.
 */
std::string normalize_device_address(const std::string& raw);

} // namespace forgefleet
