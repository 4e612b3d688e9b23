// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "session_types.h"

#include <optional>
#include <string>
#include <vector>

namespace forgefleet {

class Config;

enum class StartupMode {
    NONE,      ///< Start with no sessions
    LAST_USED, ///< Reconnect the last used saved printer
    ALL_SAVED, ///< Auto-connect every saved printer
    EXPLICIT   ///< Connect the printers listed in the request
};

const char* startup_mode_to_string(StartupMode mode);

/// @brief Parse "none" / "last_used" / "all_saved" / "explicit"
std::optional<StartupMode> parse_startup_mode(const std::string& str);

struct ExplicitPrinter {
    std::string address;
    DeviceType device_type = DeviceType::LEGACY;
    std::optional<std::string> check_code;
};

/**
 * @brief Initial set of connect requests made at launch
 */
struct StartupRequest {
    StartupMode mode = StartupMode::NONE;
    std::vector<ExplicitPrinter> printers; ///< Used by EXPLICIT only

    /**
     * @brief Read `/startup/mode` and `/startup/printers`
     *
     * Printers may be objects ({address, type, check_code}) or plain address
     * strings (legacy family). An unknown mode falls back to NONE.
     */
    static StartupRequest from_config(Config& config);
};

} // namespace forgefleet
