// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "startup_request.h"

#include "config.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

namespace forgefleet {

const char* startup_mode_to_string(StartupMode mode) {
    switch (mode) {
    case StartupMode::NONE:
        return "none";
    case StartupMode::LAST_USED:
        return "last_used";
    case StartupMode::ALL_SAVED:
        return "all_saved";
    case StartupMode::EXPLICIT:
        return "explicit";
    }
    return "unknown";
}

std::optional<StartupMode> parse_startup_mode(const std::string& str) {
    if (str == "none")
        return StartupMode::NONE;
    if (str == "last_used")
        return StartupMode::LAST_USED;
    if (str == "all_saved")
        return StartupMode::ALL_SAVED;
    if (str == "explicit")
        return StartupMode::EXPLICIT;
    return std::nullopt;
}

namespace {

// Throws json::type_error when a field has the wrong JSON type
std::optional<ExplicitPrinter> parse_explicit_printer(const json& entry) {
    ExplicitPrinter printer;
    if (entry.is_string()) {
        printer.address = normalize_device_address(entry.get<std::string>());
    } else if (entry.is_object()) {
        printer.address = normalize_device_address(entry.value("address", ""));
        auto type = parse_device_type(entry.value("type", "legacy"));
        if (!type) {
            spdlog::warn("[Startup] Skipping {}: unknown type '{}'", printer.address,
                         entry.value("type", ""));
            return std::nullopt;
        }
        printer.device_type = *type;
        std::string code = entry.value("check_code", "");
        if (!code.empty()) {
            printer.check_code = code;
        }
    } else {
        spdlog::warn("[Startup] Skipping malformed entry in /startup/printers");
        return std::nullopt;
    }

    if (!is_valid_device_address(printer.address)) {
        spdlog::warn("[Startup] Skipping invalid address '{}'", printer.address);
        return std::nullopt;
    }
    return printer;
}

} // namespace

StartupRequest StartupRequest::from_config(Config& config) {
    StartupRequest request;

    json mode_value = config.get<json>("/startup/mode", "none");
    if (!mode_value.is_string()) {
        spdlog::warn("[Startup] /startup/mode is not a string, starting with no printers");
        return request;
    }
    std::string mode_str = mode_value.get<std::string>();
    auto mode = parse_startup_mode(mode_str);
    if (!mode) {
        spdlog::warn("[Startup] Unknown startup mode '{}', starting with no printers", mode_str);
        return request;
    }
    request.mode = *mode;

    if (request.mode != StartupMode::EXPLICIT) {
        return request;
    }

    json printers = config.get<json>("/startup/printers", json::array());
    if (!printers.is_array()) {
        spdlog::warn("[Startup] /startup/printers is not an array");
        return request;
    }

    for (const auto& entry : printers) {
        try {
            if (auto printer = parse_explicit_printer(entry)) {
                request.printers.push_back(*printer);
            }
        } catch (const json::type_error& e) {
            spdlog::warn("[Startup] Skipping entry with a mistyped field: {}", e.what());
        }
    }

    spdlog::debug("[Startup] Mode {} with {} explicit printer(s)",
                  startup_mode_to_string(request.mode), request.printers.size());
    return request;
}

} // namespace forgefleet
