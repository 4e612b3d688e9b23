// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace forgefleet {

namespace {

json get_default_camera_proxy_config() {
    return {{"port_start", 8181}, {"port_end", 8191}};
}

json get_default_connection_config() {
    return {{"legacy_timeout_ms", 10000},
            {"new_timeout_ms", 15000},
            {"discovery_passes", 3},
            {"discovery_pass_timeout_ms", 2000},
            {"discovery_timeout_ms", 10000}};
}

json get_default_polling_config() {
    return {{"idle_interval_ms", 3000},   {"active_interval_ms", 1000},
            {"backoff_multiplier", 1.5},  {"max_backoff_ms", 15000},
            {"error_interval_ms", 10000}, {"failure_threshold", 3},
            {"poll_timeout_ms", 5000}};
}

/// Fill keys missing from `section` with values from `defaults`
bool merge_section_defaults(json& data, const std::string& key, const json& defaults) {
    if (!data.contains(key) || !data[key].is_object()) {
        data[key] = defaults;
        return true;
    }

    bool modified = false;
    auto& section = data[key];
    for (auto& [name, value] : defaults.items()) {
        if (!section.contains(name)) {
            section[name] = value;
            modified = true;
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

json Config::default_config() {
    // log_level intentionally absent - command line verbosity provides the fallback
    return {{"log_path", "/tmp/forgefleet.log"},
            {"log_target", "auto"},
            {"camera_proxy", get_default_camera_proxy_config()},
            {"connection", get_default_connection_config()},
            {"polling", get_default_polling_config()},
            {"startup", {{"mode", "last_used"}, {"printers", json::array()}}},
            {"saved_printers", json::array()},
            {"last_used_printer", ""}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Top-level value in {} is not an object, resetting", config_path);
            data = default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = default_config();
        config_modified = true;
    }

    if (merge_section_defaults(data, "camera_proxy", get_default_camera_proxy_config())) {
        config_modified = true;
    }
    if (merge_section_defaults(data, "connection", get_default_connection_config())) {
        config_modified = true;
    }
    if (merge_section_defaults(data, "polling", get_default_polling_config())) {
        config_modified = true;
    }

    if (!data.contains("saved_printers") || !data["saved_printers"].is_array()) {
        data["saved_printers"] = json::array();
        config_modified = true;
    }

    // Save updated config with any new defaults
    if (config_modified) {
        save();
    }

    spdlog::debug("[Config] initialized: camera ports {}-{}, {} saved printer(s)",
                  get<int>("/camera_proxy/port_start"), get<int>("/camera_proxy/port_end"),
                  data["saved_printers"].size());
}

std::string Config::get_path() {
    return path;
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to factory defaults");
    data = default_config();
}

} // namespace forgefleet
