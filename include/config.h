// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace forgefleet {

/**
 * @brief Application configuration store
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Constructed and owned by main(); components that need settings receive
 * the values they need (see SessionSettings) rather than the store itself.
 *
 * Thread safety: Not thread-safe. Load once at startup and access from the
 * main thread only.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init("/etc/forgefleet/forgefleet.json");
 *
 * // Get with default fallback
 * int first = cfg.get<int>("/camera_proxy/port_start", 8181);
 *
 * // Set and save
 * cfg.set<std::string>("/startup/mode", "last_used");
 * cfg.save();
 * ```
 */
class Config {
  private:
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails
     * to parse is renamed to `<path>.corrupt` and replaced by defaults.
     * Sections missing from an existing file are filled in from defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or type mismatch
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds null.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr) && !data[ptr].is_null()) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist. Changes are in-memory
     * only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Save current configuration to file
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    /// @brief Path of the loaded configuration file
    std::string get_path();

    /**
     * @brief Replace in-memory configuration with factory defaults
     *
     * Saved printers are dropped as well. Call save() to persist.
     */
    void reset_to_defaults();

    /// @brief Factory default configuration document
    static json default_config();
};

} // namespace forgefleet
