// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>

namespace forgefleet {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux), else console only
    Journal, ///< systemd journal (requires FORGEFLEET_HAS_SYSTEMD)
    Syslog,  ///< Traditional syslog
    File,    ///< Rotating log file
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Override for LogTarget::File, empty = auto-resolve
    size_t max_file_bytes = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/**
 * @brief Console-only logger for use before the config file is read
 */
void init_early();

/**
 * @brief Build the process-wide default logger
 *
 * Replaces whatever init_early() installed. A target sink that cannot be
 * opened is reported once and the console sink is kept. Also syncs libhv's
 * own logger level so event loop internals follow the same verbosity.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn"/"warning",
 *        "error", "critical", "off"); case sensitive
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// @brief -v count to level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Map an spdlog level to libhv's LOG_LEVEL_* value
 *
 * trace is capped at DEBUG; libhv VERBOSE output is too noisy.
 */
int to_hv_level(spdlog::level::level_enum level);

/**
 * @brief Pick the effective level
 *
 * Command line verbosity wins, then the config file level, then warn.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace forgefleet
