// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include <vector>

#include "hv/hlog.h"

#ifdef __linux__
#ifdef FORGEFLEET_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace forgefleet {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "forgefleet";

// Thread id is included: every polling task logs from its own loop thread
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

constexpr LevelName LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
    {"critical", spdlog::level::critical}, {"off", spdlog::level::off}};

struct TargetName {
    const char* name;
    LogTarget target;
};

constexpr TargetName TARGET_NAMES[] = {{"auto", LogTarget::Auto},
                                       {"journal", LogTarget::Journal},
                                       {"syslog", LogTarget::Syslog},
                                       {"file", LogTarget::File},
                                       {"console", LogTarget::Console}};

bool directory_writable(const std::filesystem::path& file) {
    std::filesystem::path dir = file.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    return ::access(dir.c_str(), W_OK) == 0;
}

std::string state_dir() {
    const char* state = std::getenv("XDG_STATE_HOME");
    if (state && state[0] != '\0') {
        return std::string(state) + "/forgefleet";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/state/forgefleet";
    }
    return "/tmp";
}

std::string pick_log_file(const std::string& requested) {
    if (!requested.empty()) {
        return requested;
    }
    if (directory_writable("/var/log/forgefleet.log")) {
        return "/var/log/forgefleet.log";
    }
    std::string dir = state_dir();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return "/tmp/forgefleet.log";
    }
    return dir + "/forgefleet.log";
}

LogTarget auto_target() {
#ifdef __linux__
#ifdef FORGEFLEET_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

spdlog::sink_ptr make_target_sink(LogTarget target, const LogConfig& config) {
    if (target == LogTarget::File) {
        std::string path = pick_log_file(config.file_path);
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, config.max_file_bytes, config.max_files);
    }
#ifdef __linux__
#ifdef FORGEFLEET_HAS_SYSTEMD
    if (target == LogTarget::Journal) {
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME);
    }
#endif
    // Journal without systemd support lands in syslog
    if (target == LogTarget::Syslog || target == LogTarget::Journal) {
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID, LOG_DAEMON,
                                                              false);
    }
#endif
    return nullptr;
}

} // namespace

void init_early() {
    auto logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void init(const LogConfig& config) {
    LogTarget target = config.target == LogTarget::Auto ? auto_target() : config.target;

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console || target == LogTarget::Console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    std::string sink_error;
    try {
        if (auto sink = make_target_sink(target, config)) {
            sinks.push_back(sink);
        }
    } catch (const spdlog::spdlog_ex& e) {
        // Unwritable log file: keep running on the console
        sink_error = e.what();
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
    }

    spdlog::drop(LOGGER_NAME);
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    // Dumped by the polling coordinator when a device reports a fatal error
    spdlog::enable_backtrace(32);
    hlog_set_level(to_hv_level(config.level));

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] {} sink unavailable, console only: {}", log_target_name(target),
                     sink_error);
    }
    spdlog::debug("[Logging] target={} level={} console={}", log_target_name(target),
                  spdlog::level::to_string_view(config.level), config.enable_console);
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (str == entry.name) {
            return entry.level;
        }
    }
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity > 2 ? spdlog::level::trace : spdlog::level::warn;
    }
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    default:
        return LOG_LEVEL_SILENT;
    }
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level) {
    return cli_verbosity > 0 ? verbosity_to_level(cli_verbosity)
                             : parse_level(config_level, spdlog::level::warn);
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.name) {
            return entry.target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "unknown";
}

} // namespace logging
} // namespace forgefleet
