// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

/**
 * @brief Logging for destructors and shutdown paths
 *
 * SessionManager, PollingCoordinator and ConnectionFlowManager shut down from
 * their destructors. Those can run after main() has dropped the default
 * logger (for example when a test replaces it), so every log call on those
 * paths checks for a logger first.
 *
 * Not safe during static destruction: objects owned by statics must not log
 * from their destructors at all.
 */

#define SAFE_LOG_DEBUG(...)                                                                        \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::debug(__VA_ARGS__);                                                            \
        }                                                                                          \
    } while (0)

#define SAFE_LOG_INFO(...)                                                                         \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::info(__VA_ARGS__);                                                             \
        }                                                                                          \
    } while (0)

#define SAFE_LOG_WARN(...)                                                                         \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::warn(__VA_ARGS__);                                                             \
        }                                                                                          \
    } while (0)

#define SAFE_LOG_ERROR(...)                                                                        \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::error(__VA_ARGS__);                                                            \
        }                                                                                          \
    } while (0)
