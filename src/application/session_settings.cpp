// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_settings.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace forgefleet {

namespace {

// One day; also keeps every interval within libhv's int timer range
constexpr int64_t MAX_INTERVAL_MS = 24 * 60 * 60 * 1000;

std::chrono::milliseconds read_ms(Config& config, const std::string& ptr,
                                  std::chrono::milliseconds fallback, int64_t minimum = 1) {
    int64_t value = config.get<int64_t>(ptr, fallback.count());
    if (value < minimum) {
        spdlog::warn("[Settings] {}={} below minimum {}, using {}", ptr, value, minimum, minimum);
        value = minimum;
    } else if (value > MAX_INTERVAL_MS) {
        spdlog::warn("[Settings] {}={} above maximum {}, using {}", ptr, value, MAX_INTERVAL_MS,
                     MAX_INTERVAL_MS);
        value = MAX_INTERVAL_MS;
    }
    return std::chrono::milliseconds(value);
}

} // namespace

SessionSettings SessionSettings::from_config(Config& config) {
    SessionSettings s;

    s.port_start = config.get<int>("/camera_proxy/port_start", s.port_start);
    s.port_end = config.get<int>("/camera_proxy/port_end", s.port_end);

    auto& c = s.connection;
    c.legacy_timeout = read_ms(config, "/connection/legacy_timeout_ms", c.legacy_timeout);
    c.new_timeout = read_ms(config, "/connection/new_timeout_ms", c.new_timeout);
    c.discovery_passes = static_cast<uint32_t>(
        std::max(1, config.get<int>("/connection/discovery_passes",
                                    static_cast<int>(c.discovery_passes))));
    c.discovery_pass_timeout =
        read_ms(config, "/connection/discovery_pass_timeout_ms", c.discovery_pass_timeout);
    c.discovery_timeout = read_ms(config, "/connection/discovery_timeout_ms", c.discovery_timeout);

    auto& p = s.polling;
    p.idle_interval = read_ms(config, "/polling/idle_interval_ms", p.idle_interval);
    p.active_interval = read_ms(config, "/polling/active_interval_ms", p.active_interval);
    p.max_backoff = read_ms(config, "/polling/max_backoff_ms", p.max_backoff);
    p.error_interval = read_ms(config, "/polling/error_interval_ms", p.error_interval);
    p.poll_timeout = read_ms(config, "/polling/poll_timeout_ms", p.poll_timeout);

    p.backoff_multiplier = config.get<double>("/polling/backoff_multiplier", p.backoff_multiplier);
    if (p.backoff_multiplier < 1.0) {
        spdlog::warn("[Settings] backoff_multiplier {} < 1.0 would shorten cadence on failure, "
                     "using 1.0",
                     p.backoff_multiplier);
        p.backoff_multiplier = 1.0;
    }

    int threshold = config.get<int>("/polling/failure_threshold",
                                    static_cast<int>(p.failure_threshold));
    p.failure_threshold = static_cast<uint32_t>(std::max(1, threshold));

    spdlog::debug("[Settings] ports {}-{}, connect timeouts legacy={}ms new={}ms", s.port_start,
                  s.port_end, c.legacy_timeout.count(), c.new_timeout.count());
    return s;
}

} // namespace forgefleet
