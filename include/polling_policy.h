// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>

namespace forgefleet {

/**
 * @brief Adaptive poll cadence
 *
 * Shape: active jobs poll faster than idle devices; each consecutive failure
 * multiplies the base interval by backoff_multiplier up to max_backoff; at
 * failure_threshold the context is in ERROR and polls no faster than
 * error_interval. Cadence never decreases as failures increase.
 */
struct PollingPolicy {
    std::chrono::milliseconds idle_interval{3000};
    std::chrono::milliseconds active_interval{1000};
    double backoff_multiplier = 1.5;
    std::chrono::milliseconds max_backoff{15000};
    std::chrono::milliseconds error_interval{10000};
    uint32_t failure_threshold = 3;
    std::chrono::milliseconds poll_timeout{5000};

    /**
     * @brief Delay before the next poll
     * @param job_active Last successful poll reported an active job
     * @param consecutive_failures Failures since the last success
     */
    [[nodiscard]] std::chrono::milliseconds cadence_for(bool job_active,
                                                        uint32_t consecutive_failures) const;

    [[nodiscard]] bool is_error(uint32_t consecutive_failures) const {
        return consecutive_failures >= failure_threshold;
    }
};

} // namespace forgefleet
