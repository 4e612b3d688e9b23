// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "polling_policy.h"

#include <algorithm>
#include <cmath>

namespace forgefleet {

std::chrono::milliseconds PollingPolicy::cadence_for(bool job_active,
                                                     uint32_t consecutive_failures) const {
    using std::chrono::milliseconds;

    milliseconds base = job_active ? active_interval : idle_interval;
    if (consecutive_failures == 0) {
        return base;
    }

    double multiplier = std::max(1.0, backoff_multiplier);
    double scaled = static_cast<double>(base.count()) *
                    std::pow(multiplier, static_cast<double>(consecutive_failures));
    double cap = static_cast<double>(std::max(max_backoff, base).count());
    milliseconds backoff(static_cast<milliseconds::rep>(std::min(scaled, cap)));

    if (is_error(consecutive_failures)) {
        return std::max(backoff, error_interval);
    }
    return backoff;
}

} // namespace forgefleet
