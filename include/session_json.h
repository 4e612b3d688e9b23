// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "session_events.h"
#include "session_types.h"

#include "hv/json.hpp"

#include <string>

using json = nlohmann::json;

namespace forgefleet {

/// @brief ISO-8601 UTC timestamp ("2026-01-05T14:03:22Z"); empty for the epoch
std::string format_timestamp(WallClock::time_point tp);

json status_to_json(const StatusSnapshot& status);

json capabilities_to_json(const Capabilities& caps);

/**
 * @brief Serialize a context for external consumers
 *
 * Keys are camelCase. cameraPort and cameraUrl are null when no camera
 * port is leased; status is null before the first successful poll.
 */
json context_info_to_json(const PrinterContext& ctx);

/**
 * @brief Serialize an event as {"type": <event name>, ...payload}
 *
 * Failed flow states carry an "error" object with code, message and
 * retryable flag.
 */
json event_to_json(const SessionEvent& event);

} // namespace forgefleet
