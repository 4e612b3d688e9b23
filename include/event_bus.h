// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "session_events.h"

#include <cstdint>
#include <map>
#include <mutex>

namespace forgefleet {

using SubscriptionId = uint64_t;

/**
 * @brief Publish/subscribe channel for session events
 *
 * Every subscriber receives every event, synchronously on the publishing
 * thread. Callbacks run without the bus lock held, so a subscriber may
 * unsubscribe itself or call back into the session layer.
 *
 * A subscriber that throws is logged and skipped; the remaining subscribers
 * still receive the event.
 */
class EventBus {
  public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(SessionEventCallback callback);

    /// @return false if the id was unknown
    bool unsubscribe(SubscriptionId id);

    void publish(const SessionEvent& event);

    [[nodiscard]] size_t subscriber_count() const;

  private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, SessionEventCallback> subscribers_;
    SubscriptionId next_id_ = 1;
};

} // namespace forgefleet
