// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_bus.h"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace forgefleet {

const char* session_event_name(const SessionEvent& event) {
    struct Visitor {
        const char* operator()(const ContextCreatedEvent&) const {
            return "context-created";
        }
        const char* operator()(const ContextRemovedEvent&) const {
            return "context-removed";
        }
        const char* operator()(const StatusChangedEvent&) const {
            return "status-changed";
        }
        const char* operator()(const ConnectionStateChangedEvent&) const {
            return "connection-state-changed";
        }
        const char* operator()(const FlowProgressEvent&) const {
            return "flow-progress";
        }
        const char* operator()(const DeviceDiscoveredEvent&) const {
            return "device-discovered";
        }
        const char* operator()(const ContextSwitchedEvent&) const {
            return "context-switched";
        }
    };
    return std::visit(Visitor{}, event);
}

SubscriptionId EventBus::subscribe(SessionEventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(callback));
    spdlog::debug("[EventBus] Subscriber {} registered ({} total)", id, subscribers_.size());
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = subscribers_.erase(id) > 0;
    if (removed) {
        spdlog::debug("[EventBus] Subscriber {} removed", id);
    }
    return removed;
}

void EventBus::publish(const SessionEvent& event) {
    // Two-phase: copy callbacks under lock, invoke outside it
    std::vector<std::pair<SubscriptionId, SessionEventCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            targets.emplace_back(entry.first, entry.second);
        }
    }

    spdlog::trace("[EventBus] Dispatching {} to {} subscriber(s)", session_event_name(event),
                  targets.size());

    for (auto& [id, callback] : targets) {
        if (!callback) {
            continue;
        }
        try {
            callback(event);
        } catch (const std::exception& e) {
            spdlog::error("[EventBus] Subscriber {} threw while handling {}: {}", id,
                          session_event_name(event), e.what());
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace forgefleet
