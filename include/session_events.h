// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_flow.h"
#include "session_types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

/**
 * @file session_events.h
 * @brief Typed events published on the EventBus
 *
 * Events for one context are published from one thread at a time, in the
 * order the registry applied the mutation. No ordering is defined across
 * contexts.
 */

namespace forgefleet {

struct ContextCreatedEvent {
    ContextId context_id;
    std::string address;
    DeviceType device_type = DeviceType::LEGACY;
    std::optional<uint16_t> camera_port;
};

struct ContextRemovedEvent {
    ContextId context_id;
    std::string address;
};

struct StatusChangedEvent {
    ContextId context_id;
    uint64_t sequence = 0; ///< Strictly increasing per context, no gaps
    StatusSnapshot snapshot;
    std::chrono::milliseconds cadence{0};
};

struct ConnectionStateChangedEvent {
    ContextId context_id;
    ConnectionState previous = ConnectionState::CONNECTING;
    ConnectionState state = ConnectionState::CONNECTING;
    uint32_t consecutive_failures = 0;
};

struct FlowProgressEvent {
    FlowId flow_id = 0;
    FlowKind kind = FlowKind::DIRECT_ADDRESS;
    std::optional<std::string> target_address;
    FlowState state; ///< FlowFailed carries the error
};

struct DeviceDiscoveredEvent {
    FlowId flow_id = 0;
    DiscoveredDevice device;
};

struct ContextSwitchedEvent {
    std::optional<ContextId> context_id; ///< Empty when the active context was removed
    std::optional<ContextId> previous_id;
};

using SessionEvent =
    std::variant<ContextCreatedEvent, ContextRemovedEvent, StatusChangedEvent,
                 ConnectionStateChangedEvent, FlowProgressEvent, DeviceDiscoveredEvent,
                 ContextSwitchedEvent>;

/// @brief Wire name of the event ("context-created", "status-changed", ...)
const char* session_event_name(const SessionEvent& event);

using SessionEventCallback = std::function<void(const SessionEvent&)>;

} // namespace forgefleet
