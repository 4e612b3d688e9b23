// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "session_error.h"
#include "session_types.h"

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace forgefleet {

using FlowId = uint64_t;

enum class FlowKind {
    DISCOVERY,      ///< Network scan, produces candidates only
    DIRECT_ADDRESS, ///< Operator supplied address
    AUTO_CONNECT,   ///< One saved address out of an auto-connect fan-out
    SAVED_REPLAY    ///< Reconnect one saved device with its stored check code
};

const char* flow_kind_to_string(FlowKind kind);

struct FlowIdle {};

struct FlowNegotiating {};

struct FlowSucceeded {
    std::optional<ContextId> context_id;      ///< Set for connect flows
    std::vector<DiscoveredDevice> candidates; ///< Set for discovery flows
};

struct FlowFailed {
    SessionError error;
};

struct FlowCancelled {};

/**
 * @brief Per-flow state machine
 *
 * Idle -> Negotiating -> {Succeeded | Failed | Cancelled}
 */
using FlowState = std::variant<FlowIdle, FlowNegotiating, FlowSucceeded, FlowFailed, FlowCancelled>;

const char* flow_state_name(const FlowState& state);

/**
 * @brief Snapshot of one in-progress connection attempt
 */
struct ConnectionFlow {
    FlowId id = 0;
    FlowKind kind = FlowKind::DIRECT_ADDRESS;
    std::optional<std::string> target_address; ///< Absent for discovery
    FlowState state = FlowIdle{};
    Clock::time_point created_at{};
    Clock::time_point updated_at{};
};

/**
 * @brief Caller's handle on a started flow
 *
 * The flow record itself is discarded when it reaches a terminal state; the
 * terminal state stays available through `result`.
 */
struct FlowHandle {
    FlowId id = 0;
    std::optional<std::string> target_address;
    std::shared_future<FlowState> result;

    [[nodiscard]] bool valid() const {
        return result.valid();
    }

    /// @brief Block until the flow is terminal or the timeout expires
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const {
        return result.valid() && result.wait_for(timeout) == std::future_status::ready;
    }
};

} // namespace forgefleet
