// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_flow.h"

namespace forgefleet {

const char* flow_kind_to_string(FlowKind kind) {
    switch (kind) {
    case FlowKind::DISCOVERY:
        return "discovery";
    case FlowKind::DIRECT_ADDRESS:
        return "direct-address";
    case FlowKind::AUTO_CONNECT:
        return "auto-connect";
    case FlowKind::SAVED_REPLAY:
        return "saved-replay";
    }
    return "unknown";
}

namespace {

struct StateName {
    const char* operator()(const FlowIdle&) const {
        return "idle";
    }
    const char* operator()(const FlowNegotiating&) const {
        return "negotiating";
    }
    const char* operator()(const FlowSucceeded&) const {
        return "succeeded";
    }
    const char* operator()(const FlowFailed&) const {
        return "failed";
    }
    const char* operator()(const FlowCancelled&) const {
        return "cancelled";
    }
};

} // namespace

const char* flow_state_name(const FlowState& state) {
    return std::visit(StateName{}, state);
}

} // namespace forgefleet
