// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "context_registry.h"

#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace forgefleet {

ContextRegistry::ContextRegistry(PortAllocator& ports, EventBus& events)
    : ports_(ports), events_(events) {}

SessionError ContextRegistry::create(const std::string& address, DeviceType device_type,
                                     const Capabilities& capabilities, ContextId& id_out) {
    ContextDescriptor descriptor;
    descriptor.address = address;
    descriptor.device_type = device_type;
    descriptor.capabilities = capabilities;
    return create(descriptor, id_out);
}

SessionError ContextRegistry::create(const ContextDescriptor& descriptor, ContextId& id_out) {
    std::string address = normalize_device_address(descriptor.address);
    if (!is_valid_device_address(address)) {
        return SessionErrorHelper::invalid_argument("Invalid device address '" +
                                                    descriptor.address + "'");
    }

    ContextCreatedEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (by_address_.count(address) > 0) {
            spdlog::warn("[ContextRegistry] Rejecting duplicate context for {}", address);
            return SessionErrorHelper::duplicate_address(address);
        }

        ContextId id = "context-" + std::to_string(next_id_);

        uint16_t port = 0;
        SessionError err = ports_.acquire(id, port);
        if (!err) {
            return err;
        }
        ++next_id_;

        auto now = WallClock::now();
        PrinterContext ctx;
        ctx.id = id;
        ctx.name = descriptor.name.empty() ? address : descriptor.name;
        ctx.address = address;
        ctx.serial_number = descriptor.serial_number;
        ctx.device_type = descriptor.device_type;
        ctx.connection_state = ConnectionState::CONNECTING;
        ctx.camera_port = port;
        ctx.capabilities = descriptor.capabilities;
        ctx.created_at = now;
        ctx.last_activity = now;

        contexts_.emplace(id, ctx);
        by_address_.emplace(address, id);
        id_out = id;

        event.context_id = id;
        event.address = address;
        event.device_type = ctx.device_type;
        event.camera_port = ctx.camera_port;
    }

    spdlog::info("[ContextRegistry] Created {} for {} ({}), camera port {}", event.context_id,
                 event.address, device_type_to_string(event.device_type), *event.camera_port);
    events_.publish(event);
    return SessionErrorHelper::success();
}

PrinterContext* ContextRegistry::find_locked(const ContextId& id) {
    auto it = contexts_.find(id);
    return it == contexts_.end() ? nullptr : &it->second;
}

void ContextRegistry::publish_state_change(const PrinterContext& ctx, ConnectionState previous) {
    spdlog::info("[ContextRegistry] {} {} -> {}", ctx.id, connection_state_to_string(previous),
                 connection_state_to_string(ctx.connection_state));
    events_.publish(ConnectionStateChangedEvent{ctx.id, previous, ctx.connection_state,
                                                ctx.consecutive_failures});
}

SessionError ContextRegistry::mark_connected(const ContextId& id,
                                             const Capabilities& capabilities) {
    PrinterContext snapshot;
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PrinterContext* ctx = find_locked(id);
        if (!ctx) {
            return SessionErrorHelper::not_found(id);
        }
        previous = ctx->connection_state;
        ctx->capabilities = capabilities;
        ctx->connection_state = ConnectionState::CONNECTED;
        ctx->consecutive_failures = 0;
        ctx->last_activity = WallClock::now();
        snapshot = *ctx;
    }

    if (previous != ConnectionState::CONNECTED) {
        publish_state_change(snapshot, previous);
    }
    return SessionErrorHelper::success();
}

SessionError ContextRegistry::mark_error(const ContextId& id) {
    PrinterContext snapshot;
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PrinterContext* ctx = find_locked(id);
        if (!ctx) {
            return SessionErrorHelper::not_found(id);
        }
        previous = ctx->connection_state;
        ctx->connection_state = ConnectionState::ERROR;
        snapshot = *ctx;
    }

    if (previous != ConnectionState::ERROR) {
        publish_state_change(snapshot, previous);
    }
    return SessionErrorHelper::success();
}

SessionError ContextRegistry::update_status(const ContextId& id, const StatusSnapshot& snapshot,
                                            std::chrono::milliseconds cadence) {
    StatusUpdate ignored;
    return update_status(id, snapshot, cadence, ignored);
}

SessionError ContextRegistry::update_status(const ContextId& id, const StatusSnapshot& snapshot,
                                            std::chrono::milliseconds cadence,
                                            StatusUpdate& update_out) {
    PrinterContext ctx_copy;
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PrinterContext* ctx = find_locked(id);
        if (!ctx) {
            return SessionErrorHelper::not_found(id);
        }
        previous = ctx->connection_state;
        ctx->consecutive_failures = 0;
        ctx->last_status = snapshot;
        ctx->status_sequence += 1;
        ctx->cadence = cadence;
        ctx->last_activity = WallClock::now();
        if (previous == ConnectionState::ERROR || previous == ConnectionState::CONNECTING) {
            ctx->connection_state = ConnectionState::CONNECTED;
        }
        ctx_copy = *ctx;
    }

    update_out.sequence = ctx_copy.status_sequence;
    update_out.recovered = previous == ConnectionState::ERROR;

    if (previous != ctx_copy.connection_state) {
        publish_state_change(ctx_copy, previous);
    }
    events_.publish(StatusChangedEvent{id, ctx_copy.status_sequence, snapshot, cadence});
    return SessionErrorHelper::success();
}

SessionError ContextRegistry::record_poll_failure(const ContextId& id,
                                                  std::chrono::milliseconds cadence,
                                                  PollFailureUpdate& update_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    PrinterContext* ctx = find_locked(id);
    if (!ctx) {
        return SessionErrorHelper::not_found(id);
    }
    ctx->consecutive_failures += 1;
    ctx->cadence = cadence;
    update_out.consecutive_failures = ctx->consecutive_failures;
    update_out.state = ctx->connection_state;
    return SessionErrorHelper::success();
}

SessionError ContextRegistry::set_cadence(const ContextId& id, std::chrono::milliseconds cadence) {
    std::lock_guard<std::mutex> lock(mutex_);
    PrinterContext* ctx = find_locked(id);
    if (!ctx) {
        return SessionErrorHelper::not_found(id);
    }
    ctx->cadence = cadence;
    return SessionErrorHelper::success();
}

SessionError ContextRegistry::bind_session(const ContextId& id, SessionHandle session) {
    std::lock_guard<std::mutex> lock(mutex_);
    PrinterContext* ctx = find_locked(id);
    if (!ctx) {
        return SessionErrorHelper::not_found(id);
    }
    ctx->session = session;
    return SessionErrorHelper::success();
}

SessionError ContextRegistry::set_active(const ContextId& id) {
    std::optional<ContextId> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PrinterContext* ctx = find_locked(id);
        if (!ctx) {
            return SessionErrorHelper::not_found(id);
        }
        if (active_id_ && *active_id_ == id) {
            return SessionErrorHelper::success();
        }
        previous = active_id_;
        if (previous) {
            if (PrinterContext* old = find_locked(*previous)) {
                old->is_active = false;
            }
        }
        ctx->is_active = true;
        active_id_ = id;
    }

    spdlog::info("[ContextRegistry] Active context {} -> {}", previous.value_or("none"), id);
    events_.publish(ContextSwitchedEvent{id, previous});
    return SessionErrorHelper::success();
}

std::optional<ContextId> ContextRegistry::active_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_id_;
}

void ContextRegistry::add_teardown_hook(TeardownHook hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    teardown_hooks_.push_back(std::move(hook));
}

bool ContextRegistry::teardown(const ContextId& id) {
    PrinterContext snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PrinterContext* ctx = find_locked(id);
        if (!ctx || tearing_down_.count(id) > 0) {
            spdlog::trace("[ContextRegistry] Teardown of {} is a no-op", id);
            return false;
        }
        tearing_down_.insert(id);
        snapshot = *ctx;
    }

    spdlog::info("[ContextRegistry] Tearing down {} ({})", id, snapshot.address);

    std::vector<TeardownHook> hooks;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        hooks = teardown_hooks_;
    }
    for (auto& hook : hooks) {
        try {
            hook(snapshot);
        } catch (const std::exception& e) {
            spdlog::error("[ContextRegistry] Teardown hook failed for {}: {}", id, e.what());
        }
    }

    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts_.erase(id);
        by_address_.erase(snapshot.address);
        tearing_down_.erase(id);
        ports_.release(id);
        if (active_id_ && *active_id_ == id) {
            active_id_.reset();
            was_active = true;
        }
    }

    spdlog::info("[ContextRegistry] Removed {}", id);
    events_.publish(ContextRemovedEvent{id, snapshot.address});
    if (was_active) {
        events_.publish(ContextSwitchedEvent{std::nullopt, id});
    }
    return true;
}

SessionError ContextRegistry::get(const ContextId& id, PrinterContext& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(id);
    if (it == contexts_.end()) {
        return SessionErrorHelper::not_found(id);
    }
    out = it->second;
    return SessionErrorHelper::success();
}

bool ContextRegistry::contains(const ContextId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.count(id) > 0;
}

std::vector<PrinterContext> ContextRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PrinterContext> result;
    result.reserve(contexts_.size());
    for (const auto& [id, ctx] : contexts_) {
        result.push_back(ctx);
    }
    // Creation order: "context-9" before "context-10"
    std::sort(result.begin(), result.end(), [](const PrinterContext& a, const PrinterContext& b) {
        if (a.id.size() != b.id.size()) {
            return a.id.size() < b.id.size();
        }
        return a.id < b.id;
    });
    return result;
}

std::optional<ContextId> ContextRegistry::find_by_address(const std::string& address) const {
    std::string key = normalize_device_address(address);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_address_.find(key);
    if (it == by_address_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t ContextRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

} // namespace forgefleet
