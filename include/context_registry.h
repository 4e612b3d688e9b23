// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_bus.h"
#include "port_allocator.h"
#include "session_error.h"
#include "session_types.h"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace forgefleet {

/**
 * @brief Everything known about a device when its context is created
 */
struct ContextDescriptor {
    std::string address;
    DeviceType device_type = DeviceType::LEGACY;
    Capabilities capabilities;
    std::string name; ///< Defaults to the address when empty
    std::optional<std::string> serial_number;
};

/// @brief Result of a successful update_status()
struct StatusUpdate {
    uint64_t sequence = 0;
    bool recovered = false; ///< Context moved from ERROR back to CONNECTED
};

/// @brief Result of a record_poll_failure()
struct PollFailureUpdate {
    uint32_t consecutive_failures = 0;
    ConnectionState state = ConnectionState::CONNECTED;
};

/**
 * @brief Owns every live PrinterContext, keyed by id and by device address
 *
 * Single writer: every mutation and every snapshot read happens under one
 * mutex. Events are published after the lock is released, from the thread
 * that performed the mutation.
 *
 * Teardown runs the registered hooks (cancel flows, stop polling, close the
 * transport session) before the context is erased and its port released.
 * Concurrent teardowns of the same id resolve to exactly one removal.
 */
class ContextRegistry {
  public:
    using TeardownHook = std::function<void(const PrinterContext&)>;

    ContextRegistry(PortAllocator& ports, EventBus& events);

    ContextRegistry(const ContextRegistry&) = delete;
    ContextRegistry& operator=(const ContextRegistry&) = delete;

    /**
     * @brief Register a new context in CONNECTING state
     *
     * Leases a camera port as a side effect and publishes context-created.
     *
     * @return DUPLICATE_ADDRESS if a live context has the address,
     *         POOL_EXHAUSTED if no port is free, INVALID_ARGUMENT for a
     *         malformed address
     */
    SessionError create(const ContextDescriptor& descriptor, ContextId& id_out);

    SessionError create(const std::string& address, DeviceType device_type,
                        const Capabilities& capabilities, ContextId& id_out);

    SessionError mark_connected(const ContextId& id, const Capabilities& capabilities);

    /// @brief Move to ERROR; no event if already there
    SessionError mark_error(const ContextId& id);

    /**
     * @brief Store a successful poll
     *
     * Resets the failure counter, assigns the next sequence number,
     * recovers ERROR to CONNECTED and publishes status-changed.
     */
    SessionError update_status(const ContextId& id, const StatusSnapshot& snapshot,
                               std::chrono::milliseconds cadence, StatusUpdate& update_out);

    SessionError update_status(const ContextId& id, const StatusSnapshot& snapshot,
                               std::chrono::milliseconds cadence);

    /**
     * @brief Count a failed poll and store the backed-off cadence
     *
     * Does not change the connection state; the caller decides when the
     * threshold is reached and calls mark_error().
     */
    SessionError record_poll_failure(const ContextId& id, std::chrono::milliseconds cadence,
                                     PollFailureUpdate& update_out);

    SessionError set_cadence(const ContextId& id, std::chrono::milliseconds cadence);

    SessionError bind_session(const ContextId& id, SessionHandle session);

    /// @brief Make a context the active one; publishes context-switched on change
    SessionError set_active(const ContextId& id);

    [[nodiscard]] std::optional<ContextId> active_id() const;

    /**
     * @brief Remove a context
     *
     * Idempotent: an unknown id, or one another caller is already tearing
     * down, is a no-op.
     *
     * @return true if this call removed the context
     */
    bool teardown(const ContextId& id);

    /// @brief Hooks run in registration order, outside the registry lock
    void add_teardown_hook(TeardownHook hook);

    SessionError get(const ContextId& id, PrinterContext& out) const;
    [[nodiscard]] bool contains(const ContextId& id) const;
    [[nodiscard]] std::vector<PrinterContext> list() const;
    [[nodiscard]] std::optional<ContextId> find_by_address(const std::string& address) const;
    [[nodiscard]] size_t size() const;

  private:
    PrinterContext* find_locked(const ContextId& id);
    void publish_state_change(const PrinterContext& ctx, ConnectionState previous);

    PortAllocator& ports_;
    EventBus& events_;

    mutable std::mutex mutex_;
    std::map<ContextId, PrinterContext> contexts_;
    std::unordered_map<std::string, ContextId> by_address_;
    std::set<ContextId> tearing_down_;
    std::optional<ContextId> active_id_;
    uint64_t next_id_ = 1;

    std::mutex hooks_mutex_;
    std::vector<TeardownHook> teardown_hooks_;
};

} // namespace forgefleet
