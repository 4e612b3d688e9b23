// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "context_registry.h"
#include "device_transport.h"
#include "polling_policy.h"
#include "session_error.h"
#include "session_types.h"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace forgefleet {

/**
 * @brief Runs one independent status loop per connected context
 *
 * Each context gets its own hv::EventLoopThread. The loop sleeps for the
 * context's cadence on a loop timer, then issues exactly one blocking poll
 * through the transport; polls for one context never overlap, and a slow
 * device only ever delays its own loop.
 *
 * Results are written to the registry, which publishes status-changed and
 * connection-state-changed events from the loop thread.
 *
 * A task whose device reports FATAL_DEVICE_ERROR stays registered but stops
 * polling until the context is torn down.
 */
class PollingCoordinator {
  public:
    PollingCoordinator(ContextRegistry& registry, IDeviceTransport& transport,
                       const PollingPolicy& policy);
    ~PollingCoordinator();

    PollingCoordinator(const PollingCoordinator&) = delete;
    PollingCoordinator& operator=(const PollingCoordinator&) = delete;

    /**
     * @brief Begin polling a context
     *
     * The first poll happens one cadence after start. Starting an already
     * polled context is a no-op.
     *
     * @return NOT_FOUND if the context is not registered, SHUT_DOWN after stop_all()
     */
    SessionError start(const ContextId& id);

    /**
     * @brief Cancel the context's task
     *
     * Blocks until an in-flight poll finishes, unless called from the task's
     * own loop thread, in which case the loop exits after the current callback.
     *
     * @return false if no task existed
     */
    bool stop(const ContextId& id);

    /**
     * @brief Poll now instead of waiting for the next tick
     *
     * Queued behind an in-flight poll, never concurrent with it.
     */
    SessionError notify_activity(const ContextId& id);

    /// @brief Stop every task and refuse new ones
    void stop_all();

    [[nodiscard]] bool is_polling(const ContextId& id) const;
    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] std::vector<ContextId> active_contexts() const;

    const PollingPolicy& policy() const {
        return policy_;
    }

  private:
    struct PollingTask;

    void schedule(PollingTask* task, std::chrono::milliseconds delay);
    void poll_once(PollingTask* task);
    void retire_orphan(PollingTask* task);
    void shutdown_task(std::unique_ptr<PollingTask> task);
    void reap_retired();

    ContextRegistry& registry_;
    IDeviceTransport& transport_;
    const PollingPolicy policy_;

    mutable std::mutex mutex_;
    std::map<ContextId, std::unique_ptr<PollingTask>> tasks_;
    std::vector<std::unique_ptr<PollingTask>> retired_;
    bool shut_down_ = false;
};

} // namespace forgefleet
