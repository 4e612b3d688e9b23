// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_flow.h"
#include "context_registry.h"
#include "device_transport.h"
#include "event_bus.h"
#include "saved_device_store.h"
#include "session_error.h"
#include "session_settings.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace forgefleet {

/**
 * @brief Turns connect requests into registered contexts
 *
 * Every flow runs on its own thread and moves through
 * Idle -> Negotiating -> {Succeeded | Failed | Cancelled}, publishing a
 * flow-progress event per transition. A connect flow that succeeds has
 * created the context, bound the transport session, marked it CONNECTED and
 * handed it to the connected callback (polling start).
 *
 * At most one flow targets an address at a time, and no flow starts for an
 * address that already has a live context: both cases are rejected with
 * BUSY at start.
 *
 * Direct connects make a single bounded attempt. Discovery makes up to
 * `discovery_passes` scans within `discovery_timeout` and stops at the first
 * pass that yields candidates.
 */
class ConnectionFlowManager {
  public:
    using ConnectedCallback = std::function<SessionError(const ContextId&)>;

    /**
     * @param discovery May be null; start_discovery() then fails
     */
    ConnectionFlowManager(ContextRegistry& registry, IDeviceTransport& transport,
                          IDeviceDiscovery* discovery, EventBus& events,
                          const ConnectionSettings& settings);
    ~ConnectionFlowManager();

    ConnectionFlowManager(const ConnectionFlowManager&) = delete;
    ConnectionFlowManager& operator=(const ConnectionFlowManager&) = delete;

    /**
     * @brief Called on the flow thread once a context is CONNECTED
     *
     * A failed result (or a thrown exception) tears the new context down and
     * fails the flow with that error.
     */
    void set_on_connected(ConnectedCallback callback);

    /**
     * @brief Connect to an operator supplied address
     *
     * @return INVALID_ARGUMENT for a malformed address, INVALID_CHECK_CODE if
     *         the family needs a check code and none was given, BUSY if a
     *         flow or live context already targets the address, SHUT_DOWN
     */
    SessionError start_direct_connect(const std::string& address, DeviceType device_type,
                                      const std::optional<std::string>& check_code,
                                      FlowHandle& handle_out);

    /**
     * @brief Scan the network for printers
     *
     * Each new candidate is announced with a device-discovered event; the
     * terminal FlowSucceeded carries them all (possibly none).
     *
     * @return BUSY if a discovery is already running
     */
    SessionError start_discovery(FlowHandle& handle_out);

    /// @brief Direct connect to a discovery candidate
    SessionError promote_candidate(const DiscoveredDevice& candidate,
                                   const std::optional<std::string>& check_code,
                                   FlowHandle& handle_out);

    /**
     * @brief One independent flow per saved device
     *
     * Always returns one handle per input. Entries rejected at start get a
     * handle that is already Failed with the rejection reason.
     */
    std::vector<FlowHandle> start_auto_connect(const std::vector<SavedDevice>& devices);

    /// @brief Reconnect one saved device with its stored check code
    SessionError start_saved_replay(const SavedDevice& device, FlowHandle& handle_out);

    /**
     * @brief Request cancellation; observed at the flow's next suspension point
     * @return false if the flow is unknown or already terminal
     */
    bool cancel(FlowId id);

    /// @brief Cancel every flow targeting the address
    size_t cancel_for_address(const std::string& address);

    [[nodiscard]] std::vector<ConnectionFlow> active_flows() const;
    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] bool is_busy(const std::string& address) const;

    /// @brief Cancel all flows, refuse new ones and wait for flow threads to exit
    void shutdown();

  private:
    struct FlowRecord {
        ConnectionFlow flow;
        std::optional<std::string> check_code;
        DeviceType device_type = DeviceType::LEGACY;
        std::promise<FlowState> promise;
        std::atomic<bool> cancel_requested{false};
        std::thread worker;
    };

    SessionError start_connect_flow(FlowKind kind, const std::string& address,
                                    DeviceType device_type,
                                    const std::optional<std::string>& check_code,
                                    FlowHandle& handle_out);
    FlowHandle rejected_handle(FlowKind kind, const std::string& address,
                               const SessionError& error);

    void run_connect(std::shared_ptr<FlowRecord> record);
    void run_discovery(std::shared_ptr<FlowRecord> record);
    SessionError finish_connect(const std::shared_ptr<FlowRecord>& record,
                                const std::string& address, const ConnectResult& result,
                                ContextId& id_out);

    void transition(const std::shared_ptr<FlowRecord>& record, FlowState state);
    void finish(const std::shared_ptr<FlowRecord>& record, FlowState state);
    bool wait_cancellable(const std::shared_ptr<FlowRecord>& record,
                          std::chrono::milliseconds duration);
    void reap_finished();

    ContextRegistry& registry_;
    IDeviceTransport& transport_;
    IDeviceDiscovery* discovery_;
    EventBus& events_;
    const ConnectionSettings settings_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<FlowId, std::shared_ptr<FlowRecord>> active_;
    std::vector<std::thread> finished_;
    FlowId next_id_ = 1;
    bool shut_down_ = false;

    std::mutex callback_mutex_;
    ConnectedCallback on_connected_;
};

} // namespace forgefleet
