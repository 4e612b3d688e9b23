// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_flow_manager.h"
#include "context_registry.h"
#include "device_transport.h"
#include "event_bus.h"
#include "polling_coordinator.h"
#include "port_allocator.h"
#include "saved_device_store.h"
#include "session_settings.h"
#include "startup_request.h"

#include <atomic>
#include <mutex>
#include <vector>

/**
 * @brief Owns and wires the session layer
 *
 * SessionManager handles:
 * - Constructing the event bus, port allocator, registry, polling
 *   coordinator and flow manager from SessionSettings
 * - Starting polling when a flow connects a context
 * - Teardown plumbing: cancel flows for the address, stop polling, close
 *   the transport session
 * - Turning a StartupRequest into flows
 *
 * The transport and discovery collaborators are owned by the caller and
 * must outlive the manager.
 *
 * Usage:
 *   MockDeviceTransport transport;
 *   SessionManager mgr(SessionSettings::from_config(config), transport, &transport);
 *   mgr.events().subscribe(on_event);
 *   mgr.launch(StartupRequest::from_config(config), saved_store);
 *   ...
 *   mgr.shutdown();
 */
namespace forgefleet {

class SessionManager {
  public:
    /**
     * @throws std::invalid_argument if the configured port range is invalid
     */
    SessionManager(const SessionSettings& settings, IDeviceTransport& transport,
                   IDeviceDiscovery* discovery);
    ~SessionManager();

    // Non-copyable, non-movable (owns threads, components hold references)
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    /**
     * @brief Start the flows a launch request asks for
     *
     * LAST_USED replays the last used saved device, ALL_SAVED auto-connects
     * every saved device, EXPLICIT direct-connects the listed printers.
     * Rejected requests are logged and produce no handle, except in
     * ALL_SAVED where every device gets one.
     */
    std::vector<FlowHandle> launch(const StartupRequest& request, const ISavedDeviceStore& store);

    /// @brief Direct connect (see ConnectionFlowManager::start_direct_connect)
    SessionError connect(const std::string& address, DeviceType device_type,
                         const std::optional<std::string>& check_code, FlowHandle& handle_out);

    /// @brief Network discovery (see ConnectionFlowManager::start_discovery)
    SessionError discover(FlowHandle& handle_out);

    /// @brief Make a context the active one; polls it immediately
    SessionError set_active(const ContextId& id);

    /// @brief Operator touched the printer, poll it now
    SessionError notify_activity(const ContextId& id);

    /// @brief Tear down one context; unknown ids are a no-op
    bool disconnect(const ContextId& id);

    /// @return Number of contexts removed
    size_t disconnect_all();

    /**
     * @brief Stop flows, tear down every context and stop polling
     *
     * Idempotent; also run by the destructor.
     */
    void shutdown();

    [[nodiscard]] bool is_shut_down() const {
        return m_shut_down.load();
    }

    EventBus& events() {
        return m_events;
    }
    PortAllocator& ports() {
        return m_ports;
    }
    ContextRegistry& registry() {
        return m_registry;
    }
    PollingCoordinator& polling() {
        return m_polling;
    }
    ConnectionFlowManager& flows() {
        return m_flows;
    }
    const SessionSettings& settings() const {
        return m_settings;
    }

  private:
    SessionError on_context_connected(const ContextId& id);
    void on_context_teardown(const PrinterContext& ctx);

    const SessionSettings m_settings;
    IDeviceTransport& m_transport;

    // Declaration order is construction order; flows go first on destruction
    EventBus m_events;
    PortAllocator m_ports;
    ContextRegistry m_registry;
    PollingCoordinator m_polling;
    ConnectionFlowManager m_flows;

    std::mutex m_shutdown_mutex;
    std::atomic<bool> m_shut_down{false};
};

} // namespace forgefleet
