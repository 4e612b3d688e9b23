// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_manager.h"

#include "safe_log.h"

#include <spdlog/spdlog.h>

namespace forgefleet {

SessionManager::SessionManager(const SessionSettings& settings, IDeviceTransport& transport,
                               IDeviceDiscovery* discovery)
    : m_settings(settings), m_transport(transport),
      m_ports(settings.port_start, settings.port_end), m_registry(m_ports, m_events),
      m_polling(m_registry, transport, settings.polling),
      m_flows(m_registry, transport, discovery, m_events, settings.connection) {
    m_flows.set_on_connected([this](const ContextId& id) { return on_context_connected(id); });
    m_registry.add_teardown_hook([this](const PrinterContext& ctx) { on_context_teardown(ctx); });

    spdlog::info("[SessionManager] Ready: {} camera port(s) {}-{}", m_ports.capacity(),
                 m_ports.first_port(), m_ports.last_port());
}

SessionManager::~SessionManager() {
    SAFE_LOG_DEBUG("[SessionManager] Destructor");
    shutdown();
}

SessionError SessionManager::on_context_connected(const ContextId& id) {
    // On failure the flow tears the context down
    SessionError err = m_polling.start(id);
    if (!err) {
        spdlog::warn("[SessionManager] Could not start polling {}: {}", id, err.technical_msg);
    }
    return err;
}

void SessionManager::on_context_teardown(const PrinterContext& ctx) {
    m_flows.cancel_for_address(ctx.address);
    m_polling.stop(ctx.id);

    // The snapshot may predate bind_session(); the context is still registered here
    SessionHandle session = ctx.session;
    PrinterContext current;
    if (m_registry.get(ctx.id, current)) {
        session = current.session;
    }
    if (session != INVALID_SESSION_HANDLE) {
        m_transport.disconnect(session);
        spdlog::debug("[SessionManager] Closed transport session {} for {}", session, ctx.id);
    }
}

std::vector<FlowHandle> SessionManager::launch(const StartupRequest& request,
                                               const ISavedDeviceStore& store) {
    std::vector<FlowHandle> handles;
    spdlog::info("[SessionManager] Launch mode: {}", startup_mode_to_string(request.mode));

    switch (request.mode) {
    case StartupMode::NONE:
        break;

    case StartupMode::LAST_USED: {
        auto device = store.last_used();
        if (!device) {
            spdlog::info("[SessionManager] No last used printer to reconnect");
            break;
        }
        FlowHandle handle;
        SessionError err = m_flows.start_saved_replay(*device, handle);
        if (err) {
            handles.push_back(handle);
        } else {
            spdlog::warn("[SessionManager] Reconnect to {} not started: {}", device->address,
                         err.technical_msg);
        }
        break;
    }

    case StartupMode::ALL_SAVED:
        handles = m_flows.start_auto_connect(store.saved_devices());
        break;

    case StartupMode::EXPLICIT:
        for (const auto& printer : request.printers) {
            FlowHandle handle;
            SessionError err = m_flows.start_direct_connect(printer.address, printer.device_type,
                                                            printer.check_code, handle);
            if (err) {
                handles.push_back(handle);
            } else {
                spdlog::warn("[SessionManager] Connect to {} not started: {}", printer.address,
                             err.technical_msg);
            }
        }
        break;
    }

    return handles;
}

SessionError SessionManager::connect(const std::string& address, DeviceType device_type,
                                     const std::optional<std::string>& check_code,
                                     FlowHandle& handle_out) {
    if (m_shut_down) {
        return SessionErrorHelper::shut_down();
    }
    return m_flows.start_direct_connect(address, device_type, check_code, handle_out);
}

SessionError SessionManager::discover(FlowHandle& handle_out) {
    if (m_shut_down) {
        return SessionErrorHelper::shut_down();
    }
    return m_flows.start_discovery(handle_out);
}

SessionError SessionManager::set_active(const ContextId& id) {
    SessionError err = m_registry.set_active(id);
    if (!err) {
        return err;
    }
    err = m_polling.notify_activity(id);
    if (!err) {
        spdlog::debug("[SessionManager] {} is active but not polled yet", id);
    }
    return SessionErrorHelper::success();
}

SessionError SessionManager::notify_activity(const ContextId& id) {
    return m_polling.notify_activity(id);
}

bool SessionManager::disconnect(const ContextId& id) {
    return m_registry.teardown(id);
}

size_t SessionManager::disconnect_all() {
    size_t removed = 0;
    for (const auto& ctx : m_registry.list()) {
        if (m_registry.teardown(ctx.id)) {
            ++removed;
        }
    }
    return removed;
}

void SessionManager::shutdown() {
    std::lock_guard<std::mutex> lock(m_shutdown_mutex);
    if (m_shut_down.exchange(true)) {
        return;
    }

    SAFE_LOG_INFO("[SessionManager] Shutting down");
    m_flows.shutdown();
    size_t removed = disconnect_all();
    m_polling.stop_all();
    SAFE_LOG_INFO("[SessionManager] Shutdown complete, {} session(s) closed", removed);
}

} // namespace forgefleet
