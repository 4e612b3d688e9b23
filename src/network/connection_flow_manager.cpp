// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_flow_manager.h"

#include "safe_log.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

namespace forgefleet {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

ConnectionFlowManager::ConnectionFlowManager(ContextRegistry& registry,
                                             IDeviceTransport& transport,
                                             IDeviceDiscovery* discovery, EventBus& events,
                                             const ConnectionSettings& settings)
    : registry_(registry), transport_(transport), discovery_(discovery), events_(events),
      settings_(settings) {}

ConnectionFlowManager::~ConnectionFlowManager() {
    SAFE_LOG_DEBUG("[ConnectionFlow] Destructor, {} flow(s) active", active_count());
    shutdown();
}

void ConnectionFlowManager::set_on_connected(ConnectedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_connected_ = std::move(callback);
}

// ============================================================================
// Flow start
// ============================================================================

SessionError ConnectionFlowManager::start_direct_connect(
    const std::string& address, DeviceType device_type,
    const std::optional<std::string>& check_code, FlowHandle& handle_out) {
    return start_connect_flow(FlowKind::DIRECT_ADDRESS, address, device_type, check_code,
                              handle_out);
}

SessionError ConnectionFlowManager::promote_candidate(const DiscoveredDevice& candidate,
                                                      const std::optional<std::string>& check_code,
                                                      FlowHandle& handle_out) {
    spdlog::debug("[ConnectionFlow] Promoting candidate {} ({})", candidate.name,
                  candidate.address);
    return start_connect_flow(FlowKind::DIRECT_ADDRESS, candidate.address,
                              candidate.device_type, check_code, handle_out);
}

SessionError ConnectionFlowManager::start_saved_replay(const SavedDevice& device,
                                                       FlowHandle& handle_out) {
    return start_connect_flow(FlowKind::SAVED_REPLAY, device.address, device.device_type,
                              device.check_code, handle_out);
}

std::vector<FlowHandle>
ConnectionFlowManager::start_auto_connect(const std::vector<SavedDevice>& devices) {
    std::vector<FlowHandle> handles;
    handles.reserve(devices.size());

    size_t started = 0;
    for (const auto& device : devices) {
        FlowHandle handle;
        SessionError err = start_connect_flow(FlowKind::AUTO_CONNECT, device.address,
                                              device.device_type, device.check_code, handle);
        if (err.success()) {
            ++started;
        } else {
            handle = rejected_handle(FlowKind::AUTO_CONNECT, device.address, err);
        }
        handles.push_back(handle);
    }

    spdlog::info("[ConnectionFlow] Auto-connect started {} of {} saved printer(s)", started,
                 devices.size());
    return handles;
}

SessionError ConnectionFlowManager::start_connect_flow(FlowKind kind, const std::string& address,
                                                       DeviceType device_type,
                                                       const std::optional<std::string>& check_code,
                                                       FlowHandle& handle_out) {
    reap_finished();

    std::string target = normalize_device_address(address);
    if (!is_valid_device_address(target)) {
        spdlog::warn("[ConnectionFlow] Rejecting connect to invalid address '{}'", address);
        return SessionErrorHelper::invalid_argument("Invalid device address '" + address + "'");
    }
    if (device_type_requires_check_code(device_type) && (!check_code || check_code->empty())) {
        spdlog::warn("[ConnectionFlow] Rejecting connect to {}: check code required", target);
        return SessionErrorHelper::invalid_check_code(target);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return SessionErrorHelper::shut_down();
    }
    for (const auto& [id, record] : active_) {
        if (record->flow.target_address == target) {
            spdlog::warn("[ConnectionFlow] Rejecting {} flow to {}: flow {} in progress",
                         flow_kind_to_string(kind), target, id);
            return SessionErrorHelper::busy(target);
        }
    }
    if (registry_.find_by_address(target)) {
        spdlog::warn("[ConnectionFlow] Rejecting {} flow to {}: already connected",
                     flow_kind_to_string(kind), target);
        return SessionErrorHelper::busy(target);
    }

    auto record = std::make_shared<FlowRecord>();
    record->flow.id = next_id_++;
    record->flow.kind = kind;
    record->flow.target_address = target;
    record->flow.state = FlowIdle{};
    record->flow.created_at = Clock::now();
    record->flow.updated_at = record->flow.created_at;
    record->device_type = device_type;
    record->check_code = check_code;

    FlowId id = record->flow.id;
    active_.emplace(id, record);
    try {
        record->worker = std::thread(&ConnectionFlowManager::run_connect, this, record);
    } catch (const std::system_error& e) {
        active_.erase(id);
        spdlog::error("[ConnectionFlow] Failed to spawn flow thread for {}: {}", target,
                      e.what());
        return SessionError(SessionResult::SHUT_DOWN,
                            "Failed to spawn flow thread: " + std::string(e.what()),
                            "Could not start connection");
    }

    handle_out.id = id;
    handle_out.target_address = target;
    handle_out.result = record->promise.get_future().share();

    spdlog::info("[ConnectionFlow] Flow {} ({}) started for {} ({})", id,
                 flow_kind_to_string(kind), target, device_type_to_string(device_type));
    return SessionErrorHelper::success();
}

SessionError ConnectionFlowManager::start_discovery(FlowHandle& handle_out) {
    reap_finished();

    if (!discovery_) {
        return SessionErrorHelper::invalid_argument("No discovery backend configured");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return SessionErrorHelper::shut_down();
    }
    for (const auto& entry : active_) {
        if (entry.second->flow.kind == FlowKind::DISCOVERY) {
            return SessionErrorHelper::busy("network discovery");
        }
    }

    auto record = std::make_shared<FlowRecord>();
    record->flow.id = next_id_++;
    record->flow.kind = FlowKind::DISCOVERY;
    record->flow.state = FlowIdle{};
    record->flow.created_at = Clock::now();
    record->flow.updated_at = record->flow.created_at;

    FlowId id = record->flow.id;
    active_.emplace(id, record);
    try {
        record->worker = std::thread(&ConnectionFlowManager::run_discovery, this, record);
    } catch (const std::system_error& e) {
        active_.erase(id);
        spdlog::error("[ConnectionFlow] Failed to spawn discovery thread: {}", e.what());
        return SessionError(SessionResult::SHUT_DOWN,
                            "Failed to spawn discovery thread: " + std::string(e.what()),
                            "Could not start printer search");
    }

    handle_out.id = id;
    handle_out.target_address.reset();
    handle_out.result = record->promise.get_future().share();

    spdlog::info("[ConnectionFlow] Discovery flow {} started ({} passes, {}ms budget)", id,
                 settings_.discovery_passes, settings_.discovery_timeout.count());
    return SessionErrorHelper::success();
}

FlowHandle ConnectionFlowManager::rejected_handle(FlowKind kind, const std::string& address,
                                                  const SessionError& error) {
    FlowId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
    }

    std::promise<FlowState> promise;
    FlowState state = FlowFailed{error};

    FlowHandle handle;
    handle.id = id;
    handle.target_address = normalize_device_address(address);
    handle.result = promise.get_future().share();

    events_.publish(FlowProgressEvent{id, kind, handle.target_address, state});
    promise.set_value(state);
    return handle;
}

// ============================================================================
// Flow bodies (flow thread)
// ============================================================================

void ConnectionFlowManager::run_connect(std::shared_ptr<FlowRecord> record) {
    const FlowId id = record->flow.id;
    const std::string address = *record->flow.target_address;

    transition(record, FlowNegotiating{});
    if (record->cancel_requested) {
        finish(record, FlowCancelled{});
        return;
    }

    ConnectRequest request;
    request.address = address;
    request.device_type = record->device_type;
    request.check_code = record->check_code;
    request.timeout = settings_.connect_timeout_for(record->device_type);

    ConnectResult result;
    auto started = Clock::now();
    SessionError err = transport_.connect(request, result);
    auto elapsed = duration_cast<milliseconds>(Clock::now() - started);

    if (err.success() && elapsed > request.timeout) {
        transport_.disconnect(result.session);
        err = SessionErrorHelper::connect_timeout(address,
                                                  static_cast<uint32_t>(request.timeout.count()));
    }

    if (record->cancel_requested) {
        if (err.success()) {
            transport_.disconnect(result.session);
        }
        finish(record, FlowCancelled{});
        return;
    }

    if (!err) {
        spdlog::warn("[ConnectionFlow] Flow {} to {} failed: {}", id, address, err.technical_msg);
        finish(record, FlowFailed{err});
        return;
    }

    ContextId context_id;
    err = finish_connect(record, address, result, context_id);
    if (!err) {
        transport_.disconnect(result.session);
        // NOT_FOUND after a cancel means the context was torn down under us
        bool cancelled = err.result == SessionResult::CANCELLED ||
                         (record->cancel_requested && err.result == SessionResult::NOT_FOUND);
        if (cancelled) {
            finish(record, FlowCancelled{});
        } else {
            spdlog::warn("[ConnectionFlow] Flow {} to {} failed after connect: {}", id, address,
                         err.technical_msg);
            finish(record, FlowFailed{err});
        }
        return;
    }

    finish(record, FlowSucceeded{context_id, {}});
}

SessionError ConnectionFlowManager::finish_connect(const std::shared_ptr<FlowRecord>& record,
                                                   const std::string& address,
                                                   const ConnectResult& result,
                                                   ContextId& id_out) {
    ContextDescriptor descriptor;
    descriptor.address = address;
    descriptor.device_type = record->device_type;
    descriptor.capabilities = result.capabilities;
    descriptor.name = result.name;
    if (!result.serial_number.empty()) {
        descriptor.serial_number = result.serial_number;
    }

    SessionError err = registry_.create(descriptor, id_out);
    if (!err) {
        return err;
    }

    // From here on a concurrent teardown of id_out surfaces as NOT_FOUND
    err = registry_.bind_session(id_out, result.session);
    if (!err) {
        return err;
    }
    if (record->cancel_requested) {
        registry_.teardown(id_out);
        return SessionErrorHelper::cancelled("Flow cancelled while registering " + address);
    }

    err = registry_.mark_connected(id_out, result.capabilities);
    if (!err) {
        return err;
    }

    ConnectedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_connected_;
    }
    if (callback) {
        SessionError cb_err;
        try {
            cb_err = callback(id_out);
        } catch (const std::exception& e) {
            cb_err = SessionErrorHelper::fatal_device_error(e.what());
        }
        if (!cb_err) {
            spdlog::error("[ConnectionFlow] Connected callback failed for {}: {}", id_out,
                          cb_err.technical_msg);
            registry_.teardown(id_out);
            return cb_err;
        }
    }

    if (record->cancel_requested) {
        registry_.teardown(id_out);
        return SessionErrorHelper::cancelled("Flow cancelled while registering " + address);
    }
    return SessionErrorHelper::success();
}

void ConnectionFlowManager::run_discovery(std::shared_ptr<FlowRecord> record) {
    const FlowId id = record->flow.id;

    transition(record, FlowNegotiating{});

    const auto deadline = Clock::now() + settings_.discovery_timeout;
    std::vector<DiscoveredDevice> candidates;
    std::set<std::string> seen;

    for (uint32_t pass = 0; pass < settings_.discovery_passes; ++pass) {
        if (record->cancel_requested) {
            finish(record, FlowCancelled{});
            return;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            spdlog::debug("[ConnectionFlow] Discovery {} out of time after {} pass(es)", id, pass);
            break;
        }
        milliseconds budget =
            std::min(settings_.discovery_pass_timeout, duration_cast<milliseconds>(deadline - now));

        std::vector<DiscoveredDevice> found;
        SessionError err = discovery_->scan(budget, found);
        if (!err) {
            spdlog::warn("[ConnectionFlow] Discovery {} pass {} failed: {}", id, pass + 1,
                         err.technical_msg);
        }

        for (auto& device : found) {
            device.address = normalize_device_address(device.address);
            if (!is_valid_device_address(device.address) || !seen.insert(device.address).second) {
                continue;
            }
            spdlog::info("[ConnectionFlow] Discovered {} at {} ({})", device.name, device.address,
                         device_type_to_string(device.device_type));
            candidates.push_back(device);
            events_.publish(DeviceDiscoveredEvent{id, device});
        }

        spdlog::debug("[ConnectionFlow] Discovery {} pass {}: {} answer(s), {} candidate(s)", id,
                      pass + 1, found.size(), candidates.size());
        if (!candidates.empty()) {
            break;
        }

        // Let the rest of the pass window elapse before rescanning
        if (pass + 1 < settings_.discovery_passes) {
            auto remaining = budget - duration_cast<milliseconds>(Clock::now() - now);
            if (remaining.count() > 0 && wait_cancellable(record, remaining)) {
                finish(record, FlowCancelled{});
                return;
            }
        }
    }

    if (record->cancel_requested) {
        finish(record, FlowCancelled{});
        return;
    }
    finish(record, FlowSucceeded{std::nullopt, candidates});
}

// ============================================================================
// State bookkeeping
// ============================================================================

void ConnectionFlowManager::transition(const std::shared_ptr<FlowRecord>& record,
                                       FlowState state) {
    FlowProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->flow.state = state;
        record->flow.updated_at = Clock::now();
        event = FlowProgressEvent{record->flow.id, record->flow.kind, record->flow.target_address,
                                  state};
    }
    spdlog::debug("[ConnectionFlow] Flow {} -> {}", event.flow_id, flow_state_name(state));
    events_.publish(event);
}

void ConnectionFlowManager::finish(const std::shared_ptr<FlowRecord>& record, FlowState state) {
    FlowProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->flow.state = state;
        record->flow.updated_at = Clock::now();
        event = FlowProgressEvent{record->flow.id, record->flow.kind, record->flow.target_address,
                                  state};
        active_.erase(record->flow.id);
        if (record->worker.joinable()) {
            finished_.push_back(std::move(record->worker));
        }
    }
    cv_.notify_all();

    spdlog::info("[ConnectionFlow] Flow {} ({}) for {} {}", event.flow_id,
                 flow_kind_to_string(event.kind), event.target_address.value_or("network"),
                 flow_state_name(state));
    events_.publish(event);
    record->promise.set_value(std::move(state));
}

bool ConnectionFlowManager::wait_cancellable(const std::shared_ptr<FlowRecord>& record,
                                             milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [&record] { return record->cancel_requested.load(); });
}

// ============================================================================
// Cancellation and queries
// ============================================================================

bool ConnectionFlowManager::cancel(FlowId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(id);
        if (it == active_.end()) {
            return false;
        }
        it->second->cancel_requested = true;
    }
    cv_.notify_all();
    spdlog::info("[ConnectionFlow] Cancel requested for flow {}", id);
    return true;
}

size_t ConnectionFlowManager::cancel_for_address(const std::string& address) {
    std::string target = normalize_device_address(address);
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, record] : active_) {
            if (record->flow.target_address == target) {
                record->cancel_requested = true;
                ++count;
            }
        }
    }
    if (count > 0) {
        cv_.notify_all();
        spdlog::info("[ConnectionFlow] Cancelled {} flow(s) for {}", count, target);
    }
    return count;
}

std::vector<ConnectionFlow> ConnectionFlowManager::active_flows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionFlow> result;
    result.reserve(active_.size());
    for (const auto& entry : active_) {
        result.push_back(entry.second->flow);
    }
    return result;
}

size_t ConnectionFlowManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

bool ConnectionFlowManager::is_busy(const std::string& address) const {
    std::string target = normalize_device_address(address);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : active_) {
        if (entry.second->flow.target_address == target) {
            return true;
        }
    }
    return registry_.find_by_address(target).has_value();
}

void ConnectionFlowManager::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!shut_down_) {
            shut_down_ = true;
            for (auto& entry : active_) {
                entry.second->cancel_requested = true;
            }
            SAFE_LOG_DEBUG("[ConnectionFlow] Shutting down, waiting for {} flow(s)",
                           active_.size());
        }
        cv_.notify_all();
        cv_.wait(lock, [this] { return active_.empty(); });
    }
    reap_finished();
}

void ConnectionFlowManager::reap_finished() {
    std::vector<std::thread> joinable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = finished_.begin(); it != finished_.end();) {
            // A flow thread that starts another flow cannot join itself
            if (it->get_id() == std::this_thread::get_id()) {
                ++it;
                continue;
            }
            joinable.push_back(std::move(*it));
            it = finished_.erase(it);
        }
    }
    for (auto& thread : joinable) {
        thread.join();
    }
}

} // namespace forgefleet
