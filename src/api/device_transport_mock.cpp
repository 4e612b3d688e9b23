// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_transport_mock.h"

#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace forgefleet {

namespace {

std::optional<MachineState> parse_machine_state(const std::string& str) {
    static const std::pair<const char*, MachineState> names[] = {
        {"ready", MachineState::READY},         {"busy", MachineState::BUSY},
        {"printing", MachineState::PRINTING},   {"paused", MachineState::PAUSED},
        {"heating", MachineState::HEATING},     {"calibrating", MachineState::CALIBRATING},
        {"completed", MachineState::COMPLETED}, {"error", MachineState::ERROR}};
    for (const auto& [name, state] : names) {
        if (str == name) {
            return state;
        }
    }
    return std::nullopt;
}

} // namespace

MockDeviceTransport::DeviceState* MockDeviceTransport::find_locked(const std::string& address) {
    auto it = devices_.find(address);
    return it == devices_.end() ? nullptr : &it->second;
}

const MockDeviceTransport::DeviceState*
MockDeviceTransport::find_locked(const std::string& address) const {
    auto it = devices_.find(address);
    return it == devices_.end() ? nullptr : &it->second;
}

SessionError MockDeviceTransport::connect(const ConnectRequest& request, ConnectResult& result) {
    MockDevice device;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (DeviceState* state = find_locked(request.address)) {
            state->connect_attempts++;
            device = state->device;
            known = true;
        } else {
            unknown_connects_[request.address]++;
        }
    }

    if (!known || device.connect_outcome == MockConnectOutcome::TIMEOUT) {
        spdlog::debug("[MockTransport] {} unreachable, waiting out {}ms", request.address,
                      request.timeout.count());
        std::this_thread::sleep_for(request.timeout);
        return SessionErrorHelper::connect_timeout(
            request.address, static_cast<uint32_t>(request.timeout.count()));
    }

    if (device.connect_delay.count() > 0) {
        std::this_thread::sleep_for(std::min(device.connect_delay, request.timeout));
        if (device.connect_delay > request.timeout) {
            return SessionErrorHelper::connect_timeout(
                request.address, static_cast<uint32_t>(request.timeout.count()));
        }
    }

    if (device.connect_outcome == MockConnectOutcome::REFUSE) {
        return SessionErrorHelper::connect_refused(request.address);
    }

    if (device_type_requires_check_code(request.device_type)) {
        bool code_missing = !request.check_code || request.check_code->empty();
        bool code_wrong = !code_missing && !device.check_code.empty() &&
                          *request.check_code != device.check_code;
        if (code_missing || code_wrong ||
            device.connect_outcome == MockConnectOutcome::REJECT_CHECK_CODE) {
            return SessionErrorHelper::invalid_check_code(request.address);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SessionHandle handle = next_session_++;
    sessions_.emplace(handle, request.address);

    result.session = handle;
    result.capabilities = device.capabilities;
    result.name = device.name.empty() ? request.address : device.name;
    result.serial_number = device.serial_number;

    spdlog::debug("[MockTransport] Session {} opened to {}", handle, request.address);
    return SessionErrorHelper::success();
}

SessionError MockDeviceTransport::poll(SessionHandle session, std::chrono::milliseconds timeout,
                                       StatusSnapshot& snapshot) {
    std::chrono::milliseconds delay{0};
    std::string address;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) {
            return SessionErrorHelper::fatal_device_error("Unknown session " +
                                                          std::to_string(session));
        }
        address = it->second;
        DeviceState* state = find_locked(address);
        if (!state) {
            return SessionErrorHelper::transient_poll_failure(address + " went offline");
        }
        delay = state->poll_delay;
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(std::min(delay, timeout));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DeviceState* state = find_locked(address);
    if (!state) {
        return SessionErrorHelper::transient_poll_failure(address + " went offline");
    }
    state->polls++;
    cv_.notify_all();

    if (delay > timeout) {
        return SessionErrorHelper::transient_poll_failure("Status request to " + address +
                                                          " timed out");
    }
    if (state->fatal) {
        return SessionErrorHelper::fatal_device_error(address + " reported a hardware fault");
    }
    if (state->pending_failures > 0) {
        state->pending_failures--;
        return SessionErrorHelper::transient_poll_failure("No response from " + address);
    }

    StatusSnapshot& status = state->device.status;
    if (state->device.simulate_job && status.machine_state == MachineState::PRINTING) {
        status.progress = std::min(1.0, status.progress + 0.01);
        if (status.progress >= 1.0) {
            status.machine_state = MachineState::COMPLETED;
        }
    }
    snapshot = status;
    snapshot.polled_at = WallClock::now();
    return SessionErrorHelper::success();
}

void MockDeviceTransport::disconnect(SessionHandle session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(session) > 0) {
        spdlog::debug("[MockTransport] Session {} closed", session);
    }
}

SessionError MockDeviceTransport::scan(std::chrono::milliseconds timeout,
                                       std::vector<DiscoveredDevice>& found) {
    (void)timeout;
    std::lock_guard<std::mutex> lock(mutex_);
    size_t pass = scans_++;
    for (const auto& [address, state] : devices_) {
        const MockDevice& device = state.device;
        if (!device.discoverable || pass < device.discoverable_after_passes) {
            continue;
        }
        found.push_back({device.name, device.address, device.serial_number, device.device_type});
    }
    return SessionErrorHelper::success();
}

void MockDeviceTransport::add_device(const MockDevice& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceState state;
    state.device = device;
    devices_[device.address] = state;
}

void MockDeviceTransport::remove_device(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.erase(address);
}

void MockDeviceTransport::set_connect_outcome(const std::string& address,
                                              MockConnectOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (DeviceState* state = find_locked(address)) {
        state->device.connect_outcome = outcome;
    }
}

void MockDeviceTransport::set_connect_delay(const std::string& address,
                                            std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (DeviceState* state = find_locked(address)) {
        state->device.connect_delay = delay;
    }
}

void MockDeviceTransport::set_status(const std::string& address, const StatusSnapshot& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (DeviceState* state = find_locked(address)) {
        state->device.status = status;
    }
}

void MockDeviceTransport::fail_next_polls(const std::string& address, uint32_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (DeviceState* state = find_locked(address)) {
        state->pending_failures = count;
    }
}

void MockDeviceTransport::set_poll_fatal(const std::string& address, bool fatal) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (DeviceState* state = find_locked(address)) {
        state->fatal = fatal;
    }
}

void MockDeviceTransport::set_poll_delay(const std::string& address,
                                         std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (DeviceState* state = find_locked(address)) {
        state->poll_delay = delay;
    }
}

size_t MockDeviceTransport::connect_attempts(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const DeviceState* state = find_locked(address)) {
        return state->connect_attempts;
    }
    auto it = unknown_connects_.find(address);
    return it == unknown_connects_.end() ? 0 : it->second;
}

size_t MockDeviceTransport::poll_count(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const DeviceState* state = find_locked(address);
    return state ? state->polls : 0;
}

size_t MockDeviceTransport::scan_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scans_;
}

size_t MockDeviceTransport::open_session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool MockDeviceTransport::is_session_open(SessionHandle session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session) > 0;
}

bool MockDeviceTransport::wait_for_polls(const std::string& address, size_t count,
                                         std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, &address, count] {
        const DeviceState* state = find_locked(address);
        return state && state->polls >= count;
    });
}

namespace {

// Throws json::type_error when a field has the wrong JSON type
std::optional<MockDevice> parse_mock_device(const json& entry) {
    MockDevice device;
    device.address = normalize_device_address(entry.value("address", ""));
    if (!is_valid_device_address(device.address)) {
        spdlog::warn("[MockTransport] Skipping simulated device with invalid address '{}'",
                     device.address);
        return std::nullopt;
    }
    auto type = parse_device_type(entry.value("type", "legacy"));
    if (!type) {
        spdlog::warn("[MockTransport] Skipping {}: unknown type '{}'", device.address,
                     entry.value("type", ""));
        return std::nullopt;
    }
    device.device_type = *type;
    device.name = entry.value("name", device.address);
    device.serial_number = entry.value("serial", "");
    device.check_code = entry.value("check_code", "");
    device.discoverable = entry.value("discoverable", true);
    if (!entry.value("reachable", true)) {
        device.connect_outcome = MockConnectOutcome::TIMEOUT;
    }

    if (entry.contains("capabilities") && entry["capabilities"].is_object()) {
        const auto& caps = entry["capabilities"];
        device.capabilities.camera = caps.value("camera", false);
        device.capabilities.led_control = caps.value("led_control", false);
        device.capabilities.filtration = caps.value("filtration", false);
        device.capabilities.material_station = caps.value("material_station", false);
        device.capabilities.legacy_gcode = caps.value("legacy_gcode", true);
    }

    device.status.machine_state =
        parse_machine_state(entry.value("state", "ready")).value_or(MachineState::READY);
    device.status.job_name = entry.value("job_name", "");
    device.status.progress = entry.value("progress", 0.0);
    device.status.nozzle_temp = entry.value("nozzle_temp", 25.0);
    device.status.bed_temp = entry.value("bed_temp", 25.0);
    device.simulate_job = entry.value("simulate_job", true);
    return device;
}

} // namespace

std::vector<MockDevice> MockDeviceTransport::devices_from_json(const json& devices) {
    std::vector<MockDevice> result;
    if (!devices.is_array()) {
        return result;
    }

    for (const auto& entry : devices) {
        if (!entry.is_object()) {
            spdlog::warn("[MockTransport] Skipping non-object simulation entry");
            continue;
        }
        try {
            if (auto device = parse_mock_device(entry)) {
                result.push_back(*device);
            }
        } catch (const json::type_error& e) {
            spdlog::warn("[MockTransport] Skipping simulated device with a mistyped field: {}",
                         e.what());
        }
    }
    return result;
}

} // namespace forgefleet
