// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_json.h"

#include <ctime>
#include <type_traits>

namespace forgefleet {

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json error_to_json(const SessionError& err) {
    json j;
    j["code"] = session_result_to_string(err.result);
    j["message"] = err.user_msg.empty() ? err.technical_msg : err.user_msg;
    j["technical"] = err.technical_msg;
    j["retryable"] = err.is_retryable();
    if (!err.suggestion.empty()) {
        j["suggestion"] = err.suggestion;
    }
    return j;
}

json flow_state_to_json(const FlowState& state) {
    json j;
    j["state"] = flow_state_name(state);

    if (const auto* ok = std::get_if<FlowSucceeded>(&state)) {
        j["contextId"] = optional_string(ok->context_id);
        if (!ok->candidates.empty()) {
            json candidates = json::array();
            for (const auto& device : ok->candidates) {
                candidates.push_back({{"name", device.name},
                                      {"address", device.address},
                                      {"serialNumber", device.serial_number},
                                      {"deviceType", device_type_to_string(device.device_type)}});
            }
            j["candidates"] = candidates;
        }
    } else if (const auto* failed = std::get_if<FlowFailed>(&state)) {
        j["error"] = error_to_json(failed->error);
    }
    return j;
}

} // namespace

std::string format_timestamp(WallClock::time_point tp) {
    if (tp == WallClock::time_point{}) {
        return "";
    }
    std::time_t t = WallClock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc) == 0) {
        return "";
    }
    return buf;
}

json status_to_json(const StatusSnapshot& status) {
    return {{"state", machine_state_to_string(status.machine_state)},
            {"jobName", status.job_name},
            {"progress", status.progress},
            {"nozzleTemp", status.nozzle_temp},
            {"bedTemp", status.bed_temp},
            {"jobActive", status.is_job_active()},
            {"polledAt", format_timestamp(status.polled_at)}};
}

json capabilities_to_json(const Capabilities& caps) {
    return {{"camera", caps.camera},
            {"ledControl", caps.led_control},
            {"filtration", caps.filtration},
            {"materialStation", caps.material_station},
            {"legacyGcode", caps.legacy_gcode}};
}

json context_info_to_json(const PrinterContext& ctx) {
    json j;
    j["id"] = ctx.id;
    j["name"] = ctx.name;
    j["address"] = ctx.address;
    j["serialNumber"] = optional_string(ctx.serial_number);
    j["deviceType"] = device_type_to_string(ctx.device_type);
    j["state"] = connection_state_to_string(ctx.connection_state);
    j["isActive"] = ctx.is_active;
    j["hasCamera"] = ctx.capabilities.camera && ctx.camera_port.has_value();
    j["cameraPort"] = ctx.camera_port ? json(*ctx.camera_port) : json(nullptr);
    j["cameraUrl"] = ctx.camera_port ? json(ctx.camera_url()) : json(nullptr);
    j["capabilities"] = capabilities_to_json(ctx.capabilities);
    j["status"] = ctx.last_status ? status_to_json(*ctx.last_status) : json(nullptr);
    j["sequence"] = ctx.status_sequence;
    j["cadenceMs"] = ctx.cadence.count();
    j["failures"] = ctx.consecutive_failures;
    j["createdAt"] = format_timestamp(ctx.created_at);
    j["lastActivity"] = format_timestamp(ctx.last_activity);
    return j;
}

json event_to_json(const SessionEvent& event) {
    json j = std::visit(
        [](const auto& e) -> json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ContextCreatedEvent>) {
                return {{"contextId", e.context_id},
                        {"address", e.address},
                        {"deviceType", device_type_to_string(e.device_type)},
                        {"cameraPort", e.camera_port ? json(*e.camera_port) : json(nullptr)}};
            } else if constexpr (std::is_same_v<T, ContextRemovedEvent>) {
                return {{"contextId", e.context_id}, {"address", e.address}};
            } else if constexpr (std::is_same_v<T, StatusChangedEvent>) {
                return {{"contextId", e.context_id},
                        {"sequence", e.sequence},
                        {"cadenceMs", e.cadence.count()},
                        {"status", status_to_json(e.snapshot)}};
            } else if constexpr (std::is_same_v<T, ConnectionStateChangedEvent>) {
                return {{"contextId", e.context_id},
                        {"previous", connection_state_to_string(e.previous)},
                        {"state", connection_state_to_string(e.state)},
                        {"failures", e.consecutive_failures}};
            } else if constexpr (std::is_same_v<T, FlowProgressEvent>) {
                json flow = flow_state_to_json(e.state);
                flow["flowId"] = e.flow_id;
                flow["kind"] = flow_kind_to_string(e.kind);
                flow["address"] = optional_string(e.target_address);
                return flow;
            } else if constexpr (std::is_same_v<T, DeviceDiscoveredEvent>) {
                return {{"flowId", e.flow_id},
                        {"name", e.device.name},
                        {"address", e.device.address},
                        {"serialNumber", e.device.serial_number},
                        {"deviceType", device_type_to_string(e.device.device_type)}};
            } else {
                return {{"contextId", optional_string(e.context_id)},
                        {"previousId", optional_string(e.previous_id)}};
            }
        },
        event);
    j["type"] = session_event_name(event);
    return j;
}

} // namespace forgefleet
