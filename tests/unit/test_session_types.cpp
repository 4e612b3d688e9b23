// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "session_error.h"
#include "session_settings.h"
#include "session_types.h"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace forgefleet;
using std::chrono::milliseconds;

// ============================================================================
// Session types
// ============================================================================

TEST_CASE("SessionTypes: device type parsing", "[types]") {
    REQUIRE(parse_device_type("legacy") == DeviceType::LEGACY);
    REQUIRE(parse_device_type("New") == DeviceType::NEW);
    REQUIRE_FALSE(parse_device_type("").has_value());
    REQUIRE_FALSE(parse_device_type("modern").has_value());

    REQUIRE(std::string(device_type_to_string(DeviceType::NEW)) == "new");
    REQUIRE(device_type_requires_check_code(DeviceType::NEW));
    REQUIRE_FALSE(device_type_requires_check_code(DeviceType::LEGACY));
}

TEST_CASE("SessionTypes: job activity by machine state", "[types]") {
    StatusSnapshot snap;
    for (auto state : {MachineState::PRINTING, MachineState::PAUSED, MachineState::HEATING,
                       MachineState::CALIBRATING, MachineState::BUSY}) {
        snap.machine_state = state;
        REQUIRE(snap.is_job_active());
    }
    for (auto state : {MachineState::READY, MachineState::COMPLETED, MachineState::ERROR,
                       MachineState::UNKNOWN}) {
        snap.machine_state = state;
        REQUIRE_FALSE(snap.is_job_active());
    }
}

TEST_CASE("SessionTypes: camera url follows the leased port", "[types]") {
    PrinterContext ctx;
    REQUIRE(ctx.camera_url().empty());
    ctx.camera_port = 8183;
    REQUIRE(ctx.camera_url() == "http://localhost:8183/stream");
}

// ============================================================================
// SessionError
// ============================================================================

TEST_CASE("SessionError: success and failure", "[errors]") {
    SessionError ok = SessionErrorHelper::success();
    REQUIRE(ok.success());
    REQUIRE(static_cast<bool>(ok));

    SessionError err = SessionErrorHelper::connect_timeout("10.0.0.5", 10000);
    REQUIRE_FALSE(err.success());
    REQUIRE_FALSE(static_cast<bool>(err));
    REQUIRE(err.technical_msg.find("10.0.0.5") != std::string::npos);
    REQUIRE(err.technical_msg.find("10000ms") != std::string::npos);
    REQUIRE_FALSE(err.user_msg.empty());
    REQUIRE_FALSE(err.suggestion.empty());
}

TEST_CASE("SessionError: retryable kinds", "[errors]") {
    REQUIRE(SessionErrorHelper::connect_timeout("a", 1).is_retryable());
    REQUIRE(SessionErrorHelper::connect_refused("a").is_retryable());
    REQUIRE(SessionErrorHelper::busy("a").is_retryable());
    REQUIRE(SessionErrorHelper::transient_poll_failure("x").is_retryable());

    REQUIRE_FALSE(SessionErrorHelper::invalid_check_code("a").is_retryable());
    REQUIRE_FALSE(SessionErrorHelper::duplicate_address("a").is_retryable());
    REQUIRE_FALSE(SessionErrorHelper::pool_exhausted(1, 2).is_retryable());
    REQUIRE_FALSE(SessionErrorHelper::fatal_device_error("x").is_retryable());
    REQUIRE_FALSE(SessionErrorHelper::invalid_argument("x").is_retryable());
}

TEST_CASE("SessionError: result names", "[errors]") {
    REQUIRE(std::string(session_result_to_string(SessionResult::POOL_EXHAUSTED)) ==
            "Pool Exhausted");
    REQUIRE(std::string(session_result_to_string(SessionResult::INVALID_CHECK_CODE)) ==
            "Invalid Check Code");
    REQUIRE(SessionErrorHelper::pool_exhausted(8181, 8191).technical_msg.find("8181-8191") !=
            std::string::npos);
}

// ============================================================================
// SessionSettings
// ============================================================================

TEST_CASE("SessionSettings: defaults from the default config", "[settings][config]") {
    Config config;
    config.set<json>("", Config::default_config());

    SessionSettings settings = SessionSettings::from_config(config);
    REQUIRE(settings.port_start == 8181);
    REQUIRE(settings.port_end == 8191);
    REQUIRE(settings.connection.connect_timeout_for(DeviceType::LEGACY) == milliseconds(10000));
    REQUIRE(settings.connection.connect_timeout_for(DeviceType::NEW) == milliseconds(15000));
    REQUIRE(settings.connection.discovery_passes == 3);
    REQUIRE(settings.polling.idle_interval == milliseconds(3000));
    REQUIRE(settings.polling.active_interval == milliseconds(1000));
    REQUIRE(settings.polling.backoff_multiplier == 1.5);
    REQUIRE(settings.polling.failure_threshold == 3);
}

TEST_CASE("SessionSettings: overrides and clamping", "[settings][config]") {
    Config config;
    config.set<int>("/camera_proxy/port_start", 9000);
    config.set<int>("/camera_proxy/port_end", 9003);
    config.set<int>("/polling/idle_interval_ms", 0);
    config.set<double>("/polling/backoff_multiplier", 0.5);
    config.set<int>("/polling/failure_threshold", -2);
    config.set<int>("/connection/discovery_passes", 0);
    config.set<int>("/connection/new_timeout_ms", 20000);

    SessionSettings settings = SessionSettings::from_config(config);
    REQUIRE(settings.port_start == 9000);
    REQUIRE(settings.port_end == 9003);
    REQUIRE(settings.polling.idle_interval == milliseconds(1));
    REQUIRE(settings.polling.backoff_multiplier == 1.0);
    REQUIRE(settings.polling.failure_threshold == 1);
    REQUIRE(settings.connection.discovery_passes == 1);
    REQUIRE(settings.connection.new_timeout == milliseconds(20000));
    // Untouched keys keep their defaults
    REQUIRE(settings.polling.error_interval == milliseconds(10000));

    SECTION("intervals are capped at one day") {
        config.set<int64_t>("/polling/active_interval_ms", 5000000000LL);
        config.set<int64_t>("/polling/max_backoff_ms", 3000000000LL);
        SessionSettings capped = SessionSettings::from_config(config);
        REQUIRE(capped.polling.active_interval == milliseconds(86400000));
        REQUIRE(capped.polling.max_backoff == milliseconds(86400000));
    }
}
