// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "polling_coordinator.h"

#include "../test_helpers/session_test_helpers.h"
#include "device_transport_mock.h"
#include "logging_init.h"

#include <algorithm>
#include <atomic>
#include <thread>

#include <catch2/catch_test_macros.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

using namespace forgefleet;
using forgefleet::test::EventRecorder;
using forgefleet::test::wait_until;
using std::chrono::milliseconds;

namespace {

PollingPolicy fast_policy() {
    PollingPolicy policy;
    policy.idle_interval = milliseconds(30);
    policy.active_interval = milliseconds(10);
    policy.backoff_multiplier = 2.0;
    policy.max_backoff = milliseconds(200);
    policy.error_interval = milliseconds(100);
    policy.failure_threshold = 3;
    policy.poll_timeout = milliseconds(100);
    return policy;
}

} // namespace

class PollingTestFixture {
  protected:
    EventBus bus;
    PortAllocator ports{8181, 8191};
    ContextRegistry registry{ports, bus};
    MockDeviceTransport transport;
    EventRecorder recorder{bus};

    // Registers a device, opens a session for it and marks the context connected
    ContextId connect_device(const std::string& address, MachineState state = MachineState::READY) {
        MockDevice device;
        device.name = "Printer " + address;
        device.address = address;
        device.status.machine_state = state;
        transport.add_device(device);

        ConnectRequest request;
        request.address = address;
        request.device_type = DeviceType::LEGACY;
        request.timeout = milliseconds(500);
        ConnectResult result;
        REQUIRE(transport.connect(request, result).success());

        ContextId id;
        REQUIRE(registry.create(address, DeviceType::LEGACY, result.capabilities, id).success());
        REQUIRE(registry.bind_session(id, result.session).success());
        REQUIRE(registry.mark_connected(id, result.capabilities).success());
        return id;
    }

    ConnectionState state_of(const ContextId& id) {
        PrinterContext ctx;
        REQUIRE(registry.get(id, ctx).success());
        return ctx.connection_state;
    }
};

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: publishes sequenced status updates",
                 "[polling]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");

    REQUIRE(polling.start(id).success());
    REQUIRE(polling.is_polling(id));
    REQUIRE(recorder.wait_for_count<StatusChangedEvent>(5));

    polling.stop(id);
    auto statuses = recorder.of_type<StatusChangedEvent>();
    for (size_t i = 0; i < statuses.size(); ++i) {
        REQUIRE(statuses[i].context_id == id);
        REQUIRE(statuses[i].sequence == i + 1);
        REQUIRE(statuses[i].cadence == milliseconds(30));
    }
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: start preconditions", "[polling]") {
    PollingCoordinator polling(registry, transport, fast_policy());

    REQUIRE(polling.start("context-404").result == SessionResult::NOT_FOUND);

    ContextId id = connect_device("10.0.0.5");
    REQUIRE(polling.start(id).success());
    REQUIRE(polling.start(id).success());
    REQUIRE(polling.active_count() == 1);
    REQUIRE(polling.active_contexts() == std::vector<ContextId>{id});

    polling.stop_all();
    REQUIRE(polling.active_count() == 0);
    REQUIRE(polling.start(id).result == SessionResult::SHUT_DOWN);
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: active jobs poll faster", "[polling]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5", MachineState::PRINTING);

    REQUIRE(polling.start(id).success());
    REQUIRE(recorder.wait_for<StatusChangedEvent>(
        [](const StatusChangedEvent& e) { return e.cadence == milliseconds(10); }));
    polling.stop(id);

    PrinterContext ctx;
    REQUIRE(registry.get(id, ctx).success());
    REQUIRE(ctx.cadence == milliseconds(10));
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: repeated failures enter ERROR and recover",
                 "[polling][errors]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");
    transport.fail_next_polls("10.0.0.5", 3);

    REQUIRE(polling.start(id).success());
    REQUIRE(recorder.wait_for<ConnectionStateChangedEvent>(
        [](const ConnectionStateChangedEvent& e) { return e.state == ConnectionState::ERROR; }));
    REQUIRE(recorder.wait_for<ConnectionStateChangedEvent>(
        [](const ConnectionStateChangedEvent& e) {
            return e.previous == ConnectionState::ERROR && e.state == ConnectionState::CONNECTED;
        }));
    polling.stop(id);

    auto changes = recorder.of_type<ConnectionStateChangedEvent>();
    auto to_error = std::find_if(changes.begin(), changes.end(), [](const auto& e) {
        return e.state == ConnectionState::ERROR;
    });
    REQUIRE(to_error != changes.end());
    REQUIRE(to_error->consecutive_failures == 3);

    PrinterContext ctx;
    REQUIRE(registry.get(id, ctx).success());
    REQUIRE(ctx.consecutive_failures == 0);
    REQUIRE(ctx.cadence == milliseconds(30));
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: failures below threshold stay CONNECTED",
                 "[polling][errors]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");
    transport.fail_next_polls("10.0.0.5", 2);

    REQUIRE(polling.start(id).success());
    REQUIRE(recorder.wait_for_count<StatusChangedEvent>(1));
    polling.stop(id);

    REQUIRE(state_of(id) == ConnectionState::CONNECTED);
    for (const auto& e : recorder.of_type<ConnectionStateChangedEvent>()) {
        REQUIRE(e.state != ConnectionState::ERROR);
    }
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: fatal device error parks the task",
                 "[polling][errors]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");
    transport.set_poll_fatal("10.0.0.5", true);

    REQUIRE(polling.start(id).success());
    REQUIRE(wait_until([&]() { return state_of(id) == ConnectionState::ERROR; }));

    size_t polls = transport.poll_count("10.0.0.5");
    std::this_thread::sleep_for(milliseconds(200));
    REQUIRE(transport.poll_count("10.0.0.5") == polls);
    REQUIRE(polling.is_polling(id));
    REQUIRE(recorder.count<StatusChangedEvent>() == 0);
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: fatal device error dumps the backtrace",
                 "[polling][errors][logging]") {
    auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
    auto logger = std::make_shared<spdlog::logger>("forgefleet", ring);
    logger->set_level(spdlog::level::warn);
    logger->enable_backtrace(16);
    spdlog::set_default_logger(logger);

    // Below the logger level, so only the backtrace keeps it
    spdlog::debug("[Test] before the fatal poll");

    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");
    transport.set_poll_fatal("10.0.0.5", true);
    REQUIRE(polling.start(id).success());
    REQUIRE(wait_until([&]() { return state_of(id) == ConnectionState::ERROR; }));
    polling.stop_all();

    bool dumped = false;
    for (const auto& line : ring->last_formatted()) {
        if (line.find("[Test] before the fatal poll") != std::string::npos) {
            dumped = true;
        }
    }
    REQUIRE(dumped);

    forgefleet::logging::init_early();
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: stop ends polling", "[polling]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");

    REQUIRE_FALSE(polling.stop(id));
    REQUIRE(polling.start(id).success());
    REQUIRE(transport.wait_for_polls("10.0.0.5", 2, milliseconds(2000)));

    REQUIRE(polling.stop(id));
    REQUIRE_FALSE(polling.is_polling(id));
    size_t polls = transport.poll_count("10.0.0.5");
    std::this_thread::sleep_for(milliseconds(150));
    REQUIRE(transport.poll_count("10.0.0.5") == polls);
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: notify_activity polls immediately",
                 "[polling]") {
    PollingPolicy policy = fast_policy();
    policy.idle_interval = milliseconds(10000);
    PollingCoordinator polling(registry, transport, policy);
    ContextId id = connect_device("10.0.0.5");

    REQUIRE(polling.notify_activity(id).result == SessionResult::NOT_FOUND);
    REQUIRE(polling.start(id).success());
    REQUIRE(transport.poll_count("10.0.0.5") == 0);

    REQUIRE(polling.notify_activity(id).success());
    REQUIRE(transport.wait_for_polls("10.0.0.5", 1, milliseconds(1000)));
    REQUIRE(recorder.wait_for_count<StatusChangedEvent>(1));
    polling.stop(id);
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: slow device does not delay others",
                 "[polling][threading]") {
    PollingPolicy policy = fast_policy();
    policy.poll_timeout = milliseconds(1000);
    PollingCoordinator polling(registry, transport, policy);

    ContextId slow = connect_device("10.0.0.5");
    ContextId fast = connect_device("10.0.0.6");
    transport.set_poll_delay("10.0.0.5", milliseconds(800));

    REQUIRE(polling.start(slow).success());
    REQUIRE(polling.start(fast).success());

    // The fast device keeps its cadence while the slow poll is in flight
    REQUIRE(transport.wait_for_polls("10.0.0.6", 5, milliseconds(700)));
    REQUIRE(transport.poll_count("10.0.0.5") == 0);

    polling.stop_all();
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: poll slower than the timeout fails",
                 "[polling][errors]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");
    transport.set_poll_delay("10.0.0.5", milliseconds(150));

    REQUIRE(polling.start(id).success());
    REQUIRE(wait_until([&]() {
        PrinterContext ctx;
        return registry.get(id, ctx).success() && ctx.consecutive_failures >= 1;
    }));
    polling.stop(id);
    REQUIRE(recorder.count<StatusChangedEvent>() == 0);
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: stop from a status callback",
                 "[polling][threading]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");

    std::atomic<bool> stopped{false};
    bus.subscribe([&](const SessionEvent& event) {
        if (std::holds_alternative<StatusChangedEvent>(event) && !stopped.exchange(true)) {
            polling.stop(id);
        }
    });

    REQUIRE(polling.start(id).success());
    REQUIRE(wait_until([&]() { return stopped.load(); }));
    REQUIRE(wait_until([&]() { return !polling.is_polling(id); }));

    size_t polls = transport.poll_count("10.0.0.5");
    std::this_thread::sleep_for(milliseconds(100));
    REQUIRE(transport.poll_count("10.0.0.5") == polls);
}

TEST_CASE_METHOD(PollingTestFixture, "PollingCoordinator: task retires when its context is gone",
                 "[polling]") {
    PollingCoordinator polling(registry, transport, fast_policy());
    ContextId id = connect_device("10.0.0.5");
    REQUIRE(polling.start(id).success());
    REQUIRE(recorder.wait_for_count<StatusChangedEvent>(1));

    // No teardown hook is wired here, so the task finds out on its next tick
    REQUIRE(registry.teardown(id));
    REQUIRE(wait_until([&]() { return !polling.is_polling(id); }));
    size_t statuses = recorder.count<StatusChangedEvent>();
    std::this_thread::sleep_for(milliseconds(100));
    REQUIRE(recorder.count<StatusChangedEvent>() == statuses);
    REQUIRE_FALSE(polling.stop(id));
}
