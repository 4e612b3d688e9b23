// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "context_registry.h"

#include "../test_helpers/session_test_helpers.h"

#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

#include <catch2/catch_test_macros.hpp>

using namespace forgefleet;
using forgefleet::test::EventRecorder;

class RegistryTestFixture {
  protected:
    EventBus bus;
    PortAllocator ports{8181, 8191};
    ContextRegistry registry{ports, bus};
    EventRecorder recorder{bus};

    ContextId create_ok(const std::string& address, DeviceType type = DeviceType::LEGACY) {
        ContextId id;
        SessionError err = registry.create(address, type, Capabilities{}, id);
        REQUIRE(err.success());
        return id;
    }
};

// ============================================================================
// create()
// ============================================================================

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: create assigns id, port and state",
                 "[registry]") {
    ContextId id = create_ok("10.0.0.5", DeviceType::NEW);
    REQUIRE(id == "context-1");

    PrinterContext ctx;
    REQUIRE(registry.get(id, ctx).success());
    REQUIRE(ctx.address == "10.0.0.5");
    REQUIRE(ctx.name == "10.0.0.5");
    REQUIRE(ctx.device_type == DeviceType::NEW);
    REQUIRE(ctx.connection_state == ConnectionState::CONNECTING);
    REQUIRE(ctx.camera_port == std::optional<uint16_t>(8181));
    REQUIRE(ctx.camera_url() == "http://localhost:8181/stream");
    REQUIRE_FALSE(ctx.last_status.has_value());
    REQUIRE(ctx.status_sequence == 0);

    auto created = recorder.of_type<ContextCreatedEvent>();
    REQUIRE(created.size() == 1);
    REQUIRE(created[0].context_id == id);
    REQUIRE(created[0].camera_port == std::optional<uint16_t>(8181));
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: descriptor carries name and serial",
                 "[registry]") {
    ContextDescriptor desc;
    desc.address = "  Printer-A.LOCAL ";
    desc.name = "Workshop";
    desc.serial_number = "SN123";
    ContextId id;
    REQUIRE(registry.create(desc, id).success());

    PrinterContext ctx;
    REQUIRE(registry.get(id, ctx).success());
    REQUIRE(ctx.address == "printer-a.local");
    REQUIRE(ctx.name == "Workshop");
    REQUIRE(ctx.serial_number == std::optional<std::string>("SN123"));
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: duplicate address is rejected",
                 "[registry]") {
    ContextId first = create_ok("10.0.0.5");

    ContextId second = "untouched";
    SessionError err = registry.create("10.0.0.5", DeviceType::LEGACY, Capabilities{}, second);
    REQUIRE(err.result == SessionResult::DUPLICATE_ADDRESS);
    REQUIRE(second == "untouched");
    REQUIRE(registry.size() == 1);
    REQUIRE(ports.leased_count() == 1);

    SECTION("normalized spelling is still a duplicate") {
        err = registry.create(" 10.0.0.5", DeviceType::LEGACY, Capabilities{}, second);
        REQUIRE(err.result == SessionResult::DUPLICATE_ADDRESS);
    }

    SECTION("address is free again after teardown") {
        REQUIRE(registry.teardown(first));
        ContextId again = create_ok("10.0.0.5");
        REQUIRE(again != first);
    }
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: invalid address is rejected",
                 "[registry]") {
    ContextId id;
    REQUIRE(registry.create("", DeviceType::LEGACY, Capabilities{}, id).result ==
            SessionResult::INVALID_ARGUMENT);
    REQUIRE(registry.create("300.1.1.1", DeviceType::LEGACY, Capabilities{}, id).result ==
            SessionResult::INVALID_ARGUMENT);
    REQUIRE(registry.create("bad host", DeviceType::LEGACY, Capabilities{}, id).result ==
            SessionResult::INVALID_ARGUMENT);
    REQUIRE(registry.size() == 0);
    REQUIRE(recorder.all().empty());
}

TEST_CASE("ContextRegistry: exhausted pool leaves no partial context", "[registry][ports]") {
    EventBus bus;
    PortAllocator ports(9000, 9000);
    ContextRegistry registry(ports, bus);

    ContextId id;
    REQUIRE(registry.create("10.0.0.1", DeviceType::LEGACY, Capabilities{}, id).success());

    ContextId second;
    SessionError err = registry.create("10.0.0.2", DeviceType::LEGACY, Capabilities{}, second);
    REQUIRE(err.result == SessionResult::POOL_EXHAUSTED);
    REQUIRE(registry.size() == 1);
    REQUIRE_FALSE(registry.find_by_address("10.0.0.2").has_value());

    // Failed creates do not burn ids
    REQUIRE(registry.teardown(id));
    REQUIRE(registry.create("10.0.0.2", DeviceType::LEGACY, Capabilities{}, second).success());
    REQUIRE(second == "context-2");
}

// ============================================================================
// Teardown
// ============================================================================

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: teardown releases port and publishes",
                 "[registry]") {
    ContextId a = create_ok("10.0.0.5");
    ContextId b = create_ok("10.0.0.6");
    REQUIRE(ports.port_for(b) == std::optional<uint16_t>(8182));

    REQUIRE(registry.teardown(a));
    REQUIRE_FALSE(registry.contains(a));
    REQUIRE_FALSE(ports.port_for(a).has_value());
    REQUIRE(ports.leased_count() == 1);

    auto removed = recorder.of_type<ContextRemovedEvent>();
    REQUIRE(removed.size() == 1);
    REQUIRE(removed[0].context_id == a);
    REQUIRE(removed[0].address == "10.0.0.5");

    ContextId c = create_ok("10.0.0.7");
    PrinterContext ctx;
    REQUIRE(registry.get(c, ctx).success());
    REQUIRE(ctx.camera_port == std::optional<uint16_t>(8181));
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: teardown of unknown id is a no-op",
                 "[registry]") {
    REQUIRE_FALSE(registry.teardown("context-42"));
    ContextId id = create_ok("10.0.0.5");
    REQUIRE(registry.teardown(id));
    REQUIRE_FALSE(registry.teardown(id));
    REQUIRE(recorder.count<ContextRemovedEvent>() == 1);
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: hooks see the context before removal",
                 "[registry]") {
    ContextId id = create_ok("10.0.0.5");
    REQUIRE(registry.bind_session(id, 77).success());

    int calls = 0;
    bool present_during_hook = false;
    SessionHandle seen_session = INVALID_SESSION_HANDLE;
    registry.add_teardown_hook([&](const PrinterContext& ctx) {
        ++calls;
        present_during_hook = registry.contains(ctx.id);
        seen_session = ctx.session;
    });

    REQUIRE(registry.teardown(id));
    REQUIRE(calls == 1);
    REQUIRE(present_during_hook);
    REQUIRE(seen_session == 77);
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: throwing hook does not block teardown",
                 "[registry]") {
    ContextId id = create_ok("10.0.0.5");
    bool second_hook_ran = false;
    registry.add_teardown_hook(
        [](const PrinterContext&) { throw std::runtime_error("hook failure"); });
    registry.add_teardown_hook([&](const PrinterContext&) { second_hook_ran = true; });

    REQUIRE(registry.teardown(id));
    REQUIRE(second_hook_ran);
    REQUIRE_FALSE(registry.contains(id));
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: re-entrant teardown from a hook is a no-op",
                 "[registry]") {
    ContextId id = create_ok("10.0.0.5");
    bool nested_result = true;
    registry.add_teardown_hook(
        [&](const PrinterContext& ctx) { nested_result = registry.teardown(ctx.id); });

    REQUIRE(registry.teardown(id));
    REQUIRE_FALSE(nested_result);
    REQUIRE(recorder.count<ContextRemovedEvent>() == 1);
}

// ============================================================================
// Status and state transitions
// ============================================================================

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: update_status sequences increase by one",
                 "[registry][status]") {
    ContextId id = create_ok("10.0.0.5");

    StatusSnapshot snap;
    snap.machine_state = MachineState::READY;
    StatusUpdate update;
    for (uint64_t i = 1; i <= 5; ++i) {
        REQUIRE(registry.update_status(id, snap, std::chrono::milliseconds(3000), update).success());
        REQUIRE(update.sequence == i);
    }

    auto statuses = recorder.of_type<StatusChangedEvent>();
    REQUIRE(statuses.size() == 5);
    for (size_t i = 0; i < statuses.size(); ++i) {
        REQUIRE(statuses[i].sequence == i + 1);
        REQUIRE(statuses[i].cadence == std::chrono::milliseconds(3000));
    }

    PrinterContext ctx;
    REQUIRE(registry.get(id, ctx).success());
    REQUIRE(ctx.status_sequence == 5);
    REQUIRE(ctx.last_status.has_value());
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: first status moves CONNECTING to CONNECTED",
                 "[registry][status]") {
    ContextId id = create_ok("10.0.0.5");
    REQUIRE(registry.update_status(id, StatusSnapshot{}, std::chrono::milliseconds(1000)).success());

    auto changes = recorder.of_type<ConnectionStateChangedEvent>();
    REQUIRE(changes.size() == 1);
    REQUIRE(changes[0].previous == ConnectionState::CONNECTING);
    REQUIRE(changes[0].state == ConnectionState::CONNECTED);

    // State change precedes the status event
    auto events = recorder.all();
    REQUIRE(std::holds_alternative<ConnectionStateChangedEvent>(events[events.size() - 2]));
    REQUIRE(std::holds_alternative<StatusChangedEvent>(events.back()));
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: error and recovery", "[registry][status]") {
    ContextId id = create_ok("10.0.0.5");
    REQUIRE(registry.mark_connected(id, Capabilities{}).success());

    PollFailureUpdate failure;
    for (uint32_t i = 1; i <= 3; ++i) {
        REQUIRE(registry.record_poll_failure(id, std::chrono::milliseconds(5000), failure).success());
        REQUIRE(failure.consecutive_failures == i);
    }
    REQUIRE(registry.mark_error(id).success());
    REQUIRE(registry.mark_error(id).success()); // already ERROR: no second event

    PrinterContext ctx;
    REQUIRE(registry.get(id, ctx).success());
    REQUIRE(ctx.connection_state == ConnectionState::ERROR);
    REQUIRE(ctx.consecutive_failures == 3);

    StatusUpdate update;
    REQUIRE(registry.update_status(id, StatusSnapshot{}, std::chrono::milliseconds(3000), update)
                .success());
    REQUIRE(update.recovered);

    REQUIRE(registry.get(id, ctx).success());
    REQUIRE(ctx.connection_state == ConnectionState::CONNECTED);
    REQUIRE(ctx.consecutive_failures == 0);

    auto changes = recorder.of_type<ConnectionStateChangedEvent>();
    REQUIRE(changes.size() == 3); // CONNECTING->CONNECTED, ->ERROR, ->CONNECTED
    REQUIRE(changes[1].state == ConnectionState::ERROR);
    REQUIRE(changes[1].consecutive_failures == 3);
    REQUIRE(changes[2].previous == ConnectionState::ERROR);
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: mutators report stale ids",
                 "[registry]") {
    const ContextId stale = "context-9";
    PollFailureUpdate failure;
    REQUIRE(registry.mark_connected(stale, Capabilities{}).result == SessionResult::NOT_FOUND);
    REQUIRE(registry.mark_error(stale).result == SessionResult::NOT_FOUND);
    REQUIRE(registry.update_status(stale, StatusSnapshot{}, std::chrono::milliseconds(1)).result ==
            SessionResult::NOT_FOUND);
    REQUIRE(registry.record_poll_failure(stale, std::chrono::milliseconds(1), failure).result ==
            SessionResult::NOT_FOUND);
    REQUIRE(registry.set_cadence(stale, std::chrono::milliseconds(1)).result ==
            SessionResult::NOT_FOUND);
    REQUIRE(registry.bind_session(stale, 1).result == SessionResult::NOT_FOUND);
    REQUIRE(registry.set_active(stale).result == SessionResult::NOT_FOUND);

    PrinterContext ctx;
    REQUIRE(registry.get(stale, ctx).result == SessionResult::NOT_FOUND);
    REQUIRE(recorder.all().empty());
}

// ============================================================================
// Active context
// ============================================================================

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: active context switching",
                 "[registry][active]") {
    ContextId a = create_ok("10.0.0.5");
    ContextId b = create_ok("10.0.0.6");
    REQUIRE_FALSE(registry.active_id().has_value());

    REQUIRE(registry.set_active(a).success());
    REQUIRE(registry.set_active(a).success()); // unchanged: no event
    REQUIRE(registry.set_active(b).success());
    REQUIRE(registry.active_id() == std::optional<ContextId>(b));

    PrinterContext ctx_a, ctx_b;
    REQUIRE(registry.get(a, ctx_a).success());
    REQUIRE(registry.get(b, ctx_b).success());
    REQUIRE_FALSE(ctx_a.is_active);
    REQUIRE(ctx_b.is_active);

    auto switches = recorder.of_type<ContextSwitchedEvent>();
    REQUIRE(switches.size() == 2);
    REQUIRE(switches[1].context_id == std::optional<ContextId>(b));
    REQUIRE(switches[1].previous_id == std::optional<ContextId>(a));

    SECTION("removing the active context clears it") {
        REQUIRE(registry.teardown(b));
        REQUIRE_FALSE(registry.active_id().has_value());
        switches = recorder.of_type<ContextSwitchedEvent>();
        REQUIRE(switches.size() == 3);
        REQUIRE_FALSE(switches[2].context_id.has_value());
        REQUIRE(switches[2].previous_id == std::optional<ContextId>(b));
    }
}

// ============================================================================
// Lookups
// ============================================================================

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: list is in creation order",
                 "[registry]") {
    for (int i = 1; i <= 11; ++i) {
        create_ok("10.0.1." + std::to_string(i));
    }
    auto contexts = registry.list();
    REQUIRE(contexts.size() == 11);
    REQUIRE(contexts[8].id == "context-9");
    REQUIRE(contexts[9].id == "context-10");
    REQUIRE(contexts[10].id == "context-11");
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: find_by_address normalizes",
                 "[registry]") {
    ContextId id = create_ok("printer.local");
    REQUIRE(registry.find_by_address("PRINTER.local ") == std::optional<ContextId>(id));
    REQUIRE_FALSE(registry.find_by_address("other.local").has_value());
}

TEST_CASE_METHOD(RegistryTestFixture, "ContextRegistry: concurrent creates for one address",
                 "[registry][threading]") {
    std::atomic<int> successes{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            ContextId id;
            SessionError err =
                registry.create("10.0.0.5", DeviceType::LEGACY, Capabilities{}, id);
            if (err.success()) {
                ++successes;
            } else if (err.result == SessionResult::DUPLICATE_ADDRESS) {
                ++duplicates;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    REQUIRE(successes == 1);
    REQUIRE(duplicates == 7);
    REQUIRE(ports.leased_count() == 1);
}
