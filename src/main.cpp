// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief forgefleet daemon entry point
 *
 * Loads the config, brings up logging and the session layer, starts the
 * configured launch flows and runs until SIGTERM/SIGINT. Devices come from
 * the /simulation/devices section and are served by the mock transport.
 */

#include "cli_args.h"
#include "config.h"
#include "device_transport_mock.h"
#include "logging_init.h"
#include "saved_device_store.h"
#include "session_json.h"
#include "session_manager.h"
#include "session_settings.h"
#include "startup_request.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <thread>

using namespace forgefleet;

// SIGTERM/SIGINT: graceful shutdown
static volatile sig_atomic_t g_quit = 0;

static void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

static logging::LogConfig build_log_config(const CliArgs& args, Config& config) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config.get<std::string>("/log_level", ""));
    std::string target = args.log_dest.empty()
                             ? config.get<std::string>("/log_target", "auto")
                             : args.log_dest;
    log_config.target = logging::parse_log_target(target);
    log_config.file_path =
        args.log_file.empty() ? config.get<std::string>("/log_path", "") : args.log_file;
    log_config.max_file_bytes =
        config.get<size_t>("/log_max_size_kb", log_config.max_file_bytes / 1024) * 1024;
    log_config.max_files = config.get<size_t>("/log_max_files", log_config.max_files);
    return log_config;
}

static int run(const CliArgs& args) {
    Config config;
    config.init(args.config_path);

    logging::init(build_log_config(args, config));
    spdlog::info("[Main] forgefleet starting, config: {}", config.get_path());

    SessionSettings settings = SessionSettings::from_config(config);

    MockDeviceTransport transport;
    for (const auto& device :
         MockDeviceTransport::devices_from_json(config.get<json>("/simulation/devices",
                                                                 json::array()))) {
        transport.add_device(device);
    }

    SessionManager manager(settings, transport, &transport);
    manager.events().subscribe([](const SessionEvent& event) {
        spdlog::info("[Event] {}", event_to_json(event).dump());
    });

    ConfigSavedDeviceStore saved_store(config);
    auto handles = manager.launch(StartupRequest::from_config(config), saved_store);
    spdlog::info("[Main] {} launch flow(s) started", handles.size());

    auto started = std::chrono::steady_clock::now();
    while (!g_quit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (args.timeout_sec > 0 &&
            std::chrono::steady_clock::now() - started >= std::chrono::seconds(args.timeout_sec)) {
            spdlog::info("[Main] Timeout reached ({}s), exiting", args.timeout_sec);
            break;
        }
    }

    manager.shutdown();
    spdlog::info("[Main] Exiting");
    return 0;
}

int main(int argc, char** argv) {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);

    logging::init_early();

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        print_help(argv[0]);
        return 1;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return 0;
    }

    try {
        return run(args);
    } catch (const std::exception& e) {
        spdlog::critical("[Main] Fatal: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
}
