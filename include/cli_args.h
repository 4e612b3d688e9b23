// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the forgefleet daemon
 */

#include <string>

namespace forgefleet {

struct CliArgs {
    std::string config_path = "forgefleet.json";
    int verbosity = 0;       ///< -v=info, -vv=debug, -vvv=trace
    std::string log_dest;    ///< Empty = use config
    std::string log_file;    ///< Empty = use config
    int timeout_sec = 0;     ///< Auto-quit after N seconds, 0 = run until signalled
    bool show_help = false;
};

/**
 * @brief Parse argv into args
 *
 * @return false on a malformed argument (message already printed)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_help(const char* program_name);

} // namespace forgefleet
