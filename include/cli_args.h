// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace printwatch {

/**
 * @brief Parsed command line of printwatch-monitor
 */
struct CliArgs {
    std::string config_path = "config/printwatch.json";
    int verbosity = 0;                 ///< Number of -v flags
    std::string log_dest;              ///< Empty = use config /log_target
    std::string log_file;              ///< Empty = use config /log_path
    std::vector<std::string> printers; ///< Empty = every monitored printer in config
    int timeout_sec = 0;               ///< Auto-quit after N seconds (0 = run until signal)
    bool show_help = false;
};

/**
 * @brief Parse argv
 *
 * Errors are printed to stdout.
 *
 * @return false on invalid arguments
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_usage(const char* program_name);

} // namespace printwatch
