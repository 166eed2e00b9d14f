// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace printwatch {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux); console elsewhere
    Journal, ///< systemd journal
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file (5 MB x 3)
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Override for LogTarget::File (empty = auto)
};

/**
 * @brief Console-only logger so log calls before init() are safe
 */
void init_early();

/**
 * @brief Replace the default logger according to config
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" .. "off", "warning" alias)
 * @return default_level for empty or unknown strings (case sensitive)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level =
                                          spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Map a spdlog level to libhv's LOG_LEVEL_* (trace caps at DEBUG)
 */
int to_hv_level(spdlog::level::level_enum level);

/**
 * @brief Pick the effective level
 *
 * CLI verbosity wins, then the config file's /log_level, then warn.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace printwatch
