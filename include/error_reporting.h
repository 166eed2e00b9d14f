// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

/**
 * @file error_reporting.h
 * @brief Logging macros for faults inside the monitoring core
 *
 * Usage Examples:
 * ```cpp
 * // Internal error (bug or environment fault, nothing the printer did)
 * LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", path);
 *
 * // Internal warning
 * LOG_WARN_INTERNAL("Session thread for {} did not exit in time", device_id);
 * ```
 */

/**
 * @brief Log internal error
 *
 * Use for file I/O failures, broken invariants and other issues that are not
 * caused by a printer's behaviour.
 */
#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

/**
 * @brief Log internal warning
 */
#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)
