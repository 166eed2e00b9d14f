// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace printwatch {

/**
 * @brief Error categories inside the monitoring core
 *
 * None of these cross the monitoring boundary as exceptions. Fetch failures
 * are counted by the session; persistent failure is visible to subscribers as
 * a degraded snapshot; bad data is dropped and logged.
 */
enum class MonitorErrorType {
    NONE,             // No error
    TRANSIENT_FETCH,  // Network/HTTP failure, retried with backoff
    TIMEOUT,          // Fetch exceeded its hard timeout (transient)
    PERSISTENT_FETCH, // Failure threshold reached, session stopped
    INVALID_FRAGMENT, // Fragment failed sanity checks, dropped
    PARSE_ERROR       // Malformed push payload, dropped
};

/**
 * @brief Error information for monitoring operations
 */
struct MonitorError {
    MonitorErrorType type = MonitorErrorType::NONE;
    std::string device_id;
    std::string message;

    bool has_error() const {
        return type != MonitorErrorType::NONE;
    }

    /// Transient errors are retried; they only feed the failure counter
    bool is_transient() const {
        return type == MonitorErrorType::TRANSIENT_FETCH || type == MonitorErrorType::TIMEOUT;
    }

    std::string get_type_string() const {
        switch (type) {
        case MonitorErrorType::NONE:
            return "NONE";
        case MonitorErrorType::TRANSIENT_FETCH:
            return "TRANSIENT_FETCH";
        case MonitorErrorType::TIMEOUT:
            return "TIMEOUT";
        case MonitorErrorType::PERSISTENT_FETCH:
            return "PERSISTENT_FETCH";
        case MonitorErrorType::INVALID_FRAGMENT:
            return "INVALID_FRAGMENT";
        case MonitorErrorType::PARSE_ERROR:
            return "PARSE_ERROR";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Message suitable for the degraded indicator shown to the user
     */
    std::string user_message() const {
        if (type == MonitorErrorType::TIMEOUT) {
            return "Printer did not answer in time.";
        } else if (type == MonitorErrorType::PERSISTENT_FETCH) {
            return message.empty() ? "Lost contact with printer. Restart monitoring to retry."
                                   : "Lost contact with printer: " + message;
        } else if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static MonitorError transient(const std::string& device, const std::string& what) {
        MonitorError err;
        err.type = MonitorErrorType::TRANSIENT_FETCH;
        err.device_id = device;
        err.message = what;
        return err;
    }

    static MonitorError timeout(const std::string& device, uint32_t timeout_ms) {
        MonitorError err;
        err.type = MonitorErrorType::TIMEOUT;
        err.device_id = device;
        err.message = "Fetch timeout after " + std::to_string(timeout_ms) + "ms";
        return err;
    }

    static MonitorError persistent(const std::string& device, int failures,
                                   const std::string& last_error) {
        MonitorError err;
        err.type = MonitorErrorType::PERSISTENT_FETCH;
        err.device_id = device;
        err.message = std::to_string(failures) + " consecutive failures";
        if (!last_error.empty()) {
            err.message += " (last: " + last_error + ")";
        }
        return err;
    }

    static MonitorError invalid_fragment(const std::string& device, const std::string& why) {
        MonitorError err;
        err.type = MonitorErrorType::INVALID_FRAGMENT;
        err.device_id = device;
        err.message = why;
        return err;
    }

    static MonitorError parse_error(const std::string& what, const std::string& device = "") {
        MonitorError err;
        err.type = MonitorErrorType::PARSE_ERROR;
        err.device_id = device;
        err.message = "JSON parse error: " + what;
        return err;
    }
};

} // namespace printwatch
