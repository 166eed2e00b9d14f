// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "state_merger.h"

#include <chrono>
#include <cstddef>

class Config;

namespace printwatch {

/**
 * @brief Tunables for polling, backoff, push queues and the watchdog
 *
 * Defaults follow the printer monitor constants: 30 s poll, exponential
 * backoff x2 from 1 s capped at 30 s with +/-10% jitter, five consecutive
 * failures before a session gives up.
 */
struct MonitoringConfig {
    std::chrono::milliseconds poll_interval{30000};
    std::chrono::milliseconds fetch_timeout{10000}; ///< Always < poll_interval
    int failure_threshold = 5;
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};
    double backoff_factor = 2.0;
    double backoff_jitter = 0.1; ///< Fractional, applied as +/- jitter
    std::chrono::milliseconds staleness_window{90000};
    std::chrono::milliseconds watchdog_interval{5000};
    size_t push_queue_capacity = 2; ///< Clamped to 1..4
    std::chrono::milliseconds push_idle_timeout{60000}; ///< Idle push consumers exit after this
    FragmentLimits limits;

    static constexpr size_t MIN_QUEUE_CAPACITY = 1;
    static constexpr size_t MAX_QUEUE_CAPACITY = 4;

    /**
     * @brief Enforce invariants between fields, logging each correction
     *
     * fetch_timeout is pulled below poll_interval, the failure threshold is
     * at least 1, the queue capacity is clamped, and backoff bounds are
     * ordered.
     *
     * @return Sanitized copy
     */
    MonitoringConfig sanitized() const;

    /**
     * @brief Read /monitoring/... keys from the application config
     *
     * Missing keys keep their defaults. The result is sanitized.
     */
    static MonitoringConfig from_config(Config& config);
};

} // namespace printwatch
