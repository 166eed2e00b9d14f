// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitoring_config.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace printwatch {

namespace {

std::chrono::milliseconds ms_from_config(Config& config, const std::string& key,
                                         std::chrono::milliseconds fallback) {
    int64_t value = config.get<int64_t>("/monitoring/" + key, fallback.count());
    return std::chrono::milliseconds(value);
}

} // namespace

MonitoringConfig MonitoringConfig::sanitized() const {
    using std::chrono::milliseconds;

    MonitoringConfig c = *this;

    if (c.poll_interval < milliseconds(2)) {
        spdlog::warn("[MonitoringConfig] poll_interval {}ms too small, using 2ms",
                     c.poll_interval.count());
        c.poll_interval = milliseconds(2);
    }

    // Every fetch must resolve before the next poll is due
    if (c.fetch_timeout <= milliseconds(0) || c.fetch_timeout >= c.poll_interval) {
        milliseconds adjusted = std::max(milliseconds(1), c.poll_interval / 2);
        spdlog::warn("[MonitoringConfig] fetch_timeout {}ms not below poll_interval {}ms, "
                     "using {}ms",
                     c.fetch_timeout.count(), c.poll_interval.count(), adjusted.count());
        c.fetch_timeout = adjusted;
    }

    if (c.failure_threshold < 1) {
        spdlog::warn("[MonitoringConfig] failure_threshold {} invalid, using 1",
                     c.failure_threshold);
        c.failure_threshold = 1;
    }

    if (c.backoff_initial <= milliseconds(0)) {
        spdlog::warn("[MonitoringConfig] backoff_initial {}ms invalid, using 1ms",
                     c.backoff_initial.count());
        c.backoff_initial = milliseconds(1);
    }
    if (c.backoff_max < c.backoff_initial) {
        spdlog::warn("[MonitoringConfig] backoff_max {}ms below backoff_initial {}ms, raising",
                     c.backoff_max.count(), c.backoff_initial.count());
        c.backoff_max = c.backoff_initial;
    }
    if (!std::isfinite(c.backoff_factor) || c.backoff_factor < 1.0) {
        spdlog::warn("[MonitoringConfig] backoff_factor {} invalid, using 2.0", c.backoff_factor);
        c.backoff_factor = 2.0;
    }
    if (!std::isfinite(c.backoff_jitter) || c.backoff_jitter < 0.0 || c.backoff_jitter >= 1.0) {
        spdlog::warn("[MonitoringConfig] backoff_jitter {} out of range [0, 1), using 0.1",
                     c.backoff_jitter);
        c.backoff_jitter = 0.1;
    }

    if (c.staleness_window <= milliseconds(0)) {
        spdlog::warn("[MonitoringConfig] staleness_window {}ms invalid, using 90000ms",
                     c.staleness_window.count());
        c.staleness_window = milliseconds(90000);
    }
    if (c.watchdog_interval <= milliseconds(0)) {
        spdlog::warn("[MonitoringConfig] watchdog_interval {}ms invalid, using 5000ms",
                     c.watchdog_interval.count());
        c.watchdog_interval = milliseconds(5000);
    }

    size_t clamped = std::clamp(c.push_queue_capacity, MIN_QUEUE_CAPACITY, MAX_QUEUE_CAPACITY);
    if (clamped != c.push_queue_capacity) {
        spdlog::warn("[MonitoringConfig] push_queue_capacity {} clamped to {}",
                     c.push_queue_capacity, clamped);
        c.push_queue_capacity = clamped;
    }

    if (c.push_idle_timeout <= milliseconds(0)) {
        spdlog::warn("[MonitoringConfig] push_idle_timeout {}ms invalid, using 60000ms",
                     c.push_idle_timeout.count());
        c.push_idle_timeout = milliseconds(60000);
    }

    if (c.limits.max_clock_skew < milliseconds(0)) {
        spdlog::warn("[MonitoringConfig] max_clock_skew {}ms negative, using 0ms",
                     c.limits.max_clock_skew.count());
        c.limits.max_clock_skew = milliseconds(0);
    }

    return c;
}

MonitoringConfig MonitoringConfig::from_config(Config& config) {
    MonitoringConfig c;
    c.poll_interval = ms_from_config(config, "poll_interval_ms", c.poll_interval);
    c.fetch_timeout = ms_from_config(config, "fetch_timeout_ms", c.fetch_timeout);
    c.failure_threshold = config.get<int>("/monitoring/failure_threshold", c.failure_threshold);
    c.backoff_initial = ms_from_config(config, "backoff_initial_ms", c.backoff_initial);
    c.backoff_max = ms_from_config(config, "backoff_max_ms", c.backoff_max);
    c.backoff_jitter = config.get<double>("/monitoring/backoff_jitter", c.backoff_jitter);
    c.staleness_window = ms_from_config(config, "staleness_window_ms", c.staleness_window);
    c.watchdog_interval = ms_from_config(config, "watchdog_interval_ms", c.watchdog_interval);
    c.push_idle_timeout = ms_from_config(config, "push_idle_timeout_ms", c.push_idle_timeout);
    c.limits.max_clock_skew = ms_from_config(config, "max_clock_skew_ms", c.limits.max_clock_skew);

    // Read as signed so a negative value clamps instead of wrapping
    int capacity =
        config.get<int>("/monitoring/push_queue_capacity", static_cast<int>(c.push_queue_capacity));
    c.push_queue_capacity = capacity < 0 ? 0 : static_cast<size_t>(capacity);

    spdlog::debug("[MonitoringConfig] poll={}ms timeout={}ms threshold={} backoff={}..{}ms "
                  "staleness={}ms queue={}",
                  c.poll_interval.count(), c.fetch_timeout.count(), c.failure_threshold,
                  c.backoff_initial.count(), c.backoff_max.count(), c.staleness_window.count(),
                  c.push_queue_capacity);
    return c.sanitized();
}

} // namespace printwatch
