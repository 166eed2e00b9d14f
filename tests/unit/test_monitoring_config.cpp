// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "monitoring_config.h"

#include "config.h"

#include <catch2/catch_test_macros.hpp>

using namespace printwatch;
using namespace std::chrono_literals;

// ============================================================================
// sanitized()
// ============================================================================

TEST_CASE("MonitoringConfig: defaults are already sane", "[monitor][config]") {
    MonitoringConfig defaults;
    MonitoringConfig c = defaults.sanitized();

    REQUIRE(c.poll_interval == 30000ms);
    REQUIRE(c.fetch_timeout == 10000ms);
    REQUIRE(c.failure_threshold == 5);
    REQUIRE(c.backoff_initial == 1000ms);
    REQUIRE(c.backoff_max == 30000ms);
    REQUIRE(c.backoff_factor == 2.0);
    REQUIRE(c.backoff_jitter == 0.1);
    REQUIRE(c.staleness_window == 90000ms);
    REQUIRE(c.watchdog_interval == 5000ms);
    REQUIRE(c.push_queue_capacity == 2);
    REQUIRE(c.push_idle_timeout == 60000ms);
    REQUIRE(c.limits.max_clock_skew == 60000ms);
}

TEST_CASE("MonitoringConfig: sanitized() repairs invalid values", "[monitor][config]") {
    MonitoringConfig c;

    SECTION("fetch timeout must be below the poll interval") {
        c.poll_interval = 1000ms;
        c.fetch_timeout = 5000ms;
        REQUIRE(c.sanitized().fetch_timeout == 500ms);

        c.fetch_timeout = 0ms;
        REQUIRE(c.sanitized().fetch_timeout == 500ms);
    }

    SECTION("tiny poll interval") {
        c.poll_interval = 0ms;
        auto s = c.sanitized();
        REQUIRE(s.poll_interval == 2ms);
        REQUIRE(s.fetch_timeout == 1ms);
    }

    SECTION("failure threshold at least one") {
        c.failure_threshold = 0;
        REQUIRE(c.sanitized().failure_threshold == 1);
        c.failure_threshold = -4;
        REQUIRE(c.sanitized().failure_threshold == 1);
    }

    SECTION("backoff bounds are ordered") {
        c.backoff_initial = 5000ms;
        c.backoff_max = 1000ms;
        auto s = c.sanitized();
        REQUIRE(s.backoff_max == 5000ms);

        c.backoff_initial = -1ms;
        REQUIRE(c.sanitized().backoff_initial == 1ms);
    }

    SECTION("backoff factor and jitter") {
        c.backoff_factor = 0.5;
        c.backoff_jitter = 1.5;
        auto s = c.sanitized();
        REQUIRE(s.backoff_factor == 2.0);
        REQUIRE(s.backoff_jitter == 0.1);

        c.backoff_jitter = 0.0;
        REQUIRE(c.sanitized().backoff_jitter == 0.0);
    }

    SECTION("queue capacity clamps to 1..4") {
        c.push_queue_capacity = 0;
        REQUIRE(c.sanitized().push_queue_capacity == 1);
        c.push_queue_capacity = 9;
        REQUIRE(c.sanitized().push_queue_capacity == 4);
    }

    SECTION("watchdog timings") {
        c.staleness_window = 0ms;
        c.watchdog_interval = -5ms;
        auto s = c.sanitized();
        REQUIRE(s.staleness_window == 90000ms);
        REQUIRE(s.watchdog_interval == 5000ms);
    }

    SECTION("push idle timeout must be positive") {
        c.push_idle_timeout = 0ms;
        REQUIRE(c.sanitized().push_idle_timeout == 60000ms);
    }

    SECTION("negative clock skew") {
        c.limits.max_clock_skew = -10ms;
        REQUIRE(c.sanitized().limits.max_clock_skew == 0ms);
    }
}

// ============================================================================
// from_config()
// ============================================================================

TEST_CASE("MonitoringConfig: from_config() reads the monitoring section", "[monitor][config]") {
    Config config;
    config.set<int>("/monitoring/poll_interval_ms", 15000);
    config.set<int>("/monitoring/fetch_timeout_ms", 4000);
    config.set<int>("/monitoring/failure_threshold", 3);
    config.set<int>("/monitoring/backoff_initial_ms", 500);
    config.set<int>("/monitoring/backoff_max_ms", 8000);
    config.set<double>("/monitoring/backoff_jitter", 0.25);
    config.set<int>("/monitoring/staleness_window_ms", 45000);
    config.set<int>("/monitoring/watchdog_interval_ms", 1000);
    config.set<int>("/monitoring/push_queue_capacity", 3);
    config.set<int>("/monitoring/push_idle_timeout_ms", 7000);
    config.set<int>("/monitoring/max_clock_skew_ms", 2000);

    MonitoringConfig c = MonitoringConfig::from_config(config);

    REQUIRE(c.poll_interval == 15000ms);
    REQUIRE(c.fetch_timeout == 4000ms);
    REQUIRE(c.failure_threshold == 3);
    REQUIRE(c.backoff_initial == 500ms);
    REQUIRE(c.backoff_max == 8000ms);
    REQUIRE(c.backoff_jitter == 0.25);
    REQUIRE(c.staleness_window == 45000ms);
    REQUIRE(c.watchdog_interval == 1000ms);
    REQUIRE(c.push_queue_capacity == 3);
    REQUIRE(c.push_idle_timeout == 7000ms);
    REQUIRE(c.limits.max_clock_skew == 2000ms);
}

TEST_CASE("MonitoringConfig: from_config() falls back and sanitizes", "[monitor][config]") {
    Config config;

    SECTION("empty config gives defaults") {
        MonitoringConfig c = MonitoringConfig::from_config(config);
        REQUIRE(c.poll_interval == 30000ms);
        REQUIRE(c.push_queue_capacity == 2);
    }

    SECTION("negative capacity clamps instead of wrapping") {
        config.set<int>("/monitoring/push_queue_capacity", -3);
        REQUIRE(MonitoringConfig::from_config(config).push_queue_capacity == 1);
    }

    SECTION("wrong type keeps the default") {
        config.set<std::string>("/monitoring/failure_threshold", "many");
        REQUIRE(MonitoringConfig::from_config(config).failure_threshold == 5);
    }

    SECTION("timeout not below poll interval is pulled down") {
        config.set<int>("/monitoring/poll_interval_ms", 2000);
        config.set<int>("/monitoring/fetch_timeout_ms", 2000);
        REQUIRE(MonitoringConfig::from_config(config).fetch_timeout == 1000ms);
    }
}
