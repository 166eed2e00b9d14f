// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * Unit tests for MonitoringSession
 *
 * Drives the polling loop through MockDeviceStatusFetcher with short
 * intervals. Jitter is disabled so backoff timing is predictable.
 */

#include "monitoring_session.h"

#include "../mocks/mock_device_status_fetcher.h"
#include "../test_helpers/wait_until.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace printwatch;
using printwatch::test::wait_until;
using namespace std::chrono_literals;

namespace {

DeviceStateFragment printing_fragment(double progress) {
    DeviceStateFragment f;
    f.connection_status = Stamped<ConnectionStatus>{ConnectionStatus::ONLINE, {}};
    f.print_status = Stamped<PrintStatus>{PrintStatus::PRINTING, {}};
    f.temperatures["nozzle"] = TemperatureReading{210.0, 210.0, {}};
    f.current_job = Stamped<std::optional<PrintJob>>{PrintJob{"benchy.gcode", progress, 600}, {}};
    return f;
}

MonitoringConfig fast_config() {
    MonitoringConfig config;
    config.poll_interval = 20ms;
    config.fetch_timeout = 10ms;
    config.failure_threshold = 3;
    config.backoff_initial = 5ms;
    config.backoff_max = 20ms;
    config.backoff_jitter = 0.0;
    return config;
}

} // namespace

class MonitoringSessionFixture {
  protected:
    MockDeviceStatusFetcher fetcher;
    SnapshotPublisher publisher;
    MonitoringConfig config = fast_config();

    void respond_ok() {
        fetcher.set_responder([](const std::string&, int call) -> std::optional<FetchResult> {
            return FetchResult::ok(printing_fragment(10.0 * (call + 1)));
        });
    }
};

// ============================================================================
// Backoff
// ============================================================================

TEST_CASE("MonitoringSession: backoff doubles up to the cap", "[monitor][session][backoff]") {
    MonitoringConfig config; // 1s initial, x2, 30s cap

    REQUIRE(MonitoringSession::backoff_delay(config, 1) == 1000ms);
    REQUIRE(MonitoringSession::backoff_delay(config, 2) == 2000ms);
    REQUIRE(MonitoringSession::backoff_delay(config, 3) == 4000ms);
    REQUIRE(MonitoringSession::backoff_delay(config, 4) == 8000ms);
    REQUIRE(MonitoringSession::backoff_delay(config, 5) == 16000ms);
    REQUIRE(MonitoringSession::backoff_delay(config, 6) == 30000ms);
    REQUIRE(MonitoringSession::backoff_delay(config, 20) == 30000ms);
    REQUIRE(MonitoringSession::backoff_delay(config, 0) == 1000ms);
}

TEST_CASE("MonitoringSession: state names", "[monitor][session]") {
    REQUIRE(std::string(session_state_to_string(SessionState::STOPPED)) == "stopped");
    REQUIRE(std::string(session_state_to_string(SessionState::STARTING)) == "starting");
    REQUIRE(std::string(session_state_to_string(SessionState::ACTIVE)) == "active");
    REQUIRE(std::string(session_state_to_string(SessionState::STOPPING)) == "stopping");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE_METHOD(MonitoringSessionFixture, "MonitoringSession: new session is STOPPED",
                 "[monitor][session]") {
    MonitoringSession session("p1", fetcher, publisher, config);
    REQUIRE(session.state() == SessionState::STOPPED);
    REQUIRE_FALSE(session.has_error());
    REQUIRE(session.device_id() == "p1");
    REQUIRE(session.metrics().base_interval == 20ms);
    REQUIRE_FALSE(session.request_stop());
}

TEST_CASE_METHOD(MonitoringSessionFixture,
                 "MonitoringSession: first fetch is immediate and success activates",
                 "[monitor][session]") {
    config.poll_interval = 10s;
    config.fetch_timeout = 2s;
    respond_ok();

    MonitoringSession session("p1", fetcher, publisher, config);
    REQUIRE(session.start());
    REQUIRE_FALSE(session.start());

    REQUIRE(fetcher.wait_for_calls(1, 1s));
    REQUIRE(wait_until([&] { return session.state() == SessionState::ACTIVE; }, 1s));
    REQUIRE(fetcher.last_timeout() == 2s);

    auto snapshot = publisher.get_snapshot("p1");
    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->print_status.value == PrintStatus::PRINTING);
    REQUIRE(snapshot->current_job.value->progress_percent == 10.0);
    REQUIRE_FALSE(snapshot->error.value.active);

    // Stop while sleeping a 10s poll interval must be prompt
    auto before = std::chrono::steady_clock::now();
    REQUIRE(session.request_stop());
    session.join();
    REQUIRE(std::chrono::steady_clock::now() - before < 1s);

    REQUIRE(session.state() == SessionState::STOPPED);
    REQUIRE_FALSE(session.has_error());
    REQUIRE(fetcher.call_count() == 1);
}

TEST_CASE_METHOD(MonitoringSessionFixture, "MonitoringSession: polls repeatedly",
                 "[monitor][session]") {
    respond_ok();

    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();

    REQUIRE(fetcher.wait_for_calls(3));
    REQUIRE(wait_until([&] {
        auto s = publisher.get_snapshot("p1");
        return s && s->current_job.value && s->current_job.value->progress_percent >= 30.0;
    }));

    session.request_stop();
    session.join();

    auto metrics = session.metrics();
    REQUIRE(metrics.total_fetches >= 3);
    REQUIRE(metrics.total_failures == 0);
    REQUIRE(metrics.current_interval == 20ms);
}

TEST_CASE_METHOD(MonitoringSessionFixture, "MonitoringSession: fetches carry the clock stamp",
                 "[monitor][session]") {
    config.poll_interval = 10s;
    config.fetch_timeout = 1s;
    respond_ok();
    const Timestamp fixed = from_epoch_ms(1700000000000);

    MonitoringSession session("p1", fetcher, publisher, config, [fixed] { return fixed; });
    session.start();
    REQUIRE(wait_until([&] { return session.state() == SessionState::ACTIVE; }));

    auto snapshot = publisher.get_snapshot("p1");
    REQUIRE(snapshot->print_status.updated_at == fixed);
    REQUIRE(snapshot->temperatures.at("nozzle").updated_at == fixed);
    REQUIRE(snapshot->last_seen == fixed);
    REQUIRE(session.metrics().last_success_time == fixed);
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_CASE_METHOD(MonitoringSessionFixture,
                 "MonitoringSession: failure threshold stops with degraded snapshot",
                 "[monitor][session][failure]") {
    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();

    REQUIRE(wait_until([&] { return session.state() == SessionState::STOPPED; }));
    session.join();

    REQUIRE(session.has_error());
    REQUIRE(fetcher.call_count() == 3);

    auto metrics = session.metrics();
    REQUIRE(metrics.consecutive_failures == 3);
    REQUIRE(metrics.total_failures == 3);
    REQUIRE(metrics.last_error == "connection refused");

    auto snapshot = publisher.get_snapshot("p1");
    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->connection_status.value == ConnectionStatus::UNKNOWN);
    REQUIRE(snapshot->error.value.active);
    REQUIRE(snapshot->error.value.message.find("Lost contact") != std::string::npos);
    REQUIRE(snapshot->last_seen == Timestamp{});
}

TEST_CASE_METHOD(MonitoringSessionFixture, "MonitoringSession: success resets the failure count",
                 "[monitor][session][failure]") {
    config.failure_threshold = 5;
    fetcher.set_responder([](const std::string& id, int call) -> std::optional<FetchResult> {
        if (call < 2) {
            return FetchResult::failed(MonitorError::transient(id, "HTTP 502"));
        }
        return FetchResult::ok(printing_fragment(50.0));
    });

    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();

    REQUIRE(wait_until([&] { return session.state() == SessionState::ACTIVE; }));
    session.request_stop();
    session.join();

    auto metrics = session.metrics();
    REQUIRE(metrics.consecutive_failures == 0);
    REQUIRE(metrics.total_failures == 2);
    REQUIRE(metrics.last_error == "HTTP 502");
    REQUIRE_FALSE(session.has_error());
}

TEST_CASE_METHOD(MonitoringSessionFixture,
                 "MonitoringSession: degraded marker wins over a device stamp ahead of us",
                 "[monitor][session][failure]") {
    config.failure_threshold = 1;
    const Timestamp now = from_epoch_ms(1000000);
    fetcher.set_responder([now](const std::string& id, int call) -> std::optional<FetchResult> {
        if (call == 0) {
            DeviceStateFragment f = printing_fragment(5.0);
            f.stamp_all(now + 30s); // Device clock runs ahead, within skew
            return FetchResult::ok(f);
        }
        return FetchResult::failed(MonitorError::transient(id, "unreachable"));
    });

    MonitoringSession session("p1", fetcher, publisher, config, [now] { return now; });
    session.start();

    REQUIRE(wait_until([&] { return session.state() == SessionState::STOPPED; }));
    session.join();

    auto snapshot = publisher.get_snapshot("p1");
    REQUIRE(session.has_error());
    REQUIRE(snapshot->connection_status.value == ConnectionStatus::UNKNOWN);
    REQUIRE(snapshot->connection_status.updated_at == now + 30s);
    REQUIRE(snapshot->error.value.active);
    REQUIRE(snapshot->last_seen == now + 30s);
}

TEST_CASE_METHOD(MonitoringSessionFixture,
                 "MonitoringSession: invalid fragment is dropped without counting",
                 "[monitor][session][failure]") {
    fetcher.set_responder([](const std::string&, int) -> std::optional<FetchResult> {
        return FetchResult::ok(printing_fragment(150.0));
    });

    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();

    REQUIRE(fetcher.wait_for_calls(3));
    session.request_stop();
    session.join();

    auto metrics = session.metrics();
    REQUIRE(metrics.consecutive_failures == 0);
    REQUIRE(metrics.total_failures == 0);
    REQUIRE_FALSE(session.has_error());
    REQUIRE(publisher.get_snapshot("p1") == nullptr);
}

TEST_CASE_METHOD(MonitoringSessionFixture,
                 "MonitoringSession: unusable response is not a connectivity failure",
                 "[monitor][session][failure]") {
    fetcher.set_responder([](const std::string& id, int) -> std::optional<FetchResult> {
        return FetchResult::failed(MonitorError::parse_error("truncated body", id));
    });

    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();

    // Well past the threshold of 3
    REQUIRE(fetcher.wait_for_calls(5));
    REQUIRE(session.state() == SessionState::STARTING);
    session.request_stop();
    session.join();

    auto metrics = session.metrics();
    REQUIRE(metrics.consecutive_failures == 0);
    REQUIRE(metrics.total_failures == 0);
    REQUIRE_FALSE(session.has_error());
    REQUIRE(publisher.get_snapshot("p1") == nullptr);
}

TEST_CASE_METHOD(MonitoringSessionFixture,
                 "MonitoringSession: exit callback runs on the loop thread after STOPPED",
                 "[monitor][session]") {
    respond_ok();
    MonitoringSession session("p1", fetcher, publisher, config);

    std::atomic<bool> called{false};
    std::atomic<bool> saw_stopped{false};
    std::atomic<bool> on_own_thread{false};
    session.set_exit_callback([&] {
        saw_stopped = session.state() == SessionState::STOPPED;
        on_own_thread = session.on_loop_thread();
        called = true;
    });

    REQUIRE_FALSE(session.on_loop_thread());
    session.start();
    REQUIRE(fetcher.wait_for_calls(1));
    session.request_stop();
    session.join();

    REQUIRE(called);
    REQUIRE(saw_stopped);
    REQUIRE(on_own_thread);
}

TEST_CASE_METHOD(MonitoringSessionFixture, "MonitoringSession: throwing fetcher counts as failure",
                 "[monitor][session][failure]") {
    fetcher.set_responder([](const std::string&, int) -> std::optional<FetchResult> {
        throw std::runtime_error("socket exploded");
    });

    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();

    REQUIRE(wait_until([&] { return session.state() == SessionState::STOPPED; }));
    session.join();

    REQUIRE(session.has_error());
    REQUIRE(session.metrics().last_error == "socket exploded");
}

// ============================================================================
// Timeouts and cancellation
// ============================================================================

TEST_CASE_METHOD(MonitoringSessionFixture, "MonitoringSession: stop interrupts a hung fetch",
                 "[monitor][session][cancel]") {
    config.poll_interval = 10s;
    config.fetch_timeout = 5s;
    fetcher.set_responder(
        [](const std::string&, int) -> std::optional<FetchResult> { return std::nullopt; });

    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();
    REQUIRE(fetcher.wait_for_calls(1));

    auto before = std::chrono::steady_clock::now();
    REQUIRE(session.request_stop());
    REQUIRE(session.state() == SessionState::STOPPING);
    session.join();
    REQUIRE(std::chrono::steady_clock::now() - before < 1s);

    REQUIRE(session.state() == SessionState::STOPPED);
    REQUIRE_FALSE(session.has_error());

    // The fetch completes after the session stopped: nothing is published
    fetcher.complete_pending(FetchResult::ok(printing_fragment(20.0)));
    REQUIRE(publisher.get_snapshot("p1") == nullptr);
}

TEST_CASE_METHOD(MonitoringSessionFixture,
                 "MonitoringSession: timeout is a failure and late results are discarded",
                 "[monitor][session][cancel]") {
    config.failure_threshold = 2;
    fetcher.set_responder(
        [](const std::string&, int) -> std::optional<FetchResult> { return std::nullopt; });

    MonitoringSession session("p1", fetcher, publisher, config);
    session.start();

    REQUIRE(wait_until([&] { return session.state() == SessionState::STOPPED; }));
    session.join();

    REQUIRE(session.has_error());
    REQUIRE(session.metrics().last_error.find("timeout") != std::string::npos);
    REQUIRE(fetcher.pending_count() == 2);

    fetcher.complete_pending(FetchResult::ok(printing_fragment(20.0)));

    auto snapshot = publisher.get_snapshot("p1");
    REQUIRE(snapshot->connection_status.value == ConnectionStatus::UNKNOWN);
    REQUIRE_FALSE(snapshot->current_job.value.has_value());
}

TEST_CASE_METHOD(MonitoringSessionFixture, "MonitoringSession: destructor stops the loop",
                 "[monitor][session][cancel]") {
    respond_ok();
    {
        MonitoringSession session("p1", fetcher, publisher, config);
        session.start();
        REQUIRE(fetcher.wait_for_calls(1));
    }
    int calls = fetcher.call_count();
    std::this_thread::sleep_for(60ms);
    REQUIRE(fetcher.call_count() == calls);
}
