// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file monitoring_session.cpp
 * @brief Per-device polling loop with backoff and cooperative cancellation
 *
 * @pattern Heap-allocated FetchSlot shared with the fetch callback, so a
 *          result that arrives after the timeout lands in an abandoned slot
 * @threading One loop thread per session; cancellation wakes both the poll
 *            sleep and the fetch wait through CancellationSignal
 * @gotchas The loop checks cancellation before every fetch and right after
 *          it; a result fetched while stopping is discarded, not published
 */

#include "monitoring_session.h"

#include "state_merger.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace printwatch {

const char* session_state_to_string(SessionState state) {
    switch (state) {
    case SessionState::STOPPED:
        return "stopped";
    case SessionState::STARTING:
        return "starting";
    case SessionState::ACTIVE:
        return "active";
    case SessionState::STOPPING:
        return "stopping";
    }
    return "stopped";
}

MonitoringSession::MonitoringSession(std::string device_id, DeviceStatusFetcher& fetcher,
                                     SnapshotPublisher& publisher,
                                     const MonitoringConfig& config, WallClock clock)
    : device_id_(std::move(device_id)), fetcher_(fetcher), publisher_(publisher),
      config_(config), clock_(std::move(clock)),
      signal_(std::make_shared<CancellationSignal>()), rng_(std::random_device{}()) {
    if (!clock_) {
        clock_ = system_now;
    }
    metrics_.base_interval = config_.poll_interval;
    metrics_.current_interval = config_.poll_interval;
}

MonitoringSession::~MonitoringSession() {
    request_stop();
    join();
}

bool MonitoringSession::start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        spdlog::warn("[MonitoringSession {}] start() called twice, ignoring", device_id_);
        return false;
    }

    spdlog::info("[MonitoringSession {}] Starting (poll every {}ms)", device_id_,
                 config_.poll_interval.count());
    state_.store(SessionState::STARTING);
    thread_ = std::thread(&MonitoringSession::run, this);
    return true;
}

bool MonitoringSession::request_stop() {
    SessionState current = state_.load();
    bool transitioned = false;
    while (current == SessionState::STARTING || current == SessionState::ACTIVE) {
        if (state_.compare_exchange_weak(current, SessionState::STOPPING)) {
            transitioned = true;
            break;
        }
    }

    signal_->cancel();

    if (transitioned) {
        spdlog::info("[MonitoringSession {}] Stop requested", device_id_);
    }
    return transitioned;
}

void MonitoringSession::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

SessionMetrics MonitoringSession::metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

std::chrono::milliseconds MonitoringSession::backoff_delay(const MonitoringConfig& config,
                                                           int consecutive_failures) {
    if (consecutive_failures < 1) {
        return config.backoff_initial;
    }
    double scaled = static_cast<double>(config.backoff_initial.count()) *
                    std::pow(config.backoff_factor, consecutive_failures - 1);
    double capped = std::min(scaled, static_cast<double>(config.backoff_max.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

std::chrono::milliseconds MonitoringSession::apply_jitter(std::chrono::milliseconds delay) {
    if (config_.backoff_jitter <= 0.0) {
        return delay;
    }
    std::uniform_real_distribution<double> dist(-config_.backoff_jitter, config_.backoff_jitter);
    double jittered = static_cast<double>(delay.count()) * (1.0 + dist(rng_));
    return std::chrono::milliseconds(std::max<int64_t>(1, static_cast<int64_t>(jittered)));
}

// ============================================================================
// Loop
// ============================================================================

void MonitoringSession::run() {
    spdlog::debug("[MonitoringSession {}] Loop thread started", device_id_);

    while (!signal_->is_cancelled()) {
        std::optional<FetchResult> result = fetch_once();
        if (!result || signal_->is_cancelled()) {
            spdlog::debug("[MonitoringSession {}] Cancelled during fetch", device_id_);
            break;
        }

        std::chrono::milliseconds next_delay;
        if (result->success) {
            next_delay = handle_success(std::move(result->fragment));
        } else if (!result->error.is_transient()) {
            // Unusable reply from a reachable device: a data problem, not lost contact
            spdlog::warn("[MonitoringSession {}] Dropping unusable response: {} [{}]", device_id_,
                         result->error.message, result->error.get_type_string());
            next_delay = config_.poll_interval;
        } else {
            std::optional<std::chrono::milliseconds> retry = handle_failure(result->error);
            if (!retry) {
                finish(true);
                return;
            }
            next_delay = *retry;
        }

        {
            std::lock_guard<std::mutex> lock(metrics_mutex_);
            metrics_.current_interval = next_delay;
        }

        if (!signal_->sleep_for(next_delay)) {
            break; // Stop requested during sleep
        }
    }

    finish(false);
}

std::optional<FetchResult> MonitoringSession::fetch_once() {
    auto slot = std::make_shared<FetchSlot>();
    auto signal = signal_;
    std::string device_id = device_id_;
    auto started = std::chrono::steady_clock::now();

    spdlog::trace("[MonitoringSession {}] Fetching status", device_id_);

    try {
        fetcher_.fetch_status(device_id_, config_.fetch_timeout,
                              [slot, signal, device_id](FetchResult result) {
                                  {
                                      std::lock_guard<std::mutex> lock(slot->mutex);
                                      if (slot->done) {
                                          return; // Second completion is ignored
                                      }
                                      slot->done = true;
                                      if (slot->abandoned) {
                                          spdlog::debug("[MonitoringSession {}] Discarding "
                                                        "result that arrived after timeout",
                                                        device_id);
                                          return;
                                      }
                                      slot->result = std::move(result);
                                  }
                                  signal->notify();
                              });
    } catch (const std::exception& e) {
        spdlog::warn("[MonitoringSession {}] Fetcher threw: {}", device_id_, e.what());
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->abandoned = true;
        return FetchResult::failed(MonitorError::transient(device_id_, e.what()));
    }

    auto outcome = signal_->wait_for(config_.fetch_timeout, [&slot] {
        std::lock_guard<std::mutex> lock(slot->mutex);
        return slot->done;
    });

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->done) {
        slot->abandoned = true;
    }

    {
        std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
        metrics_.total_fetches++;
        metrics_.last_fetch_duration = elapsed;
    }

    if (outcome == CancellationSignal::WaitResult::CANCELLED) {
        return std::nullopt;
    }
    if (!slot->done) {
        spdlog::warn("[MonitoringSession {}] Fetch timed out after {}ms", device_id_,
                     config_.fetch_timeout.count());
        return FetchResult::failed(
            MonitorError::timeout(device_id_, static_cast<uint32_t>(config_.fetch_timeout.count())));
    }
    return std::move(slot->result);
}

std::chrono::milliseconds MonitoringSession::handle_success(DeviceStateFragment fragment) {
    Timestamp now = clock_();
    fragment.from_device = true;
    fragment.stamp_unset(now);

    // A good fetch means monitoring is healthy again
    if (!fragment.error) {
        fragment.error = Stamped<ErrorStatus>{ErrorStatus{}, fragment.newest_stamp()};
    }

    MonitorError invalid = validate_fragment(device_id_, fragment, now, config_.limits);
    if (invalid.has_error()) {
        spdlog::warn("[MonitoringSession {}] Dropping invalid fragment: {}", device_id_,
                     invalid.message);
        return config_.poll_interval;
    }

    publisher_.apply_fragment(device_id_, fragment);

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        if (metrics_.consecutive_failures > 0) {
            spdlog::info("[MonitoringSession {}] Recovered after {} failure(s)", device_id_,
                         metrics_.consecutive_failures);
        }
        metrics_.consecutive_failures = 0;
        metrics_.last_success_time = now;
    }

    SessionState expected = SessionState::STARTING;
    if (state_.compare_exchange_strong(expected, SessionState::ACTIVE)) {
        spdlog::info("[MonitoringSession {}] Active", device_id_);
    }
    return config_.poll_interval;
}

std::optional<std::chrono::milliseconds>
MonitoringSession::handle_failure(const MonitorError& error) {
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        failures = ++metrics_.consecutive_failures;
        metrics_.total_failures++;
        metrics_.last_error = error.message;
        metrics_.last_error_time = clock_();
    }

    if (failures >= config_.failure_threshold) {
        MonitorError persistent = MonitorError::persistent(device_id_, failures, error.message);
        spdlog::error("[MonitoringSession {}] Giving up: {}", device_id_, persistent.message);
        publish_degraded(persistent);
        return std::nullopt;
    }

    auto delay = apply_jitter(backoff_delay(config_, failures));
    spdlog::warn("[MonitoringSession {}] Fetch failed ({}/{}): {} [{}], retrying in {}ms",
                 device_id_, failures, config_.failure_threshold, error.message,
                 error.get_type_string(), delay.count());
    return delay;
}

void MonitoringSession::publish_degraded(const MonitorError& error) {
    Timestamp now = clock_();
    std::string message = error.user_message();

    // Degraded marker must win over any stored stamp, even one slightly ahead of us
    publisher_.update(device_id_, [now, &message](const DeviceState& current) {
        Timestamp stamp =
            std::max({now, current.connection_status.updated_at, current.error.updated_at});

        DeviceStateFragment degraded;
        degraded.from_device = false;
        degraded.connection_status = Stamped<ConnectionStatus>{ConnectionStatus::UNKNOWN, stamp};
        degraded.error = Stamped<ErrorStatus>{ErrorStatus{true, message}, stamp};
        return merge(current, degraded);
    });
}

void MonitoringSession::finish(bool error) {
    has_error_.store(error);
    state_.store(SessionState::STOPPED);
    if (error) {
        spdlog::info("[MonitoringSession {}] Stopped with error", device_id_);
    } else {
        spdlog::info("[MonitoringSession {}] Stopped", device_id_);
    }

    if (on_exit_) {
        try {
            on_exit_();
        } catch (const std::exception& e) {
            spdlog::error("[MonitoringSession {}] Exit callback threw: {}", device_id_, e.what());
        }
    }
}

} // namespace printwatch
