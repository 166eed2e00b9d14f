// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cancellation_signal.h"
#include "device_state.h"
#include "device_status_fetcher.h"
#include "monitoring_config.h"
#include "snapshot_publisher.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>

namespace printwatch {

/**
 * @brief Lifecycle of a monitoring session
 *
 * STOPPED -> STARTING (start) -> ACTIVE (first good fetch) -> STOPPING
 * (request_stop) -> STOPPED (loop observed cancellation). STARTING or ACTIVE
 * go straight to STOPPED with has_error() once the failure threshold is hit.
 */
enum class SessionState {
    STOPPED,  ///< Not running (never started, finished, or failed)
    STARTING, ///< Loop running, no successful fetch yet
    ACTIVE,   ///< Loop running, device answered at least once
    STOPPING  ///< Cancellation requested, loop not yet exited
};

const char* session_state_to_string(SessionState state);

/**
 * @brief Runtime counters of one session
 */
struct SessionMetrics {
    std::chrono::milliseconds base_interval{0};       ///< Configured poll interval
    std::chrono::milliseconds current_interval{0};    ///< Delay before the next attempt
    int consecutive_failures = 0;
    uint64_t total_failures = 0;
    uint64_t total_fetches = 0;
    std::chrono::milliseconds last_fetch_duration{0};
    std::string last_error;
    Timestamp last_error_time{};
    Timestamp last_success_time{};
};

/**
 * @brief Cancellable polling loop for one device
 *
 * Owns a background thread that fetches status through a DeviceStatusFetcher,
 * validates it and applies it to the SnapshotPublisher. Failures back off
 * exponentially with jitter; after failure_threshold consecutive failures the
 * session publishes a degraded marker and stops for good. Sessions are
 * one-shot: restarting a device means creating a new session.
 *
 * Threading: state(), metrics() and request_stop() may be called from any
 * thread. The loop never holds a lock across a fetch.
 */
class MonitoringSession {
  public:
    /**
     * @param device_id Device to poll
     * @param fetcher Status source (must outlive the session)
     * @param publisher Snapshot sink (must outlive the session)
     * @param config Sanitized monitoring configuration
     * @param clock Time source for stamps and validation
     */
    MonitoringSession(std::string device_id, DeviceStatusFetcher& fetcher,
                      SnapshotPublisher& publisher, const MonitoringConfig& config,
                      WallClock clock = system_now);
    ~MonitoringSession();

    MonitoringSession(const MonitoringSession&) = delete;
    MonitoringSession& operator=(const MonitoringSession&) = delete;

    /**
     * @brief Enter STARTING and launch the loop thread
     *
     * The first fetch happens immediately on the new thread.
     *
     * @return false if the session was already started once
     */
    bool start();

    /**
     * @brief Ask the loop to exit at its next checkpoint
     *
     * Does not block. Wakes the loop if it is sleeping or waiting on a fetch.
     *
     * @return true if this call moved the session to STOPPING
     */
    bool request_stop();

    /// Block until the loop thread has exited (no-op if never started)
    void join();

    /**
     * @brief Hook run on the loop thread right after the session reaches STOPPED
     *
     * Must be set before start(). The hook may call back into whoever owns
     * the session, but must not destroy it: a thread cannot join itself.
     */
    void set_exit_callback(std::function<void()> callback) {
        on_exit_ = std::move(callback);
    }

    /// True when called from this session's own loop thread
    bool on_loop_thread() const {
        return thread_.get_id() == std::this_thread::get_id();
    }

    SessionState state() const {
        return state_.load();
    }

    /// True once the session stopped because of persistent fetch failure
    bool has_error() const {
        return has_error_.load();
    }

    const std::string& device_id() const {
        return device_id_;
    }

    SessionMetrics metrics() const;

    /**
     * @brief Backoff before the next attempt, without jitter
     *
     * @param config Backoff parameters
     * @param consecutive_failures Failures so far (>= 1)
     * @return min(initial * factor^(failures-1), max)
     */
    static std::chrono::milliseconds backoff_delay(const MonitoringConfig& config,
                                                   int consecutive_failures);

  private:
    /// Shared between the loop and one in-flight fetch callback
    struct FetchSlot {
        std::mutex mutex;
        bool done = false;
        bool abandoned = false;
        FetchResult result;
    };

    void run();

    /**
     * @brief Perform one fetch with the hard timeout
     * @return Result (timeouts become failed results), or nullopt if cancelled
     */
    std::optional<FetchResult> fetch_once();

    /// @return Delay before the next poll
    std::chrono::milliseconds handle_success(DeviceStateFragment fragment);

    /// @return Delay before the retry, or nullopt if the threshold was reached
    std::optional<std::chrono::milliseconds> handle_failure(const MonitorError& error);

    void publish_degraded(const MonitorError& error);
    std::chrono::milliseconds apply_jitter(std::chrono::milliseconds delay);
    void finish(bool error);

    const std::string device_id_;
    DeviceStatusFetcher& fetcher_;
    SnapshotPublisher& publisher_;
    const MonitoringConfig config_;
    WallClock clock_;

    std::shared_ptr<CancellationSignal> signal_;
    std::function<void()> on_exit_;
    std::thread thread_;
    std::atomic<SessionState> state_{SessionState::STOPPED};
    std::atomic<bool> has_error_{false};
    std::atomic<bool> started_{false};

    mutable std::mutex metrics_mutex_;
    SessionMetrics metrics_;

    std::mt19937 rng_; ///< Loop thread only
};

} // namespace printwatch
