// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_status_fetcher.h"
#include "monitoring_config.h"
#include "monitoring_session.h"
#include "snapshot_publisher.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace printwatch {

/**
 * @brief Owns at most one live MonitoringSession per device
 *
 * start_monitoring() and stop_monitoring() are idempotent and never block.
 * Sessions that reached STOPPED cleanly are reaped on the next registry call;
 * failed ones stay until the device is restarted.
 *
 * Threading: all methods are thread-safe and may be called from a subscriber
 * callback running on a session's own thread. A session is never destroyed
 * on its own thread; one retired there waits in retired_ for a later call.
 */
class SessionRegistry {
  public:
    SessionRegistry(DeviceStatusFetcher& fetcher, SnapshotPublisher& publisher,
                    const MonitoringConfig& config, WallClock clock = system_now);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Begin polling a device
     *
     * No-op if a session is already STARTING or ACTIVE. If the current
     * session is still STOPPING, the restart is queued and the new session
     * is launched from the old loop thread once it reaches STOPPED, so a
     * device never has two live sessions.
     *
     * @return true if a session was started or a restart was queued
     */
    bool start_monitoring(const std::string& device_id);

    /**
     * @brief Ask a device's session to stop
     *
     * No-op if there is no session or it is already STOPPING/STOPPED. Also
     * cancels a queued restart. Returns without waiting for the loop to exit.
     *
     * @return true if a running session was told to stop or a restart was cancelled
     */
    bool stop_monitoring(const std::string& device_id);

    /// Current session state (STOPPED if the device has no session)
    SessionState session_state(const std::string& device_id);

    /// True while a session is STARTING or ACTIVE, or a restart is queued
    bool is_monitoring(const std::string& device_id);

    /// Devices that are monitored in the is_monitoring() sense
    std::vector<std::string> monitored_devices();

    /// Metrics of the device's session, if it still exists
    std::optional<SessionMetrics> metrics(const std::string& device_id);

    /// True if the device's last session gave up on persistent failure
    bool has_error(const std::string& device_id);

    /// Stop every session and wait for all loops to exit (except the caller's own)
    void stop_all();

    /// Retired sessions not yet destroyed
    size_t retired_count();

  private:
    using SessionList = std::vector<std::unique_ptr<MonitoringSession>>;

    /**
     * @brief Detach sessions that are safe to destroy
     *
     * Takes sessions that reached STOPPED without error from sessions_, and
     * every STOPPED session from retired_, skipping any whose loop thread is
     * the caller. Failed sessions stay so has_error()/metrics() remain
     * observable until the device is restarted. The caller destroys (joins)
     * the returned sessions after releasing mutex_.
     *
     * Caller holds mutex_.
     */
    SessionList take_stopped_locked();

    /// Create and start a session wired to on_session_exit(). Caller holds mutex_.
    std::unique_ptr<MonitoringSession> launch_locked(const std::string& device_id);

    /// Move a session out of sessions_ into retired_. Caller holds mutex_.
    void retire_locked(std::map<std::string, std::unique_ptr<MonitoringSession>>::iterator it);

    /// Exit hook, runs on the finished session's loop thread
    void on_session_exit(const std::string& device_id, const MonitoringSession* session);

    bool is_live_locked(const std::string& device_id) const;

    DeviceStatusFetcher& fetcher_;
    SnapshotPublisher& publisher_;
    const MonitoringConfig config_;
    WallClock clock_;

    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<MonitoringSession>> sessions_;
    std::set<std::string> restart_pending_; ///< Devices to relaunch once their session stops
    SessionList retired_;                   ///< Replaced sessions awaiting destruction
};

} // namespace printwatch
