// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_state.h"
#include "device_status_fetcher.h"
#include "monitoring_config.h"
#include "monitoring_session.h"
#include "push_event_router.h"
#include "session_registry.h"
#include "snapshot_publisher.h"
#include "staleness_watchdog.h"

#include <optional>
#include <string>
#include <vector>

namespace printwatch {

/**
 * @brief Entry point to the monitoring core
 *
 * Wires a SnapshotPublisher to the poll path (SessionRegistry), the push
 * path (PushEventRouter) and the StalenessWatchdog. The publisher is the
 * only owner of device state; everything else writes through it.
 *
 * @code
 * MoonrakerStatusFetcher fetcher;
 * DeviceMonitor monitor(fetcher, MonitoringConfig::from_config(*Config::get_instance()));
 * monitor.start();
 * auto sub = monitor.subscribe("voron", [](const DeviceStatePtr& s, const auto& fields) {...});
 * monitor.start_monitoring("voron");
 * ...
 * monitor.shutdown();
 * @endcode
 */
class DeviceMonitor {
  public:
    DeviceMonitor(DeviceStatusFetcher& fetcher, const MonitoringConfig& config,
                  WallClock clock = system_now);
    ~DeviceMonitor();

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    /// Start push consumers and the staleness watchdog
    void start();

    /// Stop every session, the push consumers and the watchdog
    void shutdown();

    bool start_monitoring(const std::string& device_id) {
        return registry_.start_monitoring(device_id);
    }

    bool stop_monitoring(const std::string& device_id) {
        return registry_.stop_monitoring(device_id);
    }

    SubscriptionId subscribe(const std::string& device_id, ChangeCallback callback) {
        return publisher_.subscribe(device_id, std::move(callback));
    }

    bool unsubscribe(const std::string& device_id, SubscriptionId id) {
        return publisher_.unsubscribe(device_id, id);
    }

    DeviceStatePtr get_snapshot(const std::string& device_id) const {
        return publisher_.get_snapshot(device_id);
    }

    void push_event(PushEvent event) {
        router_.dispatch(std::move(event));
    }

    bool push_json(const std::string& payload) {
        return router_.dispatch_json(payload);
    }

    SessionState session_state(const std::string& device_id) {
        return registry_.session_state(device_id);
    }

    std::optional<SessionMetrics> metrics(const std::string& device_id) {
        return registry_.metrics(device_id);
    }

    std::vector<std::string> monitored_devices() {
        return registry_.monitored_devices();
    }

    RouterStats push_stats() const {
        return router_.stats();
    }

    const MonitoringConfig& config() const {
        return config_;
    }

    SnapshotPublisher& publisher() {
        return publisher_;
    }

    StalenessWatchdog& watchdog() {
        return watchdog_;
    }

  private:
    const MonitoringConfig config_;

    // Declaration order matters: the publisher outlives every writer
    SnapshotPublisher publisher_;
    SessionRegistry registry_;
    PushEventRouter router_;
    StalenessWatchdog watchdog_;
};

} // namespace printwatch
