// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cancellation_signal.h"
#include "device_state.h"
#include "snapshot_publisher.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace printwatch {

/**
 * @brief Forces silent devices OFFLINE
 *
 * Periodically scans every tracked snapshot. A device whose last_seen is
 * older than the staleness window is published as OFFLINE, stamped at
 * max(now, stored connection stamp) so the override wins over recency
 * arbitration. Devices already OFFLINE are left alone.
 *
 * last_seen only advances on device-originated data, so the degraded marker
 * published by a failed session does not keep a device looking alive.
 */
class StalenessWatchdog {
  public:
    StalenessWatchdog(SnapshotPublisher& publisher, std::chrono::milliseconds staleness_window,
                      std::chrono::milliseconds scan_interval, WallClock clock = system_now);
    ~StalenessWatchdog();

    StalenessWatchdog(const StalenessWatchdog&) = delete;
    StalenessWatchdog& operator=(const StalenessWatchdog&) = delete;

    /// Launch the background scan thread (no-op if running)
    void start();

    /// Stop and join the scan thread
    void stop();

    bool is_running() const;

    /**
     * @brief Run one scan synchronously
     *
     * @param now Reference time
     * @return Number of devices forced OFFLINE
     */
    size_t scan_once(Timestamp now);

  private:
    void run(std::shared_ptr<CancellationSignal> signal);

    SnapshotPublisher& publisher_;
    const std::chrono::milliseconds staleness_window_;
    const std::chrono::milliseconds scan_interval_;
    WallClock clock_;

    mutable std::mutex mutex_;
    std::thread thread_;
    std::shared_ptr<CancellationSignal> signal_;
};

} // namespace printwatch
