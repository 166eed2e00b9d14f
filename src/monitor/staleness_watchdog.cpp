// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "staleness_watchdog.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace printwatch {

StalenessWatchdog::StalenessWatchdog(SnapshotPublisher& publisher,
                                     std::chrono::milliseconds staleness_window,
                                     std::chrono::milliseconds scan_interval, WallClock clock)
    : publisher_(publisher), staleness_window_(staleness_window), scan_interval_(scan_interval),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = system_now;
    }
}

StalenessWatchdog::~StalenessWatchdog() {
    stop();
}

void StalenessWatchdog::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }

    spdlog::info("[StalenessWatchdog] Starting (window {}ms, scan every {}ms)",
                 staleness_window_.count(), scan_interval_.count());
    signal_ = std::make_shared<CancellationSignal>();
    thread_ = std::thread(&StalenessWatchdog::run, this, signal_);
}

void StalenessWatchdog::stop() {
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        signal_->cancel();
        thread = std::move(thread_);
    }
    thread.join();
    spdlog::info("[StalenessWatchdog] Stopped");
}

bool StalenessWatchdog::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable();
}

void StalenessWatchdog::run(std::shared_ptr<CancellationSignal> signal) {
    spdlog::debug("[StalenessWatchdog] Scan thread started");
    while (signal->sleep_for(scan_interval_)) {
        scan_once(clock_());
    }
    spdlog::debug("[StalenessWatchdog] Scan thread exiting");
}

size_t StalenessWatchdog::scan_once(Timestamp now) {
    size_t forced = 0;

    for (const auto& device_id : publisher_.tracked_devices()) {
        DeviceStatePtr snapshot = publisher_.get_snapshot(device_id);
        if (!snapshot || snapshot->connection_status.value == ConnectionStatus::OFFLINE ||
            now - snapshot->last_seen <= staleness_window_) {
            continue;
        }

        // Re-check inside update(): a fresh fragment may have landed since the read
        bool went_offline = false;
        publisher_.update(device_id, [this, now, &went_offline](const DeviceState& current) {
            if (current.connection_status.value == ConnectionStatus::OFFLINE ||
                now - current.last_seen <= staleness_window_) {
                return current;
            }
            DeviceState next = current;
            next.connection_status.value = ConnectionStatus::OFFLINE;
            next.connection_status.updated_at = std::max(now, current.connection_status.updated_at);
            went_offline = true;
            return next;
        });

        if (went_offline) {
            forced++;
            auto silent_for =
                std::chrono::duration_cast<std::chrono::seconds>(now - snapshot->last_seen);
            spdlog::info("[StalenessWatchdog] {} silent for {}s, marked offline", device_id,
                         silent_for.count());
        }
    }

    return forced;
}

} // namespace printwatch
