// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_monitor.h"

#include <spdlog/spdlog.h>

namespace printwatch {

DeviceMonitor::DeviceMonitor(DeviceStatusFetcher& fetcher, const MonitoringConfig& config,
                             WallClock clock)
    : config_(config.sanitized()), registry_(fetcher, publisher_, config_, clock),
      router_(publisher_, config_, clock),
      watchdog_(publisher_, config_.staleness_window, config_.watchdog_interval, clock) {}

DeviceMonitor::~DeviceMonitor() {
    shutdown();
}

void DeviceMonitor::start() {
    spdlog::info("[DeviceMonitor] Starting");
    router_.start();
    watchdog_.start();
}

void DeviceMonitor::shutdown() {
    registry_.stop_all();
    router_.stop();
    watchdog_.stop();
}

} // namespace printwatch
