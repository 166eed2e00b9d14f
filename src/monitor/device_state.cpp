// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_state.h"

#include <algorithm>

namespace printwatch {

int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

int64_t max_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::max())
        .count();
}

Timestamp from_epoch_ms(int64_t ms) {
    // Saturate: converting to clock ticks multiplies and would overflow
    const int64_t limit = max_epoch_ms();
    if (ms >= limit) {
        return Timestamp::max();
    }
    if (ms <= -limit) {
        return Timestamp::min();
    }
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

Timestamp system_now() {
    return std::chrono::system_clock::now();
}

const char* connection_status_to_string(ConnectionStatus status) {
    switch (status) {
    case ConnectionStatus::ONLINE:
        return "online";
    case ConnectionStatus::OFFLINE:
        return "offline";
    case ConnectionStatus::CONNECTING:
        return "connecting";
    case ConnectionStatus::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

const char* print_status_to_string(PrintStatus status) {
    switch (status) {
    case PrintStatus::IDLE:
        return "idle";
    case PrintStatus::PRINTING:
        return "printing";
    case PrintStatus::PAUSED:
        return "paused";
    case PrintStatus::ERROR:
        return "error";
    }
    return "idle";
}

std::optional<ConnectionStatus> parse_connection_status(const std::string& str) {
    if (str == "online")
        return ConnectionStatus::ONLINE;
    if (str == "offline")
        return ConnectionStatus::OFFLINE;
    if (str == "connecting")
        return ConnectionStatus::CONNECTING;
    if (str == "unknown")
        return ConnectionStatus::UNKNOWN;
    return std::nullopt;
}

std::optional<PrintStatus> parse_print_status(const std::string& str) {
    if (str == "idle")
        return PrintStatus::IDLE;
    if (str == "printing")
        return PrintStatus::PRINTING;
    if (str == "paused")
        return PrintStatus::PAUSED;
    if (str == "error")
        return PrintStatus::ERROR;
    return std::nullopt;
}

// ============================================================================
// DeviceStateFragment
// ============================================================================

bool DeviceStateFragment::empty() const {
    return !connection_status && !print_status && temperatures.empty() && !current_job && !error;
}

Timestamp DeviceStateFragment::newest_stamp() const {
    Timestamp newest{};
    if (connection_status)
        newest = std::max(newest, connection_status->updated_at);
    if (print_status)
        newest = std::max(newest, print_status->updated_at);
    for (const auto& [name, reading] : temperatures) {
        newest = std::max(newest, reading.updated_at);
    }
    if (current_job)
        newest = std::max(newest, current_job->updated_at);
    if (error)
        newest = std::max(newest, error->updated_at);
    return newest;
}

void DeviceStateFragment::stamp_unset(Timestamp ts) {
    const Timestamp unset{};
    if (connection_status && connection_status->updated_at == unset)
        connection_status->updated_at = ts;
    if (print_status && print_status->updated_at == unset)
        print_status->updated_at = ts;
    for (auto& [name, reading] : temperatures) {
        if (reading.updated_at == unset)
            reading.updated_at = ts;
    }
    if (current_job && current_job->updated_at == unset)
        current_job->updated_at = ts;
    if (error && error->updated_at == unset)
        error->updated_at = ts;
}

void DeviceStateFragment::stamp_all(Timestamp ts) {
    if (connection_status)
        connection_status->updated_at = ts;
    if (print_status)
        print_status->updated_at = ts;
    for (auto& [name, reading] : temperatures) {
        reading.updated_at = ts;
    }
    if (current_job)
        current_job->updated_at = ts;
    if (error)
        error->updated_at = ts;
}

} // namespace printwatch
