// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

/**
 * @file device_state.h
 * @brief Per-device state model shared by the monitoring core
 *
 * Every leaf field carries its own updated_at stamp. State values are
 * immutable once published (held as shared_ptr<const DeviceState>); a merge
 * always builds a new value.
 */

namespace printwatch {

/// Wall-clock timestamp. The default value (epoch) means "never set".
using Timestamp = std::chrono::system_clock::time_point;

/// Milliseconds since the Unix epoch (wire representation of Timestamp)
int64_t to_epoch_ms(Timestamp ts);

/// Saturates to Timestamp::max()/min() outside the representable range
Timestamp from_epoch_ms(int64_t ms);

/// Largest epoch-ms value that converts to a Timestamp without saturating
int64_t max_epoch_ms();

/// Source of "now"; injectable so tests can drive time
using WallClock = std::function<Timestamp()>;

/// Default WallClock backed by std::chrono::system_clock
Timestamp system_now();

/**
 * @brief Connection status of a tracked device
 */
enum class ConnectionStatus {
    ONLINE,     ///< Device answered recently
    OFFLINE,    ///< Device silent beyond the staleness window
    CONNECTING, ///< Device reachable but still initializing
    UNKNOWN     ///< No information, or monitoring degraded
};

/**
 * @brief Print status of a tracked device
 */
enum class PrintStatus {
    IDLE = 0,     ///< No active print
    PRINTING = 1, ///< Actively printing
    PAUSED = 2,   ///< Print paused
    ERROR = 3     ///< Printer or print in error state
};

const char* connection_status_to_string(ConnectionStatus status);
const char* print_status_to_string(PrintStatus status);

/**
 * @brief Parse lowercase status strings ("online", "printing", ...)
 * @return std::nullopt for unrecognized strings
 */
std::optional<ConnectionStatus> parse_connection_status(const std::string& str);
std::optional<PrintStatus> parse_print_status(const std::string& str);

/**
 * @brief A value paired with the time it was last observed
 */
template <typename T> struct Stamped {
    T value{};
    Timestamp updated_at{};

    bool operator==(const Stamped& o) const {
        return value == o.value && updated_at == o.updated_at;
    }
    bool operator!=(const Stamped& o) const {
        return !(*this == o);
    }
};

/**
 * @brief One temperature sensor reading (degrees Celsius)
 */
struct TemperatureReading {
    double current = 0.0;
    double target = 0.0;
    Timestamp updated_at{};

    /// Value equality, ignoring updated_at
    bool same_value(const TemperatureReading& o) const {
        return current == o.current && target == o.target;
    }
};

/**
 * @brief Current print job
 */
struct PrintJob {
    std::string name;
    double progress_percent = 0.0;
    int64_t remaining_seconds = -1; ///< -1 when unknown

    bool operator==(const PrintJob& o) const {
        return name == o.name && progress_percent == o.progress_percent &&
               remaining_seconds == o.remaining_seconds;
    }
    bool operator!=(const PrintJob& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Degraded-monitoring flag carried in the published state
 *
 * Monitoring failures never propagate as exceptions; they surface here.
 */
struct ErrorStatus {
    bool active = false;
    std::string message;

    bool operator==(const ErrorStatus& o) const {
        return active == o.active && message == o.message;
    }
    bool operator!=(const ErrorStatus& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Complete snapshot of one device
 */
struct DeviceState {
    std::string id;
    Stamped<ConnectionStatus> connection_status{ConnectionStatus::UNKNOWN, {}};
    Stamped<PrintStatus> print_status{PrintStatus::IDLE, {}};
    std::map<std::string, TemperatureReading> temperatures;
    /// Stamp is kept when the job is cleared so an older job cannot come back
    Stamped<std::optional<PrintJob>> current_job;
    Stamped<ErrorStatus> error;
    Timestamp last_seen{};
};

using DeviceStatePtr = std::shared_ptr<const DeviceState>;

/**
 * @brief Partial state update touching a subset of fields
 *
 * Each present field has its own updated_at. Fragments produced from device
 * data (polls, push events) have from_device set; locally synthesized
 * fragments (degraded markers) do not, and never advance last_seen.
 */
struct DeviceStateFragment {
    std::optional<Stamped<ConnectionStatus>> connection_status;
    std::optional<Stamped<PrintStatus>> print_status;
    std::map<std::string, TemperatureReading> temperatures;
    std::optional<Stamped<std::optional<PrintJob>>> current_job;
    std::optional<Stamped<ErrorStatus>> error;
    bool from_device = true;

    /// True if the fragment touches no field at all
    bool empty() const;

    /// Newest updated_at of any present field (epoch if empty)
    Timestamp newest_stamp() const;

    /// Give every present field with an unset (epoch) stamp the given time
    void stamp_unset(Timestamp ts);

    /// Set every present field's stamp to ts
    void stamp_all(Timestamp ts);
};

/**
 * @brief One unsolicited update pushed by a device
 *
 * Fragment fields without their own stamp inherit updated_at.
 */
struct PushEvent {
    std::string device_id;
    DeviceStateFragment fragment;
    Timestamp updated_at{};
};

} // namespace printwatch
