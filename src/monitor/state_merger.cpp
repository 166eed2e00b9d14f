// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file state_merger.cpp
 * @brief Recency-based field merge, fragment validation and state diffing
 *
 * @pattern Pure functions over immutable values
 * @gotchas Stamps compare with >= so a re-delivery of the same sample is accepted
 *          (it is a no-op value-wise and keeps polls and pushes symmetric)
 */

#include "state_merger.h"

#include <algorithm>
#include <cmath>

namespace printwatch {

namespace {

/// Accept incoming iff it is at least as recent as what is stored
template <typename T> bool admissible(const Stamped<T>& incoming, const Stamped<T>& stored) {
    return incoming.updated_at >= stored.updated_at;
}

bool temperature_ok(double value, const FragmentLimits& limits) {
    return std::isfinite(value) && value >= limits.min_temperature_c &&
           value <= limits.max_temperature_c;
}

} // namespace

DeviceState merge(const DeviceState& current, const DeviceStateFragment& fragment) {
    DeviceState next = current;

    if (fragment.connection_status &&
        admissible(*fragment.connection_status, current.connection_status)) {
        next.connection_status = *fragment.connection_status;
    }

    if (fragment.print_status && admissible(*fragment.print_status, current.print_status)) {
        next.print_status = *fragment.print_status;
    }

    for (const auto& [sensor, reading] : fragment.temperatures) {
        auto it = current.temperatures.find(sensor);
        if (it == current.temperatures.end() || reading.updated_at >= it->second.updated_at) {
            next.temperatures[sensor] = reading;
        }
    }

    if (fragment.current_job && admissible(*fragment.current_job, current.current_job)) {
        next.current_job = *fragment.current_job;
    }

    if (fragment.error && admissible(*fragment.error, current.error)) {
        next.error = *fragment.error;
    }

    if (fragment.from_device) {
        next.last_seen = std::max(current.last_seen, fragment.newest_stamp());
    }

    return next;
}

MonitorError validate_fragment(const std::string& device_id, const DeviceStateFragment& fragment,
                               Timestamp now, const FragmentLimits& limits) {
    if (fragment.empty()) {
        return MonitorError::invalid_fragment(device_id, "fragment touches no field");
    }

    const Timestamp horizon = now + limits.max_clock_skew;
    if (fragment.newest_stamp() > horizon) {
        return MonitorError::invalid_fragment(
            device_id, "field stamped " +
                           std::to_string(to_epoch_ms(fragment.newest_stamp()) - to_epoch_ms(now)) +
                           "ms in the future");
    }

    for (const auto& [sensor, reading] : fragment.temperatures) {
        if (sensor.empty()) {
            return MonitorError::invalid_fragment(device_id, "temperature with empty sensor name");
        }
        if (!temperature_ok(reading.current, limits) || !temperature_ok(reading.target, limits)) {
            return MonitorError::invalid_fragment(device_id,
                                                  "temperature out of range for '" + sensor + "'");
        }
    }

    if (fragment.current_job && fragment.current_job->value) {
        const PrintJob& job = *fragment.current_job->value;
        if (!std::isfinite(job.progress_percent) || job.progress_percent < 0.0 ||
            job.progress_percent > 100.0) {
            return MonitorError::invalid_fragment(device_id, "job progress outside 0-100");
        }
        if (job.remaining_seconds < -1) {
            return MonitorError::invalid_fragment(device_id, "negative remaining time");
        }
    }

    return {};
}

std::vector<std::string> diff_states(const DeviceState& before, const DeviceState& after) {
    std::vector<std::string> changed;

    if (before.connection_status.value != after.connection_status.value) {
        changed.emplace_back(field::CONNECTION_STATUS);
    }
    if (before.print_status.value != after.print_status.value) {
        changed.emplace_back(field::PRINT_STATUS);
    }

    // Sensors present in either state; std::map keeps paths sorted
    for (const auto& [sensor, reading] : after.temperatures) {
        auto it = before.temperatures.find(sensor);
        if (it == before.temperatures.end() || !it->second.same_value(reading)) {
            changed.push_back(field::TEMPERATURES_PREFIX + sensor);
        }
    }
    for (const auto& [sensor, reading] : before.temperatures) {
        if (after.temperatures.find(sensor) == after.temperatures.end()) {
            changed.push_back(field::TEMPERATURES_PREFIX + sensor);
        }
    }

    if (before.current_job.value != after.current_job.value) {
        changed.emplace_back(field::CURRENT_JOB);
    }
    if (before.error.value != after.error.value) {
        changed.emplace_back(field::ERROR);
    }

    return changed;
}

bool differs_at_all(const DeviceState& before, const DeviceState& after) {
    if (before.connection_status != after.connection_status ||
        before.print_status != after.print_status || before.current_job != after.current_job ||
        before.error != after.error || before.last_seen != after.last_seen) {
        return true;
    }
    if (before.temperatures.size() != after.temperatures.size()) {
        return true;
    }
    for (const auto& [sensor, reading] : after.temperatures) {
        auto it = before.temperatures.find(sensor);
        if (it == before.temperatures.end() || !it->second.same_value(reading) ||
            it->second.updated_at != reading.updated_at) {
            return true;
        }
    }
    return false;
}

} // namespace printwatch
