// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_state.h"
#include "monitor_error.h"

#include <chrono>
#include <string>
#include <vector>

/**
 * @file state_merger.h
 * @brief Field-level merge of fragments into device snapshots
 *
 * Recency is the only admissibility rule: a fragment field replaces the stored
 * field iff its updated_at is >= the stored one. Polls and push events are
 * treated identically. Nothing here locks or blocks.
 */

namespace printwatch {

/// Field paths reported to subscribers
namespace field {
constexpr const char* CONNECTION_STATUS = "connection_status";
constexpr const char* PRINT_STATUS = "print_status";
constexpr const char* TEMPERATURES_PREFIX = "temperatures.";
constexpr const char* CURRENT_JOB = "current_job";
constexpr const char* ERROR = "error";
} // namespace field

/**
 * @brief Merge a fragment into the current state
 *
 * Fields older than the stored value are discarded silently. Fields absent
 * from the fragment carry over. last_seen advances to the fragment's newest
 * stamp only for device-originated fragments.
 *
 * @param current Current snapshot (not modified)
 * @param fragment Incoming partial update
 * @return Freshly constructed merged state
 */
DeviceState merge(const DeviceState& current, const DeviceStateFragment& fragment);

/**
 * @brief Sanity limits applied to incoming fragments
 */
struct FragmentLimits {
    /// How far into the future a field stamp may be before it is rejected
    std::chrono::milliseconds max_clock_skew{60000};
    double min_temperature_c = -100.0;
    double max_temperature_c = 1000.0;
};

/**
 * @brief Validate a fragment before merging
 *
 * A rejected fragment is a data-quality problem, not a connectivity one: it
 * is dropped and logged but never counts as a fetch failure.
 *
 * @param device_id Device the fragment belongs to (for the error record)
 * @param fragment Fragment to check
 * @param now Reference time for clock-skew checks
 * @param limits Sanity limits
 * @return MonitorError of type INVALID_FRAGMENT, or NONE if acceptable
 */
MonitorError validate_fragment(const std::string& device_id, const DeviceStateFragment& fragment,
                               Timestamp now, const FragmentLimits& limits = {});

/**
 * @brief List field paths whose values differ between two states
 *
 * Compares values only; a field that was merely re-stamped is not reported.
 * Temperature sensors use "temperatures.<sensor>" paths.
 */
std::vector<std::string> diff_states(const DeviceState& before, const DeviceState& after);

/**
 * @brief True if anything differs, stamps and last_seen included
 */
bool differs_at_all(const DeviceState& before, const DeviceState& after);

} // namespace printwatch
