// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_state.h"
#include "monitor_error.h"

#include <string>

#include "hv/json.hpp"

/**
 * @file device_state_json.h
 * @brief JSON encoding of fragments, push events and snapshots
 *
 * Push payload:
 * ```json
 * {"device_id": "p1", "updated_at": 1700000000000,
 *  "fragment": {"connection_status": "online", "print_status": "printing",
 *               "temperatures": {"nozzle": {"current": 210.5, "target": 215}},
 *               "current_job": {"name": "benchy.gcode", "progress_percent": 42,
 *                               "remaining_seconds": 1800},
 *               "error": {"active": false, "message": ""}}}
 * ```
 * Timestamps are milliseconds since the Unix epoch. Object leaves (sensor
 * readings, current_job, error) may carry their own "updated_at"; the two
 * status fields may be given as {"value": "online", "updated_at": ms}.
 * "current_job": null clears the job.
 */

namespace printwatch {

using json = nlohmann::json;

/**
 * @brief Decode a push fragment object
 *
 * Unknown keys are ignored. Fields without updated_at are left unstamped.
 *
 * @param j Fragment object
 * @param[out] out Decoded fragment
 * @param[out] error Reason on failure
 * @return false on a type error or unknown enum string
 */
bool fragment_from_json(const json& j, DeviceStateFragment& out, std::string& error);

/**
 * @brief Decode a complete push payload
 *
 * @param payload Raw JSON text
 * @param[out] out Decoded event
 * @param[out] error PARSE_ERROR describing the problem
 * @return false if the payload is malformed
 */
bool parse_push_event(const std::string& payload, PushEvent& out, MonitorError& error);

/**
 * @brief Build a fragment from a Moonraker printer/objects/query status
 *
 * Reads print_stats, display_status, extruder, heater_bed and webhooks. The
 * extruder maps to sensor "nozzle" and heater_bed to "bed". Every field is
 * stamped with now.
 *
 * @param status The "status" object of the query result
 * @param now Fetch completion time
 */
DeviceStateFragment fragment_from_moonraker_status(const json& status, Timestamp now);

/// Encode a snapshot (all stamps as epoch ms)
json state_to_json(const DeviceState& state);

} // namespace printwatch
