// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_state_json.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace printwatch {

namespace {

/// Whole number that fits in int64_t; floats must have no fractional part
bool read_int64(const json& node, int64_t& out) {
    if (node.is_number_unsigned()) {
        if (node.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(node.get<uint64_t>());
        return true;
    }
    if (node.is_number_integer()) {
        out = node.get<int64_t>();
        return true;
    }
    if (node.is_number_float()) {
        double v = node.get<double>();
        // 2^63 is exact as a double; anything at or beyond it does not fit
        constexpr double LIMIT = 9223372036854775808.0;
        if (!std::isfinite(v) || v != std::floor(v) || v >= LIMIT || v < -LIMIT) {
            return false;
        }
        out = static_cast<int64_t>(v);
        return true;
    }
    return false;
}

/// Optional "updated_at" of an object leaf; false if present but not a valid stamp
bool read_stamp(const json& obj, Timestamp& out, std::string& error) {
    if (!obj.is_object() || !obj.contains("updated_at")) {
        return true;
    }
    int64_t ms = 0;
    if (!read_int64(obj["updated_at"], ms)) {
        error = "updated_at must be a whole number of milliseconds";
        return false;
    }
    if (ms < 0 || ms >= max_epoch_ms()) {
        error = "updated_at out of range: " + std::to_string(ms);
        return false;
    }
    out = from_epoch_ms(ms);
    return true;
}

/// Status leaf: either "online" or {"value": "online", "updated_at": ms}
template <typename Enum, typename Parser>
bool read_status(const json& j, const char* key, Parser parse,
                 std::optional<Stamped<Enum>>& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    const json& node = j[key];
    const json& value = node.is_object() ? node.value("value", json()) : node;
    if (!value.is_string()) {
        error = std::string(key) + " must be a string";
        return false;
    }

    std::optional<Enum> parsed = parse(value.get<std::string>());
    if (!parsed) {
        error = std::string(key) + ": unknown value '" + value.get<std::string>() + "'";
        return false;
    }

    Stamped<Enum> stamped{*parsed, {}};
    if (!read_stamp(node, stamped.updated_at, error)) {
        return false;
    }
    out = stamped;
    return true;
}

bool read_temperatures(const json& j, DeviceStateFragment& out, std::string& error) {
    if (!j.contains("temperatures")) {
        return true;
    }
    const auto& temps = j["temperatures"];
    if (!temps.is_object()) {
        error = "temperatures must be an object";
        return false;
    }

    for (auto& [sensor, node] : temps.items()) {
        TemperatureReading reading;
        if (node.is_number()) {
            reading.current = node.get<double>();
        } else if (node.is_object() && node.contains("current") && node["current"].is_number()) {
            reading.current = node["current"].get<double>();
            if (node.contains("target")) {
                if (!node["target"].is_number()) {
                    error = "temperatures." + sensor + ".target must be a number";
                    return false;
                }
                reading.target = node["target"].get<double>();
            }
            if (!read_stamp(node, reading.updated_at, error)) {
                return false;
            }
        } else {
            error = "temperatures." + sensor + " needs a numeric 'current'";
            return false;
        }
        out.temperatures[sensor] = reading;
    }
    return true;
}

bool read_job(const json& j, DeviceStateFragment& out, std::string& error) {
    if (!j.contains("current_job")) {
        return true;
    }
    const auto& node = j["current_job"];
    Stamped<std::optional<PrintJob>> job;

    if (node.is_null()) {
        out.current_job = job; // Cleared
        return true;
    }
    if (!node.is_object()) {
        error = "current_job must be an object or null";
        return false;
    }

    PrintJob parsed;
    if (node.contains("name")) {
        if (!node["name"].is_string()) {
            error = "current_job.name must be a string";
            return false;
        }
        parsed.name = node["name"].get<std::string>();
    }
    if (node.contains("progress_percent")) {
        if (!node["progress_percent"].is_number()) {
            error = "current_job.progress_percent must be a number";
            return false;
        }
        parsed.progress_percent = node["progress_percent"].get<double>();
    }
    if (node.contains("remaining_seconds") && !node["remaining_seconds"].is_null()) {
        if (!read_int64(node["remaining_seconds"], parsed.remaining_seconds)) {
            error = "current_job.remaining_seconds must be a whole number";
            return false;
        }
    }
    if (!read_stamp(node, job.updated_at, error)) {
        return false;
    }

    job.value = parsed;
    out.current_job = job;
    return true;
}

bool read_error(const json& j, DeviceStateFragment& out, std::string& error) {
    if (!j.contains("error")) {
        return true;
    }
    const auto& node = j["error"];
    if (!node.is_object() || !node.contains("active") || !node["active"].is_boolean()) {
        error = "error must be an object with a boolean 'active'";
        return false;
    }

    Stamped<ErrorStatus> status;
    status.value.active = node["active"].get<bool>();
    if (node.contains("message")) {
        if (!node["message"].is_string()) {
            error = "error.message must be a string";
            return false;
        }
        status.value.message = node["message"].get<std::string>();
    }
    if (!read_stamp(node, status.updated_at, error)) {
        return false;
    }
    out.error = status;
    return true;
}

json stamp_json(Timestamp ts) {
    return ts == Timestamp{} ? json(nullptr) : json(to_epoch_ms(ts));
}

} // namespace

bool fragment_from_json(const json& j, DeviceStateFragment& out, std::string& error) {
    if (!j.is_object()) {
        error = "fragment must be an object";
        return false;
    }

    DeviceStateFragment fragment;
    if (!read_status<ConnectionStatus>(j, "connection_status", parse_connection_status,
                                       fragment.connection_status, error) ||
        !read_status<PrintStatus>(j, "print_status", parse_print_status, fragment.print_status,
                                  error) ||
        !read_temperatures(j, fragment, error) || !read_job(j, fragment, error) ||
        !read_error(j, fragment, error)) {
        return false;
    }

    out = std::move(fragment);
    return true;
}

bool parse_push_event(const std::string& payload, PushEvent& out, MonitorError& error) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        error = MonitorError::parse_error(e.what());
        return false;
    }

    if (!j.is_object()) {
        error = MonitorError::parse_error("payload must be an object");
        return false;
    }
    if (!j.contains("device_id") || !j["device_id"].is_string() ||
        j["device_id"].get<std::string>().empty()) {
        error = MonitorError::parse_error("missing device_id");
        return false;
    }

    std::string device_id = j["device_id"].get<std::string>();

    if (!j.contains("fragment")) {
        error = MonitorError::parse_error("missing fragment", device_id);
        return false;
    }

    PushEvent event;
    event.device_id = device_id;

    std::string why;
    if (!read_stamp(j, event.updated_at, why) ||
        !fragment_from_json(j["fragment"], event.fragment, why)) {
        error = MonitorError::parse_error(why, device_id);
        return false;
    }

    out = std::move(event);
    return true;
}

DeviceStateFragment fragment_from_moonraker_status(const json& status, Timestamp now) {
    DeviceStateFragment fragment;
    fragment.from_device = true;

    ConnectionStatus connection = ConnectionStatus::ONLINE;
    bool klippy_fault = false;
    if (status.contains("webhooks") && status["webhooks"].is_object()) {
        std::string klippy_state = status["webhooks"].value("state", "ready");
        if (klippy_state == "startup") {
            connection = ConnectionStatus::CONNECTING;
        } else if (klippy_state == "shutdown" || klippy_state == "error") {
            klippy_fault = true;
            spdlog::debug("[MoonrakerStatus] Klippy state '{}'", klippy_state);
        }
    }
    fragment.connection_status = Stamped<ConnectionStatus>{connection, now};

    PrintStatus print = PrintStatus::IDLE;
    std::string filename;
    double print_duration = 0.0;
    if (status.contains("print_stats") && status["print_stats"].is_object()) {
        const auto& stats = status["print_stats"];
        std::string state = stats.value("state", "standby");
        if (state == "printing") {
            print = PrintStatus::PRINTING;
        } else if (state == "paused") {
            print = PrintStatus::PAUSED;
        } else if (state == "error") {
            print = PrintStatus::ERROR;
        }
        // standby, complete and cancelled are all idle

        if (stats.contains("filename") && stats["filename"].is_string()) {
            filename = stats["filename"].get<std::string>();
        }
        if (stats.contains("print_duration") && stats["print_duration"].is_number()) {
            print_duration = stats["print_duration"].get<double>();
        }
    }
    if (klippy_fault) {
        print = PrintStatus::ERROR;
    }
    fragment.print_status = Stamped<PrintStatus>{print, now};

    Stamped<std::optional<PrintJob>> job{std::nullopt, now};
    if ((print == PrintStatus::PRINTING || print == PrintStatus::PAUSED) && !filename.empty()) {
        PrintJob active;
        active.name = filename;

        if (status.contains("display_status") && status["display_status"].is_object()) {
            const auto& display = status["display_status"];
            if (display.contains("progress") && display["progress"].is_number()) {
                active.progress_percent =
                    std::clamp(display["progress"].get<double>() * 100.0, 0.0, 100.0);
            }
        }

        // Estimate remaining from print_duration (actual print time, excluding prep)
        double progress = active.progress_percent;
        if (progress >= 100.0) {
            active.remaining_seconds = 0;
        } else if (progress >= 1.0 && print_duration > 0.0) {
            double estimate = print_duration * (100.0 - progress) / progress;
            if (std::isfinite(estimate) && estimate < 1e15) {
                active.remaining_seconds = static_cast<int64_t>(estimate);
            }
        }
        job.value = active;
    }
    fragment.current_job = job;

    auto read_heater = [&](const char* object, const char* sensor) {
        if (!status.contains(object) || !status[object].is_object()) {
            return;
        }
        const auto& heater = status[object];
        if (!heater.contains("temperature") || !heater["temperature"].is_number()) {
            return;
        }
        TemperatureReading reading;
        reading.current = heater["temperature"].get<double>();
        if (heater.contains("target") && heater["target"].is_number()) {
            reading.target = heater["target"].get<double>();
        }
        reading.updated_at = now;
        fragment.temperatures[sensor] = reading;
    };
    read_heater("extruder", "nozzle");
    read_heater("heater_bed", "bed");

    return fragment;
}

json state_to_json(const DeviceState& state) {
    json j;
    j["id"] = state.id;
    j["connection_status"] = {
        {"value", connection_status_to_string(state.connection_status.value)},
        {"updated_at", stamp_json(state.connection_status.updated_at)}};
    j["print_status"] = {{"value", print_status_to_string(state.print_status.value)},
                         {"updated_at", stamp_json(state.print_status.updated_at)}};

    json temps = json::object();
    for (const auto& [sensor, reading] : state.temperatures) {
        temps[sensor] = {{"current", reading.current},
                         {"target", reading.target},
                         {"updated_at", stamp_json(reading.updated_at)}};
    }
    j["temperatures"] = temps;

    if (state.current_job.value) {
        const PrintJob& job = *state.current_job.value;
        j["current_job"] = {{"name", job.name},
                            {"progress_percent", job.progress_percent},
                            {"remaining_seconds", job.remaining_seconds},
                            {"updated_at", stamp_json(state.current_job.updated_at)}};
    } else {
        j["current_job"] = nullptr;
    }

    j["error"] = {{"active", state.error.value.active},
                  {"message", state.error.value.message},
                  {"updated_at", stamp_json(state.error.updated_at)}};
    j["last_seen"] = stamp_json(state.last_seen);
    return j;
}

} // namespace printwatch
