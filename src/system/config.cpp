// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "error_reporting.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

Config* Config::instance{NULL};

namespace {

/// Default monitoring section - shared between new configs and backfilling
json get_default_monitoring_config() {
    return {{"poll_interval_ms", 30000},     {"fetch_timeout_ms", 10000},
            {"failure_threshold", 5},        {"backoff_initial_ms", 1000},
            {"backoff_max_ms", 30000},       {"backoff_jitter", 0.1},
            {"staleness_window_ms", 90000},  {"watchdog_interval_ms", 5000},
            {"push_queue_capacity", 2},      {"push_idle_timeout_ms", 60000},
            {"max_clock_skew_ms", 60000}};
}

/// Default entry for one printer
json get_default_printer_config(const std::string& moonraker_host) {
    return {{"moonraker_host", moonraker_host}, {"moonraker_port", 7125}, {"monitor", true}};
}

json get_default_config() {
    return {{"config_version", 1},
            {"log_path", ""},
            {"log_target", "auto"},
            {"monitoring", get_default_monitoring_config()},
            {"printers", {{"default", get_default_printer_config("127.0.0.1")}}}};
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                LOG_WARN_INTERNAL("Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Top-level value in {} is not an object, resetting to defaults",
                         config_path);
            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    // log_level intentionally NOT defaulted - absence lets -v flags decide

    // Ensure monitoring section exists with every key
    if (!data.contains("monitoring") || !data["monitoring"].is_object()) {
        data["monitoring"] = get_default_monitoring_config();
        config_modified = true;
    } else {
        auto& monitoring = data["monitoring"];
        json defaults = get_default_monitoring_config();
        for (auto& [key, value] : defaults.items()) {
            if (!monitoring.contains(key)) {
                monitoring[key] = value;
                config_modified = true;
            }
        }
    }

    // Ensure printers section exists; individual printers get port/monitor defaults
    if (!data.contains("printers") || !data["printers"].is_object()) {
        data["printers"] = json::object();
        config_modified = true;
    }
    json printer_defaults = get_default_printer_config("");
    for (auto& [id, printer] : data["printers"].items()) {
        if (!printer.is_object()) {
            spdlog::warn("[Config] Printer '{}' is not an object, replacing with defaults", id);
            printer = printer_defaults;
            config_modified = true;
            continue;
        }
        for (auto& [key, value] : printer_defaults.items()) {
            if (!printer.contains(key)) {
                printer[key] = value;
                config_modified = true;
            }
        }
    }

    // Save updated config with any new defaults
    if (config_modified) {
        if (save()) {
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        }
    }

    spdlog::debug("[Config] initialized: {} printer(s) configured", data["printers"].size());
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    std::string tmp_path = path + ".tmp";
    try {
        fs::path config_dir = fs::path(path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir)) {
            fs::create_directories(config_dir);
        }

        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            LOG_ERROR_INTERNAL("Error writing to config file: {}", tmp_path);
            return false;
        }
        o.close();

        fs::rename(tmp_path, path);
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("Exception while saving config to {}: {}", path, e.what());
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return false;
    }
}

std::vector<std::string> Config::printer_ids(bool monitored_only) {
    std::vector<std::string> ids;
    json::json_pointer ptr("/printers");
    if (!data.contains(ptr) || !data[ptr].is_object()) {
        return ids;
    }

    // nlohmann objects iterate in key order
    for (auto& [id, printer] : data[ptr].items()) {
        if (monitored_only && printer.is_object() && !printer.value("monitor", true)) {
            spdlog::trace("[Config] Printer '{}' has monitoring disabled", id);
            continue;
        }
        ids.push_back(id);
    }
    return ids;
}

std::string Config::printer_path(const std::string& printer_id) {
    return "/printers/" + printer_id + "/";
}
