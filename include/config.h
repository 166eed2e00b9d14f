// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and read from the main thread before monitoring threads are started.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/printwatch.json");
 *
 * // Get with default fallback
 * int poll = cfg->get<int>("/monitoring/poll_interval_ms", 30000);
 *
 * // Set and save
 * cfg->set<int>("/printers/voron/moonraker_port", 7125);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON configuration file, or creates it with defaults if it
     * doesn't exist. Missing sections are filled in with defaults and the
     * file is rewritten. A corrupt file is backed up to <path>.corrupt and
     * replaced with defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * Throws nlohmann::json::exception if path doesn't exist.
     * Use the overload with default_value for safer access.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/monitoring/poll_interval_ms")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * the wrong type.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path
     * @param default_value Fallback value if path not found
     * @return Configuration value or default_value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has unexpected type ({}), using default", json_ptr,
                         e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     *
     * @tparam T Value type to store
     * @param json_ptr JSON pointer path
     * @param v Value to set
     * @return The value that was set
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Get JSON sub-object at path
     *
     * Returns mutable reference to JSON object for complex operations.
     *
     * @param json_path JSON pointer path
     * @return Reference to JSON object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Writes in-memory config to a temp file and renames it over the
     * original.
     *
     * @return true on success
     */
    bool save();

    /**
     * @brief Get configuration file path
     *
     * @return Path to the loaded configuration file
     */
    std::string get_path();

    /**
     * @brief IDs of configured printers
     *
     * @param monitored_only Skip printers whose "monitor" flag is false
     * @return Printer IDs (keys under /printers), sorted
     */
    std::vector<std::string> printer_ids(bool monitored_only = false);

    /**
     * @brief JSON pointer prefix for one printer's section
     *
     * @return e.g. "/printers/voron/"
     */
    static std::string printer_path(const std::string& printer_id);

    /**
     * @brief Get singleton instance
     *
     * @return Pointer to global Config instance
     */
    static Config* get_instance();
};
