// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef HADISCO_CONFIG_H
#define HADISCO_CONFIG_H

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace hadisco {

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Layout (defaults are filled in for every missing key):
 * ```json
 * {
 *   "mqtt": {"host": "127.0.0.1", "port": 1883, "client_id": "", "username": "",
 *            "password": "", "keepalive_sec": 60},
 *   "discovery": {"base_topic": "homeassistant", "object_id": "+", "node_id": "",
 *                 "component": "+", "duration_ms": 5000, "thing_id": "hadisco"},
 *   "log": {"level": "", "target": "auto", "file": ""}
 * }
 * ```
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/hadisco.json");
 *
 * std::string host = cfg->get<std::string>("/mqtt/host", "127.0.0.1");
 * cfg->set<int>("/mqtt/port", 8883);
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
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to
     * parse is moved aside to "<path>.corrupt" and replaced by defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds another type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::type_error& e) {
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
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /// Mutable JSON object at path
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written to "<path>.tmp" first and renamed over the original.
     *
     * @return true on success
     */
    bool save();

    /// Replace all values with the defaults (in memory)
    void reset_to_defaults();

    std::string get_path();

    /**
     * @brief Default config file location
     *
     * $XDG_CONFIG_HOME/hadisco/hadisco.json, ~/.config/hadisco/hadisco.json,
     * or ./hadisco.json when neither variable is set.
     */
    static std::string default_path();

    static Config* get_instance();
};

} // namespace hadisco

#endif // HADISCO_CONFIG_H
