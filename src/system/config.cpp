// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace hadisco {

Config* Config::instance{NULL};

namespace {

/// Default broker connection section
json get_default_mqtt_config() {
    return {{"host", "127.0.0.1"}, {"port", 1883},         {"client_id", ""},
            {"username", ""},      {"password", ""},       {"keepalive_sec", 60}};
}

/// Default discovery section: every component of every device under "homeassistant"
json get_default_discovery_config() {
    return {{"base_topic", "homeassistant"},
            {"object_id", "+"},
            {"node_id", ""},
            {"component", "+"},
            {"duration_ms", 5000},
            {"thing_id", "hadisco"}};
}

/// Default logging section
/// level intentionally empty - CLI verbosity and the warn fallback apply
json get_default_log_config() {
    return {{"level", ""}, {"target", "auto"}, {"file", ""}};
}

json get_default_config() {
    return {{"mqtt", get_default_mqtt_config()},
            {"discovery", get_default_discovery_config()},
            {"log", get_default_log_config()}};
}

/// Add every key of @p defaults missing from data[section]
/// @return true if anything was added
bool ensure_section(json& data, const char* section, const json& defaults) {
    if (!data.contains(section) || !data[section].is_object()) {
        data[section] = defaults;
        return true;
    }

    bool modified = false;
    auto& target = data[section];
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

std::string Config::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/hadisco/hadisco.json";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/hadisco/hadisco.json";
    }

    return "hadisco.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            data = json::parse(std::ifstream(config_path));
            if (!data.is_object()) {
                parse_error = "top level is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (ensure_section(data, "mqtt", get_default_mqtt_config())) {
        config_modified = true;
    }
    if (ensure_section(data, "discovery", get_default_discovery_config())) {
        config_modified = true;
    }
    if (ensure_section(data, "log", get_default_log_config())) {
        config_modified = true;
    }

    // Save updated config with any new defaults
    if (config_modified) {
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
        }
        if (save()) {
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        }
    }

    spdlog::debug("[Config] initialized: broker={}:{}", get<std::string>("/mqtt/host", ""),
                  get<int>("/mqtt/port", 0));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("[Config] Failed to replace {}: {}", path, ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = get_default_config();
}

} // namespace hadisco
