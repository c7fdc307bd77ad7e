// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

#include "hv/json.hpp"

namespace hadisco::json_util {

/// Safely extract a string from a JSON field that may be null.
/// nlohmann .value("key", "") throws type_error.302 when the field is JSON null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

/// Safely extract a bool from a JSON field that may be bool, "true"/"false", 0/1, or null.
inline bool safe_bool(const nlohmann::json& j, const char* key, bool def = false) {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_number_integer()) {
        return v.get<int>() != 0;
    }
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s == "true" || s == "True") {
            return true;
        }
        if (s == "false" || s == "False") {
            return false;
        }
    }
    return def;
}

/// Extract a field that may be a single string or an array of strings.
/// Non-string array elements are skipped.
inline std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) {
        return out;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
    } else if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string()) {
                out.push_back(item.get<std::string>());
            }
        }
    }
    return out;
}

} // namespace hadisco::json_util
