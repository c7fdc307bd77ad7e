// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mqtt_topic.h"

namespace hadisco {

std::vector<std::string> split_topic_levels(const std::string& topic) {
    std::vector<std::string> levels;
    size_t start = 0;
    while (true) {
        size_t slash = topic.find('/', start);
        if (slash == std::string::npos) {
            levels.push_back(topic.substr(start));
            break;
        }
        levels.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return levels;
}

bool mqtt_topic_matches(const std::string& filter, const std::string& topic) {
    if (filter.empty() || topic.empty()) {
        return false;
    }

    // $SYS and friends are never matched by a leading wildcard
    if (topic[0] == '$' && (filter[0] == '+' || filter[0] == '#')) {
        return false;
    }

    const auto f = split_topic_levels(filter);
    const auto t = split_topic_levels(topic);

    size_t i = 0;
    for (; i < f.size(); ++i) {
        if (f[i] == "#") {
            // Multi-level wildcard must be last and matches the parent too
            return i == f.size() - 1;
        }
        if (i >= t.size()) {
            return false;
        }
        if (f[i] != "+" && f[i] != t[i]) {
            return false;
        }
    }
    return i == t.size();
}

bool topic_has_suffix(const std::string& topic, const std::string& suffix) {
    if (topic == suffix) {
        return true;
    }
    if (topic.size() < suffix.size() + 1) {
        return false;
    }
    return topic.compare(topic.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           topic[topic.size() - suffix.size() - 1] == '/';
}

} // namespace hadisco
