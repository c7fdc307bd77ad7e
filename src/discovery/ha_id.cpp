// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ha_id.h"

#include "mqtt_topic.h"

#include <tuple>

namespace hadisco {

namespace {

constexpr const char* CONFIG_LEVEL = "config";

} // namespace

HaId::HaId(std::string base, std::string object, std::string node, std::string comp)
    : base_topic(std::move(base)), component(std::move(comp)), node_id(std::move(node)),
      object_id(std::move(object)) {}

std::optional<HaId> HaId::parse(const std::string& topic) {
    const auto levels = split_topic_levels(topic);
    if (levels.size() < 4 || levels.size() > 5) {
        return std::nullopt;
    }
    if (levels.back() != CONFIG_LEVEL) {
        return std::nullopt;
    }
    for (size_t i = 0; i + 1 < levels.size(); ++i) {
        if (levels[i].empty()) {
            return std::nullopt;
        }
    }

    HaId id;
    id.base_topic = levels[0];
    id.component = levels[1];
    if (levels.size() == 5) {
        id.node_id = levels[2];
        id.object_id = levels[3];
    } else {
        id.object_id = levels[2];
    }
    return id;
}

std::string HaId::topic(const std::string& suffix) const {
    std::string result = base_topic + "/" + component + "/";
    if (!node_id.empty()) {
        result += node_id + "/";
    }
    result += object_id + "/" + suffix;
    return result;
}

std::string HaId::short_topic() const {
    std::string result = component + "/";
    if (!node_id.empty()) {
        result += node_id + "/";
    }
    return result + object_id;
}

std::string HaId::group_id() const {
    if (node_id.empty()) {
        return object_id;
    }
    return node_id + "_" + object_id;
}

bool HaId::has_wildcard() const {
    return component == "+" || node_id == "+" || object_id == "+";
}

bool HaId::operator<(const HaId& other) const {
    return std::tie(base_topic, component, node_id, object_id) <
           std::tie(other.base_topic, other.component, other.node_id, other.object_id);
}

} // namespace hadisco
