// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "component.h"

#include <array>
#include <utility>

namespace hadisco {

namespace {

struct KindName {
    ComponentKind kind;
    const char* name;
};

constexpr std::array<KindName, 10> KIND_NAMES = {{
    {ComponentKind::ALARM_CONTROL_PANEL, "alarm_control_panel"},
    {ComponentKind::BINARY_SENSOR, "binary_sensor"},
    {ComponentKind::CAMERA, "camera"},
    {ComponentKind::CLIMATE, "climate"},
    {ComponentKind::COVER, "cover"},
    {ComponentKind::FAN, "fan"},
    {ComponentKind::LIGHT, "light"},
    {ComponentKind::LOCK, "lock"},
    {ComponentKind::SENSOR, "sensor"},
    {ComponentKind::SWITCH, "switch"},
}};

} // namespace

const char* component_kind_name(ComponentKind kind) {
    for (const auto& entry : KIND_NAMES) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<ComponentKind> parse_component_kind(const std::string& name) {
    for (const auto& entry : KIND_NAMES) {
        if (name == entry.name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

Component::Component(ComponentKind kind, HaId id, std::string owner_id, ComponentConfig config,
                     json raw, std::vector<ComponentChannel> channels)
    : kind_(kind), id_(std::move(id)), owner_id_(std::move(owner_id)), config_(std::move(config)),
      raw_(std::move(raw)), channels_(std::move(channels)) {}

const ComponentChannel* Component::channel(const std::string& channel_id) const {
    for (const auto& ch : channels_) {
        if (ch.id == channel_id) {
            return &ch;
        }
    }
    return nullptr;
}

std::string Component::unique_id() const {
    if (!config_.unique_id.empty()) {
        return config_.unique_id;
    }
    return id_.component + "_" + id_.group_id();
}

json Component::to_json() const {
    json channels = json::array();
    for (const auto& ch : channels_) {
        channels.push_back(json{{"id", ch.id},
                                {"state_topic", ch.state_topic},
                                {"command_topic", ch.command_topic},
                                {"readonly", ch.readonly}});
    }

    json j = {{"id", id_.short_topic()},
              {"component", id_.component},
              {"node_id", id_.node_id},
              {"object_id", id_.object_id},
              {"owner", owner_id_},
              {"name", config_.name},
              {"unique_id", unique_id()},
              {"channels", channels}};

    if (!config_.device.empty()) {
        j["device"] = {{"identifiers", config_.device.identifiers},
                       {"name", config_.device.name},
                       {"manufacturer", config_.device.manufacturer},
                       {"model", config_.device.model},
                       {"sw_version", config_.device.sw_version}};
    }
    return j;
}

} // namespace hadisco
