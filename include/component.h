// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ha_id.h"

#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp" // libhv's nlohmann json (via cpputil/)

using json = nlohmann::json;

namespace hadisco {

/**
 * @brief Component kinds understood by the discovery factory
 */
enum class ComponentKind {
    ALARM_CONTROL_PANEL,
    BINARY_SENSOR,
    CAMERA,
    CLIMATE,
    COVER,
    FAN,
    LIGHT,
    LOCK,
    SENSOR,
    SWITCH
};

/// Topic-level name of a kind (e.g., "binary_sensor")
const char* component_kind_name(ComponentKind kind);

/// Parse the component level of a discovery topic; std::nullopt if unsupported
std::optional<ComponentKind> parse_component_kind(const std::string& name);

/**
 * @brief Device block shared by all components of one physical device
 */
struct DeviceInfo {
    std::vector<std::string> identifiers;
    std::string name;
    std::string manufacturer;
    std::string model;
    std::string sw_version;

    bool empty() const {
        return identifiers.empty() && name.empty() && manufacturer.empty() && model.empty() &&
               sw_version.empty();
    }
};

/**
 * @brief Common fields of a discovery configuration payload
 *
 * Abbreviated keys and the "~" base-topic placeholder are already expanded.
 * Kind-specific keys remain available through Component::raw_config().
 */
struct ComponentConfig {
    std::string name;
    std::string unique_id;
    std::string device_class;
    std::string icon;
    std::string unit_of_measurement;
    std::string state_topic;
    std::string command_topic;
    std::string availability_topic;
    std::string value_template;
    std::string payload_on;
    std::string payload_off;
    std::string topic; ///< camera image topic
    bool retain = false;
    int qos = 0;
    DeviceInfo device;
};

/**
 * @brief One state/command pair exposed by a component
 */
struct ComponentChannel {
    std::string id;
    std::string state_topic;
    std::string command_topic;
    bool readonly = true;
};

/**
 * @brief A parsed, typed component descriptor
 *
 * Immutable once built by the factory. Shared between the discovery session
 * and whoever consumes discovery results.
 */
class Component {
  public:
    Component(ComponentKind kind, HaId id, std::string owner_id, ComponentConfig config,
              json raw, std::vector<ComponentChannel> channels);

    ComponentKind kind() const {
        return kind_;
    }

    const HaId& id() const {
        return id_;
    }

    const std::string& owner_id() const {
        return owner_id_;
    }

    const ComponentConfig& config() const {
        return config_;
    }

    /// Expanded JSON payload
    const json& raw_config() const {
        return raw_;
    }

    const std::vector<ComponentChannel>& channels() const {
        return channels_;
    }

    /// Channel by id, or nullptr
    const ComponentChannel* channel(const std::string& channel_id) const;

    /// unique_id if announced, otherwise derived from the topic identifier
    std::string unique_id() const;

    /**
     * @brief Summary for command-line output
     *
     * {"id", "component", "node_id", "object_id", "owner", "name", "unique_id",
     *  "device": {...} (only if announced), "channels": [...]}
     */
    json to_json() const;

  private:
    ComponentKind kind_;
    HaId id_;
    std::string owner_id_;
    ComponentConfig config_;
    json raw_;
    std::vector<ComponentChannel> channels_;
};

} // namespace hadisco
