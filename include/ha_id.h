// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>

namespace hadisco {

/**
 * @brief Identifier of a component announced on a discovery topic
 *
 * Discovery topics have the shape
 *   <base_topic>/<component>/[<node_id>/]<object_id>/config
 * e.g. "homeassistant/switch/bedroom/config" or
 *      "homeassistant/sensor/esp_kitchen/temperature/config".
 *
 * The same type describes a subscription pattern when one or more fields
 * are the single-level wildcard "+".
 */
struct HaId {
    std::string base_topic;
    std::string component;
    std::string node_id; ///< Empty when the publisher does not use node ids
    std::string object_id;

    HaId() = default;

    /**
     * @brief Build an identifier or subscription pattern
     *
     * @param base Base topic (e.g., "homeassistant")
     * @param object Object id, or "+" for all objects
     * @param node Node id, empty for none
     * @param comp Component kind, or "+" for all kinds
     */
    HaId(std::string base, std::string object, std::string node, std::string comp);

    /**
     * @brief Parse a discovery config topic
     *
     * Accepts exactly four or five levels ending in "config". Any other shape
     * (wrong level count, missing "config", empty levels) yields std::nullopt.
     */
    static std::optional<HaId> parse(const std::string& topic);

    /// Full topic with the given last level, e.g. topic("config")
    std::string topic(const std::string& suffix) const;

    /// Topic without base and suffix: "<component>/[<node_id>/]<object_id>"
    std::string short_topic() const;

    /// Stable id for grouping the channels of one component: "<node_id>_<object_id>" or object id
    std::string group_id() const;

    bool has_wildcard() const;

    std::string to_string() const {
        return short_topic();
    }

    bool operator==(const HaId& other) const {
        return base_topic == other.base_topic && component == other.component &&
               node_id == other.node_id && object_id == other.object_id;
    }

    bool operator!=(const HaId& other) const {
        return !(*this == other);
    }

    bool operator<(const HaId& other) const;
};

} // namespace hadisco
