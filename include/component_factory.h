// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "component.h"
#include "ha_id.h"

#include <memory>
#include <string>

namespace hadisco {

/**
 * @brief Outcome of turning a config payload into a component
 *
 * Either component is set, or rejection explains why the payload was refused.
 */
struct ComponentParseResult {
    std::shared_ptr<const Component> component;
    std::string rejection;

    bool ok() const {
        return component != nullptr;
    }

    static ComponentParseResult accepted(std::shared_ptr<const Component> c) {
        ComponentParseResult r;
        r.component = std::move(c);
        return r;
    }

    static ComponentParseResult rejected(std::string reason) {
        ComponentParseResult r;
        r.rejection = std::move(reason);
        return r;
    }
};

/**
 * @brief Builds components from discovery payloads
 *
 * Implementations must be pure computation: they run on the transport's
 * message-delivery thread and must not block.
 */
class IComponentFactory {
  public:
    virtual ~IComponentFactory() = default;

    /**
     * @param owner_id Identifier of the thing the discovery runs for
     * @param id Identifier parsed from the config topic
     * @param config_text Payload decoded as text
     */
    virtual ComponentParseResult create(const std::string& owner_id, const HaId& id,
                                        const std::string& config_text) const = 0;
};

/**
 * @brief Default factory for Home Assistant style JSON discovery payloads
 *
 * Validation rules:
 * - payload must be a JSON object with a non-empty "name"
 * - the topic's component level must be a known ComponentKind
 * - sensor and binary_sensor need "state_topic", camera needs "topic"
 * - "qos" must be 0, 1 or 2
 */
class ComponentFactory : public IComponentFactory {
  public:
    ComponentParseResult create(const std::string& owner_id, const HaId& id,
                                const std::string& config_text) const override;

    /**
     * @brief Expand abbreviated keys and substitute the "~" base topic
     *
     * "stat_t" becomes "state_topic", "dev": {"ids": ...} becomes
     * "device": {"identifiers": ...}, and "~/set" with "~": "home/lamp"
     * becomes "home/lamp/set". Unknown keys are kept as-is.
     */
    static json expand_config(const json& config);
};

} // namespace hadisco
