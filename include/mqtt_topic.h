// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace hadisco {

/// Split an MQTT topic or filter on '/' keeping empty levels ("a//b" has three levels)
std::vector<std::string> split_topic_levels(const std::string& topic);

/**
 * @brief Check whether a topic name matches a subscription filter
 *
 * Implements MQTT 3.1.1 section 4.7 matching: '+' matches exactly one level,
 * '#' (last level only) matches the parent level and any number of children.
 * Topics starting with '$' are not matched by a leading wildcard.
 */
bool mqtt_topic_matches(const std::string& filter, const std::string& topic);

/// True if @p topic ends with "/<suffix>" (or equals suffix)
bool topic_has_suffix(const std::string& topic, const std::string& suffix);

} // namespace hadisco
