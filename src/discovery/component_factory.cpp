// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "component_factory.h"

#include "json_utils.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace hadisco {

namespace {

// Home Assistant discovery abbreviations (subset covering the supported kinds)
const std::unordered_map<std::string, std::string>& config_abbreviations() {
    static const std::unordered_map<std::string, std::string> table = {
        {"avty_t", "availability_topic"},
        {"bri_cmd_t", "brightness_command_topic"},
        {"bri_scl", "brightness_scale"},
        {"bri_stat_t", "brightness_state_topic"},
        {"cmd_t", "command_topic"},
        {"curr_temp_t", "current_temperature_topic"},
        {"dev", "device"},
        {"dev_cla", "device_class"},
        {"ent_cat", "entity_category"},
        {"exp_aft", "expire_after"},
        {"frc_upd", "force_update"},
        {"ic", "icon"},
        {"json_attr_t", "json_attributes_topic"},
        {"mode_cmd_t", "mode_command_topic"},
        {"mode_stat_t", "mode_state_topic"},
        {"obj_id", "object_id"},
        {"opt", "optimistic"},
        {"pct_cmd_t", "percentage_command_topic"},
        {"pct_stat_t", "percentage_state_topic"},
        {"pl_arm_away", "payload_arm_away"},
        {"pl_arm_home", "payload_arm_home"},
        {"pl_avail", "payload_available"},
        {"pl_cls", "payload_close"},
        {"pl_disarm", "payload_disarm"},
        {"pl_lock", "payload_lock"},
        {"pl_not_avail", "payload_not_available"},
        {"pl_off", "payload_off"},
        {"pl_on", "payload_on"},
        {"pl_open", "payload_open"},
        {"pl_stop", "payload_stop"},
        {"pl_unlk", "payload_unlock"},
        {"pos_t", "position_topic"},
        {"ret", "retain"},
        {"set_pos_t", "set_position_topic"},
        {"stat_cla", "state_class"},
        {"stat_t", "state_topic"},
        {"stat_tpl", "state_template"},
        {"t", "topic"},
        {"temp_cmd_t", "temperature_command_topic"},
        {"temp_stat_t", "temperature_state_topic"},
        {"uniq_id", "unique_id"},
        {"unit_of_meas", "unit_of_measurement"},
        {"val_tpl", "value_template"},
    };
    return table;
}

const std::unordered_map<std::string, std::string>& device_abbreviations() {
    static const std::unordered_map<std::string, std::string> table = {
        {"cns", "connections"},     {"hw", "hw_version"}, {"ids", "identifiers"},
        {"mdl", "model"},           {"mf", "manufacturer"}, {"sa", "suggested_area"},
        {"sw", "sw_version"},
    };
    return table;
}

json expand_keys(const json& obj, const std::unordered_map<std::string, std::string>& table) {
    json out = json::object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        auto found = table.find(it.key());
        const std::string& key = found != table.end() ? found->second : it.key();
        // Full key wins over its abbreviation when both are present
        if (found != table.end() && key != it.key() && obj.contains(key)) {
            continue;
        }
        out[key] = it.value();
    }
    return out;
}

bool is_topic_key(const std::string& key) {
    static const std::string suffix = "_topic";
    if (key == "topic") {
        return true;
    }
    return key.size() > suffix.size() &&
           key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string substitute_base(const std::string& value, const std::string& base) {
    if (!value.empty() && value.front() == '~') {
        return base + value.substr(1);
    }
    if (!value.empty() && value.back() == '~') {
        return value.substr(0, value.size() - 1) + base;
    }
    return value;
}

DeviceInfo parse_device(const json& dev) {
    DeviceInfo info;
    if (!dev.is_object()) {
        return info;
    }
    info.identifiers = json_util::string_list(dev, "identifiers");
    info.name = json_util::safe_string(dev, "name");
    info.manufacturer = json_util::safe_string(dev, "manufacturer");
    info.model = json_util::safe_string(dev, "model");
    info.sw_version = json_util::safe_string(dev, "sw_version");
    return info;
}

ComponentChannel make_channel(const std::string& id, std::string state_topic,
                              std::string command_topic) {
    ComponentChannel ch;
    ch.id = id;
    ch.state_topic = std::move(state_topic);
    ch.command_topic = std::move(command_topic);
    ch.readonly = ch.command_topic.empty();
    return ch;
}

/// Add a channel only if the payload names at least one of its topics
void add_optional_channel(std::vector<ComponentChannel>& channels, const json& cfg,
                          const std::string& id, const char* state_key,
                          const char* command_key) {
    const bool has_state = state_key != nullptr && cfg.contains(state_key);
    const bool has_command = command_key != nullptr && cfg.contains(command_key);
    if (!has_state && !has_command) {
        return;
    }
    channels.push_back(
        make_channel(id, has_state ? json_util::safe_string(cfg, state_key) : "",
                     has_command ? json_util::safe_string(cfg, command_key) : ""));
}

/// "qos" as an integer 0..2 (a decimal string is tolerated); absent or null means 0
std::optional<int> parse_qos(const json& cfg) {
    if (!cfg.contains("qos") || cfg["qos"].is_null()) {
        return 0;
    }
    const auto& v = cfg["qos"];
    if (v.is_number_unsigned()) {
        uint64_t q = v.get<uint64_t>();
        return q <= 2 ? std::optional<int>(static_cast<int>(q)) : std::nullopt;
    }
    if (v.is_number_integer()) {
        int64_t q = v.get<int64_t>();
        return (q >= 0 && q <= 2) ? std::optional<int>(static_cast<int>(q)) : std::nullopt;
    }
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.size() == 1 && s[0] >= '0' && s[0] <= '2') {
            return s[0] - '0';
        }
    }
    // Floats, booleans, arrays and objects
    return std::nullopt;
}

std::vector<ComponentChannel> derive_channels(ComponentKind kind, const ComponentConfig& config,
                                              const json& cfg) {
    std::vector<ComponentChannel> channels;
    switch (kind) {
    case ComponentKind::SWITCH:
        channels.push_back(make_channel("switch", config.state_topic, config.command_topic));
        break;
    case ComponentKind::LIGHT:
        channels.push_back(make_channel("light", config.state_topic, config.command_topic));
        add_optional_channel(channels, cfg, "brightness", "brightness_state_topic",
                             "brightness_command_topic");
        break;
    case ComponentKind::LOCK:
        channels.push_back(make_channel("lock", config.state_topic, config.command_topic));
        break;
    case ComponentKind::FAN:
        channels.push_back(make_channel("fan", config.state_topic, config.command_topic));
        add_optional_channel(channels, cfg, "percentage", "percentage_state_topic",
                             "percentage_command_topic");
        break;
    case ComponentKind::COVER:
        channels.push_back(make_channel("cover", config.state_topic, config.command_topic));
        add_optional_channel(channels, cfg, "position", "position_topic", "set_position_topic");
        break;
    case ComponentKind::SENSOR:
    case ComponentKind::BINARY_SENSOR:
        channels.push_back(make_channel("sensor", config.state_topic, ""));
        break;
    case ComponentKind::CAMERA:
        channels.push_back(make_channel("camera", config.topic, ""));
        break;
    case ComponentKind::CLIMATE:
        add_optional_channel(channels, cfg, "mode", "mode_state_topic", "mode_command_topic");
        add_optional_channel(channels, cfg, "temperature", "temperature_state_topic",
                             "temperature_command_topic");
        add_optional_channel(channels, cfg, "current_temperature", "current_temperature_topic",
                             nullptr);
        break;
    case ComponentKind::ALARM_CONTROL_PANEL:
        channels.push_back(make_channel("alarm", config.state_topic, config.command_topic));
        break;
    }
    return channels;
}

} // namespace

json ComponentFactory::expand_config(const json& config) {
    json out = expand_keys(config, config_abbreviations());

    if (out.contains("device") && out["device"].is_object()) {
        out["device"] = expand_keys(out["device"], device_abbreviations());
    }

    const std::string base = json_util::safe_string(out, "~");
    if (base.empty()) {
        return out;
    }
    for (auto it = out.begin(); it != out.end(); ++it) {
        if (is_topic_key(it.key()) && it.value().is_string()) {
            it.value() = substitute_base(it.value().get<std::string>(), base);
        }
    }
    return out;
}

ComponentParseResult ComponentFactory::create(const std::string& owner_id, const HaId& id,
                                              const std::string& config_text) const {
    auto kind = parse_component_kind(id.component);
    if (!kind) {
        return ComponentParseResult::rejected("unsupported component kind '" + id.component +
                                              "'");
    }

    json cfg;
    try {
        json parsed = json::parse(config_text);
        if (!parsed.is_object()) {
            return ComponentParseResult::rejected("configuration is not a JSON object");
        }
        cfg = expand_config(parsed);
    } catch (const json::parse_error& e) {
        return ComponentParseResult::rejected(std::string("invalid JSON: ") + e.what());
    }

    ComponentConfig config;
    try {
        config.name = json_util::safe_string(cfg, "name");
        config.unique_id = json_util::safe_string(cfg, "unique_id");
        config.device_class = json_util::safe_string(cfg, "device_class");
        config.icon = json_util::safe_string(cfg, "icon");
        config.unit_of_measurement = json_util::safe_string(cfg, "unit_of_measurement");
        config.state_topic = json_util::safe_string(cfg, "state_topic");
        config.command_topic = json_util::safe_string(cfg, "command_topic");
        config.availability_topic = json_util::safe_string(cfg, "availability_topic");
        config.value_template = json_util::safe_string(cfg, "value_template");
        config.payload_on = json_util::safe_string(cfg, "payload_on", "ON");
        config.payload_off = json_util::safe_string(cfg, "payload_off", "OFF");
        config.topic = json_util::safe_string(cfg, "topic");
        config.retain = json_util::safe_bool(cfg, "retain", false);
        if (cfg.contains("device")) {
            config.device = parse_device(cfg["device"]);
        }
    } catch (const json::exception& e) {
        return ComponentParseResult::rejected(std::string("malformed field: ") + e.what());
    }

    if (config.name.empty()) {
        return ComponentParseResult::rejected("missing required field 'name'");
    }
    auto qos = parse_qos(cfg);
    if (!qos) {
        return ComponentParseResult::rejected("qos must be 0, 1 or 2 (got " + cfg["qos"].dump() +
                                              ")");
    }
    config.qos = *qos;
    if ((*kind == ComponentKind::SENSOR || *kind == ComponentKind::BINARY_SENSOR) &&
        config.state_topic.empty()) {
        return ComponentParseResult::rejected("missing required field 'state_topic'");
    }
    if (*kind == ComponentKind::CAMERA && config.topic.empty()) {
        return ComponentParseResult::rejected("missing required field 'topic'");
    }

    auto channels = derive_channels(*kind, config, cfg);
    spdlog::trace("[ComponentFactory] Built {} '{}' with {} channel(s)", id.short_topic(),
                  config.name, channels.size());

    return ComponentParseResult::accepted(std::make_shared<const Component>(
        *kind, id, owner_id, std::move(config), std::move(cfg), std::move(channels)));
}

} // namespace hadisco
