// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef HADISCO_MQTT_ERROR_H
#define HADISCO_MQTT_ERROR_H

#include <string>

namespace hadisco {

/**
 * @brief Error types for MQTT transport operations
 */
enum class MqttErrorType {
    NONE,               // No error
    NOT_CONNECTED,      // Client has no broker session
    SUBSCRIBE_REJECTED, // Broker or client refused the subscription
    CONNECTION_LOST,    // Session closed while the request was pending
    UNKNOWN             // Unknown error
};

/**
 * @brief Failure cause reported by an IMqttConnection
 */
struct MqttError {
    MqttErrorType type = MqttErrorType::NONE;
    int code = 0;        // libhv / broker return code if applicable
    std::string message; // Human-readable error message
    std::string topic;   // Topic filter the request was for

    bool has_error() const {
        return type != MqttErrorType::NONE;
    }

    std::string get_type_string() const {
        switch (type) {
        case MqttErrorType::NONE:
            return "NONE";
        case MqttErrorType::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case MqttErrorType::SUBSCRIBE_REJECTED:
            return "SUBSCRIBE_REJECTED";
        case MqttErrorType::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case MqttErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    static MqttError not_connected(const std::string& topic_filter) {
        MqttError err;
        err.type = MqttErrorType::NOT_CONNECTED;
        err.topic = topic_filter;
        err.message = "MQTT client is not connected";
        return err;
    }

    static MqttError connection_lost(const std::string& topic_filter = "") {
        MqttError err;
        err.type = MqttErrorType::CONNECTION_LOST;
        err.topic = topic_filter;
        err.message = "MQTT connection lost";
        return err;
    }

    static MqttError rejected(const std::string& topic_filter, int code,
                              const std::string& what) {
        MqttError err;
        err.type = MqttErrorType::SUBSCRIBE_REJECTED;
        err.topic = topic_filter;
        err.code = code;
        err.message = what;
        return err;
    }
};

} // namespace hadisco

#endif // HADISCO_MQTT_ERROR_H
