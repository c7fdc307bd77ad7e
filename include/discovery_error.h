// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef HADISCO_DISCOVERY_ERROR_H
#define HADISCO_DISCOVERY_ERROR_H

#include "mqtt_error.h"

#include <string>

namespace hadisco {

/**
 * @brief Reasons a discovery session finished without success
 */
enum class DiscoveryErrorType {
    NONE,             // Finished normally (timer elapsed, or zero duration subscribed)
    SUBSCRIBE_FAILED, // Transport refused or lost the subscription
    STOPPED,          // stop() was called before natural completion
    ALREADY_STARTED,  // start() on a session that was already started
    INVALID_ARGUMENT  // start() with a dead connection or without observer
};

/**
 * @brief Error carried by a finished discovery session
 *
 * For SUBSCRIBE_FAILED the transport failure is kept in @ref cause.
 */
struct DiscoveryError {
    DiscoveryErrorType type = DiscoveryErrorType::NONE;
    std::string message;
    MqttError cause;

    bool has_error() const {
        return type != DiscoveryErrorType::NONE;
    }

    std::string get_type_string() const {
        switch (type) {
        case DiscoveryErrorType::NONE:
            return "NONE";
        case DiscoveryErrorType::SUBSCRIBE_FAILED:
            return "SUBSCRIBE_FAILED";
        case DiscoveryErrorType::STOPPED:
            return "STOPPED";
        case DiscoveryErrorType::ALREADY_STARTED:
            return "ALREADY_STARTED";
        case DiscoveryErrorType::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        }
        return "UNKNOWN";
    }

    static DiscoveryError stopped() {
        DiscoveryError err;
        err.type = DiscoveryErrorType::STOPPED;
        err.message = "Stopped";
        return err;
    }

    static DiscoveryError subscribe_failed(const MqttError& transport_error) {
        DiscoveryError err;
        err.type = DiscoveryErrorType::SUBSCRIBE_FAILED;
        err.cause = transport_error;
        err.message = "Subscribe to '" + transport_error.topic + "' failed: " +
                      transport_error.message;
        return err;
    }

    static DiscoveryError already_started() {
        DiscoveryError err;
        err.type = DiscoveryErrorType::ALREADY_STARTED;
        err.message = "Discovery session already started";
        return err;
    }

    static DiscoveryError invalid_argument(const std::string& what) {
        DiscoveryError err;
        err.type = DiscoveryErrorType::INVALID_ARGUMENT;
        err.message = what;
        return err;
    }
};

/**
 * @brief Value delivered through a session's completion handle
 */
struct DiscoveryResult {
    DiscoveryError error;

    bool ok() const {
        return !error.has_error();
    }
};

} // namespace hadisco

#endif // HADISCO_DISCOVERY_ERROR_H
