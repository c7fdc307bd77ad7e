// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "mqtt_error.h"

#include <functional>
#include <memory>
#include <string>

namespace hadisco {

/**
 * @brief Receiver of messages for a subscribed topic filter
 *
 * process_message() is called on the transport's delivery thread for every
 * message whose topic matches a filter the subscriber registered.
 */
class IMqttMessageSubscriber {
  public:
    virtual ~IMqttMessageSubscriber() = default;

    virtual void process_message(const std::string& topic, const std::string& payload) = 0;
};

/**
 * @brief Abstract broker connection used by discovery
 *
 * Allows dependency injection of mock implementations for testing. The
 * connection holds subscribers weakly and locks them for the duration of each
 * delivery, so a subscriber released on another thread is never called after
 * its destruction. unsubscribe() identifies the subscriber by address and is
 * safe to call from its destructor.
 */
class IMqttConnection {
  public:
    using SuccessCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const MqttError&)>;

    virtual ~IMqttConnection() = default;

    /**
     * @brief Subscribe @p subscriber to a topic filter
     *
     * Exactly one of @p on_success / @p on_error is invoked, possibly
     * synchronously from within this call, unless unsubscribe() cancels the
     * request first. A callback already being dispatched when unsubscribe()
     * runs may still arrive afterwards and must be tolerated.
     *
     * on_success means the broker answered the SUBSCRIBE. A transport that
     * cannot see the SUBACK return code (HvMqttConnection: libhv drops it)
     * reports a refused filter (return code 0x80) through on_success as well;
     * no messages arrive for it.
     *
     * @param topic Topic filter (MQTT wildcards allowed)
     * @param subscriber Message sink, held weakly
     * @param on_success Invoked once the broker acknowledged the subscription
     * @param on_error Invoked with the failure cause
     */
    virtual void subscribe(const std::string& topic,
                           std::weak_ptr<IMqttMessageSubscriber> subscriber,
                           SuccessCallback on_success, ErrorCallback on_error) = 0;

    /**
     * @brief Remove @p subscriber from a topic filter
     *
     * Safe to call for a subscriber that is not registered (no-op).
     */
    virtual void unsubscribe(const std::string& topic,
                             const IMqttMessageSubscriber* subscriber) = 0;

    virtual bool is_connected() const = 0;
};

} // namespace hadisco
