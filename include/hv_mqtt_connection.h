// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hv/EventLoop.h"
#include "hv/mqtt_client.h"
#include "mqtt_connection.h"
#include "mqtt_subscription_table.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace hadisco {

/**
 * @brief IMqttConnection backed by libhv's MQTT client
 *
 * Threading model:
 * - All broker I/O and message delivery happen on the supplied hv::EventLoop
 * - subscribe()/unsubscribe() may be called from any thread; the broker
 *   request is queued onto the loop with runInLoop()
 * - Subscriber callbacks are copied under lock and invoked outside it
 * - Subscribers are held weakly; each delivery locks them, so dropping the
 *   last reference on another thread never frees one mid-delivery
 * - A broker refusal inside SUBACK (0x80) is not visible through libhv and
 *   is reported as success
 *
 * Several local subscribers can share one topic filter; the broker sees a
 * single SUBSCRIBE and a single UNSUBSCRIBE when the last subscriber leaves.
 * After an automatic reconnect every remaining filter is re-subscribed.
 */
class HvMqttConnection : public IMqttConnection {
  public:
    struct Options {
        std::string client_id;
        std::string username;
        std::string password;
        int keepalive_sec = 60;
        int connect_timeout_ms = 5000;
        bool auto_reconnect = true;
    };

    explicit HvMqttConnection(hv::EventLoopPtr loop);
    ~HvMqttConnection() override;

    // Non-copyable (owns the libhv client)
    HvMqttConnection(const HvMqttConnection&) = delete;
    HvMqttConnection& operator=(const HvMqttConnection&) = delete;

    /**
     * @brief Open the broker session
     *
     * @param host Broker host name or address
     * @param port Broker port (usually 1883)
     * @param options Client id, credentials and timeouts
     * @param on_connected Invoked on the loop thread after CONNACK
     * @param on_disconnected Invoked on the loop thread when the session closes
     * @return 0 on success, non-zero libhv error code otherwise
     */
    int connect(const std::string& host, int port, const Options& options,
                std::function<void()> on_connected, std::function<void()> on_disconnected);

    /// Close the session; pending subscribes fail with CONNECTION_LOST. Idempotent.
    void disconnect();

    void subscribe(const std::string& topic, std::weak_ptr<IMqttMessageSubscriber> subscriber,
                   SuccessCallback on_success, ErrorCallback on_error) override;
    void unsubscribe(const std::string& topic, const IMqttMessageSubscriber* subscriber) override;

    bool is_connected() const override {
        return connected_.load();
    }

  private:
    void handle_connect();
    void handle_close();
    void handle_message(const std::string& topic, const std::string& payload);
    void handle_suback(const std::string& filter);

    /// Send SUBSCRIBE for @p filter; must run on the loop thread
    void send_subscribe(const std::string& filter);

    hv::EventLoopPtr loop_;
    std::unique_ptr<hv::MqttClient> client_;
    MqttSubscriptionTable table_;
    mutable std::mutex mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};

    std::function<void()> on_connected_;
    std::function<void()> on_disconnected_;
};

} // namespace hadisco
