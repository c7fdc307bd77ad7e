// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file hv_mqtt_connection.cpp
 * @brief libhv MQTT client adapter used by discovery sessions
 *
 * @pattern Shared broker subscription per filter, two-phase callback dispatch
 * @threading Broker callbacks run on the hv::EventLoop thread
 * @gotchas libhv only reports SUBACK through the ack callback without its
 *          return code, so a filter the broker refused (0x80) is reported as
 *          subscribed; only send failures and closed sessions become errors
 */

#include "hv_mqtt_connection.h"

#include "safe_log.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <vector>

namespace hadisco {

namespace {

// Discovery configs are retained QoS 1 messages; QoS 1 also guarantees a SUBACK callback
constexpr int SUBSCRIBE_QOS = 1;

// Reconnect backoff bounds (milliseconds)
constexpr uint32_t RECONNECT_MIN_DELAY_MS = 1000;
constexpr uint32_t RECONNECT_MAX_DELAY_MS = 30000;

} // namespace

HvMqttConnection::HvMqttConnection(hv::EventLoopPtr loop) : loop_(std::move(loop)) {
    client_ = std::make_unique<hv::MqttClient>(loop_ ? loop_->loop() : nullptr);

    client_->onConnect = [this](hv::MqttClient*) { handle_connect(); };
    client_->onClose = [this](hv::MqttClient*) { handle_close(); };
    client_->onMessage = [this](hv::MqttClient*, mqtt_message_t* msg) {
        if (!msg || !msg->topic) {
            return;
        }
        std::string topic(msg->topic, msg->topic_len);
        std::string payload;
        if (msg->payload && msg->payload_len > 0) {
            payload.assign(msg->payload, msg->payload_len);
        }
        handle_message(topic, payload);
    };
}

HvMqttConnection::~HvMqttConnection() {
    // fprintf: may run during static destruction
    fprintf(stderr, "[HvMqttConnection] Destructor called\n");
    on_connected_ = nullptr;
    on_disconnected_ = nullptr;
    disconnect();
}

int HvMqttConnection::connect(const std::string& host, int port, const Options& options,
                              std::function<void()> on_connected,
                              std::function<void()> on_disconnected) {
    on_connected_ = std::move(on_connected);
    on_disconnected_ = std::move(on_disconnected);
    closing_.store(false);

    if (!options.client_id.empty()) {
        client_->setID(options.client_id.c_str());
    }
    if (!options.username.empty()) {
        client_->setAuth(options.username.c_str(), options.password.c_str());
    }
    client_->setPingInterval(options.keepalive_sec);
    client_->setConnectTimeout(options.connect_timeout_ms);

    if (options.auto_reconnect) {
        reconn_setting_t reconn;
        reconn_setting_init(&reconn);
        reconn.min_delay = RECONNECT_MIN_DELAY_MS;
        reconn.max_delay = RECONNECT_MAX_DELAY_MS;
        reconn.delay_policy = 2; // exponential
        client_->setReconnect(&reconn);
    }

    spdlog::info("[HvMqttConnection] Connecting to {}:{} (client_id: {})", host, port,
                 options.client_id.empty() ? "<generated>" : options.client_id);

    int ret = client_->connect(host.c_str(), port);
    if (ret != 0) {
        spdlog::error("[HvMqttConnection] connect() to {}:{} failed: {}", host, port, ret);
    }
    return ret;
}

void HvMqttConnection::disconnect() {
    if (closing_.exchange(true)) {
        return;
    }
    if (client_ && client_->isConnected()) {
        client_->disconnect();
    }
}

void HvMqttConnection::subscribe(const std::string& topic,
                                 std::weak_ptr<IMqttMessageSubscriber> subscriber,
                                 SuccessCallback on_success, ErrorCallback on_error) {
    auto sub = subscriber.lock();
    if (!sub || topic.empty()) {
        if (on_error) {
            on_error(MqttError::rejected(topic, -1, "Invalid topic filter or subscriber"));
        }
        return;
    }

    bool needs_broker = false;
    bool acknowledged = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        needs_broker = table_.add(topic, sub);
        acknowledged = table_.is_acknowledged(topic);
        if (!acknowledged) {
            table_.add_waiter(topic, {sub.get(), on_success, on_error});
        }
    }

    if (acknowledged) {
        // Filter already active on the broker for another local subscriber
        spdlog::debug("[HvMqttConnection] Joined existing subscription {}", topic);
        if (on_success) {
            on_success();
        }
        return;
    }

    if (!connected_.load()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            table_.remove(topic, sub.get());
        }
        spdlog::warn("[HvMqttConnection] Cannot subscribe to {}: not connected", topic);
        if (on_error) {
            on_error(MqttError::not_connected(topic));
        }
        return;
    }

    if (needs_broker) {
        loop_->runInLoop([this, topic]() { send_subscribe(topic); });
    }
}

void HvMqttConnection::unsubscribe(const std::string& topic,
                                   const IMqttMessageSubscriber* subscriber) {
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last = table_.remove(topic, subscriber);
    }

    if (last && connected_.load()) {
        spdlog::debug("[HvMqttConnection] Unsubscribing {}", topic);
        loop_->runInLoop([this, topic]() {
            if (client_->unsubscribe(topic.c_str()) < 0) {
                spdlog::warn("[HvMqttConnection] UNSUBSCRIBE {} could not be sent", topic);
            }
        });
    }
}

void HvMqttConnection::send_subscribe(const std::string& filter) {
    spdlog::debug("[HvMqttConnection] SUBSCRIBE {}", filter);

    int mid = client_->subscribe(filter.c_str(), SUBSCRIBE_QOS,
                                 [this, filter](hv::MqttClient*) { handle_suback(filter); });
    if (mid >= 0) {
        return;
    }

    std::vector<MqttSubscriptionTable::Waiter> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed = table_.take_waiters(filter);
        for (const auto& w : failed) {
            table_.remove(filter, w.subscriber);
        }
    }

    spdlog::error("[HvMqttConnection] SUBSCRIBE {} failed: {}", filter, mid);
    for (auto& w : failed) {
        if (w.on_error) {
            w.on_error(MqttError::rejected(filter, mid, "Subscribe request could not be sent"));
        }
    }
}

void HvMqttConnection::handle_suback(const std::string& filter) {
    std::vector<MqttSubscriptionTable::Waiter> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        table_.set_acknowledged(filter, true);
        ready = table_.take_waiters(filter);
    }

    spdlog::debug("[HvMqttConnection] SUBACK {} ({} waiter(s))", filter, ready.size());
    for (auto& w : ready) {
        if (w.on_success) {
            w.on_success();
        }
    }
}

void HvMqttConnection::handle_connect() {
    connected_.store(true);

    std::vector<std::string> filters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        filters = table_.filters();
    }

    spdlog::info("[HvMqttConnection] Connected, restoring {} subscription(s)", filters.size());
    for (const auto& filter : filters) {
        send_subscribe(filter);
    }

    if (on_connected_) {
        on_connected_();
    }
}

void HvMqttConnection::handle_close() {
    bool was_connected = connected_.exchange(false);

    std::vector<std::pair<std::string, MqttSubscriptionTable::Waiter>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        table_.reset_acknowledgements();
        for (const auto& filter : table_.filters()) {
            for (auto& w : table_.take_waiters(filter)) {
                table_.remove(filter, w.subscriber);
                failed.emplace_back(filter, std::move(w));
            }
        }
    }

    if (was_connected) {
        SAFE_LOG_INFO("[HvMqttConnection] Connection closed");
    } else {
        SAFE_LOG_WARN("[HvMqttConnection] Connection attempt failed or closed");
    }

    for (auto& [filter, w] : failed) {
        if (w.on_error) {
            w.on_error(MqttError::connection_lost(filter));
        }
    }

    if (on_disconnected_) {
        on_disconnected_();
    }
}

void HvMqttConnection::handle_message(const std::string& topic, const std::string& payload) {
    // Locked references: a subscriber released elsewhere lives until its delivery returns
    std::vector<std::shared_ptr<IMqttMessageSubscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = table_.match(topic);
    }

    spdlog::trace("[HvMqttConnection] {} ({} bytes) -> {} subscriber(s)", topic, payload.size(),
                  targets.size());
    for (const auto& sub : targets) {
        sub->process_message(topic, payload);
    }
}

} // namespace hadisco
