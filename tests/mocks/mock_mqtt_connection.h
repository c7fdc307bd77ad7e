// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_MQTT_CONNECTION_H
#define MOCK_MQTT_CONNECTION_H

/**
 * @file mock_mqtt_connection.h
 * @brief In-memory broker connection for testing
 *
 * Records every subscribe/unsubscribe call and lets the test decide when (and
 * how) a subscription is answered:
 * - AckMode::IMMEDIATE_SUCCESS answers on_success from inside subscribe()
 * - AckMode::IMMEDIATE_FAILURE answers on_error with the set_failure_error() error
 * - AckMode::MANUAL keeps the request pending until ack_pending()/fail_pending()
 *
 * publish() delivers a message synchronously to every registered subscriber
 * whose filter matches, like the broker's delivery thread would. Subscribers
 * are held weakly and locked for the delivery, as HvMqttConnection does.
 * Unlike the real connection, unsubscribe() leaves MANUAL requests pending so
 * a test can replay an acknowledgement that was already in flight.
 *
 * Recording is mutex-guarded; callbacks run without the lock held, so
 * stop()/ack/publish may race from different threads.
 *
 * @example
 * auto conn = std::make_shared<MockMqttConnection>();
 * conn->set_ack_mode(MockMqttConnection::AckMode::MANUAL);
 * session->start(conn, 5000, topic_filter, observer);
 * conn->ack_pending();
 * conn->publish("homeassistant/switch/bedroom/config", R"({"name":"Bedroom"})");
 */

#include "mqtt_connection.h"
#include "mqtt_topic.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace hadisco;

class MockMqttConnection : public IMqttConnection {
  public:
    enum class AckMode { IMMEDIATE_SUCCESS, IMMEDIATE_FAILURE, MANUAL };

    struct Call {
        std::string topic;
        const IMqttMessageSubscriber* subscriber = nullptr;
        std::weak_ptr<IMqttMessageSubscriber> ref;
    };

    MockMqttConnection() = default;
    ~MockMqttConnection() override = default;

    // Non-copyable
    MockMqttConnection(const MockMqttConnection&) = delete;
    MockMqttConnection& operator=(const MockMqttConnection&) = delete;

    void subscribe(const std::string& topic, std::weak_ptr<IMqttMessageSubscriber> subscriber,
                   SuccessCallback on_success, ErrorCallback on_error) override {
        const IMqttMessageSubscriber* key = nullptr;
        if (auto sub = subscriber.lock()) {
            key = sub.get();
        }

        AckMode mode = AckMode::IMMEDIATE_SUCCESS;
        MqttError err;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            mode = ack_mode_;
            err = failure_error_;
            subscribe_calls_.push_back({topic, key, subscriber});
            if (mode == AckMode::MANUAL) {
                pending_.push_back({std::move(on_success), std::move(on_error)});
            }
            // A refused subscription never becomes active
            if (mode != AckMode::IMMEDIATE_FAILURE) {
                active_.push_back({topic, key, subscriber});
            }
        }

        if (mode == AckMode::IMMEDIATE_SUCCESS && on_success) {
            on_success();
        } else if (mode == AckMode::IMMEDIATE_FAILURE && on_error) {
            err.topic = topic;
            on_error(err);
        }
    }

    void unsubscribe(const std::string& topic, const IMqttMessageSubscriber* subscriber) override {
        std::lock_guard<std::mutex> lock(mutex_);
        unsubscribe_calls_.push_back({topic, subscriber, {}});
        active_.erase(std::remove_if(active_.begin(), active_.end(),
                                     [&](const Call& c) {
                                         return c.topic == topic && c.subscriber == subscriber;
                                     }),
                      active_.end());
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    // =========================================================================
    // Test Control Methods
    // =========================================================================

    void set_ack_mode(AckMode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        ack_mode_ = mode;
    }

    void set_connected(bool connected) {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = connected;
    }

    /// Error reported in IMMEDIATE_FAILURE mode (topic is filled in per call)
    void set_failure_error(const MqttError& err) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_error_ = err;
    }

    /// Answer every pending subscribe with success (MANUAL mode)
    void ack_pending() {
        auto pending = take_pending();
        for (auto& p : pending) {
            if (p.first) {
                p.first();
            }
        }
    }

    /// Answer every pending subscribe with @p err (MANUAL mode)
    void fail_pending(const MqttError& err) {
        auto pending = take_pending();
        for (auto& p : pending) {
            if (p.second) {
                p.second(err);
            }
        }
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    /**
     * @brief Deliver a message to every live subscriber whose filter matches
     * @return Number of subscribers the message was delivered to
     */
    size_t publish(const std::string& topic, const std::string& payload) {
        std::vector<std::shared_ptr<IMqttMessageSubscriber>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& a : active_) {
                if (!mqtt_topic_matches(a.topic, topic)) {
                    continue;
                }
                auto sub = a.ref.lock();
                if (sub && std::find(targets.begin(), targets.end(), sub) == targets.end()) {
                    targets.push_back(std::move(sub));
                }
            }
        }
        for (const auto& sub : targets) {
            sub->process_message(topic, payload);
        }
        return targets.size();
    }

    std::vector<Call> subscribe_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribe_calls_;
    }

    std::vector<Call> unsubscribe_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unsubscribe_calls_;
    }

    /// Number of unsubscribe() calls for @p topic
    size_t unsubscribe_count(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(
            std::count_if(unsubscribe_calls_.begin(), unsubscribe_calls_.end(),
                          [&topic](const Call& c) { return c.topic == topic; }));
    }

    bool is_subscribed(const std::string& topic, const IMqttMessageSubscriber* subscriber) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(active_.begin(), active_.end(), [&](const Call& c) {
            return c.topic == topic && c.subscriber == subscriber;
        });
    }

    size_t active_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.size();
    }

  private:
    std::vector<std::pair<SuccessCallback, ErrorCallback>> take_pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pending = std::move(pending_);
        pending_.clear();
        return pending;
    }

    mutable std::mutex mutex_;

    AckMode ack_mode_ = AckMode::IMMEDIATE_SUCCESS;
    bool connected_ = true;
    MqttError failure_error_ = MqttError::rejected("", 128, "Subscription refused by broker");

    std::vector<Call> subscribe_calls_;
    std::vector<Call> unsubscribe_calls_;
    std::vector<Call> active_;
    std::vector<std::pair<SuccessCallback, ErrorCallback>> pending_;
};

#endif // MOCK_MQTT_CONNECTION_H
