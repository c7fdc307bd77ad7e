// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "discovery_session.h"

#include "mqtt_topic.h"

#include <spdlog/spdlog.h>

#include <cstdio>

namespace hadisco {

namespace {

constexpr const char* CONFIG_SUFFIX = "config";

} // namespace

const char* discovery_state_name(DiscoveryState state) {
    switch (state) {
    case DiscoveryState::CREATED:
        return "CREATED";
    case DiscoveryState::SUBSCRIBING:
        return "SUBSCRIBING";
    case DiscoveryState::RUNNING:
        return "RUNNING";
    case DiscoveryState::FINISHED:
        return "FINISHED";
    }
    return "UNKNOWN";
}

std::shared_ptr<DiscoverySession>
DiscoverySession::create(std::string owner_id, std::shared_ptr<IScheduler> scheduler,
                         std::shared_ptr<const IComponentFactory> factory) {
    return std::make_shared<DiscoverySession>(CreateKey{}, std::move(owner_id),
                                              std::move(scheduler), std::move(factory));
}

DiscoverySession::DiscoverySession(CreateKey, std::string owner_id,
                                   std::shared_ptr<IScheduler> scheduler,
                                   std::shared_ptr<const IComponentFactory> factory)
    : owner_id_(std::move(owner_id)), scheduler_(std::move(scheduler)),
      factory_(std::move(factory)), completion_(promise_.get_future().share()) {}

DiscoverySession::~DiscoverySession() {
    // No other reference exists any more, so no lock is needed.
    // fprintf instead of spdlog: may run during static destruction.
    if (timer_id_ != INVALID_TIMER_ID && scheduler_) {
        scheduler_->cancel(timer_id_);
        timer_id_ = INVALID_TIMER_ID;
    }
    if (subscribed_) {
        if (auto conn = connection_.lock()) {
            conn->unsubscribe(topic_, this);
        }
        subscribed_ = false;
    }
    if (!completed_.exchange(true)) {
        std::fprintf(stderr, "[DiscoverySession] %s destroyed while pending\n", owner_id_.c_str());
        promise_.set_value(DiscoveryResult{DiscoveryError::stopped()});
    }
}

DiscoverySession::CompletionHandle
DiscoverySession::start(const std::shared_ptr<IMqttConnection>& connection, uint32_t duration_ms,
                        const HaId& topic_spec, ComponentDiscoveredCallback observer) {
    std::string topic = topic_spec.topic(CONFIG_SUFFIX);
    const char* invalid = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != DiscoveryState::CREATED) {
            spdlog::warn("[DiscoverySession] {} start() ignored in state {}", owner_id_,
                         discovery_state_name(state_));
            return resolved_handle(DiscoveryResult{DiscoveryError::already_started()});
        }
        if (!connection) {
            invalid = "connection is gone";
        } else if (!observer) {
            invalid = "observer is required";
        } else if (!scheduler_ || !factory_) {
            invalid = "scheduler and factory are required";
        }

        if (invalid) {
            state_ = DiscoveryState::FINISHED;
        } else {
            state_ = DiscoveryState::SUBSCRIBING;
            topic_ = topic;
            duration_ms_ = duration_ms;
            observer_ = std::move(observer);
            connection_ = connection;
            subscribed_ = true;
        }
    }

    if (invalid) {
        spdlog::error("[DiscoverySession] {} cannot start: {}", owner_id_, invalid);
        complete(DiscoveryResult{DiscoveryError::invalid_argument(invalid)});
        return completion_;
    }

    spdlog::info("[DiscoverySession] {} discovering on '{}' ({})", owner_id_, topic,
                 duration_ms > 0 ? std::to_string(duration_ms) + "ms" : "until stopped");

    std::weak_ptr<DiscoverySession> weak_self = weak_from_this();
    connection->subscribe(
        topic, weak_self,
        [weak_self]() {
            if (auto self = weak_self.lock()) {
                self->on_subscribe_success();
            }
        },
        [weak_self](const MqttError& err) {
            if (auto self = weak_self.lock()) {
                spdlog::warn("[DiscoverySession] {} subscribe to '{}' failed: {} ({})",
                             self->owner_id_, err.topic, err.message, err.get_type_string());
                self->finish(DiscoveryError::subscribe_failed(err));
            }
        });

    return completion_;
}

void DiscoverySession::on_subscribe_success() {
    std::string topic;
    uint32_t duration_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != DiscoveryState::SUBSCRIBING) {
            // Acknowledged after stop(): the unsubscribe issued there already
            // cancelled the request and releases the broker side.
            spdlog::debug("[DiscoverySession] {} late subscribe ack for '{}' ignored", owner_id_,
                          topic_);
            return;
        }
        state_ = DiscoveryState::RUNNING;
        duration_ms = duration_ms_;
        topic = topic_;
    }

    if (duration_ms == 0) {
        spdlog::debug("[DiscoverySession] {} subscribed to '{}', no auto-stop", owner_id_, topic);
        complete(DiscoveryResult{});
        return;
    }

    // Schedule outside the lock; a stop() racing with us is detected below
    std::weak_ptr<DiscoverySession> weak_self = weak_from_this();
    TimerId timer = scheduler_->schedule(duration_ms, [weak_self]() {
        if (auto self = weak_self.lock()) {
            self->on_deadline();
        }
    });
    if (timer == INVALID_TIMER_ID) {
        spdlog::error("[DiscoverySession] {} could not arm the {}ms timer", owner_id_,
                      duration_ms);
        finish(DiscoveryError::stopped());
        return;
    }

    bool cancel_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == DiscoveryState::RUNNING) {
            timer_id_ = timer;
        } else {
            cancel_now = true;
        }
    }
    if (cancel_now) {
        scheduler_->cancel(timer);
        return;
    }
    spdlog::debug("[DiscoverySession] {} subscribed to '{}', stopping in {}ms", owner_id_, topic,
                  duration_ms);
}

void DiscoverySession::on_deadline() {
    std::shared_ptr<IMqttConnection> conn;
    std::string topic;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != DiscoveryState::RUNNING) {
            return;
        }
        timer_id_ = INVALID_TIMER_ID;
        state_ = DiscoveryState::FINISHED;
        observer_ = nullptr;
        conn = connection_.lock();
        connection_.reset();
        subscribed_ = false;
        topic = topic_;
    }

    if (conn) {
        conn->unsubscribe(topic, this);
    }
    spdlog::info("[DiscoverySession] {} discovery time elapsed", owner_id_);
    complete(DiscoveryResult{});
}

void DiscoverySession::finish(const DiscoveryError& error) {
    TimerId timer = INVALID_TIMER_ID;
    std::shared_ptr<IMqttConnection> conn;
    std::string topic;
    bool was_subscribed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == DiscoveryState::FINISHED) {
            return;
        }
        state_ = DiscoveryState::FINISHED;
        std::swap(timer, timer_id_);
        observer_ = nullptr;
        conn = connection_.lock();
        connection_.reset();
        was_subscribed = subscribed_;
        subscribed_ = false;
        topic = topic_;
    }

    if (timer != INVALID_TIMER_ID) {
        scheduler_->cancel(timer);
    }
    if (conn && was_subscribed) {
        conn->unsubscribe(topic, this);
    }
    complete(DiscoveryResult{error});
}

void DiscoverySession::stop() {
    spdlog::debug("[DiscoverySession] {} stop requested", owner_id_);
    finish(DiscoveryError::stopped());
}

void DiscoverySession::process_message(const std::string& topic, const std::string& payload) {
    if (!topic_has_suffix(topic, CONFIG_SUFFIX)) {
        return;
    }

    auto id = HaId::parse(topic);
    if (!id) {
        spdlog::debug("[DiscoverySession] {} ignoring malformed discovery topic '{}'", owner_id_,
                      topic);
        return;
    }

    auto result = factory_->create(owner_id_, *id, payload);
    if (!result.ok()) {
        spdlog::debug("[DiscoverySession] Configuration of {} invalid: {}", id->short_topic(),
                      result.rejection);
        return;
    }

    ComponentDiscoveredCallback observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observer = observer_;
    }
    if (!observer) {
        spdlog::trace("[DiscoverySession] {} dropping {} (session finished)", owner_id_,
                      id->short_topic());
        return;
    }

    spdlog::trace("[DiscoverySession] Found {} component {}", id->group_id(), id->component);
    observer(*id, result.component);
}

DiscoveryState DiscoverySession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string DiscoverySession::topic() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return topic_;
}

void DiscoverySession::complete(const DiscoveryResult& result) {
    if (completed_.exchange(true)) {
        spdlog::trace("[DiscoverySession] {} already completed, discarding {}", owner_id_,
                      result.error.get_type_string());
        return;
    }
    promise_.set_value(result);
}

DiscoverySession::CompletionHandle DiscoverySession::resolved_handle(const DiscoveryResult& result) {
    std::promise<DiscoveryResult> promise;
    promise.set_value(result);
    return promise.get_future().share();
}

} // namespace hadisco
