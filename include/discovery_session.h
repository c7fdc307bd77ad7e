// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "component.h"
#include "component_factory.h"
#include "discovery_error.h"
#include "ha_id.h"
#include "mqtt_connection.h"
#include "scheduler.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace hadisco {

/**
 * @brief Lifecycle of a discovery session
 *
 * The completion handle is tracked separately: a zero-duration run is
 * RUNNING with an already resolved handle until stop() is called.
 */
enum class DiscoveryState {
    CREATED,     // Constructed, start() not called yet
    SUBSCRIBING, // Waiting for the subscribe acknowledgement
    RUNNING,     // Subscribed and delivering components
    FINISHED     // Unsubscribed; observer and timer released
};

const char* discovery_state_name(DiscoveryState state);

/**
 * @brief One time-limited (or open-ended) component discovery run
 *
 * Subscribes to a wildcard discovery topic, turns every retained "config"
 * message into a Component through an IComponentFactory and hands it to the
 * observer. The completion handle resolves exactly once:
 * - ok when the duration elapsed (or right after subscribing if duration is 0)
 * - SUBSCRIBE_FAILED when the transport refused the subscription
 * - STOPPED when stop() ran first
 *
 * The connection is held weakly: the session never keeps it alive, and a
 * connection that went away simply skips the unsubscribe during cleanup.
 *
 * Threading: process_message() runs on the transport delivery thread, the
 * timer on the scheduler thread, stop() on any thread. All of them may race;
 * the observer and transport are always invoked without the session lock held.
 *
 * @code
 * auto session = DiscoverySession::create("mqtt:homeassistant:broker", scheduler, factory);
 * auto done = session->start(connection, 5000, HaId("homeassistant", "+", "", "+"),
 *                            [](const HaId& id, std::shared_ptr<const Component> c) { ... });
 * DiscoveryResult result = done.get();
 * @endcode
 */
class DiscoverySession : public IMqttMessageSubscriber,
                         public std::enable_shared_from_this<DiscoverySession> {
    /// Restricts construction to create() while still allowing std::make_shared
    struct CreateKey {
        explicit CreateKey() = default;
    };

  public:
    using ComponentDiscoveredCallback =
        std::function<void(const HaId& id, std::shared_ptr<const Component> component)>;
    using CompletionHandle = std::shared_future<DiscoveryResult>;

    /**
     * @brief Create a session in the CREATED state
     *
     * @param owner_id Identifier of the thing components are discovered for
     * @param scheduler Timer source for the auto-stop
     * @param factory Payload to Component conversion
     */
    static std::shared_ptr<DiscoverySession> create(std::string owner_id,
                                                    std::shared_ptr<IScheduler> scheduler,
                                                    std::shared_ptr<const IComponentFactory> factory);

    DiscoverySession(CreateKey, std::string owner_id, std::shared_ptr<IScheduler> scheduler,
                     std::shared_ptr<const IComponentFactory> factory);
    ~DiscoverySession() override;

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    /**
     * @brief Subscribe to <topic_spec>/config and start reporting components
     *
     * Never throws. A null connection or observer resolves the handle with
     * INVALID_ARGUMENT; a second start() returns a separate, already resolved
     * handle with ALREADY_STARTED and leaves the running session untouched.
     *
     * @param connection Broker connection, referenced weakly
     * @param duration_ms Auto-stop delay; 0 keeps the subscription until stop()
     * @param topic_spec Base topic, component, node and object ids ("+" allowed)
     * @param observer Called once per accepted config message
     * @return Completion handle
     */
    CompletionHandle start(const std::shared_ptr<IMqttConnection>& connection,
                           uint32_t duration_ms, const HaId& topic_spec,
                           ComponentDiscoveredCallback observer);

    /**
     * @brief Handle one message from the subscribed filter
     *
     * Topics not ending in "/config", unparsable topics and rejected payloads
     * are dropped. No network I/O happens here.
     */
    void process_message(const std::string& topic, const std::string& payload) override;

    /**
     * @brief End the session
     *
     * Cancels the timer, drops the observer, unsubscribes and resolves the
     * handle with STOPPED unless it was already resolved. Idempotent.
     */
    void stop();

    DiscoveryState state() const;

    /// Subscribed topic filter (empty before start())
    std::string topic() const;

    const std::string& owner_id() const {
        return owner_id_;
    }

    /// Same handle start() returned
    CompletionHandle completion() const {
        return completion_;
    }

    bool is_completed() const {
        return completed_.load();
    }

  private:
    void on_subscribe_success();
    void on_deadline();

    /// Shared cleanup for stop() and subscribe failure
    void finish(const DiscoveryError& error);

    /// Resolve the handle; later calls are discarded
    void complete(const DiscoveryResult& result);

    static CompletionHandle resolved_handle(const DiscoveryResult& result);

    const std::string owner_id_;
    const std::shared_ptr<IScheduler> scheduler_;
    const std::shared_ptr<const IComponentFactory> factory_;

    mutable std::mutex mutex_;
    DiscoveryState state_ = DiscoveryState::CREATED;
    std::string topic_;
    uint32_t duration_ms_ = 0;
    ComponentDiscoveredCallback observer_;
    std::weak_ptr<IMqttConnection> connection_;
    TimerId timer_id_ = INVALID_TIMER_ID;
    bool subscribed_ = false; // subscribe() issued, unsubscribe() not yet

    std::promise<DiscoveryResult> promise_;
    CompletionHandle completion_;
    std::atomic<bool> completed_{false};
};

} // namespace hadisco
