// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "mqtt_connection.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hadisco {

/**
 * @brief Bookkeeping for broker subscriptions shared between local subscribers
 *
 * Several local subscribers may register the same topic filter; the broker
 * only sees one SUBSCRIBE per filter. The table tracks which filters the broker
 * acknowledged and which subscribe callbacks are still waiting for that ack.
 *
 * Subscribers are held weakly and identified by address. match() returns
 * locked references, so a subscriber stays alive while a delivery is in
 * progress even if its owner drops it on another thread.
 *
 * Not thread-safe. The owning connection guards it with its own mutex and
 * invokes the returned callbacks outside that lock.
 */
class MqttSubscriptionTable {
  public:
    struct Waiter {
        const IMqttMessageSubscriber* subscriber = nullptr;
        IMqttConnection::SuccessCallback on_success;
        IMqttConnection::ErrorCallback on_error;
    };

    /**
     * @brief Register @p subscriber for @p filter
     * @return true if the filter is new and a broker SUBSCRIBE must be sent
     */
    bool add(const std::string& filter, const std::shared_ptr<IMqttMessageSubscriber>& subscriber);

    /**
     * @brief Remove @p subscriber from @p filter
     * @return true if no subscriber is left and a broker UNSUBSCRIBE must be sent
     */
    bool remove(const std::string& filter, const IMqttMessageSubscriber* subscriber);

    /// Remove @p subscriber from every filter; returns filters that became empty
    std::vector<std::string> remove_all(const IMqttMessageSubscriber* subscriber);

    bool contains(const std::string& filter, const IMqttMessageSubscriber* subscriber) const;

    /// Live subscribers of every filter matching @p topic, each listed once
    std::vector<std::shared_ptr<IMqttMessageSubscriber>> match(const std::string& topic) const;

    void set_acknowledged(const std::string& filter, bool acked);
    bool is_acknowledged(const std::string& filter) const;

    void add_waiter(const std::string& filter, Waiter waiter);

    /// Take waiters of @p filter (all of them are answered by one SUBACK)
    std::vector<Waiter> take_waiters(const std::string& filter);

    /// Take every pending waiter, e.g. when the connection closes
    std::vector<Waiter> take_all_waiters();

    /// All filters with at least one subscriber (for re-subscribing after reconnect)
    std::vector<std::string> filters() const;

    /// Forget acknowledgements, keep subscribers (connection dropped)
    void reset_acknowledgements();

    void clear();

    size_t size() const {
        return entries_.size();
    }

  private:
    struct Registration {
        const IMqttMessageSubscriber* key = nullptr;
        std::weak_ptr<IMqttMessageSubscriber> ref;
    };

    struct Entry {
        std::vector<Registration> subscribers;
        bool acknowledged = false;
    };

    std::map<std::string, Entry> entries_;
    std::multimap<std::string, Waiter> waiters_;
};

} // namespace hadisco
