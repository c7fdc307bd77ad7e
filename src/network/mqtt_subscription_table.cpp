// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mqtt_subscription_table.h"

#include "mqtt_topic.h"

#include <algorithm>

namespace hadisco {

namespace {

template <typename Registrations>
auto find_key(Registrations& subs, const IMqttMessageSubscriber* key) {
    return std::find_if(subs.begin(), subs.end(), [key](const auto& r) { return r.key == key; });
}

} // namespace

bool MqttSubscriptionTable::add(const std::string& filter,
                                const std::shared_ptr<IMqttMessageSubscriber>& subscriber) {
    auto it = entries_.find(filter);
    if (it == entries_.end()) {
        entries_[filter].subscribers.push_back({subscriber.get(), subscriber});
        return true;
    }

    auto& subs = it->second.subscribers;
    auto pos = find_key(subs, subscriber.get());
    if (pos == subs.end()) {
        subs.push_back({subscriber.get(), subscriber});
    } else {
        // Same address, possibly a new object after the old one was freed
        pos->ref = subscriber;
    }
    return false;
}

bool MqttSubscriptionTable::remove(const std::string& filter,
                                   const IMqttMessageSubscriber* subscriber) {
    auto it = entries_.find(filter);
    if (it == entries_.end()) {
        return false;
    }

    auto& subs = it->second.subscribers;
    auto pos = find_key(subs, subscriber);
    if (pos == subs.end()) {
        return false;
    }
    subs.erase(pos);

    // Drop waiters that belonged to this subscriber; nobody will answer them now
    auto range = waiters_.equal_range(filter);
    for (auto w = range.first; w != range.second;) {
        if (w->second.subscriber == subscriber) {
            w = waiters_.erase(w);
        } else {
            ++w;
        }
    }

    if (subs.empty()) {
        entries_.erase(it);
        return true;
    }
    return false;
}

std::vector<std::string>
MqttSubscriptionTable::remove_all(const IMqttMessageSubscriber* subscriber) {
    std::vector<std::string> emptied;
    std::vector<std::string> candidates;
    for (const auto& [filter, entry] : entries_) {
        candidates.push_back(filter);
    }
    for (const auto& filter : candidates) {
        if (remove(filter, subscriber)) {
            emptied.push_back(filter);
        }
    }
    return emptied;
}

bool MqttSubscriptionTable::contains(const std::string& filter,
                                     const IMqttMessageSubscriber* subscriber) const {
    auto it = entries_.find(filter);
    if (it == entries_.end()) {
        return false;
    }
    const auto& subs = it->second.subscribers;
    return find_key(subs, subscriber) != subs.end();
}

std::vector<std::shared_ptr<IMqttMessageSubscriber>>
MqttSubscriptionTable::match(const std::string& topic) const {
    std::vector<std::shared_ptr<IMqttMessageSubscriber>> result;
    for (const auto& [filter, entry] : entries_) {
        if (!mqtt_topic_matches(filter, topic)) {
            continue;
        }
        for (const auto& reg : entry.subscribers) {
            auto sub = reg.ref.lock();
            if (!sub) {
                // Destroyed; its unsubscribe() is on the way
                continue;
            }
            if (std::find(result.begin(), result.end(), sub) == result.end()) {
                result.push_back(std::move(sub));
            }
        }
    }
    return result;
}

void MqttSubscriptionTable::set_acknowledged(const std::string& filter, bool acked) {
    auto it = entries_.find(filter);
    if (it != entries_.end()) {
        it->second.acknowledged = acked;
    }
}

bool MqttSubscriptionTable::is_acknowledged(const std::string& filter) const {
    auto it = entries_.find(filter);
    return it != entries_.end() && it->second.acknowledged;
}

void MqttSubscriptionTable::add_waiter(const std::string& filter, Waiter waiter) {
    waiters_.emplace(filter, std::move(waiter));
}

std::vector<MqttSubscriptionTable::Waiter>
MqttSubscriptionTable::take_waiters(const std::string& filter) {
    std::vector<Waiter> taken;
    auto range = waiters_.equal_range(filter);
    for (auto it = range.first; it != range.second; ++it) {
        taken.push_back(std::move(it->second));
    }
    waiters_.erase(range.first, range.second);
    return taken;
}

std::vector<MqttSubscriptionTable::Waiter> MqttSubscriptionTable::take_all_waiters() {
    std::vector<Waiter> taken;
    for (auto& [filter, waiter] : waiters_) {
        taken.push_back(std::move(waiter));
    }
    waiters_.clear();
    return taken;
}

std::vector<std::string> MqttSubscriptionTable::filters() const {
    std::vector<std::string> result;
    for (const auto& [filter, entry] : entries_) {
        result.push_back(filter);
    }
    return result;
}

void MqttSubscriptionTable::reset_acknowledgements() {
    for (auto& [filter, entry] : entries_) {
        entry.acknowledged = false;
    }
}

void MqttSubscriptionTable::clear() {
    entries_.clear();
    waiters_.clear();
}

} // namespace hadisco
