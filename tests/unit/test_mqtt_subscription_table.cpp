// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mqtt_subscription_table.h"

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

using namespace hadisco;

namespace {

class RecordingSubscriber : public IMqttMessageSubscriber {
  public:
    void process_message(const std::string& topic, const std::string& payload) override {
        received.emplace_back(topic, payload);
    }

    std::vector<std::pair<std::string, std::string>> received;
};

} // namespace

class SubscriptionTableFixture {
  protected:
    MqttSubscriptionTable table;
    std::shared_ptr<RecordingSubscriber> first = std::make_shared<RecordingSubscriber>();
    std::shared_ptr<RecordingSubscriber> second = std::make_shared<RecordingSubscriber>();
};

// ============================================================================
// Registration
// ============================================================================

TEST_CASE_METHOD(SubscriptionTableFixture, "MqttSubscriptionTable: one broker SUBSCRIBE per filter",
                 "[mqtt][subscriptions]") {
    REQUIRE(table.add("homeassistant/+/+/config", first));
    REQUIRE_FALSE(table.add("homeassistant/+/+/config", second));
    REQUIRE_FALSE(table.add("homeassistant/+/+/config", first)); // duplicate is a no-op

    REQUIRE(table.size() == 1);
    REQUIRE(table.contains("homeassistant/+/+/config", first.get()));
    REQUIRE(table.contains("homeassistant/+/+/config", second.get()));
    REQUIRE_FALSE(table.contains("homeassistant/light/+/config", first.get()));
}

TEST_CASE_METHOD(SubscriptionTableFixture,
                 "MqttSubscriptionTable: UNSUBSCRIBE only when the last subscriber leaves",
                 "[mqtt][subscriptions]") {
    table.add("a/+/config", first);
    table.add("a/+/config", second);

    REQUIRE_FALSE(table.remove("a/+/config", first.get()));
    REQUIRE(table.contains("a/+/config", second.get()));
    REQUIRE(table.remove("a/+/config", second.get()));
    REQUIRE(table.size() == 0);

    // Unknown filter or subscriber
    REQUIRE_FALSE(table.remove("a/+/config", first.get()));
    table.add("b/config", first);
    REQUIRE_FALSE(table.remove("b/config", second.get()));
}

TEST_CASE_METHOD(SubscriptionTableFixture, "MqttSubscriptionTable: remove_all",
                 "[mqtt][subscriptions]") {
    table.add("a/config", first);
    table.add("b/config", first);
    table.add("b/config", second);

    auto emptied = table.remove_all(first.get());

    REQUIRE(emptied == std::vector<std::string>{"a/config"});
    REQUIRE(table.filters() == std::vector<std::string>{"b/config"});
}

// ============================================================================
// Delivery
// ============================================================================

TEST_CASE_METHOD(SubscriptionTableFixture,
                 "MqttSubscriptionTable: match lists each subscriber once",
                 "[mqtt][subscriptions]") {
    table.add("homeassistant/+/+/config", first);
    table.add("homeassistant/#", first);
    table.add("homeassistant/light/+/config", second);

    auto light = table.match("homeassistant/light/porch/config");
    REQUIRE(light.size() == 2);

    auto sw = table.match("homeassistant/switch/hall/config");
    REQUIRE(sw.size() == 1);
    REQUIRE(sw[0] == first);

    REQUIRE(table.match("other/light/porch/config").empty());
}

TEST_CASE_METHOD(SubscriptionTableFixture,
                 "MqttSubscriptionTable: destroyed subscribers are never matched",
                 "[mqtt][subscriptions]") {
    table.add("homeassistant/+/+/config", first);
    table.add("homeassistant/+/+/config", second);

    const IMqttMessageSubscriber* gone = first.get();
    first.reset();

    auto targets = table.match("homeassistant/switch/hall/config");
    REQUIRE(targets.size() == 1);
    REQUIRE(targets[0] == second);

    // Its registration stays until the owner unsubscribes by address
    REQUIRE(table.contains("homeassistant/+/+/config", gone));
    REQUIRE_FALSE(table.remove("homeassistant/+/+/config", gone));
    REQUIRE_FALSE(table.contains("homeassistant/+/+/config", gone));
}

TEST_CASE_METHOD(SubscriptionTableFixture,
                 "MqttSubscriptionTable: matched subscribers outlive their owner's reference",
                 "[mqtt][subscriptions]") {
    table.add("a/config", first);
    std::weak_ptr<RecordingSubscriber> weak = first;

    auto targets = table.match("a/config");
    first.reset();

    // The delivery in progress keeps it alive
    REQUIRE_FALSE(weak.expired());
    targets[0]->process_message("a/config", "{}");
    REQUIRE(weak.lock()->received.size() == 1);

    targets.clear();
    REQUIRE(weak.expired());
}

// ============================================================================
// Acknowledgements and waiters
// ============================================================================

TEST_CASE_METHOD(SubscriptionTableFixture, "MqttSubscriptionTable: acknowledgement tracking",
                 "[mqtt][subscriptions]") {
    table.add("a/config", first);
    REQUIRE_FALSE(table.is_acknowledged("a/config"));

    table.set_acknowledged("a/config", true);
    REQUIRE(table.is_acknowledged("a/config"));

    table.reset_acknowledgements();
    REQUIRE_FALSE(table.is_acknowledged("a/config"));
    REQUIRE(table.contains("a/config", first.get()));

    // Unknown filters are never acknowledged
    table.set_acknowledged("b/config", true);
    REQUIRE_FALSE(table.is_acknowledged("b/config"));
}

TEST_CASE_METHOD(SubscriptionTableFixture, "MqttSubscriptionTable: waiters",
                 "[mqtt][subscriptions]") {
    int successes = 0;
    table.add("a/config", first);
    table.add("a/config", second);
    table.add_waiter("a/config", {first.get(), [&successes]() { ++successes; }, nullptr});
    table.add_waiter("a/config", {second.get(), [&successes]() { ++successes; }, nullptr});

    SECTION("one SUBACK answers every waiter of the filter") {
        auto waiters = table.take_waiters("a/config");
        REQUIRE(waiters.size() == 2);
        for (auto& w : waiters) {
            w.on_success();
        }
        REQUIRE(successes == 2);
        REQUIRE(table.take_waiters("a/config").empty());
    }

    SECTION("a subscriber that leaves drops its waiter") {
        table.remove("a/config", first.get());
        auto waiters = table.take_waiters("a/config");
        REQUIRE(waiters.size() == 1);
        REQUIRE(waiters[0].subscriber == second.get());
    }

    SECTION("connection close takes every waiter") {
        table.add("b/config", first);
        table.add_waiter("b/config", {first.get(), nullptr, nullptr});
        REQUIRE(table.take_all_waiters().size() == 3);
        REQUIRE(table.take_all_waiters().empty());
    }

    SECTION("clear forgets everything") {
        table.clear();
        REQUIRE(table.size() == 0);
        REQUIRE(table.take_all_waiters().empty());
    }
}
