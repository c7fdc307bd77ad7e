// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scheduler.h"

#include "../mocks/mock_scheduler.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "hv/EventLoopThread.h"

#include <catch2/catch_all.hpp>

using namespace hadisco;

// ============================================================================
// MockScheduler (used by every session test, so pin its behaviour down)
// ============================================================================

TEST_CASE("MockScheduler: tasks run when their time comes", "[scheduler][mock]") {
    MockScheduler scheduler;
    std::vector<int> order;

    scheduler.schedule(300, [&order]() { order.push_back(3); });
    scheduler.schedule(100, [&order]() { order.push_back(1); });
    scheduler.schedule(200, [&order]() { order.push_back(2); });

    scheduler.advance(99);
    REQUIRE(order.empty());

    scheduler.advance(151);
    REQUIRE(order == std::vector<int>{1, 2});
    REQUIRE(scheduler.now_ms() == 250);

    scheduler.advance(50);
    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE(scheduler.pending_count() == 0);
}

TEST_CASE("MockScheduler: cancel", "[scheduler][mock]") {
    MockScheduler scheduler;
    bool fired = false;

    TimerId id = scheduler.schedule(100, [&fired]() { fired = true; });
    REQUIRE(id != INVALID_TIMER_ID);

    scheduler.cancel(id);
    scheduler.cancel(id);
    scheduler.advance(1000);

    REQUIRE_FALSE(fired);
    REQUIRE(scheduler.cancelled_count() == 1);
    REQUIRE(scheduler.scheduled_count() == 1);
}

// ============================================================================
// HvScheduler on a real libhv loop
// ============================================================================

class HvSchedulerFixture {
  public:
    HvSchedulerFixture() {
        loop_thread.start();
        scheduler = std::make_shared<HvScheduler>(loop_thread.loop());
    }

    ~HvSchedulerFixture() {
        loop_thread.stop();
        loop_thread.join();
    }

  protected:
    hv::EventLoopThread loop_thread;
    std::shared_ptr<HvScheduler> scheduler;
};

TEST_CASE_METHOD(HvSchedulerFixture, "HvScheduler: task fires on the loop thread",
                 "[scheduler][hv][slow]") {
    std::promise<std::thread::id> fired;
    auto result = fired.get_future();

    TimerId id = scheduler->schedule(20, [&fired]() { fired.set_value(std::this_thread::get_id()); });
    REQUIRE(id != INVALID_TIMER_ID);

    REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(result.get() != std::this_thread::get_id());
}

TEST_CASE_METHOD(HvSchedulerFixture, "HvScheduler: cancelled task never fires",
                 "[scheduler][hv][slow]") {
    std::atomic<bool> cancelled_fired{false};
    std::promise<void> later;
    auto later_done = later.get_future();

    TimerId id = scheduler->schedule(200, [&cancelled_fired]() { cancelled_fired = true; });
    scheduler->cancel(id);

    // A later timer proves the loop got past the cancelled deadline
    scheduler->schedule(400, [&later]() { later.set_value(); });

    REQUIRE(later_done.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE_FALSE(cancelled_fired.load());
}

TEST_CASE("HvScheduler: refuses without a loop or task", "[scheduler][hv]") {
    HvScheduler no_loop(nullptr);
    REQUIRE(no_loop.schedule(10, []() {}) == INVALID_TIMER_ID);
    no_loop.cancel(1); // no-op

    hv::EventLoopThread loop_thread;
    loop_thread.start();
    HvScheduler scheduler(loop_thread.loop());
    REQUIRE(scheduler.schedule(10, nullptr) == INVALID_TIMER_ID);
    loop_thread.stop();
    loop_thread.join();
}
