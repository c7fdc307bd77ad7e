// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_SCHEDULER_H
#define MOCK_SCHEDULER_H

/**
 * @file mock_scheduler.h
 * @brief Manually advanced scheduler for testing
 *
 * Nothing runs until the test calls advance(). Tasks due within the advanced
 * window run in due-time order, on the calling thread, without the internal
 * lock held. schedule()/cancel() may be called from other threads meanwhile.
 *
 * @example
 * auto scheduler = std::make_shared<MockScheduler>();
 * scheduler->schedule(5000, [] { ... });
 * scheduler->advance(4999); // nothing runs
 * scheduler->advance(1);    // task runs
 */

#include "scheduler.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

using namespace hadisco;

class MockScheduler : public IScheduler {
  public:
    TimerId schedule(uint32_t delay_ms, std::function<void()> task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        TimerId id = next_id_++;
        tasks_.emplace(id, Task{now_ms_ + delay_ms, std::move(task)});
        ++scheduled_count_;
        return id;
    }

    void cancel(TimerId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.erase(id) > 0) {
            ++cancelled_count_;
        }
    }

    // =========================================================================
    // Test Control Methods
    // =========================================================================

    /// Move the clock forward by @p ms, running every task that becomes due
    void advance(uint64_t ms) {
        uint64_t target = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target = now_ms_ + ms;
        }
        while (true) {
            std::function<void()> task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto next = tasks_.end();
                for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
                    if (it->second.due_ms <= target &&
                        (next == tasks_.end() || it->second.due_ms < next->second.due_ms)) {
                        next = it;
                    }
                }
                if (next == tasks_.end()) {
                    now_ms_ = target;
                    return;
                }
                now_ms_ = next->second.due_ms;
                task = std::move(next->second.fn);
                tasks_.erase(next);
            }
            task();
        }
    }

    uint64_t now_ms() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_ms_;
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    size_t scheduled_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return scheduled_count_;
    }

    size_t cancelled_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_count_;
    }

  private:
    struct Task {
        uint64_t due_ms;
        std::function<void()> fn;
    };

    mutable std::mutex mutex_;
    uint64_t now_ms_ = 0;
    TimerId next_id_ = 1;
    std::map<TimerId, Task> tasks_;
    size_t scheduled_count_ = 0;
    size_t cancelled_count_ = 0;
};

#endif // MOCK_SCHEDULER_H
