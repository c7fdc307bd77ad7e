// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scheduler.h"

#include <spdlog/spdlog.h>

namespace hadisco {

TimerId HvScheduler::schedule(uint32_t delay_ms, std::function<void()> task) {
    if (!loop_ || !task) {
        spdlog::warn("[HvScheduler] Cannot schedule task: {}", loop_ ? "empty task" : "no loop");
        return INVALID_TIMER_ID;
    }

    // setTimeout() is thread-safe: it allocates the id and queues the timer onto the loop
    hv::TimerID id = loop_->setTimeout(static_cast<int>(delay_ms),
                                       [task = std::move(task)](hv::TimerID) { task(); });
    spdlog::trace("[HvScheduler] Scheduled timer {} in {}ms", id, delay_ms);
    return static_cast<TimerId>(id);
}

void HvScheduler::cancel(TimerId id) {
    if (!loop_ || id == INVALID_TIMER_ID) {
        return;
    }

    auto loop = loop_;
    loop_->runInLoop([loop, id]() { loop->killTimer(static_cast<hv::TimerID>(id)); });
    spdlog::trace("[HvScheduler] Cancelled timer {}", id);
}

} // namespace hadisco
