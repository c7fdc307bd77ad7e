// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hv/EventLoop.h"

#include <cstdint>
#include <functional>

namespace hadisco {

/// @brief Identifier of a scheduled one-shot task (valid IDs > 0)
using TimerId = uint64_t;

/** @brief Invalid timer ID constant */
constexpr TimerId INVALID_TIMER_ID = 0;

/**
 * @brief One-shot delayed task execution
 *
 * Allows dependency injection of a manually advanced clock for testing.
 */
class IScheduler {
  public:
    virtual ~IScheduler() = default;

    /**
     * @brief Run @p task once after @p delay_ms
     * @return Timer ID for cancel(), or INVALID_TIMER_ID if the task could not be scheduled
     */
    virtual TimerId schedule(uint32_t delay_ms, std::function<void()> task) = 0;

    /**
     * @brief Cancel a pending task
     *
     * Safe to call with INVALID_TIMER_ID or an already fired timer (no-op).
     * A task already executing is not interrupted.
     */
    virtual void cancel(TimerId id) = 0;
};

/**
 * @brief IScheduler running tasks on a libhv event loop
 *
 * Tasks execute on the loop thread, the same thread that delivers MQTT
 * messages when the loop is shared with HvMqttConnection.
 */
class HvScheduler : public IScheduler {
  public:
    explicit HvScheduler(hv::EventLoopPtr loop) : loop_(std::move(loop)) {}

    TimerId schedule(uint32_t delay_ms, std::function<void()> task) override;
    void cancel(TimerId id) override;

  private:
    hv::EventLoopPtr loop_;
};

} // namespace hadisco
