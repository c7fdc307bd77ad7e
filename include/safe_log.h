// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

/**
 * @brief Logging for shutdown and connection-teardown paths
 *
 * Transport close callbacks and session destructors may run after the
 * default logger has been dropped (spdlog::shutdown() at the end of main(),
 * or an hv::EventLoopThread stopping late). These macros skip the call when
 * no default logger is installed.
 *
 * During static destruction even checking spdlog::default_logger() can crash
 * because spdlog's internal mutexes may be destroyed; use fprintf(stderr, ...)
 * in destructors instead.
 */

#define SAFE_LOG_DEBUG(...)                                                                        \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::debug(__VA_ARGS__);                                                            \
        }                                                                                          \
    } while (0)

#define SAFE_LOG_INFO(...)                                                                         \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::info(__VA_ARGS__);                                                             \
        }                                                                                          \
    } while (0)

#define SAFE_LOG_WARN(...)                                                                         \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::warn(__VA_ARGS__);                                                             \
        }                                                                                          \
    } while (0)

#define SAFE_LOG_ERROR(...)                                                                        \
    do {                                                                                           \
        if (spdlog::default_logger()) {                                                            \
            spdlog::error(__VA_ARGS__);                                                            \
        }                                                                                          \
    } while (0)
