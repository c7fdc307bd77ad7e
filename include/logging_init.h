// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace hadisco {
namespace logging {

/**
 * @brief Where hadisco-scan writes its log
 *
 * The console sink is stderr, so stdout stays free for discovery output.
 */
enum class LogTarget {
    Auto,   ///< File when a log file is configured, otherwise Console
    Syslog, ///< syslog(3); Console on platforms without it
    File,   ///< Rotating log file
    Console ///< stderr only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true; ///< Keep stderr next to a Syslog/File target
    std::string file_path;      ///< Empty picks $XDG_STATE_HOME/hadisco/hadisco.log
};

/// Target init() will use: Auto resolved against @p config.file_path
LogTarget effective_target(const LogConfig& config);

/**
 * @brief Install the default "hadisco" logger
 *
 * Builds the sinks for effective_target(), makes the logger spdlog's default
 * and matches libhv's own log level. A log file that cannot be opened falls
 * back to stderr with a warning. Call once from main().
 */
void init(const LogConfig& config);

/// Level from its name ("trace".."off", "warning" alias); @p def if unrecognized
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum def = spdlog::level::warn);

/// -v count to level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// spdlog level to libhv's LOG_LEVEL_* value
int to_hv_level(spdlog::level::level_enum level);

/**
 * @brief Pick the effective level
 *
 * CLI verbosity wins, then the config file value, then warn.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace hadisco
