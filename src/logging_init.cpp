// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#include "hv/hlog.h"

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace hadisco {
namespace logging {

namespace {

constexpr const char* LOG_IDENT = "hadisco";

// Rotating file: 5MB per file, 3 rotated files
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

/// $XDG_STATE_HOME/hadisco/hadisco.log (~/.local/state when unset)
std::string default_log_file() {
    std::string state_home;
    const char* xdg = std::getenv("XDG_STATE_HOME");
    const char* home = std::getenv("HOME");
    if (xdg && xdg[0] != '\0') {
        state_home = xdg;
    } else if (home && home[0] != '\0') {
        state_home = std::string(home) + "/.local/state";
    } else {
        state_home = "/tmp";
    }

    std::string dir = state_home + "/hadisco";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return dir + "/hadisco.log";
}

} // namespace

LogTarget effective_target(const LogConfig& config) {
    if (config.target != LogTarget::Auto) {
        return config.target;
    }
    return config.file_path.empty() ? LogTarget::Console : LogTarget::File;
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    LogTarget target = effective_target(config);
    std::string file_error;

    if (target == LogTarget::File) {
        std::string path = config.file_path.empty() ? default_log_file() : config.file_path;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, LOG_FILE_MAX_BYTES, LOG_FILE_COUNT));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
            target = LogTarget::Console;
        }
    }
#ifdef __linux__
    if (target == LogTarget::Syslog) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>(LOG_IDENT, LOG_PID, LOG_USER, false));
    }
#else
    if (target == LogTarget::Syslog) {
        target = LogTarget::Console;
    }
#endif

    if (target == LogTarget::Console || config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(LOG_IDENT, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // libhv writes its own log file by default; route its verbosity to ours
    hlog_set_level(to_hv_level(config.level));

    if (!file_error.empty()) {
        spdlog::warn("[Logging] Log file unavailable, using stderr: {}", file_error);
    }
    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str, spdlog::level::level_enum def) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return def;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    case spdlog::level::off:
    default:
        return LOG_LEVEL_SILENT;
    }
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace hadisco
