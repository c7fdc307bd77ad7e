// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for hadisco-scan
 *
 * Values left at their "not set" marker fall back to the config file.
 */

#include "ha_id.h"

#include <string>

namespace hadisco {

class Config;

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; // --config: empty = Config::default_path()

    // Broker
    std::string host; // empty = not set
    int port = -1;    // -1 = not set

    // Discovery topic (empty = not set)
    std::string base_topic;
    std::string object_id;
    std::string node_id;
    std::string component;
    std::string thing_id;
    int duration_ms = -1; // -1 = not set, 0 = run until interrupted

    // Output
    bool json_output = false;

    // Logging
    int verbosity = 0;
    std::string log_dest; // auto, syslog, file, console
    std::string log_file;

    bool show_help = false;
    bool show_version = false;

    /** @brief Check if any discovery topic field was given on the command line */
    bool overrides_topic() const {
        return !base_topic.empty() || !object_id.empty() || !node_id.empty() ||
               !component.empty();
    }
};

/**
 * @brief Parse command-line arguments
 *
 * --help and --version set show_help/show_version and return true; the
 * caller prints and exits.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false on a usage error (message already printed)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_help(const char* program_name);

/**
 * @brief Write every set CLI value into @p config (in memory, not saved)
 */
void apply_cli_overrides(const CliArgs& args, Config& config);

/**
 * @brief Subscription pattern from the /discovery section of @p config
 *
 * An empty object or component id becomes the "+" wildcard.
 */
HaId discovery_topic_from_config(Config& config);

} // namespace hadisco
