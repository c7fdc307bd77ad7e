// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for hadisco-scan argument parsing and config overrides
 */

#include "cli_args.h"
#include "config.h"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

using namespace hadisco;

namespace {

/// Owns argv storage for parse_cli_args()
class Argv {
  public:
    Argv(std::initializer_list<std::string> args) : storage_{"hadisco-scan"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }

    char** argv() {
        return pointers_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

bool parse(Argv argv, CliArgs& args) {
    return parse_cli_args(argv.argc(), argv.argv(), args);
}

} // namespace

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("CliArgs: nothing set by default", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse(Argv{}, args));

    CHECK(args.config_path.empty());
    CHECK(args.host.empty());
    CHECK(args.port == -1);
    CHECK(args.duration_ms == -1);
    CHECK(args.verbosity == 0);
    CHECK_FALSE(args.json_output);
    CHECK_FALSE(args.show_help);
    CHECK_FALSE(args.overrides_topic());
}

// ============================================================================
// Option forms
// ============================================================================

TEST_CASE("parse_cli_args: broker options", "[cli_args]") {
    CliArgs args;

    SECTION("separate values") {
        REQUIRE(parse(Argv{"--host", "broker.lan", "--port", "8883"}, args));
    }

    SECTION("short options") {
        REQUIRE(parse(Argv{"-H", "broker.lan", "-p", "8883"}, args));
    }

    SECTION("--opt=value") {
        REQUIRE(parse(Argv{"--host=broker.lan", "--port=8883"}, args));
    }

    CHECK(args.host == "broker.lan");
    CHECK(args.port == 8883);
}

TEST_CASE("parse_cli_args: discovery topic options", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse(Argv{"--base-topic", "devices", "--component", "switch", "--object-id",
                       "bedroom", "--node-id=esp", "-d", "0", "--thing", "mqtt:broker:1"},
                  args));

    CHECK(args.base_topic == "devices");
    CHECK(args.component == "switch");
    CHECK(args.object_id == "bedroom");
    CHECK(args.node_id == "esp");
    CHECK(args.duration_ms == 0);
    CHECK(args.thing_id == "mqtt:broker:1");
    CHECK(args.overrides_topic());
}

TEST_CASE("parse_cli_args: single-level wildcard is allowed", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse(Argv{"--component", "+", "--object-id", "+", "--node-id", "+"}, args));
    CHECK(args.component == "+");
    CHECK(args.node_id == "+");
}

TEST_CASE("parse_cli_args: verbosity, output and logging", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse(Argv{"-vv", "--verbose", "--json", "--log-dest", "file", "--log-file",
                       "/tmp/hadisco.log"},
                  args));

    CHECK(args.verbosity == 3);
    CHECK(args.json_output);
    CHECK(args.log_dest == "file");
    CHECK(args.log_file == "/tmp/hadisco.log");
}

TEST_CASE("parse_cli_args: help and version", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse(Argv{"-h"}, args));
    CHECK(args.show_help);

    CliArgs version;
    REQUIRE(parse(Argv{"--version"}, version));
    CHECK(version.show_version);
}

// ============================================================================
// Usage errors
// ============================================================================

TEST_CASE("parse_cli_args: rejects invalid input", "[cli_args][errors]") {
    CliArgs args;

    SECTION("unknown argument") {
        REQUIRE_FALSE(parse(Argv{"--frobnicate"}, args));
    }

    SECTION("missing value") {
        REQUIRE_FALSE(parse(Argv{"--host"}, args));
    }

    SECTION("empty host") {
        REQUIRE_FALSE(parse(Argv{"--host="}, args));
    }

    SECTION("port out of range") {
        REQUIRE_FALSE(parse(Argv{"--port", "0"}, args));
        REQUIRE_FALSE(parse(Argv{"--port", "65536"}, args));
        REQUIRE_FALSE(parse(Argv{"--port", "18x3"}, args));
    }

    SECTION("negative duration") {
        REQUIRE_FALSE(parse(Argv{"-d", "-1"}, args));
    }

    SECTION("multi-level topic values") {
        REQUIRE_FALSE(parse(Argv{"--object-id", "a/b"}, args));
        REQUIRE_FALSE(parse(Argv{"--component", "#"}, args));
        REQUIRE_FALSE(parse(Argv{"--object-id", ""}, args));
    }

    SECTION("wildcard in base topic") {
        REQUIRE_FALSE(parse(Argv{"--base-topic", "+"}, args));
        REQUIRE_FALSE(parse(Argv{"--base-topic", "home/#"}, args));
    }

    SECTION("unknown log destination") {
        REQUIRE_FALSE(parse(Argv{"--log-dest", "cloud"}, args));
        REQUIRE_FALSE(parse(Argv{"--log-dest", "journal"}, args));
    }
}

// ============================================================================
// Config integration
// ============================================================================

TEST_CASE("apply_cli_overrides: only set values replace config", "[cli_args][config]") {
    Config config;
    config.reset_to_defaults();
    config.set<std::string>("/mqtt/host", "from-file.lan");

    CliArgs args;
    args.port = 1884;
    args.component = "light";
    args.duration_ms = 0;
    args.log_dest = "console";

    apply_cli_overrides(args, config);

    CHECK(config.get<std::string>("/mqtt/host") == "from-file.lan");
    CHECK(config.get<int>("/mqtt/port") == 1884);
    CHECK(config.get<std::string>("/discovery/component") == "light");
    CHECK(config.get<std::string>("/discovery/object_id") == "+");
    CHECK(config.get<int>("/discovery/duration_ms") == 0);
    CHECK(config.get<std::string>("/log/target") == "console");
}

TEST_CASE("discovery_topic_from_config", "[cli_args][config]") {
    Config config;
    config.reset_to_defaults();

    SECTION("defaults subscribe to every component") {
        HaId spec = discovery_topic_from_config(config);
        CHECK(spec.topic("config") == "homeassistant/+/+/config");
    }

    SECTION("empty ids become wildcards") {
        config.set<std::string>("/discovery/base_topic", "");
        config.set<std::string>("/discovery/object_id", "");
        config.set<std::string>("/discovery/component", "");
        HaId spec = discovery_topic_from_config(config);
        CHECK(spec.topic("config") == "homeassistant/+/+/config");
    }

    SECTION("fully specified") {
        config.set<std::string>("/discovery/base_topic", "devices");
        config.set<std::string>("/discovery/component", "switch");
        config.set<std::string>("/discovery/node_id", "esp");
        config.set<std::string>("/discovery/object_id", "bedroom");
        HaId spec = discovery_topic_from_config(config);
        CHECK(spec.topic("config") == "devices/switch/esp/bedroom/config");
    }
}
