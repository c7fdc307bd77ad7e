// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace hadisco {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// A topic level may be "+" but must not contain '/' or '#'
static bool parse_topic_level(const char* str, std::string& out, const char* name,
                              bool allow_empty) {
    if (!allow_empty && *str == '\0') {
        printf("Error: %s must not be empty\n", name);
        return false;
    }
    if (strchr(str, '/') != nullptr || strchr(str, '#') != nullptr) {
        printf("Error: %s must be a single topic level without '/' or '#': %s\n", name, str);
        return false;
    }
    out = str;
    return true;
}

// Accepts "--opt value" and "--opt=value"; advances i past a separate value
static const char* option_value(int argc, char** argv, int& i, const char* long_name,
                                const char* short_name) {
    const size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (strcmp(argv[i], long_name) == 0 || (short_name && strcmp(argv[i], short_name) == 0)) {
        if (i + 1 >= argc) {
            if (short_name) {
                printf("Error: %s/%s requires an argument\n", short_name, long_name);
            } else {
                printf("Error: %s requires an argument\n", long_name);
            }
            return nullptr;
        }
        return argv[++i];
    }
    return nullptr;
}

static bool matches(const char* arg, const char* long_name, const char* short_name) {
    const size_t len = strlen(long_name);
    if (strcmp(arg, long_name) == 0 || (strncmp(arg, long_name, len) == 0 && arg[len] == '=')) {
        return true;
    }
    return short_name && strcmp(arg, short_name) == 0;
}

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Discover Home Assistant MQTT components announced on a broker.\n\n");
    printf("Options:\n");
    printf("  -c, --config <path>    Config file (default: %s)\n", Config::default_path().c_str());
    printf("  -H, --host <host>      MQTT broker host\n");
    printf("  -p, --port <port>      MQTT broker port (1-65535)\n");
    printf("  --base-topic <topic>   Discovery prefix (default: homeassistant)\n");
    printf("  --object-id <id>       Object id or + for all (default: +)\n");
    printf("  --node-id <id>         Node id, empty for none\n");
    printf("  --component <kind>     Component kind or + for all (default: +)\n");
    printf("  -d, --duration <ms>    Discovery time in ms, 0 = until Ctrl-C (default: 5000)\n");
    printf("  --thing <id>           Owner id reported with every component\n");
    printf("  --json                 Print one JSON object per component\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>      Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>      Log file path (when --log-dest=file)\n");
    printf("  -h, --help             Show this help message\n");
    printf("  -V, --version          Show version information\n");
    printf("\nExamples:\n");
    printf("  %s -H broker.local                       # All components, 5 seconds\n",
           program_name);
    printf("  %s --component switch --object-id bedroom -d 0\n", program_name);
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (matches(arg, "--config", "-c")) {
            const char* value = option_value(argc, argv, i, "--config", "-c");
            if (!value)
                return false;
            args.config_path = value;
        }
        // Broker
        else if (matches(arg, "--host", "-H")) {
            const char* value = option_value(argc, argv, i, "--host", "-H");
            if (!value)
                return false;
            if (*value == '\0') {
                printf("Error: --host must not be empty\n");
                return false;
            }
            args.host = value;
        } else if (matches(arg, "--port", "-p")) {
            const char* value = option_value(argc, argv, i, "--port", "-p");
            if (!value || !parse_int(value, 1, 65535, args.port, "port"))
                return false;
        }
        // Discovery topic
        else if (matches(arg, "--base-topic", nullptr)) {
            const char* value = option_value(argc, argv, i, "--base-topic", nullptr);
            if (!value)
                return false;
            if (*value == '\0' || strchr(value, '+') != nullptr || strchr(value, '#') != nullptr) {
                printf("Error: invalid --base-topic (no wildcards, not empty): %s\n", value);
                return false;
            }
            args.base_topic = value;
        } else if (matches(arg, "--object-id", nullptr)) {
            const char* value = option_value(argc, argv, i, "--object-id", nullptr);
            if (!value || !parse_topic_level(value, args.object_id, "--object-id", false))
                return false;
        } else if (matches(arg, "--node-id", nullptr)) {
            const char* value = option_value(argc, argv, i, "--node-id", nullptr);
            if (!value || !parse_topic_level(value, args.node_id, "--node-id", true))
                return false;
        } else if (matches(arg, "--component", nullptr)) {
            const char* value = option_value(argc, argv, i, "--component", nullptr);
            if (!value || !parse_topic_level(value, args.component, "--component", false))
                return false;
        } else if (matches(arg, "--duration", "-d")) {
            const char* value = option_value(argc, argv, i, "--duration", "-d");
            if (!value || !parse_int(value, 0, 86400000, args.duration_ms, "duration"))
                return false;
        } else if (matches(arg, "--thing", nullptr)) {
            const char* value = option_value(argc, argv, i, "--thing", nullptr);
            if (!value)
                return false;
            args.thing_id = value;
        }
        // Output
        else if (strcmp(arg, "--json") == 0) {
            args.json_output = true;
        }
        // Verbosity
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "-vv") == 0 || strcmp(arg, "-vvv") == 0) {
            const char* p = arg;
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        }
        // Logging
        else if (matches(arg, "--log-dest", nullptr)) {
            const char* value = option_value(argc, argv, i, "--log-dest", nullptr);
            if (!value)
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "syslog" &&
                args.log_dest != "file" && args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, syslog, file, console\n");
                return false;
            }
        } else if (matches(arg, "--log-file", nullptr)) {
            const char* value = option_value(argc, argv, i, "--log-file", nullptr);
            if (!value)
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
        }
        // Version
        else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            args.show_version = true;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", arg);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

void apply_cli_overrides(const CliArgs& args, Config& config) {
    if (!args.host.empty())
        config.set<std::string>("/mqtt/host", args.host);
    if (args.port > 0)
        config.set<int>("/mqtt/port", args.port);
    if (!args.base_topic.empty())
        config.set<std::string>("/discovery/base_topic", args.base_topic);
    if (!args.object_id.empty())
        config.set<std::string>("/discovery/object_id", args.object_id);
    if (!args.node_id.empty())
        config.set<std::string>("/discovery/node_id", args.node_id);
    if (!args.component.empty())
        config.set<std::string>("/discovery/component", args.component);
    if (args.duration_ms >= 0)
        config.set<int>("/discovery/duration_ms", args.duration_ms);
    if (!args.thing_id.empty())
        config.set<std::string>("/discovery/thing_id", args.thing_id);
    if (!args.log_dest.empty())
        config.set<std::string>("/log/target", args.log_dest);
    if (!args.log_file.empty())
        config.set<std::string>("/log/file", args.log_file);
}

HaId discovery_topic_from_config(Config& config) {
    std::string base = config.get<std::string>("/discovery/base_topic", "homeassistant");
    std::string object = config.get<std::string>("/discovery/object_id", "+");
    std::string node = config.get<std::string>("/discovery/node_id", "");
    std::string component = config.get<std::string>("/discovery/component", "+");

    if (base.empty())
        base = "homeassistant";
    if (object.empty())
        object = "+";
    if (component.empty())
        component = "+";

    return HaId(base, object, node, component);
}

} // namespace hadisco
