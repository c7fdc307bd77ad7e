// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief hadisco-scan: list the Home Assistant components announced on a broker
 *
 * Exit codes: 0 success, 1 connection or subscription failure, 2 usage error.
 */

#include "cli_args.h"
#include "component_factory.h"
#include "config.h"
#include "discovery_session.h"
#include "hadisco_version.h"
#include "hv_mqtt_connection.h"
#include "logging_init.h"
#include "scheduler.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

#include "hv/EventLoopThread.h"

using namespace hadisco;

namespace {

constexpr int EXIT_FAILURE_RUNTIME = 1;
constexpr int EXIT_USAGE = 2;

// Extra wait on top of the libhv connect timeout before giving up
constexpr int CONNECT_GRACE_MS = 1000;
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

volatile std::sig_atomic_t g_quit = 0;

void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

void setup_signal_handlers() {
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
}

void print_component(const HaId& id, const Component& component, bool as_json) {
    if (as_json) {
        std::printf("%s\n", component.to_json().dump().c_str());
    } else {
        std::printf("%-40s %s\n", id.short_topic().c_str(), component.config().name.c_str());
        for (const auto& ch : component.channels()) {
            std::printf("    %-20s state=%s%s%s\n", ch.id.c_str(),
                        ch.state_topic.empty() ? "-" : ch.state_topic.c_str(),
                        ch.readonly ? "" : " command=",
                        ch.readonly ? "" : ch.command_topic.c_str());
        }
    }
    std::fflush(stdout);
}

logging::LogConfig make_log_config(const CliArgs& args, Config& config) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config.get<std::string>("/log/level", ""));
    log_config.target = logging::parse_log_target(config.get<std::string>("/log/target", "auto"));
    log_config.file_path = config.get<std::string>("/log/file", "");
    return log_config;
}

/// Connect on the loop thread and wait for CONNACK
bool connect_broker(const hv::EventLoopPtr& loop, const std::shared_ptr<HvMqttConnection>& conn,
                    Config& config) {
    const std::string host = config.get<std::string>("/mqtt/host", "127.0.0.1");
    const int port = config.get<int>("/mqtt/port", 1883);

    HvMqttConnection::Options options;
    options.client_id = config.get<std::string>("/mqtt/client_id", "");
    options.username = config.get<std::string>("/mqtt/username", "");
    options.password = config.get<std::string>("/mqtt/password", "");
    options.keepalive_sec = config.get<int>("/mqtt/keepalive_sec", 60);

    // Reconnects fire the callbacks again; only the first outcome counts
    auto reported = std::make_shared<std::atomic<bool>>(false);
    auto outcome = std::make_shared<std::promise<bool>>();
    auto result = outcome->get_future();
    auto report = [reported, outcome](bool ok) {
        if (!reported->exchange(true)) {
            outcome->set_value(ok);
        }
    };

    loop->runInLoop([conn, host, port, options, report]() {
        int ret = conn->connect(
            host, port, options, [report]() { report(true); }, [report]() { report(false); });
        if (ret != 0) {
            report(false);
        }
    });

    auto timeout = std::chrono::milliseconds(options.connect_timeout_ms + CONNECT_GRACE_MS);
    if (result.wait_for(timeout) != std::future_status::ready) {
        spdlog::error("[Main] Timed out connecting to {}:{}", host, port);
        return false;
    }
    if (!result.get()) {
        spdlog::error("[Main] Could not connect to {}:{}", host, port);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return EXIT_USAGE;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.show_version) {
        std::printf("hadisco-scan %s\n", hadisco_version());
        return 0;
    }

    setup_signal_handlers();

    // Quiet default logger until the configured one is installed
    spdlog::set_level(logging::verbosity_to_level(args.verbosity));

    Config* config = Config::get_instance();
    config->init(args.config_path.empty() ? Config::default_path() : args.config_path);
    apply_cli_overrides(args, *config);

    logging::init(make_log_config(args, *config));
    spdlog::info("[Main] hadisco-scan {} starting", hadisco_version());

    const HaId topic = discovery_topic_from_config(*config);
    const int duration_ms = config->get<int>("/discovery/duration_ms", 5000);
    const std::string thing_id = config->get<std::string>("/discovery/thing_id", "hadisco");
    if (duration_ms < 0) {
        std::fprintf(stderr, "Error: /discovery/duration_ms must not be negative\n");
        return EXIT_USAGE;
    }

    hv::EventLoopThread loop_thread;
    loop_thread.start();
    hv::EventLoopPtr loop = loop_thread.loop();

    auto connection = std::make_shared<HvMqttConnection>(loop);
    // Function scope: a delivery already running on the loop thread may still
    // call the observer after stop(), and the observer uses these
    std::shared_ptr<DiscoverySession> session;
    std::mutex output_mutex;
    size_t found = 0;
    int exit_code = 0;

    if (!connect_broker(loop, connection, *config)) {
        exit_code = EXIT_FAILURE_RUNTIME;
    } else {
        auto scheduler = std::make_shared<HvScheduler>(loop);
        auto factory = std::make_shared<ComponentFactory>();
        session = DiscoverySession::create(thing_id, scheduler, factory);

        const bool as_json = args.json_output;
        auto on_component = [&output_mutex, &found, as_json](
                                const HaId& id, std::shared_ptr<const Component> c) {
            std::lock_guard<std::mutex> lock(output_mutex);
            ++found;
            print_component(id, *c, as_json);
        };
        auto done = session->start(connection, static_cast<uint32_t>(duration_ms), topic,
                                   on_component);

        while (!g_quit && done.wait_for(POLL_INTERVAL) != std::future_status::ready) {
        }

        // Zero duration resolves once subscribed; keep listening until interrupted
        if (duration_ms == 0 && done.wait_for(std::chrono::seconds(0)) ==
                                    std::future_status::ready && done.get().ok()) {
            while (!g_quit) {
                std::this_thread::sleep_for(POLL_INTERVAL);
            }
        }

        session->stop();
        const DiscoveryResult result = done.get();
        size_t total = 0;
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            total = found;
        }

        switch (result.error.type) {
        case DiscoveryErrorType::NONE:
        case DiscoveryErrorType::STOPPED:
            spdlog::info("[Main] Discovery finished: {} component(s)", total);
            break;
        default:
            spdlog::error("[Main] Discovery failed: {} ({})", result.error.message,
                          result.error.get_type_string());
            exit_code = EXIT_FAILURE_RUNTIME;
            break;
        }
    }

    loop->runInLoop([connection]() { connection->disconnect(); });
    // Give the DISCONNECT a moment to leave before the loop stops
    std::this_thread::sleep_for(POLL_INTERVAL);
    loop_thread.stop();
    loop_thread.join();
    session.reset();
    connection.reset();

    spdlog::shutdown();
    return exit_code;
}
