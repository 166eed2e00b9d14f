// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief printwatch-monitor: headless monitor for configured printers
 *
 * Loads the config, starts a monitoring session per printer and logs every
 * change notification until SIGINT/SIGTERM (or --timeout).
 */

#include "cli_args.h"
#include "config.h"
#include "device_monitor.h"
#include "device_state_json.h"
#include "logging_init.h"
#include "moonraker_status_fetcher.h"

#include "hv/hlog.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <map>
#include <thread>

using namespace printwatch;

static volatile sig_atomic_t g_quit = 0;

// =============================================================================
// Signal Handling
// =============================================================================

static void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

static void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
}

static void init_logging(const CliArgs& args, Config& config) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config.get<std::string>("/log_level", ""));

    std::string log_dest = args.log_dest;
    if (log_dest.empty()) {
        log_dest = config.get<std::string>("/log_target", "auto");
    }
    log_config.target = logging::parse_log_target(log_dest);

    log_config.file_path = args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = config.get<std::string>("/log_path", "");
    }

    logging::init(log_config);

    // CLI -v flags don't affect libhv; only the config file does
    hlog_set_level(logging::to_hv_level(
        logging::parse_level(config.get<std::string>("/log_level", ""), spdlog::level::warn)));
}

int main(int argc, char** argv) {
    logging::init_early();
    // libhv's default level is INFO, silence it before any request is made
    hlog_set_level(LOG_LEVEL_WARN);

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }
    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    Config* config = Config::get_instance();
    config->init(args.config_path);
    init_logging(args, *config);

    MonitoringConfig monitoring = MonitoringConfig::from_config(*config);

    MoonrakerStatusFetcher fetcher;
    fetcher.load_from_config(*config);

    std::vector<std::string> printers =
        args.printers.empty() ? config->printer_ids(true) : args.printers;
    if (printers.empty()) {
        spdlog::error("[Main] No printers to monitor (add one under /printers in {})",
                      config->get_path());
        return 1;
    }

    DeviceMonitor monitor(fetcher, monitoring);
    monitor.start();

    std::map<std::string, SubscriptionId> subscriptions;
    for (const auto& id : printers) {
        if (!fetcher.has_endpoint(id)) {
            spdlog::warn("[Main] Printer '{}' has no valid Moonraker endpoint, skipping", id);
            continue;
        }

        subscriptions[id] = monitor.subscribe(
            id, [](const DeviceStatePtr& state, const std::vector<std::string>& fields) {
                std::string changed;
                for (const auto& f : fields) {
                    changed += changed.empty() ? f : "," + f;
                }
                spdlog::info("[Main] {} changed [{}]: {}", state->id, changed,
                             state_to_json(*state).dump());
            });
        monitor.start_monitoring(id);
    }

    if (subscriptions.empty()) {
        spdlog::error("[Main] None of the requested printers could be monitored");
        monitor.shutdown();
        return 1;
    }

    setup_signal_handlers();
    spdlog::info("[Main] Monitoring {} printer(s), press Ctrl+C to stop", subscriptions.size());

    auto started = std::chrono::steady_clock::now();
    while (!g_quit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (args.timeout_sec > 0 &&
            std::chrono::steady_clock::now() - started >= std::chrono::seconds(args.timeout_sec)) {
            spdlog::info("[Main] Timeout of {}s reached", args.timeout_sec);
            break;
        }
    }

    spdlog::info("[Main] Shutting down");
    for (const auto& [id, sub] : subscriptions) {
        monitor.unsubscribe(id, sub);
    }
    monitor.shutdown();
    return 0;
}
