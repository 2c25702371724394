/**
 * @file main.cpp
 * @brief LAN discovery demo entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into a standalone participant:
 *   Config → Logger → Runtime → DiscoveryEngine → periodic peer report
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/runtime.hpp"
#include "network/discovery_engine.hpp"
#include "telemetry/log_sinks.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace lan_discovery;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr auto REPORT_INTERVAL = std::chrono::seconds(5);
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string name;
    uint16_t port = 0;
    std::string log_dir;
    std::string log_level;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            args.name = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            args.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: lan_discovery_demo [OPTIONS]\n"
                      << "  --config <path>     Configuration file (default: config/default.toml)\n"
                      << "  --name <name>       Name to announce\n"
                      << "  --port <port>       Service port to announce\n"
                      << "  --log-dir <path>    Log output directory\n"
                      << "  --log-level <lvl>   debug | info | warn | error\n"
                      << "  --help, -h          Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

void report_peers(const DiscoveryEngine& engine, Logger& logger) {
    auto peers = engine.get_peers();
    logger.info("Known peers: " + std::to_string(peers.size()));
    for (const auto& peer : peers) {
        logger.info("  " + peer.name + " at " + peer.addr_string()
                    + " (service port " + std::to_string(peer.port) + ")");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.name.empty()) config.node.name = args.name;
    if (args.port != 0) config.node.service_port = args.port;
    if (!args.log_dir.empty()) config.logging.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.logging.level = args.log_level;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.logging.level);
    if (!level) {
        std::cerr << level.error().message << "; using info" << std::endl;
    }

    std::unique_ptr<ILogSink> log_sink;
    if (!config.logging.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, "lan_discovery",
                                                  config.logging.max_file_size_mb,
                                                  config.logging.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto logger = std::make_shared<Logger>(std::move(log_sink), level.value_or(LogLevel::Info));
    logger->info("LanDiscovery starting...");
    logger->info("Name: " + config.node.name);
    logger->info("Service port: " + std::to_string(config.node.service_port));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Runtime ───────────────────
    Runtime runtime(config.runtime.worker_threads, logger);
    logger->info("Runtime: " + std::to_string(runtime.thread_count()) + " workers");

    // ── Initialize Discovery ─────────────────
    auto engine_result = DiscoveryEngine::create(runtime.context(),
                                                 config.node.service_port,
                                                 config.node.name,
                                                 config.discovery,
                                                 logger);
    if (!engine_result) {
        logger->error("Discovery setup failed: " + engine_result.error().message);
        return EXIT_FAILURE;
    }
    auto engine = std::move(*engine_result);

    engine->on_peer_lost([logger](const Peer& peer) {
        logger->warn("Peer lost: " + peer.name);
    });

    engine->start();

    // ── Main Loop ────────────────────────────
    logger->info("Entering main loop. Press Ctrl+C to shutdown.");

    auto next_report = std::chrono::steady_clock::now() + REPORT_INTERVAL;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(POLL_INTERVAL);
        if (std::chrono::steady_clock::now() >= next_report) {
            report_peers(*engine, *logger);
            next_report += REPORT_INTERVAL;
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger->info("Shutdown requested. Cleaning up...");
    engine->stop();
    engine.reset();
    runtime.shutdown();

    logger->info("LanDiscovery stopped.");
    logger->flush();
    return EXIT_SUCCESS;
}
