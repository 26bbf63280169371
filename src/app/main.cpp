/**
 * @file main.cpp
 * @brief LanBeacon daemon entry point.
 *
 * Wires the discovery stack together:
 *   Config -> Logger -> Local identity -> Sockets -> Discovery loop -> Registry watcher
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "discovery/discovery_service.hpp"
#include "discovery/node_registry.hpp"
#include "network/http_registration_client.hpp"
#include "network/multicast_socket_manager.hpp"
#include "telemetry/log_sinks.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace lan_beacon;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string alias;
    std::string interface_address;
    std::string group;
    uint16_t port = 0;
    std::string log_dir;
    std::string log_level;
};

void print_usage() {
    std::cout << "Usage: lan_beacon [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --alias <name>       Device name advertised to peers\n"
              << "  --interface <ip>     Local interface address\n"
              << "  --group <ip>         Multicast group address\n"
              << "  --port <port>        Multicast port (send socket uses port + 1)\n"
              << "  --log-dir <path>     Log output directory (default: stdout)\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  --help, -h           Show this help message\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--alias" && i + 1 < argc) {
            args.alias = argv[++i];
        } else if (arg == "--interface" && i + 1 < argc) {
            args.interface_address = argv[++i];
        } else if (arg == "--group" && i + 1 < argc) {
            args.group = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            int port = 0;
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                port = 0;
            }
            if (port < 1 || port > 65534) {
                std::cerr << "Invalid --port value" << std::endl;
                return false;
            }
            args.port = static_cast<uint16_t>(port);
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage();
            return false;
        }
    }
    return true;
}

std::string describe(const PeerMap& peers) {
    std::string text = std::to_string(peers.size()) + " peer(s)";
    for (const auto& [fingerprint, peer] : peers) {
        text += "; " + peer.alias + "@" + peer.address + ":" + std::to_string(peer.port);
    }
    return text;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;
    if (!parse_args(argc, argv, args)) return 2;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.alias.empty()) config.node.alias = args.alias;
    if (!args.interface_address.empty()) config.discovery.interface_address = args.interface_address;
    if (!args.group.empty()) config.discovery.multicast_group = args.group;
    if (args.port != 0) config.discovery.port = args.port;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<RotatingFileSink>(config.telemetry.log_dir, "lan_beacon",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger root_logger(std::move(log_sink),
                       parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    auto logger = root_logger.component("daemon");

    auto local = make_local_record(config.node);
    if (!local) {
        logger.error("Invalid node identity: " + local.error().message);
        return 2;
    }
    logger.info("LanBeacon starting as " + local->alias + " (" + local->fingerprint + ")");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Discovery stack ──────────────────────
    MulticastSocketManager sockets;
    HttpRegistrationClient registration(Milliseconds{config.discovery.register_timeout_ms});
    auto discovery_log = logger.component("discovery");
    DiscoveryService discovery(make_discovery_settings(config), sockets, registration, discovery_log);
    discovery.set_current_node(*local);

    auto watcher = discovery.registry().subscribe();

    auto serving = std::async(std::launch::async, [&discovery] { return discovery.serve(); });
    auto loop_exited = [&serving] {
        return serving.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
    };

    // Wait for the loop to bind before the first burst.
    while (discovery.state() != ServiceState::Listening && !loop_exited() && !g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::jthread burst;
    if (discovery.state() == ServiceState::Listening) {
        burst = std::jthread([&discovery, &logger] {
            if (auto found = discovery.discover(); !found) {
                logger.warn("Discovery burst failed: " + found.error().message);
            }
        });
    }

    // ── Main Loop ────────────────────────────
    while (!g_shutdown_requested && !loop_exited()) {
        if (auto snapshot = watcher.next(std::chrono::milliseconds(200))) {
            logger.info("Registry: " + describe(**snapshot));
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    discovery.stop();
    auto serve_result = serving.get();
    if (burst.joinable()) burst.join();

    if (!serve_result) {
        logger.error("Discovery failed: " + serve_result.error().message);
        logger.flush();
        return 1;
    }

    logger.info("LanBeacon stopped.");
    logger.flush();
    return 0;
}
