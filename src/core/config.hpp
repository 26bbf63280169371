/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace lan_beacon {

/// Local identity advertised to peers.
struct NodeConfig {
    std::string alias = "lan-beacon";
    std::string fingerprint;             ///< empty = generate at startup
    uint16_t port = 53317;               ///< registration HTTP server port
    std::string protocol = "http";
    std::string device_model;            ///< empty = not advertised
    std::string device_type = "desktop";
    bool download = false;
};

struct DiscoveryConfig {
    std::string interface_address = "0.0.0.0";
    std::string multicast_group = "224.0.0.167";
    uint16_t port = 53317;
    uint32_t announce_interval_ms = 1000;
    uint32_t discover_repeat = 5;
    uint32_t register_timeout_ms = 3000;
    uint32_t confirm_workers = 2;
    uint32_t subscriber_queue_depth = 64;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;       ///< empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    NodeConfig node;
    DiscoveryConfig discovery;
    TelemetryConfig telemetry;
};

/**
 * @brief Load and validate configuration from a TOML file.
 *
 * Missing tables and keys fall back to the defaults above.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges and enumerations.
 */
Result<void> validate_config(const Config& config);

Config default_config();

/**
 * @brief Build the local PeerRecord described by the [node] table.
 *
 * An empty fingerprint is replaced with a random 32-digit hex string.
 */
Result<PeerRecord> make_local_record(const NodeConfig& node);

}  // namespace lan_beacon
