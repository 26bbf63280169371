/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

#include "core/logger.hpp"

namespace lan_beacon {

namespace {

std::string random_fingerprint() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    for (int i = 0; i < 2; ++i) {
        oss << std::hex << std::setw(16) << std::setfill('0') << gen();
    }
    return oss.str();
}

bool valid_port(int64_t port) {
    return port >= 1 && port <= 65535;
}

// The send socket binds port + 1, so 65535 is unusable for discovery.
bool valid_discovery_port(int64_t port) {
    return port >= 1 && port <= 65534;
}

/// Reads an unsigned count, rejecting negatives and values past uint32_t.
Result<uint32_t> read_count(toml::node_view<toml::node> section, std::string_view section_name,
                            std::string_view key, int64_t fallback, int64_t minimum) {
    auto value = section[key].value_or(fallback);
    if (value < minimum || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{ErrorKind::Config, std::string{section_name} + "." + std::string{key} +
                                            " out of range: " + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.alias = node["alias"].value_or(config.node.alias);
            config.node.fingerprint = node["fingerprint"].value_or(std::string{});
            auto port = node["port"].value_or(int64_t{53317});
            if (!valid_port(port)) {
                return Error{ErrorKind::Config, "node.port out of range: " + std::to_string(port)};
            }
            config.node.port = static_cast<uint16_t>(port);
            config.node.protocol = node["protocol"].value_or(config.node.protocol);
            config.node.device_model = node["device_model"].value_or(std::string{});
            config.node.device_type = node["device_type"].value_or(config.node.device_type);
            config.node.download = node["download"].value_or(false);
        }

        // [discovery]
        if (auto disc = tbl["discovery"]; disc.is_table()) {
            config.discovery.interface_address =
                disc["interface"].value_or(config.discovery.interface_address);
            config.discovery.multicast_group =
                disc["multicast_group"].value_or(config.discovery.multicast_group);
            auto port = disc["port"].value_or(int64_t{53317});
            if (!valid_discovery_port(port)) {
                return Error{ErrorKind::Config,
                             "discovery.port out of range: " + std::to_string(port)};
            }
            config.discovery.port = static_cast<uint16_t>(port);
            auto interval = read_count(disc, "discovery", "announce_interval_ms", 1000, 0);
            if (!interval) return interval.error();
            auto repeat = read_count(disc, "discovery", "discover_repeat", 5, 1);
            if (!repeat) return repeat.error();
            auto timeout = read_count(disc, "discovery", "register_timeout_ms", 3000, 0);
            if (!timeout) return timeout.error();
            auto workers = read_count(disc, "discovery", "confirm_workers", 2, 1);
            if (!workers) return workers.error();
            auto depth = read_count(disc, "discovery", "subscriber_queue_depth", 64, 1);
            if (!depth) return depth.error();
            config.discovery.announce_interval_ms = interval.value();
            config.discovery.discover_repeat = repeat.value();
            config.discovery.register_timeout_ms = timeout.value();
            config.discovery.confirm_workers = workers.value();
            config.discovery.subscriber_queue_depth = depth.value();
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level =
                telemetry["log_level"].value_or(config.telemetry.log_level);
            auto max_size = read_count(telemetry, "telemetry", "max_file_size_mb", 50, 0);
            if (!max_size) return max_size.error();
            auto rotate = read_count(telemetry, "telemetry", "rotate_count", 5, 0);
            if (!rotate) return rotate.error();
            config.telemetry.max_file_size_mb = max_size.value();
            config.telemetry.rotate_count = rotate.value();
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    if (!parse_protocol(config.node.protocol)) {
        return Error{ErrorKind::Config, "Unknown node.protocol: " + config.node.protocol};
    }
    if (!parse_device_type(config.node.device_type)) {
        return Error{ErrorKind::Config, "Unknown node.device_type: " + config.node.device_type};
    }
    if (!valid_port(config.node.port)) {
        return Error{ErrorKind::Config, "node.port must be in 1..65535"};
    }
    if (!valid_discovery_port(config.discovery.port)) {
        return Error{ErrorKind::Config, "discovery.port must be in 1..65534"};
    }
    if (config.discovery.discover_repeat == 0) {
        return Error{ErrorKind::Config, "discovery.discover_repeat must be at least 1"};
    }
    if (config.discovery.confirm_workers == 0) {
        return Error{ErrorKind::Config, "discovery.confirm_workers must be at least 1"};
    }
    if (config.discovery.subscriber_queue_depth == 0) {
        return Error{ErrorKind::Config, "discovery.subscriber_queue_depth must be at least 1"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorKind::Config, "Unknown telemetry.log_level: " + config.telemetry.log_level};
    }
    return {};
}

Config default_config() {
    return Config{};
}

Result<PeerRecord> make_local_record(const NodeConfig& node) {
    auto protocol = parse_protocol(node.protocol);
    if (!protocol) {
        return Error{ErrorKind::Config, "Unknown protocol: " + node.protocol};
    }
    auto device_type = parse_device_type(node.device_type);
    if (!device_type) {
        return Error{ErrorKind::Config, "Unknown device type: " + node.device_type};
    }

    PeerRecord record;
    record.fingerprint = node.fingerprint.empty() ? random_fingerprint() : node.fingerprint;
    record.port = node.port;
    record.protocol = *protocol;
    record.alias = node.alias;
    if (!node.device_model.empty()) record.device_model = node.device_model;
    record.device_type = *device_type;
    record.download = node.download;
    return record;
}

}  // namespace lan_beacon
