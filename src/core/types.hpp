/**
 * @file types.hpp
 * @brief Vocabulary types shared by the discovery subsystem.
 *
 * PeerRecord is the locally-held identity of a node. The fingerprint is the
 * only identity key: two records with the same fingerprint describe the same
 * peer and the later write wins.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lan_beacon {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using Fingerprint = std::string;
using Milliseconds = std::chrono::milliseconds;

/// Protocol version advertised in announce messages.
inline constexpr std::string_view PROTOCOL_VERSION = "2.0";

enum class Protocol : uint8_t {
    Http,
    Https
};

enum class DeviceType : uint8_t {
    Mobile,
    Desktop,
    Web,
    Headless,
    Server
};

[[nodiscard]] constexpr std::string_view to_string(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::Http:  return "http";
        case Protocol::Https: return "https";
    }
    return "http";
}

[[nodiscard]] constexpr std::string_view to_string(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::Mobile:   return "mobile";
        case DeviceType::Desktop:  return "desktop";
        case DeviceType::Web:      return "web";
        case DeviceType::Headless: return "headless";
        case DeviceType::Server:   return "server";
    }
    return "desktop";
}

[[nodiscard]] std::optional<Protocol> parse_protocol(std::string_view text) noexcept;
[[nodiscard]] std::optional<DeviceType> parse_device_type(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Peer Record
// ─────────────────────────────────────────────

/**
 * @brief A node's identity as known locally.
 *
 * For remote peers, `address` is always the observed datagram source, never
 * a value carried in the payload.
 */
struct PeerRecord {
    Fingerprint fingerprint;
    std::string address;
    uint16_t port{0};
    Protocol protocol{Protocol::Http};

    std::string alias;
    std::string version{PROTOCOL_VERSION};
    std::optional<std::string> device_model;
    DeviceType device_type{DeviceType::Desktop};
    bool download{false};

    bool operator==(const PeerRecord&) const = default;
};

/// Registry contents keyed by fingerprint.
using PeerMap = std::unordered_map<Fingerprint, PeerRecord>;

}  // namespace lan_beacon
