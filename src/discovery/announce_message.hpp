/**
 * @file announce_message.hpp
 * @brief Wire projection of a PeerRecord sent over multicast and in
 *        registration calls.
 *
 * Encoded as a compact UTF-8 JSON object with camelCase keys:
 *
 *   {"alias":"..","version":"2.0","deviceModel":null,"deviceType":"desktop",
 *    "fingerprint":"..","port":53317,"protocol":"http","download":false,
 *    "announce":true}
 *
 * The message never carries an address; the receiver takes it from the
 * datagram source.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace lan_beacon {

/// Receive buffer size; encoded announces must fit in one datagram of this size.
inline constexpr size_t MAX_ANNOUNCE_BYTES = 1024;

struct AnnounceMessage {
    std::string alias;
    std::string version{PROTOCOL_VERSION};
    std::optional<std::string> device_model;
    DeviceType device_type{DeviceType::Desktop};
    Fingerprint fingerprint;
    uint16_t port{0};
    Protocol protocol{Protocol::Http};
    bool download{false};
    bool announce{false};

    [[nodiscard]] static AnnounceMessage from_record(const PeerRecord& record, bool announce);

    /// Build a PeerRecord using the address the datagram was observed from.
    [[nodiscard]] PeerRecord to_record(std::string observed_address) const;

    bool operator==(const AnnounceMessage&) const = default;
};

[[nodiscard]] std::string encode_announce(const AnnounceMessage& message);

/**
 * @brief Parse an announce payload.
 *
 * Fails with ErrorKind::Decode on invalid JSON, a missing required field
 * (alias, deviceType, fingerprint, port, protocol), or a mistyped field.
 */
[[nodiscard]] Result<AnnounceMessage> decode_announce(std::string_view payload);

}  // namespace lan_beacon
