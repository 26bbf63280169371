/**
 * @file datagram_channel.hpp
 * @brief Abstract multicast datagram channel used by the discovery loop.
 *
 * The POSIX implementation is MulticastSocketManager. Tests plug in an
 * in-memory segment so several nodes can run in one process.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lan_beacon {

/// Where to bind and which group to join.
struct MulticastEndpoint {
    std::string interface_address;   ///< IPv4 of the local interface, "0.0.0.0" = any
    std::string group_address;       ///< IPv4 multicast group
    uint16_t port{0};                ///< receive port; the send socket uses port + 1

    bool operator==(const MulticastEndpoint&) const = default;
};

struct Datagram {
    std::string payload;
    std::string source_address;      ///< dotted-quad of the sender
    uint16_t source_port{0};
    bool truncated{false};           ///< payload exceeded the receive buffer
};

class DatagramChannel {
public:
    virtual ~DatagramChannel() = default;

    /// Bind receive and send handles and join the group.
    virtual Result<void> open(const MulticastEndpoint& endpoint) = 0;

    /**
     * @brief Release the receive handle.
     *
     * Non-blocking. A receive in progress returns on its next poll, and every
     * receive after this fails with ErrorKind::Closed.
     */
    virtual void close() = 0;

    /**
     * @brief Wait up to `poll_timeout` for one datagram.
     *
     * Returns nullopt when the timeout elapses with nothing received.
     */
    virtual Result<std::optional<Datagram>> receive(size_t buffer_size,
                                                    std::chrono::milliseconds poll_timeout) = 0;

    /// Send one datagram to the group target resolved by open().
    virtual Result<void> send(std::string_view payload) = 0;

    /// Group address and port resolved by open(); nullopt before that.
    [[nodiscard]] virtual std::optional<MulticastEndpoint> target() const = 0;
};

}  // namespace lan_beacon
