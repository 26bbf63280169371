/**
 * @file multicast_socket_manager.hpp
 * @brief POSIX UDP multicast sockets for announce send/receive.
 *
 * Owns two IPv4 UDP sockets joined to the same group:
 *   - receive socket bound to the group port, used for recvfrom
 *   - send socket bound to port + 1 on the interface, used for sendto
 *
 * The receive socket is shared with an in-flight receive() so that close()
 * can drop it without pulling the descriptor out from under poll().
 */

#pragma once

#include "network/datagram_channel.hpp"

#include <atomic>
#include <memory>
#include <mutex>

#include <netinet/in.h>

namespace lan_beacon {

class MulticastSocketManager : public DatagramChannel {
public:
    MulticastSocketManager() = default;
    ~MulticastSocketManager() override;

    MulticastSocketManager(const MulticastSocketManager&) = delete;
    MulticastSocketManager& operator=(const MulticastSocketManager&) = delete;

    Result<void> open(const MulticastEndpoint& endpoint) override;
    void close() override;
    Result<std::optional<Datagram>> receive(size_t buffer_size,
                                            std::chrono::milliseconds poll_timeout) override;
    Result<void> send(std::string_view payload) override;
    [[nodiscard]] std::optional<MulticastEndpoint> target() const override;

    [[nodiscard]] bool is_receiving() const;

    /// Local port the send socket is bound to (0 when not open).
    [[nodiscard]] uint16_t send_port() const;

private:
    /// RAII descriptor with a release flag observed by receive().
    struct Socket {
        explicit Socket(int descriptor) : fd(descriptor) {}
        ~Socket();
        Socket(const Socket&) = delete;
        Socket& operator=(const Socket&) = delete;

        int fd;
        std::atomic<bool> released{false};
    };

    mutable std::mutex mutex_;
    std::shared_ptr<Socket> receiver_;
    std::shared_ptr<Socket> sender_;
    std::optional<MulticastEndpoint> target_;
    sockaddr_in target_addr_{};

    std::mutex send_mutex_;
};

}  // namespace lan_beacon
