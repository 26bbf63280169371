/**
 * @file multicast_socket_manager.cpp
 * @brief MulticastSocketManager implementation using POSIX sockets.
 *
 * The receive socket is bound to the wildcard address: on Linux a socket
 * bound to a unicast interface address does not see group traffic. The
 * interface address is used for the group membership and as the outgoing
 * multicast interface instead.
 */

#include "network/multicast_socket_manager.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace lan_beacon {

namespace {

std::string errno_text() {
    return std::string(std::strerror(errno));
}

/**
 * @brief Create a UDP socket with SO_REUSEADDR so several nodes can share
 *        a host during testing.
 */
int create_udp_socket() {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
    return fd;
}

Result<in_addr> parse_ipv4(const std::string& text, const char* what) {
    in_addr addr{};
    if (::inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return Error{ErrorKind::Startup, std::string{"Invalid "} + what + " address: " + text};
    }
    return addr;
}

Result<void> bind_socket(int fd, in_addr address, uint16_t port) {
    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(port);
    bind_addr.sin_addr = address;

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        return Error{ErrorKind::Startup,
                     "Bind to port " + std::to_string(port) + " failed: " + errno_text()};
    }
    return {};
}

Result<void> join_group(int fd, in_addr group, in_addr interface) {
    ip_mreq mreq{};
    mreq.imr_multiaddr = group;
    mreq.imr_interface = interface;
    if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
        return Error{ErrorKind::Startup, "Failed to join multicast group: " + errno_text()};
    }
    return {};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Socket
// ─────────────────────────────────────────────

MulticastSocketManager::Socket::~Socket() {
    if (fd >= 0) ::close(fd);
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

MulticastSocketManager::~MulticastSocketManager() {
    close();
}

Result<void> MulticastSocketManager::open(const MulticastEndpoint& endpoint) {
    auto interface = parse_ipv4(endpoint.interface_address, "interface");
    if (!interface) return interface.error();

    auto group = parse_ipv4(endpoint.group_address, "multicast group");
    if (!group) return group.error();
    if (!IN_MULTICAST(ntohl(group->s_addr))) {
        return Error{ErrorKind::Startup, "Not a multicast address: " + endpoint.group_address};
    }

    auto receiver = std::make_shared<Socket>(create_udp_socket());
    if (receiver->fd < 0) {
        return Error{ErrorKind::Startup, "Failed to create receive socket: " + errno_text()};
    }
    in_addr any{};
    any.s_addr = htonl(INADDR_ANY);
    if (auto bound = bind_socket(receiver->fd, any, endpoint.port); !bound) {
        return bound.error();
    }
    if (auto joined = join_group(receiver->fd, *group, *interface); !joined) {
        return joined.error();
    }

    auto sender = std::make_shared<Socket>(create_udp_socket());
    if (sender->fd < 0) {
        return Error{ErrorKind::Startup, "Failed to create send socket: " + errno_text()};
    }
    if (auto bound = bind_socket(sender->fd, *interface,
                                 static_cast<uint16_t>(endpoint.port + 1)); !bound) {
        return bound.error();
    }
    if (auto joined = join_group(sender->fd, *group, *interface); !joined) {
        return joined.error();
    }

    unsigned char loop = 1;
    ::setsockopt(sender->fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));
    if (interface->s_addr != htonl(INADDR_ANY)) {
        ::setsockopt(sender->fd, IPPROTO_IP, IP_MULTICAST_IF, &*interface, sizeof(in_addr));
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(endpoint.port);
    target.sin_addr = *group;

    std::lock_guard lock(mutex_);
    if (receiver_) receiver_->released = true;
    receiver_ = std::move(receiver);
    sender_ = std::move(sender);
    target_addr_ = target;
    target_ = endpoint;
    return {};
}

void MulticastSocketManager::close() {
    std::shared_ptr<Socket> receiver;
    {
        std::lock_guard lock(mutex_);
        receiver = std::move(receiver_);
    }
    if (receiver) {
        receiver->released = true;
        // Wakes a blocked poll(); the descriptor closes when the last owner drops it.
        ::shutdown(receiver->fd, SHUT_RDWR);
    }
}

bool MulticastSocketManager::is_receiving() const {
    std::lock_guard lock(mutex_);
    return receiver_ != nullptr;
}

uint16_t MulticastSocketManager::send_port() const {
    std::lock_guard lock(mutex_);
    if (!sender_) return 0;
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (::getsockname(sender_->fd, reinterpret_cast<sockaddr*>(&local), &len) < 0) return 0;
    return ntohs(local.sin_port);
}

std::optional<MulticastEndpoint> MulticastSocketManager::target() const {
    std::lock_guard lock(mutex_);
    return target_;
}

// ─────────────────────────────────────────────
// Receive / Send
// ─────────────────────────────────────────────

Result<std::optional<Datagram>> MulticastSocketManager::receive(
        size_t buffer_size, std::chrono::milliseconds poll_timeout) {
    std::shared_ptr<Socket> socket;
    {
        std::lock_guard lock(mutex_);
        socket = receiver_;
    }
    if (!socket || socket->released) {
        return Error{ErrorKind::Closed, "receive socket released"};
    }

    pollfd pfd{};
    pfd.fd = socket->fd;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, static_cast<int>(poll_timeout.count()));
    if (socket->released) {
        return Error{ErrorKind::Closed, "receive socket released"};
    }
    if (ready < 0) {
        if (errno == EINTR) return std::optional<Datagram>{};
        return Error{ErrorKind::Closed, "poll failed: " + errno_text()};
    }
    if (ready == 0) return std::optional<Datagram>{};

    std::vector<char> buf(buffer_size);
    sockaddr_in sender_addr{};
    socklen_t addr_len = sizeof(sender_addr);

    auto received = ::recvfrom(socket->fd, buf.data(), buf.size(), MSG_TRUNC,
                               reinterpret_cast<sockaddr*>(&sender_addr), &addr_len);
    if (received < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            return std::optional<Datagram>{};
        }
        return Error{ErrorKind::Closed, "recvfrom failed: " + errno_text()};
    }
    if (socket->released) {
        return Error{ErrorKind::Closed, "receive socket released"};
    }

    char ip_buf[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &sender_addr.sin_addr, ip_buf, sizeof(ip_buf));

    Datagram datagram;
    auto length = static_cast<size_t>(received);
    datagram.truncated = length > buf.size();
    datagram.payload.assign(buf.data(), std::min(length, buf.size()));
    datagram.source_address = ip_buf;
    datagram.source_port = ntohs(sender_addr.sin_port);
    return std::optional<Datagram>{std::move(datagram)};
}

Result<void> MulticastSocketManager::send(std::string_view payload) {
    std::shared_ptr<Socket> socket;
    sockaddr_in target{};
    {
        std::lock_guard lock(mutex_);
        if (!sender_ || !target_) {
            return Error{ErrorKind::Precondition, "multicast target not resolved"};
        }
        socket = sender_;
        target = target_addr_;
    }

    std::lock_guard send_lock(send_mutex_);
    auto sent = ::sendto(socket->fd, payload.data(), payload.size(), 0,
                         reinterpret_cast<const sockaddr*>(&target), sizeof(target));
    if (sent < 0) {
        return Error{ErrorKind::Io, "sendto failed: " + errno_text()};
    }
    if (static_cast<size_t>(sent) != payload.size()) {
        return Error{ErrorKind::Io, "short datagram send"};
    }
    return {};
}

}  // namespace lan_beacon
