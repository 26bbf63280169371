/**
 * @file discovery_service.hpp
 * @brief Multicast announce protocol and discovery listen loop.
 *
 * Nodes broadcast their identity to a multicast group. A node that hears an
 * unknown peer confirms it with a unicast registration call, records it, and
 * re-announces itself once so that nodes which missed the newcomer learn
 * about it on the next hop.
 *
 * State machine driven by serve():
 *
 *   Unstarted --serve--> Bound --> Listening --stop/receive error--> Stopped
 *
 * serve() may be called again from Stopped, which starts a fresh cycle.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "discovery/local_identity.hpp"
#include "discovery/node_registry.hpp"
#include "executor/worker_pool.hpp"
#include "network/datagram_channel.hpp"
#include "network/registration_client.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace lan_beacon {

enum class ServiceState : uint8_t {
    Unstarted,
    Bound,
    Listening,
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(ServiceState state) noexcept {
    switch (state) {
        case ServiceState::Unstarted: return "unstarted";
        case ServiceState::Bound:     return "bound";
        case ServiceState::Listening: return "listening";
        case ServiceState::Stopped:   return "stopped";
    }
    return "unknown";
}

/// What the listen loop did with one datagram.
enum class DatagramOutcome : uint8_t {
    Malformed,            ///< decode failed; logged and dropped
    Self,                 ///< our own announce
    Duplicate,            ///< fingerprint already registered
    ConfirmationPending,  ///< a confirmation for this fingerprint is in flight
    Dispatched            ///< confirmation handed to a worker
};

struct DiscoverySettings {
    MulticastEndpoint endpoint;
    Milliseconds announce_interval{1000};
    uint32_t discover_repeat{5};
    size_t receive_buffer_bytes{1024};
    Milliseconds receive_poll{100};
    size_t confirm_workers{2};
    size_t subscriber_queue_depth{NodeRegistry::DEFAULT_QUEUE_DEPTH};
};

[[nodiscard]] DiscoverySettings make_discovery_settings(const Config& config);

class DiscoveryService {
public:
    DiscoveryService(DiscoverySettings settings,
                     DatagramChannel& channel,
                     RegistrationClient& registration,
                     Logger& logger);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    void set_current_node(PeerRecord record);

    [[nodiscard]] NodeRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const NodeRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const LocalIdentity& identity() const noexcept { return identity_; }
    [[nodiscard]] ServiceState state() const noexcept { return state_.load(); }
    [[nodiscard]] const DiscoverySettings& settings() const noexcept { return settings_; }

    /**
     * @brief Bind, join, and run the listen loop until stop().
     *
     * Blocks the calling thread. Returns success after an orderly stop;
     * Precondition when the local identity is unset or the loop is already
     * running; Startup when the sockets cannot be bound or joined.
     */
    Result<void> serve();

    /**
     * @brief Release the receive handle.
     *
     * Does not wait: the loop observes the closed handle on its next poll
     * and exits. Watch state() for Stopped to synchronize.
     */
    void stop();

    /**
     * @brief Send the local announce `repeat` times to the group.
     *
     * Sleeps one announce_interval between consecutive sends, not after the
     * last. Stops at the first failed send and returns its error.
     */
    Result<void> announce(uint32_t repeat);

    /**
     * @brief Clear the registry, then announce discover_repeat times.
     *
     * Confirmations dispatched before the clear still register with their
     * peer but no longer add it to the registry.
     */
    Result<void> discover();

    /// Process one received payload as the listen loop does.
    DatagramOutcome handle_datagram(std::string_view payload, const std::string& source_address);

    /// Wait for dispatched confirmations to finish.
    bool wait_for_confirmations(Milliseconds timeout);

    [[nodiscard]] size_t pending_confirmations() const;

private:
    void confirm_peer(const PeerRecord& peer, uint64_t cycle);
    void reset_registry();
    void finish_confirmation(const Fingerprint& fingerprint);

    DiscoverySettings settings_;
    DatagramChannel& channel_;
    RegistrationClient& registration_;
    Logger& logger_;

    NodeRegistry registry_;
    LocalIdentity identity_;

    std::atomic<ServiceState> state_{ServiceState::Unstarted};
    std::atomic<bool> serving_{false};
    std::atomic<bool> stop_requested_{false};

    // Bumped on every registry clear; guards the cycle check and add together.
    std::mutex cycle_mutex_;
    uint64_t cycle_{0};

    mutable std::mutex pending_mutex_;
    std::unordered_set<Fingerprint> pending_;

    // Declared last: joined before the members its tasks touch are destroyed.
    WorkerPool confirm_pool_;
};

}  // namespace lan_beacon
