/**
 * @file discovery_service.cpp
 * @brief DiscoveryService implementation.
 */

#include "discovery/discovery_service.hpp"

#include "discovery/announce_message.hpp"

#include <thread>

namespace lan_beacon {

DiscoverySettings make_discovery_settings(const Config& config) {
    DiscoverySettings settings;
    settings.endpoint = MulticastEndpoint{
        .interface_address = config.discovery.interface_address,
        .group_address = config.discovery.multicast_group,
        .port = config.discovery.port,
    };
    settings.announce_interval = Milliseconds{config.discovery.announce_interval_ms};
    settings.discover_repeat = config.discovery.discover_repeat;
    settings.receive_buffer_bytes = MAX_ANNOUNCE_BYTES;
    settings.confirm_workers = config.discovery.confirm_workers;
    settings.subscriber_queue_depth = config.discovery.subscriber_queue_depth;
    return settings;
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

DiscoveryService::DiscoveryService(DiscoverySettings settings,
                                   DatagramChannel& channel,
                                   RegistrationClient& registration,
                                   Logger& logger)
    : settings_(std::move(settings))
    , channel_(channel)
    , registration_(registration)
    , logger_(logger)
    , registry_(settings_.subscriber_queue_depth)
    , confirm_pool_(settings_.confirm_workers) {}

DiscoveryService::~DiscoveryService() {
    stop();
}

void DiscoveryService::set_current_node(PeerRecord record) {
    identity_.set_current(std::move(record));
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> DiscoveryService::serve() {
    if (serving_.exchange(true)) {
        return Error{ErrorKind::Precondition, "discovery loop already running"};
    }
    stop_requested_ = false;

    reset_registry();

    auto local = identity_.require();
    if (!local) {
        logger_.error("Cannot serve discovery: " + local.error().message);
        serving_ = false;
        return local.error();
    }

    const auto& endpoint = settings_.endpoint;
    if (auto opened = channel_.open(endpoint); !opened) {
        logger_.error("Discovery startup failed: " + opened.error().message);
        serving_ = false;
        return opened.error();
    }
    state_ = ServiceState::Bound;
    logger_.info("Discovery bound to " + endpoint.group_address + ":"
                 + std::to_string(endpoint.port) + " on " + endpoint.interface_address
                 + " as " + local->fingerprint);

    // stop() may have raced with open(); honour it now that the handle exists.
    if (stop_requested_) channel_.close();

    state_ = ServiceState::Listening;

    while (true) {
        auto received = channel_.receive(settings_.receive_buffer_bytes, settings_.receive_poll);
        if (!received) {
            if (received.error().is(ErrorKind::Closed)) {
                logger_.info("Discovery receive handle released, stopping");
            } else {
                logger_.warn("Discovery receive failed, stopping: " + received.error().message);
            }
            break;
        }
        if (!received->has_value()) continue;

        const auto& datagram = **received;
        if (datagram.truncated) {
            logger_.warn("Dropped oversized announce from " + datagram.source_address
                         + " (buffer " + std::to_string(settings_.receive_buffer_bytes) + " bytes)");
            continue;
        }
        handle_datagram(datagram.payload, datagram.source_address);
    }

    state_ = ServiceState::Stopped;
    serving_ = false;
    return {};
}

void DiscoveryService::stop() {
    stop_requested_ = true;
    channel_.close();
}

// ─────────────────────────────────────────────
// Announce Protocol
// ─────────────────────────────────────────────

Result<void> DiscoveryService::announce(uint32_t repeat) {
    auto local = identity_.require();
    if (!local) return local.error();

    auto target = channel_.target();
    if (!target) {
        return Error{ErrorKind::Precondition, "multicast target not resolved; serve() not started"};
    }

    const auto payload = encode_announce(AnnounceMessage::from_record(*local, true));
    if (payload.size() > settings_.receive_buffer_bytes) {
        return Error{ErrorKind::Precondition,
                     "announce payload of " + std::to_string(payload.size())
                     + " bytes exceeds the datagram budget"};
    }

    logger_.debug("Start announce burst of " + std::to_string(repeat));

    for (uint32_t i = 0; i < repeat; ++i) {
        if (auto sent = channel_.send(payload); !sent) {
            logger_.warn("Announce send failed: " + sent.error().message);
            return sent.error();
        }
        logger_.debug("Announce " + std::to_string(i + 1) + "/" + std::to_string(repeat)
                      + " sent to " + target->group_address + ":" + std::to_string(target->port));
        if (i + 1 < repeat) {
            std::this_thread::sleep_for(settings_.announce_interval);
        }
    }
    return {};
}

Result<void> DiscoveryService::discover() {
    reset_registry();
    return announce(settings_.discover_repeat);
}

void DiscoveryService::reset_registry() {
    std::lock_guard lock(cycle_mutex_);
    ++cycle_;
    registry_.clear();
}

// ─────────────────────────────────────────────
// Listen Loop Body
// ─────────────────────────────────────────────

DatagramOutcome DiscoveryService::handle_datagram(std::string_view payload,
                                                  const std::string& source_address) {
    auto message = decode_announce(payload);
    if (!message) {
        logger_.warn("Malformed announce from " + source_address + ": "
                     + message.error().message);
        return DatagramOutcome::Malformed;
    }

    auto peer = message->to_record(source_address);
    logger_.debug("Announce from " + peer.alias + " (" + peer.fingerprint + ") at "
                  + peer.address + ":" + std::to_string(peer.port));

    auto local = identity_.current();
    if (local && local->fingerprint == peer.fingerprint) {
        logger_.debug("Announce is self");
        return DatagramOutcome::Self;
    }

    // Claim the fingerprint before consulting the registry: a confirmation
    // adds to the registry before it releases its claim.
    {
        std::lock_guard lock(pending_mutex_);
        if (!pending_.insert(peer.fingerprint).second) {
            return DatagramOutcome::ConfirmationPending;
        }
    }

    if (registry_.contains(peer.fingerprint)) {
        finish_confirmation(peer.fingerprint);
        logger_.debug("Node " + peer.fingerprint + " already registered");
        return DatagramOutcome::Duplicate;
    }

    uint64_t cycle = 0;
    {
        std::lock_guard lock(cycle_mutex_);
        cycle = cycle_;
    }

    confirm_pool_.post([this, peer = std::move(peer), cycle](std::stop_token) {
        confirm_peer(peer, cycle);
    });
    return DatagramOutcome::Dispatched;
}

void DiscoveryService::confirm_peer(const PeerRecord& peer, uint64_t cycle) {
    auto local = identity_.require();
    if (!local) {
        logger_.error("Cannot confirm " + peer.fingerprint + ": " + local.error().message);
        finish_confirmation(peer.fingerprint);
        return;
    }

    const auto body = encode_announce(AnnounceMessage::from_record(*local, false));
    auto registered = registration_.register_with(peer, body);
    if (!registered) {
        logger_.warn("Register with " + peer.fingerprint + " failed: "
                     + registered.error().message);
        finish_confirmation(peer.fingerprint);
        return;
    }

    bool current_cycle = false;
    {
        std::lock_guard lock(cycle_mutex_);
        current_cycle = (cycle == cycle_);
        if (current_cycle) registry_.add(peer);
    }
    if (!current_cycle) {
        logger_.debug("Dropped confirmation of " + peer.fingerprint
                      + " dispatched before the registry was cleared");
        finish_confirmation(peer.fingerprint);
        return;
    }

    logger_.info("Registered peer " + peer.alias + " (" + peer.fingerprint + ") at "
                 + peer.address + ":" + std::to_string(peer.port));
    finish_confirmation(peer.fingerprint);

    if (auto reannounced = announce(1); !reannounced) {
        logger_.warn("Re-announce after registering " + peer.fingerprint + " failed: "
                     + reannounced.error().message);
    }
}

void DiscoveryService::finish_confirmation(const Fingerprint& fingerprint) {
    std::lock_guard lock(pending_mutex_);
    pending_.erase(fingerprint);
}

bool DiscoveryService::wait_for_confirmations(Milliseconds timeout) {
    return confirm_pool_.wait_idle(timeout);
}

size_t DiscoveryService::pending_confirmations() const {
    std::lock_guard lock(pending_mutex_);
    return pending_.size();
}

}  // namespace lan_beacon
