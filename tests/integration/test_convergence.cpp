/**
 * @file test_convergence.cpp
 * @brief Multi-node convergence over an in-memory multicast segment.
 *
 * Each node runs a full DiscoveryService with its own channel, registration
 * client and logger. The segment can drop selected datagrams to model loss.
 */

#include "discovery/discovery_service.hpp"
#include "telemetry/log_sinks.hpp"

#include "support/fakes.hpp"
#include "support/in_memory_segment.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>

using namespace lan_beacon;
using namespace lan_beacon::test_support;
using namespace std::chrono_literals;

namespace {

struct Node {
    Node(InMemorySegment& segment, const std::string& address, const std::string& fingerprint,
         const std::string& alias)
        : channel(segment, address)
        , logger(std::make_unique<NullSink>())
        , service(make_settings(address), channel, registration, logger) {
        local.fingerprint = fingerprint;
        local.alias = alias;
        local.port = 53317;
        service.set_current_node(local);
        registration.set_reach_all(true);
    }

    ~Node() { stop(); }

    static DiscoverySettings make_settings(const std::string& address) {
        DiscoverySettings settings;
        settings.endpoint = MulticastEndpoint{
            .interface_address = address,
            .group_address = "224.0.0.167",
            .port = 53317,
        };
        settings.announce_interval = 5ms;
        settings.discover_repeat = 5;
        settings.receive_poll = 10ms;
        return settings;
    }

    bool start() {
        serving = std::async(std::launch::async, [this] { return service.serve(); });
        return eventually([this] { return service.state() == ServiceState::Listening; });
    }

    void stop() {
        if (!serving.valid()) return;
        service.stop();
        (void)serving.get();
    }

    /// The record a peer should hold for this node.
    [[nodiscard]] PeerRecord as_seen_by_peers() const {
        auto record = local;
        record.address = channel.address();
        return record;
    }

    InMemoryChannel channel;
    FakeRegistrationClient registration;
    Logger logger;
    PeerRecord local;
    DiscoveryService service;
    std::future<Result<void>> serving;
};

bool knows(Node& node, const Node& peer) {
    auto record = node.service.registry().get(peer.local.fingerprint);
    return record && *record == peer.as_seen_by_peers();
}

}  // namespace

// ═══════════════════════════════════════════════
// Convergence Scenarios
// ═══════════════════════════════════════════════

TEST(ConvergenceTest, ReannounceReachesNodeThatMissedFirstAnnounce) {
    InMemorySegment segment;
    Node a(segment, "10.0.0.2", "A1", "Alpha");
    Node b(segment, "10.0.0.3", "B1", "Bravo");
    Node c(segment, "10.0.0.4", "C1", "Charlie");
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(c.start());

    // C misses A's first datagram.
    auto dropped = std::make_shared<std::atomic<bool>>(false);
    segment.set_filter([dropped](const std::string& source, const std::string& destination) {
        if (source == "10.0.0.2" && destination == "10.0.0.4" && !dropped->exchange(true)) {
            return false;
        }
        return true;
    });

    ASSERT_TRUE(a.service.announce(1).has_value());

    ASSERT_TRUE(eventually([&] { return knows(c, a); }, 5000ms));
    EXPECT_TRUE(dropped->load());

    auto seen = c.service.registry().get("A1");
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->address, "10.0.0.2");
    EXPECT_EQ(*seen, a.as_seen_by_peers());

    ASSERT_TRUE(eventually([&] {
        return knows(a, b) && knows(a, c) && knows(b, a) && knows(b, c) && knows(c, b);
    }, 5000ms));
}

TEST(ConvergenceTest, EveryConfirmationTargetsTheRegisterEndpoint) {
    InMemorySegment segment;
    Node a(segment, "10.0.0.2", "A1", "Alpha");
    Node b(segment, "10.0.0.3", "B1", "Bravo");
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());

    ASSERT_TRUE(a.service.announce(1).has_value());
    ASSERT_TRUE(eventually([&] { return knows(a, b) && knows(b, a); }, 5000ms));
    ASSERT_TRUE(a.service.wait_for_confirmations(2000ms));
    ASSERT_TRUE(b.service.wait_for_confirmations(2000ms));

    auto b_calls = b.registration.calls();
    ASSERT_EQ(b_calls.size(), 1u);
    EXPECT_EQ(b_calls[0].url, "http://10.0.0.2:53317/api/localsend/v2/register");

    auto a_calls = a.registration.calls();
    ASSERT_EQ(a_calls.size(), 1u);
    EXPECT_EQ(a_calls[0].url, "http://10.0.0.3:53317/api/localsend/v2/register");
}

TEST(ConvergenceTest, LateJoinerDiscoversEstablishedNodes) {
    InMemorySegment segment;
    Node a(segment, "10.0.0.2", "A1", "Alpha");
    Node b(segment, "10.0.0.3", "B1", "Bravo");
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(a.service.discover().has_value());
    ASSERT_TRUE(eventually([&] { return knows(a, b) && knows(b, a); }, 5000ms));

    Node d(segment, "10.0.0.5", "D1", "Delta");
    ASSERT_TRUE(d.start());
    ASSERT_TRUE(d.service.discover().has_value());

    ASSERT_TRUE(eventually([&] {
        return knows(d, a) && knows(d, b) && knows(a, d) && knows(b, d);
    }, 5000ms));
}

TEST(ConvergenceTest, UnreachablePeerIsNeverRecorded) {
    InMemorySegment segment;
    Node a(segment, "10.0.0.2", "A1", "Alpha");
    Node b(segment, "10.0.0.3", "B1", "Bravo");
    Node x(segment, "10.0.0.66", "X1", "Unreachable");

    a.registration.set_reach_all(false);
    a.registration.set_reachable("10.0.0.3");
    b.registration.set_reach_all(false);
    b.registration.set_reachable("10.0.0.2");

    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(x.start());

    ASSERT_TRUE(x.service.announce(1).has_value());
    ASSERT_TRUE(a.service.announce(1).has_value());

    ASSERT_TRUE(eventually([&] { return knows(a, b) && knows(b, a); }, 5000ms));
    ASSERT_TRUE(a.service.wait_for_confirmations(2000ms));
    ASSERT_TRUE(b.service.wait_for_confirmations(2000ms));

    EXPECT_FALSE(a.service.registry().contains("X1"));
    EXPECT_FALSE(b.service.registry().contains("X1"));
    EXPECT_TRUE(eventually([&] { return knows(x, a) && knows(x, b); }, 5000ms));
}

TEST(ConvergenceTest, StoppedNodeLeavesOthersRunning) {
    InMemorySegment segment;
    Node a(segment, "10.0.0.2", "A1", "Alpha");
    Node b(segment, "10.0.0.3", "B1", "Bravo");
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());

    b.stop();
    EXPECT_EQ(b.service.state(), ServiceState::Stopped);
    EXPECT_EQ(a.service.state(), ServiceState::Listening);

    ASSERT_TRUE(a.service.announce(1).has_value());
    ASSERT_TRUE(a.service.wait_for_confirmations(1000ms));
    EXPECT_FALSE(b.service.registry().contains("A1"));
}
