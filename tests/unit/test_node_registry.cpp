/**
 * @file test_node_registry.cpp
 * @brief Unit tests for NodeRegistry mutations and snapshot subscriptions.
 */

#include "discovery/node_registry.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace lan_beacon;
using namespace std::chrono_literals;

namespace {

PeerRecord make_peer(const std::string& fingerprint,
                     const std::string& address = "10.0.0.2",
                     uint16_t port = 53317) {
    PeerRecord peer;
    peer.fingerprint = fingerprint;
    peer.address = address;
    peer.port = port;
    peer.alias = "peer-" + fingerprint;
    return peer;
}

}  // namespace

// ═══════════════════════════════════════════════
// Mutation Tests
// ═══════════════════════════════════════════════

TEST(NodeRegistryTest, EmptyByDefault) {
    NodeRegistry registry;
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.snapshot().empty());
    EXPECT_FALSE(registry.get("nobody").has_value());
}

TEST(NodeRegistryTest, AddAndGet) {
    NodeRegistry registry;
    registry.add(make_peer("A1"));

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains("A1"));
    auto peer = registry.get("A1");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->address, "10.0.0.2");
}

TEST(NodeRegistryTest, AddReplacesSameFingerprint) {
    NodeRegistry registry;
    registry.add(make_peer("A1", "10.0.0.2"));
    registry.add(make_peer("A1", "10.0.0.99", 60000));

    EXPECT_EQ(registry.size(), 1u);
    auto peer = registry.get("A1");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->address, "10.0.0.99");
    EXPECT_EQ(peer->port, 60000);
}

TEST(NodeRegistryTest, RemoveAndClear) {
    NodeRegistry registry;
    registry.add(make_peer("A1"));
    registry.add(make_peer("B1"));
    registry.add(make_peer("C1"));

    registry.remove("B1");
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_FALSE(registry.contains("B1"));

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST(NodeRegistryTest, MatchesMapModel) {
    NodeRegistry registry;
    std::map<std::string, PeerRecord> model;

    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> op_dist(0, 9);
    std::uniform_int_distribution<int> key_dist(0, 7);
    std::uniform_int_distribution<int> port_dist(1024, 65000);

    for (int step = 0; step < 500; ++step) {
        auto key = "fp" + std::to_string(key_dist(rng));
        int op = op_dist(rng);
        if (op < 6) {
            auto peer = make_peer(key, "10.0.0." + std::to_string(key_dist(rng)),
                                  static_cast<uint16_t>(port_dist(rng)));
            registry.add(peer);
            model[key] = peer;
        } else if (op < 9) {
            registry.remove(key);
            model.erase(key);
        } else {
            registry.clear();
            model.clear();
        }

        auto snapshot = registry.snapshot();
        ASSERT_EQ(snapshot.size(), model.size()) << "step " << step;
        for (const auto& [fp, peer] : model) {
            auto it = snapshot.find(fp);
            ASSERT_NE(it, snapshot.end()) << "step " << step;
            EXPECT_EQ(it->second, peer);
        }
    }
}

// ═══════════════════════════════════════════════
// Subscription Tests
// ═══════════════════════════════════════════════

TEST(NodeRegistryTest, SubscriberSeesCurrentStateFirst) {
    NodeRegistry registry;
    registry.add(make_peer("A1"));

    auto sub = registry.subscribe();
    auto first = sub.next(100ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)->size(), 1u);
    EXPECT_EQ((*first)->count("A1"), 1u);
    EXPECT_FALSE(sub.try_next().has_value());
}

TEST(NodeRegistryTest, SubscriberSeesMutationsInOrder) {
    NodeRegistry registry;
    auto sub = registry.subscribe();

    registry.add(make_peer("A1"));
    registry.add(make_peer("B1"));
    registry.remove("A1");
    registry.clear();

    std::vector<size_t> sizes;
    while (auto snapshot = sub.try_next()) sizes.push_back((*snapshot)->size());

    EXPECT_EQ(sizes, (std::vector<size_t>{0, 1, 2, 1, 0}));
}

TEST(NodeRegistryTest, RemoveOfAbsentKeyStillPublishes) {
    NodeRegistry registry;
    auto sub = registry.subscribe();
    ASSERT_TRUE(sub.try_next().has_value());

    registry.remove("ghost");

    auto published = sub.try_next();
    ASSERT_TRUE(published.has_value());
    EXPECT_TRUE((*published)->empty());
}

TEST(NodeRegistryTest, SnapshotsAreImmutable) {
    NodeRegistry registry;
    auto sub = registry.subscribe();
    registry.add(make_peer("A1"));

    (void)sub.try_next();
    auto after_add = sub.try_next();
    ASSERT_TRUE(after_add.has_value());

    registry.clear();
    EXPECT_EQ((*after_add)->size(), 1u);
}

TEST(NodeRegistryTest, SlowSubscriberDropsOldest) {
    NodeRegistry registry(3);
    auto sub = registry.subscribe();

    for (int i = 0; i < 10; ++i) registry.add(make_peer("fp" + std::to_string(i)));

    EXPECT_EQ(sub.pending(), 3u);
    EXPECT_EQ(sub.dropped(), 8u);

    std::vector<size_t> sizes;
    while (auto snapshot = sub.try_next()) sizes.push_back((*snapshot)->size());
    EXPECT_EQ(sizes, (std::vector<size_t>{8, 9, 10}));
}

TEST(NodeRegistryTest, MultipleSubscribersIndependent) {
    NodeRegistry registry;
    auto early = registry.subscribe();
    registry.add(make_peer("A1"));
    auto late = registry.subscribe();
    registry.add(make_peer("B1"));

    EXPECT_EQ(early.pending(), 3u);
    EXPECT_EQ(late.pending(), 2u);
    EXPECT_EQ(registry.subscriber_count(), 2u);
}

TEST(NodeRegistryTest, DestroyedSubscriptionDetaches) {
    NodeRegistry registry;
    {
        auto sub = registry.subscribe();
        EXPECT_EQ(registry.subscriber_count(), 1u);
    }
    EXPECT_EQ(registry.subscriber_count(), 0u);
    registry.add(make_peer("A1"));
    EXPECT_EQ(registry.subscriber_count(), 0u);
}

TEST(NodeRegistryTest, MovedFromSubscriptionIsEmpty) {
    NodeRegistry registry;
    auto original = registry.subscribe();
    registry.add(make_peer("A1"));

    auto moved = std::move(original);
    EXPECT_FALSE(original.try_next().has_value());  // NOLINT(bugprone-use-after-move)
    EXPECT_FALSE(original.next(10ms).has_value());  // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(original.pending(), 0u);              // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(original.dropped(), 0u);              // NOLINT(bugprone-use-after-move)

    EXPECT_EQ(moved.pending(), 2u);
    EXPECT_EQ(registry.subscriber_count(), 1u);
}

TEST(NodeRegistryTest, NextTimesOutWhenIdle) {
    NodeRegistry registry;
    auto sub = registry.subscribe();
    (void)sub.try_next();

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(sub.next(30ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(NodeRegistryTest, NextWakesOnPublish) {
    NodeRegistry registry;
    auto sub = registry.subscribe();
    (void)sub.try_next();

    std::jthread writer([&registry] {
        std::this_thread::sleep_for(20ms);
        registry.add(make_peer("A1"));
    });

    auto snapshot = sub.next(2000ms);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ((*snapshot)->size(), 1u);
}

TEST(NodeRegistryTest, ConcurrentWritersAndReader) {
    NodeRegistry registry(1024);
    auto sub = registry.subscribe();
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 100;

    {
        std::vector<std::jthread> writers;
        for (int w = 0; w < kWriters; ++w) {
            writers.emplace_back([&registry, w] {
                for (int i = 0; i < kPerWriter; ++i) {
                    registry.add(make_peer("w" + std::to_string(w) + "-" + std::to_string(i)));
                }
            });
        }
        std::jthread reader([&registry] {
            for (int i = 0; i < 200; ++i) {
                (void)registry.snapshot();
                (void)registry.contains("w0-0");
            }
        });
    }

    EXPECT_EQ(registry.size(), static_cast<size_t>(kWriters * kPerWriter));

    // Snapshots never shrink while only adds happen.
    size_t last = 0;
    size_t seen = 0;
    while (auto snapshot = sub.try_next()) {
        EXPECT_GE((*snapshot)->size(), last);
        last = (*snapshot)->size();
        ++seen;
    }
    EXPECT_EQ(last, static_cast<size_t>(kWriters * kPerWriter));
    EXPECT_GT(seen, 0u);
}
