/**
 * @file node_registry.hpp
 * @brief Thread-safe fingerprint -> PeerRecord map with snapshot broadcast.
 *
 * Every mutation publishes an immutable snapshot to all subscribers while
 * the registry lock is held, so subscribers see mutations whole and in
 * order. Each subscriber has its own bounded queue; a full queue drops its
 * oldest entry instead of blocking the publisher, so a slow consumer may
 * skip intermediate snapshots but always ends on the latest one.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace lan_beacon {

using SnapshotPtr = std::shared_ptr<const PeerMap>;

class NodeRegistry;

/**
 * @brief Receiving end of a registry subscription.
 *
 * Move-only. Detaches from the registry when destroyed. A moved-from
 * handle is empty and yields nothing.
 */
class Subscription {
public:
    Subscription(Subscription&&) noexcept = default;
    Subscription& operator=(Subscription&&) noexcept = default;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /// Wait up to `timeout` for the next snapshot.
    [[nodiscard]] std::optional<SnapshotPtr> next(std::chrono::milliseconds timeout);

    /// Pop the next snapshot if one is queued.
    [[nodiscard]] std::optional<SnapshotPtr> try_next();

    /// Number of queued, unread snapshots.
    [[nodiscard]] size_t pending() const;

    /// Snapshots dropped because the queue was full.
    [[nodiscard]] size_t dropped() const;

private:
    friend class NodeRegistry;

    struct Queue {
        explicit Queue(size_t cap) : capacity(cap) {}

        void push(SnapshotPtr snapshot);

        const size_t capacity;
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<SnapshotPtr> items;
        size_t dropped{0};
    };

    explicit Subscription(std::shared_ptr<Queue> queue) : queue_(std::move(queue)) {}

    std::shared_ptr<Queue> queue_;
};

class NodeRegistry {
public:
    static constexpr size_t DEFAULT_QUEUE_DEPTH = 64;

    explicit NodeRegistry(size_t subscriber_queue_depth = DEFAULT_QUEUE_DEPTH);

    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    /// Insert or replace by fingerprint.
    void add(PeerRecord record);

    /// Remove if present. Publishes even when nothing was removed.
    void remove(const Fingerprint& fingerprint);

    void clear();

    [[nodiscard]] std::optional<PeerRecord> get(const Fingerprint& fingerprint) const;
    [[nodiscard]] PeerMap snapshot() const;
    [[nodiscard]] bool contains(const Fingerprint& fingerprint) const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Attach a subscriber.
     *
     * The returned handle yields the current snapshot first, then one
     * snapshot per subsequent mutation.
     */
    [[nodiscard]] Subscription subscribe();

    [[nodiscard]] size_t subscriber_count() const;

private:
    // Requires mutex_ held.
    void publish_locked();

    const size_t queue_depth_;
    mutable std::mutex mutex_;
    PeerMap peers_;
    SnapshotPtr latest_;
    std::vector<std::weak_ptr<Subscription::Queue>> subscribers_;
};

}  // namespace lan_beacon
