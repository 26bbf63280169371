/**
 * @file node_registry.cpp
 * @brief NodeRegistry and Subscription implementation.
 */

#include "discovery/node_registry.hpp"

#include <algorithm>

namespace lan_beacon {

// ─────────────────────────────────────────────
// Subscription
// ─────────────────────────────────────────────

void Subscription::Queue::push(SnapshotPtr snapshot) {
    {
        std::lock_guard lock(mutex);
        if (items.size() >= capacity) {
            items.pop_front();
            ++dropped;
        }
        items.push_back(std::move(snapshot));
    }
    cv.notify_one();
}

std::optional<SnapshotPtr> Subscription::next(std::chrono::milliseconds timeout) {
    if (!queue_) return std::nullopt;  // moved-from
    std::unique_lock lock(queue_->mutex);
    if (!queue_->cv.wait_for(lock, timeout, [this] { return !queue_->items.empty(); })) {
        return std::nullopt;
    }
    auto snapshot = std::move(queue_->items.front());
    queue_->items.pop_front();
    return snapshot;
}

std::optional<SnapshotPtr> Subscription::try_next() {
    if (!queue_) return std::nullopt;
    std::lock_guard lock(queue_->mutex);
    if (queue_->items.empty()) return std::nullopt;
    auto snapshot = std::move(queue_->items.front());
    queue_->items.pop_front();
    return snapshot;
}

size_t Subscription::pending() const {
    if (!queue_) return 0;
    std::lock_guard lock(queue_->mutex);
    return queue_->items.size();
}

size_t Subscription::dropped() const {
    if (!queue_) return 0;
    std::lock_guard lock(queue_->mutex);
    return queue_->dropped;
}

// ─────────────────────────────────────────────
// NodeRegistry
// ─────────────────────────────────────────────

NodeRegistry::NodeRegistry(size_t subscriber_queue_depth)
    : queue_depth_(std::max<size_t>(subscriber_queue_depth, 1))
    , latest_(std::make_shared<const PeerMap>()) {}

void NodeRegistry::add(PeerRecord record) {
    std::lock_guard lock(mutex_);
    auto key = record.fingerprint;
    peers_.insert_or_assign(std::move(key), std::move(record));
    publish_locked();
}

void NodeRegistry::remove(const Fingerprint& fingerprint) {
    std::lock_guard lock(mutex_);
    peers_.erase(fingerprint);
    publish_locked();
}

void NodeRegistry::clear() {
    std::lock_guard lock(mutex_);
    peers_.clear();
    publish_locked();
}

std::optional<PeerRecord> NodeRegistry::get(const Fingerprint& fingerprint) const {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(fingerprint);
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

PeerMap NodeRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    return peers_;
}

bool NodeRegistry::contains(const Fingerprint& fingerprint) const {
    std::lock_guard lock(mutex_);
    return peers_.count(fingerprint) > 0;
}

size_t NodeRegistry::size() const {
    std::lock_guard lock(mutex_);
    return peers_.size();
}

Subscription NodeRegistry::subscribe() {
    auto queue = std::make_shared<Subscription::Queue>(queue_depth_);

    std::lock_guard lock(mutex_);
    queue->push(latest_);
    subscribers_.push_back(queue);
    return Subscription(std::move(queue));
}

size_t NodeRegistry::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
        [](const auto& weak) { return !weak.expired(); }));
}

void NodeRegistry::publish_locked() {
    latest_ = std::make_shared<const PeerMap>(peers_);

    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
        if (auto queue = it->lock()) {
            queue->push(latest_);
            ++it;
        } else {
            it = subscribers_.erase(it);
        }
    }
}

}  // namespace lan_beacon
