/**
 * @file local_identity.cpp
 * @brief LocalIdentity implementation.
 */

#include "discovery/local_identity.hpp"

namespace lan_beacon {

void LocalIdentity::set_current(PeerRecord record) {
    std::lock_guard lock(mutex_);
    record_ = std::move(record);
}

std::optional<PeerRecord> LocalIdentity::current() const {
    std::lock_guard lock(mutex_);
    return record_;
}

Result<PeerRecord> LocalIdentity::require() const {
    std::lock_guard lock(mutex_);
    if (!record_) {
        return Error{ErrorKind::Precondition, "local node identity not initialized"};
    }
    return *record_;
}

bool LocalIdentity::is_set() const {
    std::lock_guard lock(mutex_);
    return record_.has_value();
}

}  // namespace lan_beacon
