/**
 * @file local_identity.hpp
 * @brief Holder for this node's own PeerRecord.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <mutex>
#include <optional>

namespace lan_beacon {

class LocalIdentity {
public:
    /// Replace the local identity. Always succeeds.
    void set_current(PeerRecord record);

    [[nodiscard]] std::optional<PeerRecord> current() const;

    /// The identity, or an ErrorKind::Precondition error when unset.
    [[nodiscard]] Result<PeerRecord> require() const;

    [[nodiscard]] bool is_set() const;

private:
    mutable std::mutex mutex_;
    std::optional<PeerRecord> record_;
};

}  // namespace lan_beacon
