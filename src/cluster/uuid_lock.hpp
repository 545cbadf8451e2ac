/**
 * @file uuid_lock.hpp
 * @brief In-process identity lock: one peer UUID, one owning cluster record.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

namespace fabric_controller {

/**
 * @brief Maps each claimed peer UUID to the single cluster name that owns it.
 *
 * Two local records must never claim the same peer. Re-locking by the
 * owner is a no-op; locking by anyone else fails with ErrorKind::Conflict
 * until the owner is released. Safe for concurrent use.
 */
class UuidLock {
public:
    Result<void> lock_by_owner(const Uuid& uuid, const ClusterName& owner);

    /// Drops every UUID held by owner. Returns how many were released.
    size_t release_by_owner(const ClusterName& owner);

    [[nodiscard]] std::optional<ClusterName> owner_of(const Uuid& uuid) const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<Uuid, ClusterName> owners_;
};

}  // namespace fabric_controller
