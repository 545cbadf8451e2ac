/**
 * @file uuid_lock.cpp
 * @brief UuidLock implementation.
 */

#include "cluster/uuid_lock.hpp"

namespace fabric_controller {

Result<void> UuidLock::lock_by_owner(const Uuid& uuid, const ClusterName& owner) {
    if (uuid.empty() || owner.empty()) {
        return Error{ErrorKind::InvalidArgument, "uuid and owner must be non-empty"};
    }

    std::lock_guard lock(mutex_);
    auto [it, inserted] = owners_.try_emplace(uuid, owner);
    if (inserted || it->second == owner) {
        return {};
    }
    return Error{ErrorKind::Conflict,
                 "uuid " + uuid + " is held by cluster " + it->second
                 + ", refusing claim by " + owner};
}

size_t UuidLock::release_by_owner(const ClusterName& owner) {
    std::lock_guard lock(mutex_);
    return std::erase_if(owners_, [&owner](const auto& entry) {
        return entry.second == owner;
    });
}

std::optional<ClusterName> UuidLock::owner_of(const Uuid& uuid) const {
    std::lock_guard lock(mutex_);
    auto it = owners_.find(uuid);
    if (it == owners_.end()) return std::nullopt;
    return it->second;
}

size_t UuidLock::size() const {
    std::lock_guard lock(mutex_);
    return owners_.size();
}

}  // namespace fabric_controller
