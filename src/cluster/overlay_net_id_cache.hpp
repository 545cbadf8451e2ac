/**
 * @file overlay_net_id_cache.hpp
 * @brief Cached identifier of the local overlay network.
 *
 * Peer-facing queries read this on their hot path, so it has its own
 * reader/writer lock instead of sharing the controller's bookkeeping lock.
 */

#pragma once

#include "core/logger.hpp"
#include "store/collaborators.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>

namespace fabric_controller {

class OverlayNetIdCache {
public:
    OverlayNetIdCache(const ILocalNetworkSource& networks, Logger logger);

    /**
     * @brief Rescan local networks and refresh the cached identifier.
     *
     * Takes the first overlay network; clears the cache when there is none
     * or when it carries no identifier. A failed listing keeps the old value.
     */
    void sync_once();

    [[nodiscard]] std::optional<uint32_t> get() const;

    /// True if a change from old_net to new_net can move the overlay identifier.
    [[nodiscard]] static bool needs_resync(const LocalNetwork& old_net, const LocalNetwork& new_net);

private:
    const ILocalNetworkSource& networks_;
    Logger logger_;
    mutable std::shared_mutex mutex_;
    std::optional<uint32_t> net_id_;
};

}  // namespace fabric_controller
