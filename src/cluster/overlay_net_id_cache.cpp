/**
 * @file overlay_net_id_cache.cpp
 * @brief OverlayNetIdCache implementation.
 */

#include "cluster/overlay_net_id_cache.hpp"

#include <mutex>

namespace fabric_controller {

OverlayNetIdCache::OverlayNetIdCache(const ILocalNetworkSource& networks, Logger logger)
    : networks_(networks), logger_(std::move(logger)) {}

void OverlayNetIdCache::sync_once() {
    std::unique_lock lock(mutex_);

    auto networks = networks_.list_networks();
    if (!networks) {
        logger_.warn("failed to list networks: " + networks.error().describe());
        return;
    }

    for (const auto& network : *networks) {
        if (network.type != NetworkType::Overlay) continue;

        if (net_id_ != network.net_id) {
            net_id_ = network.net_id;
            logger_.info("overlay network " + network.name + " id now "
                         + (net_id_ ? std::to_string(*net_id_) : std::string{"unset"}));
        }
        return;
    }

    if (net_id_) {
        logger_.info("no overlay network left, clearing cached id");
    }
    net_id_.reset();
}

std::optional<uint32_t> OverlayNetIdCache::get() const {
    std::shared_lock lock(mutex_);
    return net_id_;
}

bool OverlayNetIdCache::needs_resync(const LocalNetwork& old_net, const LocalNetwork& new_net) {
    return old_net.type != new_net.type
        || !old_net.net_id || !new_net.net_id
        || *old_net.net_id != *new_net.net_id;
}

}  // namespace fabric_controller
