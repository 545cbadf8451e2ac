/**
 * @file collaborators.hpp
 * @brief Interfaces to the API server, informer caches and event sink.
 *
 * These are configured once at startup, so plain virtual dispatch is
 * used. The store is the authoritative API (list/get/patch); informers are
 * eventually-consistent caches that must report synced before the
 * controller serves any read from them.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "session/session.hpp"

#include <functional>
#include <string>
#include <vector>

namespace fabric_controller {

// ─────────────────────────────────────────────
// Informer notifications
// ─────────────────────────────────────────────

/**
 * @brief Add/update/delete callbacks behind an optional filter.
 *
 * With a filter, an update whose old object passed but new object does
 * not is delivered as a delete, and the reverse as an add.
 */
template <typename T>
struct ResourceHandlers {
    std::function<bool(const T&)> filter;
    std::function<void(const T&)> on_add;
    std::function<void(const T&, const T&)> on_update;
    std::function<void(const T&)> on_delete;
};

template <typename T>
void dispatch_add(const ResourceHandlers<T>& h, const T& obj) {
    if (h.filter && !h.filter(obj)) return;
    if (h.on_add) h.on_add(obj);
}

template <typename T>
void dispatch_update(const ResourceHandlers<T>& h, const T& old_obj, const T& new_obj) {
    bool old_ok = !h.filter || h.filter(old_obj);
    bool new_ok = !h.filter || h.filter(new_obj);
    if (old_ok && new_ok) {
        if (h.on_update) h.on_update(old_obj, new_obj);
    } else if (new_ok) {
        if (h.on_add) h.on_add(new_obj);
    } else if (old_ok) {
        if (h.on_delete) h.on_delete(old_obj);
    }
}

template <typename T>
void dispatch_delete(const ResourceHandlers<T>& h, const T& obj) {
    if (h.filter && !h.filter(obj)) return;
    if (h.on_delete) h.on_delete(obj);
}

// ─────────────────────────────────────────────
// Remote cluster records
// ─────────────────────────────────────────────

/**
 * @brief Authoritative record store (the API server).
 */
class IRemoteClusterStore {
public:
    virtual ~IRemoteClusterStore() = default;

    virtual Result<std::vector<RemoteClusterRecord>> list() = 0;
    virtual Result<RemoteClusterRecord> get(const ClusterName& name) = 0;

    /// Merge-patches the status subresource. Conflict on a stale resource_version.
    virtual Result<RemoteClusterRecord> patch_status(const ClusterName& name,
                                                     const StatusPatch& patch) = 0;
};

/**
 * @brief Eventually-consistent cache of remote cluster records.
 */
class IRemoteClusterInformer {
public:
    virtual ~IRemoteClusterInformer() = default;

    [[nodiscard]] virtual bool has_synced() const = 0;
    virtual Result<std::vector<RemoteClusterRecord>> cached_list() const = 0;
    virtual Result<RemoteClusterRecord> cached_get(const ClusterName& name) const = 0;
    virtual void add_event_handler(ResourceHandlers<RemoteClusterRecord> handlers) = 0;
};

// ─────────────────────────────────────────────
// Local cluster
// ─────────────────────────────────────────────

/**
 * @brief Read-only view of the local cluster's networks and subnets.
 */
class ILocalNetworkSource {
public:
    virtual ~ILocalNetworkSource() = default;

    [[nodiscard]] virtual bool has_synced() const = 0;
    virtual Result<std::vector<LocalNetwork>> list_networks() const = 0;
    virtual Result<std::vector<LocalSubnet>> list_subnets() const = 0;
    virtual void add_network_handler(ResourceHandlers<LocalNetwork> handlers) = 0;
};

/**
 * @brief Resolves the local cluster's own identity.
 */
class ILocalClusterIdentity {
public:
    virtual ~ILocalClusterIdentity() = default;

    virtual Result<Uuid> resolve() = 0;
};

/**
 * @brief Sink for human-readable events attached to a cluster record.
 */
class IEventRecorder {
public:
    virtual ~IEventRecorder() = default;

    virtual void event(const RemoteClusterRecord& target,
                       EventType type,
                       const std::string& reason,
                       const std::string& message) = 0;
};

}  // namespace fabric_controller
