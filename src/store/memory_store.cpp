/**
 * @file memory_store.cpp
 * @brief In-memory store, informer and network source implementation.
 */

#include "store/memory_store.hpp"

#include <chrono>

namespace fabric_controller {

namespace {

Error not_found(const ClusterName& name) {
    return Error{ErrorKind::NotFound, "remote cluster " + name + " not found"};
}

void apply_patch(RemoteClusterStatus& status, const StatusPatch& patch) {
    if (patch.uuid) status.uuid = *patch.uuid;
    if (patch.state) status.state = *patch.state;
    if (patch.message) status.message = *patch.message;
    if (patch.last_probe_time) status.last_probe_time = *patch.last_probe_time;
    if (patch.remote_subnet_count) status.remote_subnet_count = *patch.remote_subnet_count;
    if (patch.remote_vtep_count) status.remote_vtep_count = *patch.remote_vtep_count;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// MemoryRemoteClusterStore: API
// ─────────────────────────────────────────────

Result<std::vector<RemoteClusterRecord>> MemoryRemoteClusterStore::list() {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure_locked(StoreOp::List)) return *failure;

    std::vector<RemoteClusterRecord> result;
    result.reserve(records_.size());
    for (const auto& [name, record] : records_) {
        result.push_back(record);
    }
    return result;
}

Result<RemoteClusterRecord> MemoryRemoteClusterStore::get(const ClusterName& name) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure_locked(StoreOp::Get)) return *failure;

    auto it = records_.find(name);
    if (it == records_.end()) return not_found(name);
    return it->second;
}

Result<RemoteClusterRecord> MemoryRemoteClusterStore::patch_status(const ClusterName& name,
                                                                   const StatusPatch& patch) {
    RemoteClusterRecord old_record;
    RemoteClusterRecord new_record;
    {
        std::lock_guard lock(mutex_);
        if (auto failure = take_failure_locked(StoreOp::PatchStatus)) return *failure;
        if (auto it = failing_patches_.find(name); it != failing_patches_.end()) {
            return Error{it->second, "injected patch failure for " + name};
        }

        auto it = records_.find(name);
        if (it == records_.end()) return not_found(name);
        if (patch.resource_version && *patch.resource_version != it->second.resource_version) {
            return Error{ErrorKind::Conflict,
                         "remote cluster " + name + " was modified: resource version "
                         + std::to_string(it->second.resource_version) + " != "
                         + std::to_string(*patch.resource_version)};
        }

        old_record = it->second;
        apply_patch(it->second.status, patch);
        it->second.resource_version = next_version_++;
        ++patch_counts_[name];
        new_record = it->second;
    }

    for (const auto& h : handlers_snapshot()) dispatch_update(h, old_record, new_record);
    return new_record;
}

// ─────────────────────────────────────────────
// MemoryRemoteClusterStore: informer
// ─────────────────────────────────────────────

Result<std::vector<RemoteClusterRecord>> MemoryRemoteClusterStore::cached_list() const {
    std::lock_guard lock(mutex_);
    std::vector<RemoteClusterRecord> result;
    result.reserve(records_.size());
    for (const auto& [name, record] : records_) {
        result.push_back(record);
    }
    return result;
}

Result<RemoteClusterRecord> MemoryRemoteClusterStore::cached_get(const ClusterName& name) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) return not_found(name);
    return it->second;
}

void MemoryRemoteClusterStore::add_event_handler(ResourceHandlers<RemoteClusterRecord> handlers) {
    std::vector<RemoteClusterRecord> existing;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [name, record] : records_) existing.push_back(record);
    }
    {
        std::lock_guard lock(handlers_mutex_);
        handlers_.push_back(handlers);
    }
    // A late handler still sees every existing record as an add.
    for (const auto& record : existing) dispatch_add(handlers, record);
}

std::vector<ResourceHandlers<RemoteClusterRecord>> MemoryRemoteClusterStore::handlers_snapshot() const {
    std::lock_guard lock(handlers_mutex_);
    return handlers_;
}

// ─────────────────────────────────────────────
// MemoryRemoteClusterStore: mutations
// ─────────────────────────────────────────────

Result<RemoteClusterRecord> MemoryRemoteClusterStore::create(RemoteClusterRecord record) {
    if (record.name.empty()) {
        return Error{ErrorKind::InvalidArgument, "remote cluster name must be non-empty"};
    }
    {
        std::lock_guard lock(mutex_);
        if (records_.count(record.name) > 0) {
            return Error{ErrorKind::Conflict, "remote cluster " + record.name + " already exists"};
        }
        record.resource_version = next_version_++;
        records_[record.name] = record;
    }

    for (const auto& h : handlers_snapshot()) dispatch_add(h, record);
    return record;
}

Result<RemoteClusterRecord> MemoryRemoteClusterStore::update(const RemoteClusterRecord& record) {
    RemoteClusterRecord old_record;
    RemoteClusterRecord new_record;
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(record.name);
        if (it == records_.end()) return not_found(record.name);

        old_record = it->second;
        it->second.labels = record.labels;
        it->second.connection = record.connection;
        it->second.resource_version = next_version_++;
        new_record = it->second;
    }

    for (const auto& h : handlers_snapshot()) dispatch_update(h, old_record, new_record);
    return new_record;
}

Result<RemoteClusterRecord> MemoryRemoteClusterStore::mark_deleted(const ClusterName& name) {
    RemoteClusterRecord old_record;
    RemoteClusterRecord new_record;
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) return not_found(name);
        if (it->second.being_deleted()) return it->second;

        old_record = it->second;
        it->second.deletion_timestamp = std::chrono::system_clock::now();
        it->second.resource_version = next_version_++;
        new_record = it->second;
    }

    for (const auto& h : handlers_snapshot()) dispatch_update(h, old_record, new_record);
    return new_record;
}

Result<void> MemoryRemoteClusterStore::erase(const ClusterName& name) {
    RemoteClusterRecord removed;
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end()) return not_found(name);
        removed = std::move(it->second);
        records_.erase(it);
    }

    for (const auto& h : handlers_snapshot()) dispatch_delete(h, removed);
    return {};
}

// ─────────────────────────────────────────────
// MemoryRemoteClusterStore: failure injection
// ─────────────────────────────────────────────

void MemoryRemoteClusterStore::inject_failure(StoreOp op, ErrorKind kind, uint32_t count) {
    std::lock_guard lock(mutex_);
    injected_[op] = Injected{.kind = kind, .remaining = count};
}

void MemoryRemoteClusterStore::fail_patches_for(const ClusterName& name, ErrorKind kind) {
    std::lock_guard lock(mutex_);
    failing_patches_[name] = kind;
}

void MemoryRemoteClusterStore::clear_failures() {
    std::lock_guard lock(mutex_);
    injected_.clear();
    failing_patches_.clear();
}

uint64_t MemoryRemoteClusterStore::patch_count(const ClusterName& name) const {
    std::lock_guard lock(mutex_);
    auto it = patch_counts_.find(name);
    return it == patch_counts_.end() ? 0 : it->second;
}

std::optional<Error> MemoryRemoteClusterStore::take_failure_locked(StoreOp op) {
    auto it = injected_.find(op);
    if (it == injected_.end() || it->second.remaining == 0) return std::nullopt;

    Error err{it->second.kind, "injected failure"};
    if (--it->second.remaining == 0) injected_.erase(it);
    return err;
}

// ─────────────────────────────────────────────
// MemoryNetworkSource
// ─────────────────────────────────────────────

Result<std::vector<LocalNetwork>> MemoryNetworkSource::list_networks() const {
    if (fail_list_.load()) return Error{ErrorKind::Unavailable, "network lister unavailable"};

    std::lock_guard lock(mutex_);
    std::vector<LocalNetwork> result;
    result.reserve(networks_.size());
    for (const auto& [name, network] : networks_) result.push_back(network);
    return result;
}

Result<std::vector<LocalSubnet>> MemoryNetworkSource::list_subnets() const {
    if (fail_list_.load()) return Error{ErrorKind::Unavailable, "subnet lister unavailable"};

    std::lock_guard lock(mutex_);
    std::vector<LocalSubnet> result;
    result.reserve(subnets_.size());
    for (const auto& [name, subnet] : subnets_) result.push_back(subnet);
    return result;
}

void MemoryNetworkSource::add_network_handler(ResourceHandlers<LocalNetwork> handlers) {
    std::lock_guard lock(handlers_mutex_);
    handlers_.push_back(std::move(handlers));
}

void MemoryNetworkSource::upsert_network(LocalNetwork network) {
    std::optional<LocalNetwork> previous;
    {
        std::lock_guard lock(mutex_);
        auto it = networks_.find(network.name);
        if (it != networks_.end()) {
            previous = it->second;
            it->second = network;
        } else {
            networks_.emplace(network.name, network);
        }
    }

    std::vector<ResourceHandlers<LocalNetwork>> handlers;
    {
        std::lock_guard lock(handlers_mutex_);
        handlers = handlers_;
    }
    for (const auto& h : handlers) {
        if (previous) {
            dispatch_update(h, *previous, network);
        } else {
            dispatch_add(h, network);
        }
    }
}

bool MemoryNetworkSource::remove_network(const std::string& name) {
    LocalNetwork removed;
    {
        std::lock_guard lock(mutex_);
        auto it = networks_.find(name);
        if (it == networks_.end()) return false;
        removed = std::move(it->second);
        networks_.erase(it);
    }

    std::vector<ResourceHandlers<LocalNetwork>> handlers;
    {
        std::lock_guard lock(handlers_mutex_);
        handlers = handlers_;
    }
    for (const auto& h : handlers) dispatch_delete(h, removed);
    return true;
}

void MemoryNetworkSource::upsert_subnet(LocalSubnet subnet) {
    std::lock_guard lock(mutex_);
    subnets_[subnet.name] = std::move(subnet);
}

// ─────────────────────────────────────────────
// StaticClusterIdentity
// ─────────────────────────────────────────────

Result<Uuid> StaticClusterIdentity::resolve() {
    if (uuid_.empty()) {
        return Error{ErrorKind::NotFound, "local cluster identity is not available"};
    }
    return uuid_;
}

}  // namespace fabric_controller
