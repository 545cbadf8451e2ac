/**
 * @file memory_store.hpp
 * @brief In-memory record store, informer and local network source.
 *
 * Used by the standalone daemon and by tests. Mutations bump a global
 * resource version and notify registered handlers synchronously on the
 * mutating thread, after the store lock has been released. Failures can
 * be injected per operation to exercise retry and skip paths.
 */

#pragma once

#include "store/collaborators.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace fabric_controller {

enum class StoreOp : uint8_t {
    List,
    Get,
    PatchStatus
};

class MemoryRemoteClusterStore : public IRemoteClusterStore, public IRemoteClusterInformer {
public:
    // ── IRemoteClusterStore ──────────────────
    Result<std::vector<RemoteClusterRecord>> list() override;
    Result<RemoteClusterRecord> get(const ClusterName& name) override;
    Result<RemoteClusterRecord> patch_status(const ClusterName& name,
                                             const StatusPatch& patch) override;

    // ── IRemoteClusterInformer ───────────────
    [[nodiscard]] bool has_synced() const override { return synced_.load(); }
    Result<std::vector<RemoteClusterRecord>> cached_list() const override;
    Result<RemoteClusterRecord> cached_get(const ClusterName& name) const override;
    void add_event_handler(ResourceHandlers<RemoteClusterRecord> handlers) override;

    // ── Administrative mutations ─────────────
    Result<RemoteClusterRecord> create(RemoteClusterRecord record);
    /// Replaces labels and connection; status is preserved.
    Result<RemoteClusterRecord> update(const RemoteClusterRecord& record);
    Result<RemoteClusterRecord> mark_deleted(const ClusterName& name);
    Result<void> erase(const ClusterName& name);

    // ── Test hooks ───────────────────────────
    void set_synced(bool synced) { synced_.store(synced); }
    /// The next `count` calls of op fail with kind.
    void inject_failure(StoreOp op, ErrorKind kind, uint32_t count = 1);
    /// Fails patch_status for one cluster until cleared.
    void fail_patches_for(const ClusterName& name, ErrorKind kind);
    void clear_failures();
    [[nodiscard]] uint64_t patch_count(const ClusterName& name) const;

private:
    struct Injected {
        ErrorKind kind;
        uint32_t remaining;
    };

    std::optional<Error> take_failure_locked(StoreOp op);
    std::vector<ResourceHandlers<RemoteClusterRecord>> handlers_snapshot() const;

    mutable std::mutex mutex_;
    std::map<ClusterName, RemoteClusterRecord> records_;
    std::unordered_map<ClusterName, uint64_t> patch_counts_;
    std::unordered_map<ClusterName, ErrorKind> failing_patches_;
    std::map<StoreOp, Injected> injected_;
    uint64_t next_version_ = 1;
    std::atomic<bool> synced_{true};

    mutable std::mutex handlers_mutex_;
    std::vector<ResourceHandlers<RemoteClusterRecord>> handlers_;
};

class MemoryNetworkSource : public ILocalNetworkSource {
public:
    [[nodiscard]] bool has_synced() const override { return synced_.load(); }
    Result<std::vector<LocalNetwork>> list_networks() const override;
    Result<std::vector<LocalSubnet>> list_subnets() const override;
    void add_network_handler(ResourceHandlers<LocalNetwork> handlers) override;

    void upsert_network(LocalNetwork network);
    bool remove_network(const std::string& name);
    void upsert_subnet(LocalSubnet subnet);

    void set_synced(bool synced) { synced_.store(synced); }
    void set_list_failure(bool fail) { fail_list_.store(fail); }

private:
    mutable std::mutex mutex_;
    std::map<std::string, LocalNetwork> networks_;
    std::map<std::string, LocalSubnet> subnets_;
    std::atomic<bool> synced_{true};
    std::atomic<bool> fail_list_{false};

    mutable std::mutex handlers_mutex_;
    std::vector<ResourceHandlers<LocalNetwork>> handlers_;
};

/**
 * @brief Identity fixed at construction. An empty uuid fails to resolve.
 */
class StaticClusterIdentity : public ILocalClusterIdentity {
public:
    explicit StaticClusterIdentity(Uuid uuid) : uuid_(std::move(uuid)) {}

    Result<Uuid> resolve() override;

private:
    Uuid uuid_;
};

}  // namespace fabric_controller
