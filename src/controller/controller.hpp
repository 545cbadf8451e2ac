/**
 * @file controller.hpp
 * @brief Remote cluster controller facade: wiring, startup gate and shutdown.
 *
 * Owns the identity lock, the session registry and the overlay cache, and
 * passes them explicitly to the reconciler, the status syncer and the
 * event pipeline. start() refuses to launch any worker until the local
 * identity is known, the caches have synced and the identity lock holds
 * every UUID already persisted on a record.
 */

#pragma once

#include "cluster/overlay_net_id_cache.hpp"
#include "cluster/session_registry.hpp"
#include "cluster/uuid_lock.hpp"
#include "controller/event_pipeline.hpp"
#include "controller/reconciler.hpp"
#include "controller/status_sync.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "session/session.hpp"
#include "store/collaborators.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fabric_controller {

/**
 * @brief External collaborators. All must outlive the controller.
 */
struct ControllerDeps {
    IRemoteClusterStore& store;
    IRemoteClusterInformer& informer;
    ILocalNetworkSource& networks;
    ILocalClusterIdentity& identity;
    ISessionFactory& sessions;
    IEventRecorder& recorder;
};

class RemoteClusterController {
public:
    static constexpr std::string_view kName = "remotecluster";

    RemoteClusterController(Config config, ControllerDeps deps, Logger logger);
    ~RemoteClusterController();

    // Non-copyable, non-movable
    RemoteClusterController(const RemoteClusterController&) = delete;
    RemoteClusterController& operator=(const RemoteClusterController&) = delete;

    // ── Lifecycle ────────────────────────────
    /// One-shot: fails with Internal once stop() has run.
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] bool has_synced() const noexcept { return synced_.load(); }

    // ── Peer-facing queries ──────────────────
    [[nodiscard]] const Uuid& local_uuid() const noexcept { return local_uuid_; }
    Result<void> lock_uuid(const Uuid& uuid, const ClusterName& cluster_name);
    [[nodiscard]] std::optional<uint32_t> overlay_net_id() const { return overlay_cache_.get(); }
    /// Fails with NotReady until the caches have synced.
    Result<std::vector<LocalSubnet>> list_local_subnets() const;
    bool publish(Event event);

    // ── Accessors (for testing) ─────────────
    SessionRegistry& registry() { return registry_; }
    UuidLock& uuid_lock() { return uuid_lock_; }
    Reconciler& reconciler() { return reconciler_; }
    StatusSyncer& status_syncer() { return status_syncer_; }
    EventPipeline& pipeline() { return pipeline_; }
    const Config& config() const { return config_; }

    /// Scope filter applied to remote cluster notifications.
    [[nodiscard]] bool in_scope(const RemoteClusterRecord& record) const;
    /// True if an update touches anything reconciliation depends on.
    [[nodiscard]] static bool needs_reconcile(const RemoteClusterRecord& old_record,
                                              const RemoteClusterRecord& new_record);

private:
    std::function<bool(const RemoteClusterRecord&)> scope_filter() const;
    void register_handlers();
    Result<void> wait_for_cache_sync();
    Result<void> seed_uuid_lock();

    Config config_;
    ControllerDeps deps_;
    Logger logger_;

    Uuid local_uuid_;
    std::atomic<bool> running_{false};
    std::atomic<bool> synced_{false};
    std::atomic<bool> stopped_{false};

    UuidLock uuid_lock_;
    SessionRegistry registry_;
    OverlayNetIdCache overlay_cache_;
    StatusSyncer status_syncer_;
    EventPipeline pipeline_;
    Reconciler reconciler_;
};

}  // namespace fabric_controller
