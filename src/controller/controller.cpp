/**
 * @file controller.cpp
 * @brief RemoteClusterController implementation.
 */

#include "controller/controller.hpp"

#include <chrono>
#include <functional>
#include <thread>

namespace fabric_controller {

namespace {

using ScopeFilter = std::function<bool(const RemoteClusterRecord&)>;

StatusSyncer::Options status_options(const Config& config, ScopeFilter in_scope) {
    return StatusSyncer::Options{
        .period = config.controller.health_check_period(),
        .retry = RetryPolicy::from_config(config.retry),
        .in_scope = std::move(in_scope)
    };
}

EventPipeline::Options pipeline_options(const Config& config) {
    return EventPipeline::Options{
        .capacity = config.events.capacity,
        .throttle = std::chrono::milliseconds{config.events.throttle_ms},
        .retry = RetryPolicy::from_config(config.retry)
    };
}

Reconciler::Options reconciler_options(const Config& config, ScopeFilter in_scope) {
    return Reconciler::Options{
        .workers = config.controller.reconcile_workers,
        .max_retries = config.queue.max_retries,
        .base_delay = std::chrono::milliseconds{config.queue.base_delay_ms},
        .max_delay = std::chrono::milliseconds{config.queue.max_delay_ms},
        .in_scope = std::move(in_scope)
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

RemoteClusterController::RemoteClusterController(Config config, ControllerDeps deps, Logger logger)
    : config_(std::move(config))
    , deps_(deps)
    , logger_(logger.with_component(std::string{kName}))
    , registry_(logger.with_component("session-registry"))
    , overlay_cache_(deps.networks, logger.with_component("overlay-cache"))
    , status_syncer_(status_options(config_, scope_filter()), deps.informer, deps.store, registry_,
                     logger.with_component("status-sync"))
    , pipeline_(pipeline_options(config_), uuid_lock_, registry_, deps.store, deps.informer,
                deps.recorder, status_syncer_, logger.with_component("event-pipeline"))
    , reconciler_(reconciler_options(config_, scope_filter()), deps.informer, registry_, uuid_lock_,
                  deps.sessions, deps.recorder, pipeline_.publisher(),
                  logger.with_component("reconciler")) {
    register_handlers();
}

RemoteClusterController::~RemoteClusterController() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> RemoteClusterController::start() {
    if (stopped_.load()) {
        return Error{ErrorKind::Internal, "controller cannot be restarted after stop"};
    }
    if (running_.exchange(true)) {
        return Error{ErrorKind::Internal, "Already running"};
    }

    logger_.info("Starting " + std::string{kName} + " controller");

    auto uuid = deps_.identity.resolve();
    if (!uuid) {
        running_.store(false);
        return Error{uuid.error().kind,
                     "cannot determine local cluster uuid: " + uuid.error().message};
    }
    local_uuid_ = *uuid;
    logger_.info("local cluster uuid " + local_uuid_);

    logger_.info("Waiting for informer caches to sync");
    if (auto synced = wait_for_cache_sync(); !synced) {
        running_.store(false);
        return synced;
    }
    synced_.store(true);

    if (auto seeded = seed_uuid_lock(); !seeded) {
        running_.store(false);
        return seeded;
    }

    overlay_cache_.sync_once();

    logger_.info("Starting workers");
    pipeline_.start();
    status_syncer_.start();
    reconciler_.start();

    logger_.info("controller started, health check period "
                 + std::to_string(status_syncer_.period().count()) + "ms");
    return {};
}

void RemoteClusterController::stop() {
    if (!running_.exchange(false)) return;
    stopped_.store(true);

    logger_.info("Shutting down workers");
    reconciler_.stop();
    pipeline_.close();
    pipeline_.join();
    status_syncer_.stop();
    registry_.close_all();
    logger_.info("controller stopped");
}

Result<void> RemoteClusterController::wait_for_cache_sync() {
    auto deadline = std::chrono::steady_clock::now()
                  + std::chrono::milliseconds(config_.controller.cache_sync_timeout_ms);

    while (!(deps_.informer.has_synced() && deps_.networks.has_synced())) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return Error{ErrorKind::NotReady,
                         std::string{kName} + " failed to wait for caches to sync"};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return {};
}

Result<void> RemoteClusterController::seed_uuid_lock() {
    auto records = deps_.store.list();
    if (!records) {
        return Error{records.error().kind,
                     "cannot list remote clusters to seed uuid lock: " + records.error().message};
    }

    size_t seeded = 0;
    for (const auto& record : *records) {
        if (record.status.uuid.empty()) continue;
        if (auto locked = uuid_lock_.lock_by_owner(record.status.uuid, record.name); !locked) {
            logger_.warn("duplicate uuid at startup: " + locked.error().message);
            continue;
        }
        ++seeded;
    }
    logger_.info("uuid lock seeded with " + std::to_string(seeded) + " entries");
    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<void> RemoteClusterController::lock_uuid(const Uuid& uuid, const ClusterName& cluster_name) {
    return uuid_lock_.lock_by_owner(uuid, cluster_name);
}

Result<std::vector<LocalSubnet>> RemoteClusterController::list_local_subnets() const {
    if (!synced_.load()) {
        return Error{ErrorKind::NotReady, "informer cache has not synced yet"};
    }
    return deps_.networks.list_subnets();
}

bool RemoteClusterController::publish(Event event) {
    return pipeline_.publish(std::move(event));
}

// ─────────────────────────────────────────────
// Informer handlers
// ─────────────────────────────────────────────

bool RemoteClusterController::in_scope(const RemoteClusterRecord& record) const {
    if (record.name.empty()) return false;

    const auto& selector = config_.controller.scope_label;
    if (selector.empty()) return true;

    auto eq = selector.find('=');
    if (eq == std::string::npos) {
        return record.labels.count(selector) > 0;
    }
    auto it = record.labels.find(selector.substr(0, eq));
    return it != record.labels.end() && it->second == selector.substr(eq + 1);
}

std::function<bool(const RemoteClusterRecord&)> RemoteClusterController::scope_filter() const {
    return [this](const RemoteClusterRecord& record) { return in_scope(record); };
}

bool RemoteClusterController::needs_reconcile(const RemoteClusterRecord& old_record,
                                              const RemoteClusterRecord& new_record) {
    return connection_changed(old_record.connection, new_record.connection)
        || old_record.labels != new_record.labels
        || old_record.being_deleted() != new_record.being_deleted()
        || old_record.status.uuid != new_record.status.uuid;
}

void RemoteClusterController::register_handlers() {
    deps_.informer.add_event_handler(ResourceHandlers<RemoteClusterRecord>{
        .filter = scope_filter(),
        .on_add = [this](const RemoteClusterRecord& record) {
            reconciler_.enqueue(record.name);
        },
        .on_update = [this](const RemoteClusterRecord& old_record,
                            const RemoteClusterRecord& new_record) {
            if (needs_reconcile(old_record, new_record)) {
                reconciler_.enqueue(new_record.name);
            }
        },
        .on_delete = [this](const RemoteClusterRecord& record) {
            reconciler_.enqueue(record.name);
        },
    });

    // Any new network may be the overlay one; updates and deletes only
    // matter when they touch an overlay network.
    deps_.networks.add_network_handler(ResourceHandlers<LocalNetwork>{
        .filter = nullptr,
        .on_add = [this](const LocalNetwork&) {
            overlay_cache_.sync_once();
        },
        .on_update = [this](const LocalNetwork& old_net, const LocalNetwork& new_net) {
            bool overlay = old_net.type == NetworkType::Overlay
                        || new_net.type == NetworkType::Overlay;
            if (overlay && OverlayNetIdCache::needs_resync(old_net, new_net)) {
                overlay_cache_.sync_once();
            }
        },
        .on_delete = [this](const LocalNetwork& network) {
            if (network.type == NetworkType::Overlay) {
                overlay_cache_.sync_once();
            }
        },
    });
}

}  // namespace fabric_controller
