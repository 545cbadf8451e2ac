/**
 * @file status_sync.cpp
 * @brief StatusSyncer implementation.
 */

#include "controller/status_sync.hpp"

namespace fabric_controller {

StatusSyncer::StatusSyncer(Options options,
                           IRemoteClusterInformer& informer,
                           IRemoteClusterStore& store,
                           SessionRegistry& registry,
                           Logger logger)
    : options_(std::move(options))
    , informer_(informer)
    , store_(store)
    , registry_(registry)
    , logger_(std::move(logger)) {
    if (options_.period.count() <= 0) {
        options_.period = std::chrono::milliseconds{30000};
    }
}

StatusSyncer::~StatusSyncer() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void StatusSyncer::start() {
    if (ticker_.joinable()) return;
    stopped_.store(false);
    ticker_ = std::jthread([this](std::stop_token stop) {
        run_loop(stop);
    });
}

void StatusSyncer::stop() {
    stopped_.store(true);
    if (ticker_.joinable()) {
        ticker_.request_stop();
        tick_cv_.notify_all();
        ticker_.join();
    }
    reactive_tasks_.request_stop();
    wait_reactive();
}

void StatusSyncer::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        sync_all();

        std::unique_lock lock(tick_mutex_);
        tick_cv_.wait_for(lock, stop, options_.period, [] { return false; });
    }
}

// ─────────────────────────────────────────────
// Rounds
// ─────────────────────────────────────────────

size_t StatusSyncer::sync_all() {
    auto records = informer_.cached_list();
    if (!records) {
        logger_.error("can't list remote clusters: " + records.error().describe());
        return 0;
    }

    TaskGroup round;
    size_t spawned = 0;
    for (auto& record : *records) {
        if (options_.in_scope && !options_.in_scope(record)) continue;
        auto session = registry_.get(record.name);
        if (!session) continue;

        round.spawn([this, r = std::move(record), s = std::move(session)] {
            sync_one(r, s);
        });
        ++spawned;
    }

    log_failures(round.wait());
    rounds_.fetch_add(1);
    if (spawned > 0) {
        logger_.debug("status round finished for " + std::to_string(spawned) + " clusters");
    }
    return spawned;
}

bool StatusSyncer::sync_one(const RemoteClusterRecord& record,
                            const std::shared_ptr<ISession>& session) {
    if (!try_begin(record.name)) {
        logger_.debug("status probe already running for cluster " + record.name);
        return false;
    }
    struct Release {
        StatusSyncer* self;
        const ClusterName& name;
        ~Release() { self->finish(name); }
    } release{this, record.name};

    auto health = session->probe();
    if (!health) {
        logger_.warn("health probe failed for cluster " + record.name
                     + ", skipping status update: " + health.error().describe());
        return true;
    }

    StatusPatch patch{
        .state = health->healthy ? ClusterState::Online : ClusterState::Offline,
        .message = health->message,
        .last_probe_time = health->probed_at,
        .remote_subnet_count = health->remote_subnet_count,
        .remote_vtep_count = health->remote_vtep_count
    };

    auto patched = retry_on_conflict(options_.retry, [&] {
        return store_.patch_status(record.name, patch);
    });
    if (!patched) {
        logger_.error("failed to update status of cluster " + record.name + ": "
                      + patched.error().describe());
    }
    return true;
}

void StatusSyncer::refresh_async(RemoteClusterRecord record, std::shared_ptr<ISession> session) {
    if (stopped_.load()) {
        logger_.debug("status syncer stopped, ignoring refresh for cluster " + record.name);
        return;
    }
    reactive_tasks_.spawn([this, r = std::move(record), s = std::move(session)] {
        sync_one(r, s);
    });
}

void StatusSyncer::wait_reactive() {
    log_failures(reactive_tasks_.wait());
}

// ─────────────────────────────────────────────
// In-flight guard
// ─────────────────────────────────────────────

bool StatusSyncer::try_begin(const ClusterName& name) {
    std::lock_guard lock(inflight_mutex_);
    return in_flight_.insert(name).second;
}

void StatusSyncer::finish(const ClusterName& name) {
    std::lock_guard lock(inflight_mutex_);
    in_flight_.erase(name);
}

void StatusSyncer::log_failures(const std::vector<std::string>& failures) {
    for (const auto& failure : failures) {
        logger_.error("status task ended with exception: " + failure);
    }
}

}  // namespace fabric_controller
