/**
 * @file reconciler.cpp
 * @brief Reconciler implementation.
 */

#include "controller/reconciler.hpp"

namespace fabric_controller {

Reconciler::Reconciler(Options options,
                       IRemoteClusterInformer& informer,
                       SessionRegistry& registry,
                       UuidLock& uuid_lock,
                       ISessionFactory& factory,
                       IEventRecorder& recorder,
                       EventPublisher publisher,
                       Logger logger)
    : options_(std::move(options))
    , informer_(informer)
    , registry_(registry)
    , uuid_lock_(uuid_lock)
    , factory_(factory)
    , recorder_(recorder)
    , publisher_(std::move(publisher))
    , logger_(std::move(logger))
    , queue_(options_.base_delay, options_.max_delay) {}

Reconciler::~Reconciler() {
    stop();
}

// ─────────────────────────────────────────────
// Workers
// ─────────────────────────────────────────────

void Reconciler::enqueue(const ClusterName& name) {
    queue_.add(name);
}

void Reconciler::start() {
    if (!workers_.empty()) return;
    uint32_t count = options_.workers == 0 ? 1 : options_.workers;
    workers_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

void Reconciler::stop() {
    queue_.shut_down();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

void Reconciler::worker_loop() {
    while (process_next()) {
    }
}

bool Reconciler::process_next() {
    auto key = queue_.get();
    if (!key) return false;

    auto result = reconcile(*key);
    if (result) {
        queue_.forget(*key);
    } else if (queue_.num_requeues(*key) < options_.max_retries) {
        logger_.warn("error syncing remote cluster " + *key + ", requeuing: "
                     + result.error().describe());
        queue_.add_rate_limited(*key);
    } else {
        logger_.error("dropping remote cluster " + *key + " out of the queue after "
                      + std::to_string(options_.max_retries) + " retries: "
                      + result.error().describe());
        queue_.forget(*key);
    }

    queue_.done(*key);
    return true;
}

// ─────────────────────────────────────────────
// Reconcile
// ─────────────────────────────────────────────

Result<void> Reconciler::reconcile(const ClusterName& name) {
    auto cached = informer_.cached_get(name);
    if (!cached) {
        if (cached.error().is_not_found()) {
            cleanup(name, "deleted");
            return {};
        }
        return cached.error();
    }

    const auto& record = *cached;
    if (record.being_deleted()) {
        cleanup(name, "deleted");
        return {};
    }

    if (options_.in_scope && !options_.in_scope(record)) {
        cleanup(name, "out of scope");
        return {};
    }

    if (!record.connection.usable()) {
        if (registry_.remove(name)) {
            logger_.warn("closed session of cluster " + name + ": connection is not usable");
        }
        recorder_.event(record, EventType::Warning, "InvalidConnection",
                        "remote cluster has no usable endpoint or credentials");
        return {};
    }

    if (!record.status.uuid.empty()) {
        auto locked = uuid_lock_.lock_by_owner(record.status.uuid, name);
        if (!locked) {
            if (registry_.remove(name)) {
                logger_.warn("deactivated session of cluster " + name + " after uuid conflict");
            }
            recorder_.event(record, EventType::Warning, "UUIDConflict", locked.error().message);
            return locked.error();
        }
    }

    auto existing = registry_.entry(name);
    if (!existing) {
        return activate(record);
    }

    if (connection_changed(existing->params, record.connection)) {
        logger_.info("connection of cluster " + name + " changed, replacing session");
        registry_.remove(name);
        return activate(record);
    }

    return {};
}

Result<void> Reconciler::activate(const RemoteClusterRecord& record) {
    auto session = factory_.create(record, publisher_);
    if (!session) {
        recorder_.event(record, EventType::Warning, "SessionFailed", session.error().message);
        return Error{session.error().kind,
                     "failed to create session for cluster " + record.name + ": "
                     + session.error().message};
    }

    registry_.set(record.name, std::move(*session), record.connection);
    logger_.info("session established for cluster " + record.name);
    return {};
}

void Reconciler::cleanup(const ClusterName& name, std::string_view reason) {
    bool closed = registry_.remove(name);
    size_t released = uuid_lock_.release_by_owner(name);
    if (closed || released > 0) {
        logger_.info("remote cluster " + name + " " + std::string{reason} + ", session "
                     + (closed ? "closed" : "absent") + ", released "
                     + std::to_string(released) + " uuid lock(s)");
    }
}

}  // namespace fabric_controller
