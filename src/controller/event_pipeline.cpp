/**
 * @file event_pipeline.cpp
 * @brief EventPipeline implementation.
 */

#include "controller/event_pipeline.hpp"

namespace fabric_controller {

EventPipeline::EventPipeline(Options options,
                             UuidLock& uuid_lock,
                             SessionRegistry& registry,
                             IRemoteClusterStore& store,
                             IRemoteClusterInformer& informer,
                             IEventRecorder& recorder,
                             StatusSyncer& status_syncer,
                             Logger logger)
    : options_(std::move(options))
    , uuid_lock_(uuid_lock)
    , registry_(registry)
    , store_(store)
    , informer_(informer)
    , recorder_(recorder)
    , status_syncer_(status_syncer)
    , logger_(std::move(logger))
    , channel_(options_.capacity) {}

EventPipeline::~EventPipeline() {
    close();
    join();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void EventPipeline::start() {
    if (consumer_.joinable()) return;
    consumer_ = std::jthread([this] {
        consume_loop();
    });
}

bool EventPipeline::publish(Event event) {
    return channel_.send(std::move(event));
}

EventPublisher EventPipeline::publisher() {
    return [this](Event event) { return publish(std::move(event)); };
}

void EventPipeline::close() {
    channel_.close();
}

void EventPipeline::join() {
    if (consumer_.joinable()) consumer_.join();
}

void EventPipeline::consume_loop() {
    while (auto event = channel_.receive()) {
        process(*event);
        if (options_.throttle.count() > 0) {
            std::this_thread::sleep_for(options_.throttle);
        }
    }
    logger_.info("event pipeline drained, consumer exiting");
}

// ─────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────

void EventPipeline::process(const Event& event) {
    std::visit([this](const auto& e) { handle(e); }, event);
    processed_.fetch_add(1);
}

void EventPipeline::drop(std::string_view reason) {
    dropped_.fetch_add(1);
    logger_.warn(std::string{reason});
}

void EventPipeline::handle(const RefreshUuidEvent& event) {
    if (event.uuid.empty()) {
        drop("invalid uuid in refresh event for cluster '" + event.cluster_name + "'");
        return;
    }
    if (event.cluster_name.empty()) {
        drop("invalid cluster name in refresh event for uuid " + event.uuid);
        return;
    }

    if (auto locked = uuid_lock_.lock_by_owner(event.uuid, event.cluster_name); !locked) {
        dropped_.fetch_add(1);
        logger_.error("uuid lock failed: " + locked.error().describe());
        return;
    }

    auto patched = retry_on_conflict(options_.retry, [&]() -> Result<RemoteClusterRecord> {
        auto current = store_.get(event.cluster_name);
        if (!current) return current.error();
        if (current->status.uuid == event.uuid) return *current;

        StatusPatch patch;
        patch.resource_version = current->resource_version;
        patch.uuid = event.uuid;
        return store_.patch_status(event.cluster_name, patch);
    });

    if (!patched) {
        if (patched.error().is_not_found()) {
            // The claim must not outlive a record that no longer exists.
            uuid_lock_.release_by_owner(event.cluster_name);
        }
        logger_.error("failed to persist uuid " + event.uuid + " for cluster "
                      + event.cluster_name + ": " + patched.error().describe());
        return;
    }
    logger_.info("receive event and update uuid " + event.uuid + " for cluster "
                 + event.cluster_name);
}

void EventPipeline::handle(const UpdateStatusEvent& event) {
    if (event.cluster_name.empty()) {
        drop("invalid cluster name in update status event");
        return;
    }

    auto record = informer_.cached_get(event.cluster_name);
    if (!record) {
        logger_.error("update status event fail on getting object: " + record.error().describe());
        return;
    }

    auto session = registry_.get(event.cluster_name);
    if (!session) {
        logger_.debug("no active session for cluster " + event.cluster_name
                      + ", ignoring update status event");
        return;
    }

    status_syncer_.refresh_async(std::move(*record), std::move(session));
    logger_.info("receive event and update status for cluster " + event.cluster_name);
}

void EventPipeline::handle(const RecordEventEvent& event) {
    if (event.cluster_name.empty()) {
        drop("invalid cluster name in record event event");
        return;
    }

    auto record = informer_.cached_get(event.cluster_name);
    if (!record) {
        dropped_.fetch_add(1);
        logger_.error("record event fail on getting object: " + record.error().describe());
        return;
    }

    recorder_.event(*record, event.body.type, event.body.reason, event.body.message);
    logger_.debug("record event " + event.body.reason + " for cluster " + event.cluster_name);
}

}  // namespace fabric_controller
