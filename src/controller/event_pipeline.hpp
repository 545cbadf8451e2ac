/**
 * @file event_pipeline.hpp
 * @brief Ordered, single-consumer processing of controller side effects.
 *
 * Sessions and informer callbacks publish events into a small bounded
 * channel. One consumer applies them strictly in arrival order, so UUID
 * claims, status patches and recorded events never race each other
 * against the record store. The consumer pauses briefly after every event
 * to keep startup bursts from flooding the API server.
 */

#pragma once

#include "cluster/session_registry.hpp"
#include "cluster/uuid_lock.hpp"
#include "controller/status_sync.hpp"
#include "core/logger.hpp"
#include "executor/bounded_channel.hpp"
#include "executor/retry.hpp"
#include "session/session.hpp"
#include "store/collaborators.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace fabric_controller {

class EventPipeline {
public:
    struct Options {
        size_t capacity = 10;
        std::chrono::milliseconds throttle{100};
        RetryPolicy retry;
    };

    EventPipeline(Options options,
                  UuidLock& uuid_lock,
                  SessionRegistry& registry,
                  IRemoteClusterStore& store,
                  IRemoteClusterInformer& informer,
                  IEventRecorder& recorder,
                  StatusSyncer& status_syncer,
                  Logger logger);
    ~EventPipeline();

    EventPipeline(const EventPipeline&) = delete;
    EventPipeline& operator=(const EventPipeline&) = delete;

    void start();

    /// Blocks while the buffer is full. False once the pipeline is closed.
    bool publish(Event event);
    [[nodiscard]] EventPublisher publisher();

    /// Stops intake. Buffered events are still processed.
    void close();
    /// Waits for the consumer to drain and exit.
    void join();

    /// Applies one event on the calling thread.
    void process(const Event& event);

    [[nodiscard]] uint64_t processed_count() const noexcept { return processed_.load(); }
    [[nodiscard]] uint64_t dropped_count() const noexcept { return dropped_.load(); }
    [[nodiscard]] size_t pending() const { return channel_.size(); }

private:
    void consume_loop();

    void handle(const RefreshUuidEvent& event);
    void handle(const UpdateStatusEvent& event);
    void handle(const RecordEventEvent& event);

    void drop(std::string_view reason);

    Options options_;
    UuidLock& uuid_lock_;
    SessionRegistry& registry_;
    IRemoteClusterStore& store_;
    IRemoteClusterInformer& informer_;
    IEventRecorder& recorder_;
    StatusSyncer& status_syncer_;
    Logger logger_;

    BoundedChannel<Event> channel_;
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> dropped_{0};
    std::jthread consumer_;
};

}  // namespace fabric_controller
