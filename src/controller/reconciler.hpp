/**
 * @file reconciler.hpp
 * @brief Level-triggered reconciliation of remote cluster records into sessions.
 *
 * Informer notifications only enqueue a cluster name. A worker always
 * re-reads the current record before acting, so a stale add followed by
 * a delete resolves to the deleted state.
 */

#pragma once

#include "cluster/session_registry.hpp"
#include "cluster/uuid_lock.hpp"
#include "core/logger.hpp"
#include "executor/work_queue.hpp"
#include "session/session.hpp"
#include "store/collaborators.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <thread>
#include <vector>

namespace fabric_controller {

class Reconciler {
public:
    struct Options {
        uint32_t workers = 1;
        uint32_t max_retries = 15;
        std::chrono::milliseconds base_delay{5};
        std::chrono::milliseconds max_delay{1000000};
        /// Records it rejects are torn down like deleted ones. Empty admits all.
        std::function<bool(const RemoteClusterRecord&)> in_scope;
    };

    Reconciler(Options options,
               IRemoteClusterInformer& informer,
               SessionRegistry& registry,
               UuidLock& uuid_lock,
               ISessionFactory& factory,
               IEventRecorder& recorder,
               EventPublisher publisher,
               Logger logger);
    ~Reconciler();

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    void enqueue(const ClusterName& name);

    void start();
    /// Shuts the queue down and joins the workers once they drain it.
    void stop();

    /**
     * @brief Reconcile one cluster against its current record.
     *
     * An error means the key should be retried through the rate limiter.
     */
    Result<void> reconcile(const ClusterName& name);

    /// Pops one key, reconciles it and requeues or forgets it. False on shutdown.
    bool process_next();

    [[nodiscard]] WorkQueue& queue() noexcept { return queue_; }

private:
    void cleanup(const ClusterName& name, std::string_view reason);
    Result<void> activate(const RemoteClusterRecord& record);
    void worker_loop();

    Options options_;
    IRemoteClusterInformer& informer_;
    SessionRegistry& registry_;
    UuidLock& uuid_lock_;
    ISessionFactory& factory_;
    IEventRecorder& recorder_;
    EventPublisher publisher_;
    Logger logger_;

    WorkQueue queue_;
    std::vector<std::jthread> workers_;
};

}  // namespace fabric_controller
