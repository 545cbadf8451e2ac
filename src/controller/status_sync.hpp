/**
 * @file status_sync.hpp
 * @brief Periodic and reactive health/status refresh of remote clusters.
 *
 * Each round lists the cached records, spawns one probe task for every
 * record with a live session, and joins them all before sleeping until
 * the next round. A per-cluster in-flight guard keeps reactive refreshes
 * from overlapping a probe that is already running for the same cluster.
 */

#pragma once

#include "cluster/session_registry.hpp"
#include "core/logger.hpp"
#include "executor/retry.hpp"
#include "executor/task_group.hpp"
#include "store/collaborators.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace fabric_controller {

class StatusSyncer {
public:
    struct Options {
        std::chrono::milliseconds period{30000};
        RetryPolicy retry;
        /// Records it rejects are skipped by periodic rounds. Empty admits all.
        std::function<bool(const RemoteClusterRecord&)> in_scope;
    };

    StatusSyncer(Options options,
                 IRemoteClusterInformer& informer,
                 IRemoteClusterStore& store,
                 SessionRegistry& registry,
                 Logger logger);
    ~StatusSyncer();

    StatusSyncer(const StatusSyncer&) = delete;
    StatusSyncer& operator=(const StatusSyncer&) = delete;

    /// Starts the ticker. The first round runs immediately.
    void start();
    /// Stops the ticker and joins every outstanding probe.
    void stop();

    /**
     * @brief Run one full round and wait for all of its probes.
     * @return Number of probe tasks spawned.
     */
    size_t sync_all();

    /**
     * @brief Probe one cluster and patch its status.
     * @return false if a probe for the cluster was already running.
     */
    bool sync_one(const RemoteClusterRecord& record, const std::shared_ptr<ISession>& session);

    /// Out-of-band refresh on a supervised task. Ignored once stopped.
    void refresh_async(RemoteClusterRecord record, std::shared_ptr<ISession> session);

    /// Joins reactive refreshes started so far.
    void wait_reactive();

    [[nodiscard]] uint64_t rounds_completed() const noexcept { return rounds_.load(); }
    [[nodiscard]] std::chrono::milliseconds period() const noexcept { return options_.period; }

private:
    void run_loop(std::stop_token stop);
    bool try_begin(const ClusterName& name);
    void finish(const ClusterName& name);
    void log_failures(const std::vector<std::string>& failures);

    Options options_;
    IRemoteClusterInformer& informer_;
    IRemoteClusterStore& store_;
    SessionRegistry& registry_;
    Logger logger_;

    std::mutex inflight_mutex_;
    std::unordered_set<ClusterName> in_flight_;

    std::mutex tick_mutex_;
    std::condition_variable_any tick_cv_;
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> rounds_{0};

    TaskGroup reactive_tasks_;
    std::jthread ticker_;
};

}  // namespace fabric_controller
