/**
 * @file work_queue.hpp
 * @brief Rate-limited, de-duplicating work queue for reconciliation keys.
 *
 * Semantics follow the controller work queue used by Kubernetes
 * controllers:
 *   - a key added while already queued is stored once;
 *   - a key added while a worker processes it is queued again only after
 *     done() is called, so one key is never processed concurrently;
 *   - add_rate_limited() delays the key by a per-key exponential backoff
 *     until forget() resets it.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace fabric_controller {

/**
 * @brief Per-key exponential backoff: base * 2^failures, capped at max.
 */
class ItemExponentialRateLimiter {
public:
    ItemExponentialRateLimiter(std::chrono::milliseconds base, std::chrono::milliseconds max);

    /// Delay for the next retry of key; counts one more failure.
    std::chrono::milliseconds when(const std::string& key);
    void forget(const std::string& key);
    [[nodiscard]] uint32_t num_requeues(const std::string& key) const;

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint32_t> failures_;
};

class WorkQueue {
public:
    WorkQueue(std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay);
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void add(const std::string& key);
    void add_after(const std::string& key, std::chrono::milliseconds delay);
    void add_rate_limited(const std::string& key);

    /// Blocks for the next key. std::nullopt once shut down and empty.
    std::optional<std::string> get();

    /// Marks a key returned by get() as finished.
    void done(const std::string& key);

    void forget(const std::string& key);
    [[nodiscard]] uint32_t num_requeues(const std::string& key) const;

    void shut_down();
    [[nodiscard]] bool shutting_down() const;
    [[nodiscard]] size_t len() const;

private:
    using Clock = std::chrono::steady_clock;
    using Waiting = std::pair<Clock::time_point, std::string>;

    void delay_loop(std::stop_token stop);

    ItemExponentialRateLimiter limiter_;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<std::string> queue_;
    std::unordered_set<std::string> dirty_;
    std::unordered_set<std::string> processing_;
    bool shutting_down_ = false;

    std::mutex delay_mutex_;
    std::condition_variable_any delay_cv_;
    std::priority_queue<Waiting, std::vector<Waiting>, std::greater<>> waiting_;

    std::jthread delay_thread_;
};

}  // namespace fabric_controller
