/**
 * @file task_group.hpp
 * @brief Supervised std::jthread tasks with tracked join and cooperative cancellation.
 *
 * Every spawned task is owned by the group until wait() joins it, so no
 * work outlives the component that started it. Finished tasks are reaped
 * on the next spawn to keep long-lived groups bounded.
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace fabric_controller {

class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    // Non-copyable, non-movable
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /// Start func on its own thread. It receives the group's stop token.
    template <std::invocable<std::stop_token> F>
    void spawn(F&& func);

    /// Start a callable that ignores cancellation.
    template <std::invocable F>
    void spawn(F&& func);

    /**
     * @brief Join every task spawned so far.
     * @return Messages of tasks that ended with an exception.
     */
    std::vector<std::string> wait();

    void request_stop() noexcept;
    [[nodiscard]] size_t in_flight() const;

private:
    struct Task {
        std::jthread thread;
        std::future<void> result;
    };

    void reap_finished_locked();
    static void collect(Task& task, std::vector<std::string>& failures);

    mutable std::mutex mutex_;
    std::vector<Task> tasks_;
    std::vector<std::string> failures_;
    std::stop_source stop_source_;
};

// ── Template implementations ─────────────────

template <std::invocable<std::stop_token> F>
void TaskGroup::spawn(F&& func) {
    std::packaged_task<void(std::stop_token)> task(std::forward<F>(func));
    auto result = task.get_future();

    std::lock_guard lock(mutex_);
    reap_finished_locked();
    tasks_.push_back(Task{
        std::jthread([t = std::move(task), token = stop_source_.get_token()]() mutable {
            t(token);
        }),
        std::move(result)});
}

template <std::invocable F>
void TaskGroup::spawn(F&& func) {
    spawn([f = std::forward<F>(func)](std::stop_token) mutable { f(); });
}

}  // namespace fabric_controller
