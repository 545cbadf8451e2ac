/**
 * @file task_group.cpp
 * @brief TaskGroup implementation.
 */

#include "executor/task_group.hpp"

#include <chrono>
#include <exception>

namespace fabric_controller {

TaskGroup::~TaskGroup() {
    request_stop();
    wait();
}

void TaskGroup::request_stop() noexcept {
    stop_source_.request_stop();
}

void TaskGroup::collect(Task& task, std::vector<std::string>& failures) {
    if (task.thread.joinable()) task.thread.join();
    try {
        task.result.get();
    } catch (const std::exception& e) {
        failures.emplace_back(e.what());
    }
}

void TaskGroup::reap_finished_locked() {
    for (auto it = tasks_.begin(); it != tasks_.end(); ) {
        if (it->result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            collect(*it, failures_);
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<std::string> TaskGroup::wait() {
    std::vector<Task> pending;
    std::vector<std::string> failures;
    {
        std::lock_guard lock(mutex_);
        pending.swap(tasks_);
        failures.swap(failures_);
    }

    for (auto& task : pending) {
        collect(task, failures);
    }
    return failures;
}

size_t TaskGroup::in_flight() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& task : tasks_) {
        if (task.result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) ++count;
    }
    return count;
}

}  // namespace fabric_controller
