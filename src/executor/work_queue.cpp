/**
 * @file work_queue.cpp
 * @brief WorkQueue and ItemExponentialRateLimiter implementation.
 */

#include "executor/work_queue.hpp"

#include <algorithm>
#include <cmath>

namespace fabric_controller {

// ─────────────────────────────────────────────
// ItemExponentialRateLimiter
// ─────────────────────────────────────────────

ItemExponentialRateLimiter::ItemExponentialRateLimiter(std::chrono::milliseconds base,
                                                       std::chrono::milliseconds max)
    : base_(base), max_(max) {}

std::chrono::milliseconds ItemExponentialRateLimiter::when(const std::string& key) {
    uint32_t exp = 0;
    {
        std::lock_guard lock(mutex_);
        exp = failures_[key]++;
    }

    // 2^exp overflows long before any sane cap is reached
    if (exp >= 62) return max_;
    double backoff = static_cast<double>(base_.count()) * std::ldexp(1.0, static_cast<int>(exp));
    if (backoff > static_cast<double>(max_.count())) return max_;
    return std::chrono::milliseconds{static_cast<int64_t>(backoff)};
}

void ItemExponentialRateLimiter::forget(const std::string& key) {
    std::lock_guard lock(mutex_);
    failures_.erase(key);
}

uint32_t ItemExponentialRateLimiter::num_requeues(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = failures_.find(key);
    return it == failures_.end() ? 0 : it->second;
}

// ─────────────────────────────────────────────
// WorkQueue
// ─────────────────────────────────────────────

WorkQueue::WorkQueue(std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay)
    : limiter_(base_delay, max_delay) {
    delay_thread_ = std::jthread([this](std::stop_token stop) {
        delay_loop(stop);
    });
}

WorkQueue::~WorkQueue() {
    shut_down();
    delay_thread_.request_stop();
    delay_cv_.notify_all();
}

void WorkQueue::add(const std::string& key) {
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) return;
        if (dirty_.count(key) > 0) return;

        dirty_.insert(key);
        if (processing_.count(key) > 0) return;  // re-queued by done()

        queue_.push_back(key);
    }
    cond_.notify_one();
}

void WorkQueue::add_after(const std::string& key, std::chrono::milliseconds delay) {
    if (shutting_down()) return;
    if (delay.count() <= 0) {
        add(key);
        return;
    }

    {
        std::lock_guard lock(delay_mutex_);
        waiting_.emplace(Clock::now() + delay, key);
    }
    delay_cv_.notify_all();
}

void WorkQueue::add_rate_limited(const std::string& key) {
    add_after(key, limiter_.when(key));
}

std::optional<std::string> WorkQueue::get() {
    std::unique_lock lock(mutex_);
    cond_.wait(lock, [this] { return shutting_down_ || !queue_.empty(); });
    if (queue_.empty()) return std::nullopt;

    std::string key = std::move(queue_.front());
    queue_.pop_front();
    processing_.insert(key);
    dirty_.erase(key);
    return key;
}

void WorkQueue::done(const std::string& key) {
    {
        std::lock_guard lock(mutex_);
        processing_.erase(key);
        if (dirty_.count(key) == 0) return;
        queue_.push_back(key);
    }
    cond_.notify_one();
}

void WorkQueue::forget(const std::string& key) {
    limiter_.forget(key);
}

uint32_t WorkQueue::num_requeues(const std::string& key) const {
    return limiter_.num_requeues(key);
}

void WorkQueue::shut_down() {
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
    }
    cond_.notify_all();
    delay_cv_.notify_all();
}

bool WorkQueue::shutting_down() const {
    std::lock_guard lock(mutex_);
    return shutting_down_;
}

size_t WorkQueue::len() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

// ─────────────────────────────────────────────
// Delayed adds
// ─────────────────────────────────────────────

void WorkQueue::delay_loop(std::stop_token stop) {
    std::unique_lock lock(delay_mutex_);
    while (!stop.stop_requested()) {
        if (shutting_down()) return;

        if (waiting_.empty()) {
            delay_cv_.wait(lock, stop, [this] { return !waiting_.empty() || shutting_down(); });
            continue;
        }

        auto next_ready = waiting_.top().first;
        if (Clock::now() < next_ready) {
            delay_cv_.wait_until(lock, stop, next_ready, [this, next_ready] {
                return shutting_down() || (!waiting_.empty() && waiting_.top().first < next_ready);
            });
            continue;
        }

        std::vector<std::string> ready;
        while (!waiting_.empty() && waiting_.top().first <= Clock::now()) {
            ready.push_back(waiting_.top().second);
            waiting_.pop();
        }

        lock.unlock();
        for (const auto& key : ready) add(key);
        lock.lock();
    }
}

}  // namespace fabric_controller
