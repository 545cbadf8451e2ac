/**
 * @file retry.hpp
 * @brief Retry-on-conflict with a small, jittered, bounded backoff.
 *
 * Only ErrorKind::Conflict is retried; any other error, or success, is
 * returned immediately. The defaults (5 steps, 10 ms, factor 1.0, jitter
 * 0.1) match the usual retry policy for optimistic-concurrency writes
 * against an API server.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <chrono>
#include <cstdint>
#include <random>
#include <thread>
#include <type_traits>

namespace fabric_controller {

struct RetryPolicy {
    uint32_t steps = 5;
    std::chrono::milliseconds initial_delay{10};
    double factor = 1.0;
    double jitter = 0.1;

    static RetryPolicy from_config(const RetryConfig& cfg) {
        return RetryPolicy{
            .steps = cfg.steps == 0 ? 1 : cfg.steps,
            .initial_delay = std::chrono::milliseconds{cfg.initial_delay_ms},
            .factor = cfg.factor,
            .jitter = cfg.jitter
        };
    }
};

namespace detail {

inline std::chrono::microseconds jittered(std::chrono::microseconds delay, double jitter) {
    if (jitter <= 0.0) return delay;
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, jitter);
    return std::chrono::microseconds{
        static_cast<int64_t>(static_cast<double>(delay.count()) * (1.0 + dist(rng)))};
}

}  // namespace detail

/**
 * @brief Call fn until it succeeds, fails with a non-conflict error, or
 *        the policy runs out of steps.
 *
 * fn must return a Result. The last result is returned as-is.
 */
template <typename F>
auto retry_on_conflict(const RetryPolicy& policy, F&& fn) -> std::invoke_result_t<F> {
    std::chrono::microseconds delay = policy.initial_delay;
    uint32_t steps = policy.steps == 0 ? 1 : policy.steps;

    for (uint32_t attempt = 1; ; ++attempt) {
        auto result = fn();
        if (result.has_value() || !result.error().is_conflict() || attempt >= steps) {
            return result;
        }
        std::this_thread::sleep_for(detail::jittered(delay, policy.jitter));
        delay = std::chrono::microseconds{
            static_cast<int64_t>(static_cast<double>(delay.count()) * policy.factor)};
    }
}

}  // namespace fabric_controller
