/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <string_view>

namespace fabric_controller {

namespace {

/// Reads a non-negative integer key that must fit in T.
template <typename T, typename Node>
Result<T> read_unsigned(const Node& node, std::string_view key, T fallback) {
    auto value = node.value_or(static_cast<int64_t>(fallback));
    bool too_large = false;
    if constexpr (sizeof(T) < sizeof(int64_t)) {
        too_large = value > static_cast<int64_t>(std::numeric_limits<T>::max());
    }
    if (value < 0 || too_large) {
        return Error{ErrorKind::InvalidArgument,
                     std::string{key} + " out of range: " + std::to_string(value)};
    }
    return static_cast<T>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [controller]
        if (auto controller = tbl["controller"]; controller.is_table()) {
            config.controller.cluster_name =
                controller["cluster_name"].value_or(std::string{"local"});
            config.controller.local_uuid =
                controller["local_uuid"].value_or(std::string{});
            config.controller.health_check_period_s =
                controller["health_check_period_s"].value_or(int64_t{30});
            auto workers = read_unsigned<uint32_t>(
                controller["reconcile_workers"], "controller.reconcile_workers", 1);
            if (!workers) return workers.error();
            config.controller.reconcile_workers = *workers;

            auto sync_timeout = read_unsigned<uint32_t>(
                controller["cache_sync_timeout_ms"], "controller.cache_sync_timeout_ms", 30000);
            if (!sync_timeout) return sync_timeout.error();
            config.controller.cache_sync_timeout_ms = *sync_timeout;

            config.controller.scope_label =
                controller["scope_label"].value_or(std::string{});
        }
        if (config.controller.reconcile_workers == 0) {
            config.controller.reconcile_workers = 1;
        }

        // [queue]
        if (auto queue = tbl["queue"]; queue.is_table()) {
            auto base_delay = read_unsigned<uint32_t>(queue["base_delay_ms"], "queue.base_delay_ms", 5);
            if (!base_delay) return base_delay.error();
            config.queue.base_delay_ms = *base_delay;

            auto max_delay = read_unsigned<uint64_t>(queue["max_delay_ms"], "queue.max_delay_ms", 1000000);
            if (!max_delay) return max_delay.error();
            config.queue.max_delay_ms = *max_delay;

            auto max_retries = read_unsigned<uint32_t>(queue["max_retries"], "queue.max_retries", 15);
            if (!max_retries) return max_retries.error();
            config.queue.max_retries = *max_retries;
        }

        // [events]
        if (auto events = tbl["events"]; events.is_table()) {
            auto capacity = read_unsigned<uint32_t>(events["capacity"], "events.capacity", 10);
            if (!capacity) return capacity.error();
            config.events.capacity = *capacity;

            auto throttle = read_unsigned<uint32_t>(events["throttle_ms"], "events.throttle_ms", 100);
            if (!throttle) return throttle.error();
            config.events.throttle_ms = *throttle;
        }
        if (config.events.capacity == 0) {
            return Error{ErrorKind::InvalidArgument, "events.capacity must be positive"};
        }

        // [retry]
        if (auto retry = tbl["retry"]; retry.is_table()) {
            auto steps = read_unsigned<uint32_t>(retry["steps"], "retry.steps", 5);
            if (!steps) return steps.error();
            config.retry.steps = *steps;

            auto initial_delay = read_unsigned<uint32_t>(
                retry["initial_delay_ms"], "retry.initial_delay_ms", 10);
            if (!initial_delay) return initial_delay.error();
            config.retry.initial_delay_ms = *initial_delay;

            config.retry.factor = retry["factor"].value_or(1.0);
            config.retry.jitter = retry["jitter"].value_or(0.1);
        }
        if (config.retry.factor <= 0.0 || config.retry.jitter < 0.0) {
            return Error{ErrorKind::InvalidArgument,
                         "retry.factor must be positive and retry.jitter non-negative"};
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            auto max_size = read_unsigned<uint32_t>(
                telemetry["max_file_size_mb"], "telemetry.max_file_size_mb", 50);
            if (!max_size) return max_size.error();
            config.telemetry.max_file_size_mb = *max_size;

            auto rotate = read_unsigned<uint32_t>(telemetry["rotate_count"], "telemetry.rotate_count", 5);
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = *rotate;

            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // [[remote_cluster]]
        if (auto clusters = tbl["remote_cluster"].as_array()) {
            for (auto& node : *clusters) {
                auto* entry = node.as_table();
                if (!entry) continue;
                RemoteClusterFixture fixture;
                fixture.name = (*entry)["name"].value_or(std::string{});
                fixture.api_endpoint = (*entry)["api_endpoint"].value_or(std::string{});
                fixture.token = (*entry)["token"].value_or(std::string{});
                fixture.uuid = (*entry)["uuid"].value_or(std::string{});
                fixture.peer_uuid = (*entry)["peer_uuid"].value_or(std::string{});
                fixture.healthy = (*entry)["healthy"].value_or(true);
                if (fixture.name.empty()) {
                    return Error{ErrorKind::InvalidArgument, "remote_cluster entry without a name"};
                }
                config.remote_clusters.push_back(std::move(fixture));
            }
        }

        // [[network]]
        if (auto networks = tbl["network"].as_array()) {
            for (auto& node : *networks) {
                auto* entry = node.as_table();
                if (!entry) continue;
                NetworkFixture fixture;
                fixture.name = (*entry)["name"].value_or(std::string{});
                fixture.type = (*entry)["type"].value_or(std::string{"underlay"});
                if ((*entry)["net_id"]) {
                    auto net_id = read_unsigned<uint32_t>(
                        (*entry)["net_id"], "network " + fixture.name + " net_id", 0);
                    if (!net_id) return net_id.error();
                    fixture.net_id = *net_id;
                }
                if (fixture.type != "underlay" && fixture.type != "overlay"
                    && fixture.type != "global_bgp") {
                    return Error{ErrorKind::InvalidArgument,
                                 "network " + fixture.name + " has unknown type " + fixture.type};
                }
                if (auto subnets = (*entry)["subnets"].as_array()) {
                    for (auto& cidr : *subnets) {
                        if (auto text = cidr.value<std::string>()) {
                            fixture.subnets.push_back(*text);
                        }
                    }
                }
                config.networks.push_back(std::move(fixture));
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace fabric_controller
