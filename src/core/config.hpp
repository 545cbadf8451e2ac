/**
 * @file config.hpp
 * @brief Controller configuration with TOML deserialization.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace fabric_controller {

struct ControllerConfig {
    std::string cluster_name = "local";
    std::string local_uuid;               ///< identity this cluster advertises to peers
    int64_t health_check_period_s = 30;   ///< <= 0 falls back to the default
    uint32_t reconcile_workers = 1;
    uint32_t cache_sync_timeout_ms = 30000;
    std::string scope_label;              ///< "key=value", empty admits all records

    static constexpr std::chrono::seconds kDefaultHealthCheckPeriod{30};

    [[nodiscard]] std::chrono::milliseconds health_check_period() const noexcept {
        if (health_check_period_s <= 0) return kDefaultHealthCheckPeriod;
        return std::chrono::seconds{health_check_period_s};
    }
};

struct QueueConfig {
    uint32_t base_delay_ms = 5;
    uint64_t max_delay_ms = 1000000;
    uint32_t max_retries = 15;
};

struct EventConfig {
    uint32_t capacity = 10;
    uint32_t throttle_ms = 100;
};

struct RetryConfig {
    uint32_t steps = 5;
    uint32_t initial_delay_ms = 10;
    double factor = 1.0;
    double jitter = 0.1;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief A remote cluster to seed into the in-memory record store.
 *
 * Only the standalone daemon reads these; a deployment against a real
 * API server would discover records instead.
 */
struct RemoteClusterFixture {
    std::string name;
    std::string api_endpoint;
    std::string token;
    std::string uuid;
    std::string peer_uuid;
    bool healthy = true;
};

struct NetworkFixture {
    std::string name;
    std::string type = "underlay";
    int64_t net_id = -1;                  ///< < 0 means unset
    std::vector<std::string> subnets;     ///< CIDRs
};

/**
 * @brief Top-level controller configuration.
 */
struct Config {
    ControllerConfig controller;
    QueueConfig queue;
    EventConfig events;
    RetryConfig retry;
    TelemetryConfig telemetry;
    std::vector<RemoteClusterFixture> remote_clusters;
    std::vector<NetworkFixture> networks;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace fabric_controller
