/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace fabric_controller;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "fc_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.controller.cluster_name, "local");
    EXPECT_EQ(config.controller.health_check_period(), std::chrono::seconds(30));
    EXPECT_EQ(config.controller.reconcile_workers, 1u);
    EXPECT_EQ(config.queue.max_retries, 15u);
    EXPECT_EQ(config.events.capacity, 10u);
    EXPECT_EQ(config.events.throttle_ms, 100u);
    EXPECT_EQ(config.retry.steps, 5u);
    EXPECT_TRUE(config.remote_clusters.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [controller]
        cluster_name = "edge-1"
        local_uuid = "u-local"
        health_check_period_s = 5
        reconcile_workers = 4
        cache_sync_timeout_ms = 2000
        scope_label = "fabric/peer=true"

        [queue]
        base_delay_ms = 10
        max_delay_ms = 60000
        max_retries = 3

        [events]
        capacity = 32
        throttle_ms = 0

        [retry]
        steps = 8
        initial_delay_ms = 20
        factor = 2.0
        jitter = 0.0

        [telemetry]
        log_dir = "/tmp/fc_logs"
        log_level = "debug"

        [[remote_cluster]]
        name = "cluster-a"
        api_endpoint = "https://10.0.0.1:6443"
        token = "t"
        uuid = "u-a"
        peer_uuid = "u-a"
        healthy = false

        [[network]]
        name = "overlay"
        type = "overlay"
        net_id = 42
        subnets = ["10.10.0.0/16", "10.11.0.0/16"]
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.controller.cluster_name, "edge-1");
    EXPECT_EQ(config.controller.local_uuid, "u-local");
    EXPECT_EQ(config.controller.health_check_period(), std::chrono::seconds(5));
    EXPECT_EQ(config.controller.reconcile_workers, 4u);
    EXPECT_EQ(config.controller.cache_sync_timeout_ms, 2000u);
    EXPECT_EQ(config.controller.scope_label, "fabric/peer=true");
    EXPECT_EQ(config.queue.base_delay_ms, 10u);
    EXPECT_EQ(config.queue.max_delay_ms, 60000u);
    EXPECT_EQ(config.queue.max_retries, 3u);
    EXPECT_EQ(config.events.capacity, 32u);
    EXPECT_EQ(config.events.throttle_ms, 0u);
    EXPECT_EQ(config.retry.steps, 8u);
    EXPECT_DOUBLE_EQ(config.retry.factor, 2.0);
    EXPECT_EQ(config.telemetry.log_level, "debug");

    ASSERT_EQ(config.remote_clusters.size(), 1u);
    EXPECT_EQ(config.remote_clusters[0].name, "cluster-a");
    EXPECT_EQ(config.remote_clusters[0].uuid, "u-a");
    EXPECT_FALSE(config.remote_clusters[0].healthy);

    ASSERT_EQ(config.networks.size(), 1u);
    EXPECT_EQ(config.networks[0].type, "overlay");
    EXPECT_EQ(config.networks[0].net_id, 42);
    EXPECT_EQ(config.networks[0].subnets.size(), 2u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [controller]
        cluster_name = "partial"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->controller.cluster_name, "partial");
    // Defaults for everything else
    EXPECT_EQ(result->queue.base_delay_ms, 5u);
    EXPECT_EQ(result->events.capacity, 10u);
}

TEST_F(ConfigTest, NonPositivePeriodFallsBackToDefault) {
    auto path = write_toml(R"(
        [controller]
        health_check_period_s = 0
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->controller.health_check_period(),
              ControllerConfig::kDefaultHealthCheckPeriod);

    ControllerConfig negative;
    negative.health_check_period_s = -7;
    EXPECT_EQ(negative.health_check_period(), ControllerConfig::kDefaultHealthCheckPeriod);
}

TEST_F(ConfigTest, ZeroWorkersBecomesOne) {
    auto path = write_toml(R"(
        [controller]
        reconcile_workers = 0
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->controller.reconcile_workers, 1u);
}

TEST_F(ConfigTest, ZeroEventCapacityRejected) {
    auto path = write_toml(R"(
        [events]
        capacity = 0
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, NegativeCountsRejected) {
    for (const char* body : {
             "[controller]\nreconcile_workers = -1\n",
             "[controller]\ncache_sync_timeout_ms = -100\n",
             "[queue]\nmax_retries = -1\n",
             "[queue]\nmax_delay_ms = -1\n",
             "[events]\ncapacity = -1\n",
             "[retry]\nsteps = -3\n",
             "[telemetry]\nrotate_count = -2\n"}) {
        auto result = load_config(write_toml(body));
        ASSERT_FALSE(result.has_value()) << body;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument) << body;
    }
}

TEST_F(ConfigTest, OversizedCountRejected) {
    auto path = write_toml(R"(
        [controller]
        reconcile_workers = 4294967296
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
    EXPECT_NE(result.error().message.find("controller.reconcile_workers"), std::string::npos);
}

TEST_F(ConfigTest, NetworkIdMustFitUint32) {
    auto too_large = load_config(write_toml(R"(
        [[network]]
        name = "overlay"
        type = "overlay"
        net_id = 4294967296
    )"));
    ASSERT_FALSE(too_large.has_value());
    EXPECT_EQ(too_large.error().kind, ErrorKind::InvalidArgument);

    auto negative = load_config(write_toml(R"(
        [[network]]
        name = "overlay"
        type = "overlay"
        net_id = -4
    )"));
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().kind, ErrorKind::InvalidArgument);

    auto absent = load_config(write_toml(R"(
        [[network]]
        name = "overlay"
        type = "overlay"
    )"));
    ASSERT_TRUE(absent.has_value());
    EXPECT_EQ(absent->networks[0].net_id, -1);
}

TEST_F(ConfigTest, NonPositiveRetryFactorRejected) {
    auto path = write_toml(R"(
        [retry]
        factor = 0.0
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, UnnamedRemoteClusterRejected) {
    auto path = write_toml(R"(
        [[remote_cluster]]
        api_endpoint = "https://10.0.0.1:6443"
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, UnknownNetworkTypeRejected) {
    auto path = write_toml(R"(
        [[network]]
        name = "n1"
        type = "vxlan"
    )");

    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}
