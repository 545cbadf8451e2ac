/**
 * @file main.cpp
 * @brief Fabric controller daemon entry point.
 *
 * Wires the remote cluster controller against in-memory collaborators
 * seeded from the configuration file:
 *   Config → Logger → Store / Networks → Sessions → Controller
 */

#include "controller/controller.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "session/simulated_session.hpp"
#include "store/event_recorder.hpp"
#include "store/memory_store.hpp"
#include "telemetry/log_sinks.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace fabric_controller;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

NetworkType network_type_of(const std::string& text) {
    if (text == "overlay") return NetworkType::Overlay;
    if (text == "global_bgp") return NetworkType::GlobalBgp;
    return NetworkType::Underlay;
}

/**
 * @brief Populate the in-memory collaborators from the config fixtures.
 */
Result<void> seed_fixtures(const Config& config,
                           MemoryRemoteClusterStore& store,
                           MemoryNetworkSource& networks,
                           SimulatedSessionFactory& sessions) {
    for (const auto& fixture : config.remote_clusters) {
        RemoteClusterRecord record;
        record.name = fixture.name;
        record.connection.api_endpoint = fixture.api_endpoint;
        record.connection.token = fixture.token;
        record.status.uuid = fixture.uuid;

        auto created = store.create(std::move(record));
        if (!created) return created.error();

        sessions.set_profile(fixture.name, PeerProfile{
            .peer_uuid = fixture.peer_uuid,
            .healthy = fixture.healthy
        });
    }

    for (const auto& fixture : config.networks) {
        LocalNetwork network{.name = fixture.name, .type = network_type_of(fixture.type)};
        if (fixture.net_id >= 0) {
            network.net_id = static_cast<uint32_t>(fixture.net_id);
        }
        networks.upsert_network(std::move(network));

        uint32_t index = 0;
        for (const auto& cidr : fixture.subnets) {
            networks.upsert_subnet(LocalSubnet{
                .name = fixture.name + "-" + std::to_string(index++),
                .network = fixture.name,
                .cidr = cidr
            });
        }
    }
    return {};
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path config_path = "config/default.toml";
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: fabric_controller [config.toml]\n"
                      << "  config.toml   Configuration file (default: config/default.toml)\n";
            return 0;
        }
        config_path = arg;
    }

    // Load configuration
    auto config_result = load_config(config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        if (config_result.error().kind != ErrorKind::NotFound) {
            return 1;
        }
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << ", using info" << std::endl;
    }

    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                  "fabric_controller",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info), "main");
    logger.info("fabric controller starting...");
    logger.info("Cluster: " + config.controller.cluster_name);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Collaborators ─────────────
    MemoryRemoteClusterStore store;
    MemoryNetworkSource networks;
    StaticClusterIdentity identity(config.controller.local_uuid);
    SimulatedSessionFactory sessions;
    RecordingEventSink recorder(logger.with_component("events"));

    if (auto seeded = seed_fixtures(config, store, networks, sessions); !seeded) {
        logger.error("Invalid fixtures: " + seeded.error().message);
        logger.flush();
        return 1;
    }
    logger.info("Seeded " + std::to_string(config.remote_clusters.size()) + " remote clusters, "
                + std::to_string(config.networks.size()) + " networks");

    // ── Start Controller ─────────────────────
    RemoteClusterController controller(
        config,
        ControllerDeps{
            .store = store,
            .informer = store,
            .networks = networks,
            .identity = identity,
            .sessions = sessions,
            .recorder = recorder
        },
        logger);

    if (auto started = controller.start(); !started) {
        logger.error("Controller failed to start: " + started.error().describe());
        logger.flush();
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    controller.stop();

    logger.info("fabric controller stopped. "
                + std::to_string(recorder.size()) + " events recorded");
    logger.flush();
    return 0;
}
