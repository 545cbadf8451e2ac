/**
 * @file types.hpp
 * @brief Vocabulary types shared by the remote cluster controller.
 *
 * Defines the remote cluster record as seen through the record store, the
 * merge patch used to write its status, health snapshots reported by peer
 * sessions, and the local network inventory. All types are plain values.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fabric_controller {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ClusterName = std::string;
using Uuid = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Labels = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Remote Cluster
// ─────────────────────────────────────────────

enum class ClusterState : uint8_t {
    Unknown,
    Online,
    Offline,
    NotReady
};

[[nodiscard]] constexpr std::string_view to_string(ClusterState state) noexcept {
    switch (state) {
        case ClusterState::Unknown:  return "unknown";
        case ClusterState::Online:   return "online";
        case ClusterState::Offline:  return "offline";
        case ClusterState::NotReady: return "not_ready";
    }
    return "unknown";
}

/**
 * @brief Parameters a session needs to reach a peer API server.
 *
 * Every field here is connection-affecting: a change to any of them
 * replaces the live session.
 */
struct ConnectionParams {
    std::string api_endpoint;
    std::string ca_bundle;
    std::string client_cert;
    std::string client_key;
    std::string token;
    uint32_t timeout_seconds{30};

    bool operator==(const ConnectionParams&) const = default;

    /// Endpoint plus a token or a client certificate pair.
    [[nodiscard]] bool usable() const noexcept {
        if (api_endpoint.empty()) return false;
        return !token.empty() || (!client_cert.empty() && !client_key.empty());
    }
};

struct RemoteClusterStatus {
    Uuid uuid;                                  ///< Identity reported by the peer
    ClusterState state{ClusterState::Unknown};
    std::string message;
    std::optional<Timestamp> last_probe_time;
    uint32_t remote_subnet_count{0};
    uint32_t remote_vtep_count{0};
};

/**
 * @brief A remote cluster record as persisted by the record store.
 *
 * The controller never owns these; it reads them through the informer
 * cache and writes only the status subresource.
 */
struct RemoteClusterRecord {
    ClusterName name;
    uint64_t resource_version{0};
    Labels labels;
    ConnectionParams connection;
    RemoteClusterStatus status;
    std::optional<Timestamp> deletion_timestamp;

    [[nodiscard]] bool being_deleted() const noexcept {
        return deletion_timestamp.has_value();
    }
};

/**
 * @brief Merge patch against the status subresource.
 *
 * Unset fields leave the stored value untouched, so writers touching
 * disjoint fields do not clobber each other. When resource_version is set
 * the store rejects the patch with a Conflict if the record moved on.
 */
struct StatusPatch {
    std::optional<uint64_t> resource_version;
    std::optional<Uuid> uuid;
    std::optional<ClusterState> state;
    std::optional<std::string> message;
    std::optional<Timestamp> last_probe_time;
    std::optional<uint32_t> remote_subnet_count;
    std::optional<uint32_t> remote_vtep_count;
};

/**
 * @brief Result of a single session health probe.
 */
struct HealthSnapshot {
    bool healthy{false};
    std::string message;
    uint32_t remote_subnet_count{0};
    uint32_t remote_vtep_count{0};
    Timestamp probed_at{};
};

// ─────────────────────────────────────────────
// Local Networks
// ─────────────────────────────────────────────

enum class NetworkType : uint8_t {
    Underlay,
    Overlay,
    GlobalBgp
};

[[nodiscard]] constexpr std::string_view to_string(NetworkType type) noexcept {
    switch (type) {
        case NetworkType::Underlay:  return "underlay";
        case NetworkType::Overlay:   return "overlay";
        case NetworkType::GlobalBgp: return "global_bgp";
    }
    return "unknown";
}

struct LocalNetwork {
    std::string name;
    NetworkType type{NetworkType::Underlay};
    std::optional<uint32_t> net_id;
};

struct LocalSubnet {
    std::string name;
    std::string network;
    std::string cidr;
};

}  // namespace fabric_controller
