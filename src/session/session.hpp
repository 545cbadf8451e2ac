/**
 * @file session.hpp
 * @brief Live management session to a peer cluster, and the factory that builds it.
 *
 * The controller only creates, probes and closes sessions; what a session
 * does on the wire is its own business. Sessions report back through the
 * EventPublisher they are given at construction.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace fabric_controller {

// ─────────────────────────────────────────────
// Events published towards the controller
// ─────────────────────────────────────────────

enum class EventType : uint8_t {
    Normal,
    Warning
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::Normal:  return "Normal";
        case EventType::Warning: return "Warning";
    }
    return "Unknown";
}

struct EventBody {
    EventType type{EventType::Normal};
    std::string reason;
    std::string message;
};

/// Peer reported its identity; claim it for cluster_name and persist it.
struct RefreshUuidEvent {
    Uuid uuid;
    ClusterName cluster_name;
};

/// Peer state changed; refresh its status now instead of at the next tick.
struct UpdateStatusEvent {
    ClusterName cluster_name;
};

/// Forward a human-readable event to the cluster record's event stream.
struct RecordEventEvent {
    ClusterName cluster_name;
    EventBody body;
};

using Event = std::variant<RefreshUuidEvent, UpdateStatusEvent, RecordEventEvent>;

[[nodiscard]] const ClusterName& event_cluster(const Event& event);
[[nodiscard]] std::string_view event_kind(const Event& event);

/// Returns false once the receiving pipeline is closed.
using EventPublisher = std::function<bool(Event)>;

// ─────────────────────────────────────────────
// ISession / ISessionFactory
// ─────────────────────────────────────────────

class ISession {
public:
    virtual ~ISession() = default;

    /// Idempotent. Probing a closed session fails.
    virtual Result<void> close() = 0;
    virtual Result<HealthSnapshot> probe() = 0;
};

class ISessionFactory {
public:
    virtual ~ISessionFactory() = default;

    virtual Result<std::shared_ptr<ISession>> create(const RemoteClusterRecord& record,
                                                     EventPublisher publisher) = 0;
};

/**
 * @brief True when moving from old_params to new_params requires a new session.
 *
 * Every ConnectionParams field is connection-affecting; labels, status and
 * resource versions live outside ConnectionParams and never count.
 */
[[nodiscard]] inline bool connection_changed(const ConnectionParams& old_params,
                                             const ConnectionParams& new_params) {
    return !(old_params == new_params);
}

}  // namespace fabric_controller
