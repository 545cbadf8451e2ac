/**
 * @file simulated_session.cpp
 * @brief SimulatedSession and SimulatedSessionFactory implementation.
 */

#include "session/simulated_session.hpp"

#include <thread>

namespace fabric_controller {

namespace {

uint32_t count_of(const std::map<ClusterName, uint32_t>& counts, const ClusterName& name) {
    auto it = counts.find(name);
    return it == counts.end() ? 0 : it->second;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// SimulatedSessionFactory
// ─────────────────────────────────────────────

SimulatedSessionFactory::SimulatedSessionFactory()
    : state_(std::make_shared<State>()) {}

Result<std::shared_ptr<ISession>> SimulatedSessionFactory::create(const RemoteClusterRecord& record,
                                                                  EventPublisher publisher) {
    PeerProfile profile;
    {
        std::lock_guard lock(state_->mutex);
        profile = state_->profiles[record.name];
        if (profile.fail_create) {
            return Error{ErrorKind::Unavailable,
                         "cannot reach " + record.connection.api_endpoint};
        }
        ++state_->created[record.name];
    }

    auto session = std::make_shared<SimulatedSession>(record.name, state_);

    if (publisher) {
        bool published = true;
        if (!profile.peer_uuid.empty()) {
            published = publisher(RefreshUuidEvent{.uuid = profile.peer_uuid, .cluster_name = record.name});
        }
        published = published && publisher(RecordEventEvent{
            .cluster_name = record.name,
            .body = EventBody{
                .type = EventType::Normal,
                .reason = "SessionEstablished",
                .message = "connected to " + record.connection.api_endpoint
            }});
        if (!published) {
            auto closed = session->close();
            return Error{ErrorKind::Unavailable,
                         "event pipeline closed while connecting " + record.name
                         + (closed ? "" : "; close failed: " + closed.error().message)};
        }
    }
    return std::shared_ptr<ISession>(std::move(session));
}

void SimulatedSessionFactory::set_profile(const ClusterName& name, PeerProfile profile) {
    std::lock_guard lock(state_->mutex);
    state_->profiles[name] = std::move(profile);
}

void SimulatedSessionFactory::set_healthy(const ClusterName& name, bool healthy) {
    std::lock_guard lock(state_->mutex);
    state_->profiles[name].healthy = healthy;
}

void SimulatedSessionFactory::set_probe_failure(const ClusterName& name, bool fail) {
    std::lock_guard lock(state_->mutex);
    state_->profiles[name].fail_probe = fail;
}

uint32_t SimulatedSessionFactory::created_count(const ClusterName& name) const {
    std::lock_guard lock(state_->mutex);
    return count_of(state_->created, name);
}

uint32_t SimulatedSessionFactory::closed_count(const ClusterName& name) const {
    std::lock_guard lock(state_->mutex);
    return count_of(state_->closed, name);
}

uint32_t SimulatedSessionFactory::probe_count(const ClusterName& name) const {
    std::lock_guard lock(state_->mutex);
    return count_of(state_->probes, name);
}

// ─────────────────────────────────────────────
// SimulatedSession
// ─────────────────────────────────────────────

SimulatedSession::SimulatedSession(ClusterName name,
                                   std::shared_ptr<SimulatedSessionFactory::State> state)
    : name_(std::move(name)), state_(std::move(state)) {}

Result<void> SimulatedSession::close() {
    if (closed_.exchange(true)) return {};

    std::lock_guard lock(state_->mutex);
    ++state_->closed[name_];
    return {};
}

Result<HealthSnapshot> SimulatedSession::probe() {
    if (closed_.load()) {
        return Error{ErrorKind::Unavailable, "session for " + name_ + " is closed"};
    }

    PeerProfile profile;
    {
        std::lock_guard lock(state_->mutex);
        profile = state_->profiles[name_];
        ++state_->probes[name_];
    }

    if (profile.probe_latency.count() > 0) {
        std::this_thread::sleep_for(profile.probe_latency);
    }
    if (profile.fail_probe) {
        return Error{ErrorKind::Unavailable, "health probe to " + name_ + " timed out"};
    }

    return HealthSnapshot{
        .healthy = profile.healthy,
        .message = profile.healthy ? "cluster is reachable" : "cluster reports not ready",
        .remote_subnet_count = profile.remote_subnet_count,
        .remote_vtep_count = profile.remote_vtep_count,
        .probed_at = std::chrono::system_clock::now()
    };
}

}  // namespace fabric_controller
