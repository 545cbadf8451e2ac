/**
 * @file simulated_session.hpp
 * @brief In-process peer sessions with configurable health, for the daemon and tests.
 *
 * Each peer cluster gets a PeerProfile describing what its session reports.
 * Profiles can change while sessions are live; the next probe sees the change.
 * On creation a session announces the peer's UUID through its publisher,
 * the same way a real session reports the identity it learned from the peer.
 */

#pragma once

#include "session/session.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace fabric_controller {

struct PeerProfile {
    Uuid peer_uuid;
    bool healthy = true;
    bool fail_probe = false;
    bool fail_create = false;
    uint32_t remote_subnet_count = 0;
    uint32_t remote_vtep_count = 0;
    std::chrono::milliseconds probe_latency{0};
};

class SimulatedSessionFactory : public ISessionFactory {
public:
    SimulatedSessionFactory();

    Result<std::shared_ptr<ISession>> create(const RemoteClusterRecord& record,
                                             EventPublisher publisher) override;

    // Test helpers: configure what sessions report
    void set_profile(const ClusterName& name, PeerProfile profile);
    void set_healthy(const ClusterName& name, bool healthy);
    void set_probe_failure(const ClusterName& name, bool fail);

    [[nodiscard]] uint32_t created_count(const ClusterName& name) const;
    [[nodiscard]] uint32_t closed_count(const ClusterName& name) const;
    [[nodiscard]] uint32_t probe_count(const ClusterName& name) const;

    struct State {
        mutable std::mutex mutex;
        std::map<ClusterName, PeerProfile> profiles;
        std::map<ClusterName, uint32_t> created;
        std::map<ClusterName, uint32_t> closed;
        std::map<ClusterName, uint32_t> probes;
    };

private:
    std::shared_ptr<State> state_;
};

class SimulatedSession : public ISession {
public:
    SimulatedSession(ClusterName name, std::shared_ptr<SimulatedSessionFactory::State> state);

    Result<void> close() override;
    Result<HealthSnapshot> probe() override;

    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(); }

private:
    ClusterName name_;
    std::shared_ptr<SimulatedSessionFactory::State> state_;
    std::atomic<bool> closed_{false};
};

}  // namespace fabric_controller
