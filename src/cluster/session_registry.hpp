/**
 * @file session_registry.hpp
 * @brief Thread-safe map of cluster name to its live peer session.
 *
 * The registry is the only component that closes sessions. Replacing or
 * removing an entry closes the displaced session after the lock is
 * released, so a slow peer never stalls other lookups.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "session/session.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace fabric_controller {

struct SessionEntry {
    std::shared_ptr<ISession> session;
    ConnectionParams params;        ///< Parameters the session was built from
};

class SessionRegistry {
public:
    explicit SessionRegistry(Logger logger);

    /// Null when the cluster has no active session.
    [[nodiscard]] std::shared_ptr<ISession> get(const ClusterName& name) const;
    [[nodiscard]] std::optional<SessionEntry> entry(const ClusterName& name) const;

    /// Registers session for name, closing any session it replaces.
    void set(const ClusterName& name, std::shared_ptr<ISession> session, ConnectionParams params);

    /// Closes and removes the session for name. False if there was none.
    bool remove(const ClusterName& name);

    /// Closes every session. Close failures are logged.
    void close_all();

    [[nodiscard]] std::vector<ClusterName> names() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const ClusterName& name) const;

private:
    void close_session(const ClusterName& name, const std::shared_ptr<ISession>& session);

    Logger logger_;
    mutable std::mutex mutex_;
    std::unordered_map<ClusterName, SessionEntry> sessions_;
};

}  // namespace fabric_controller
