/**
 * @file session_registry.cpp
 * @brief SessionRegistry implementation.
 */

#include "cluster/session_registry.hpp"

namespace fabric_controller {

SessionRegistry::SessionRegistry(Logger logger) : logger_(std::move(logger)) {}

std::shared_ptr<ISession> SessionRegistry::get(const ClusterName& name) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(name);
    if (it == sessions_.end()) return nullptr;
    return it->second.session;
}

std::optional<SessionEntry> SessionRegistry::entry(const ClusterName& name) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(name);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

void SessionRegistry::set(const ClusterName& name,
                          std::shared_ptr<ISession> session,
                          ConnectionParams params) {
    std::shared_ptr<ISession> displaced;
    {
        std::lock_guard lock(mutex_);
        auto& slot = sessions_[name];
        displaced = std::move(slot.session);
        slot = SessionEntry{.session = std::move(session), .params = std::move(params)};
    }
    if (displaced) close_session(name, displaced);
}

bool SessionRegistry::remove(const ClusterName& name) {
    std::shared_ptr<ISession> removed;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) return false;
        removed = std::move(it->second.session);
        sessions_.erase(it);
    }
    if (removed) close_session(name, removed);
    return true;
}

void SessionRegistry::close_all() {
    std::unordered_map<ClusterName, SessionEntry> drained;
    {
        std::lock_guard lock(mutex_);
        drained.swap(sessions_);
    }
    for (const auto& [name, entry] : drained) {
        if (entry.session) close_session(name, entry.session);
    }
}

std::vector<ClusterName> SessionRegistry::names() const {
    std::lock_guard lock(mutex_);
    std::vector<ClusterName> result;
    result.reserve(sessions_.size());
    for (const auto& [name, entry] : sessions_) {
        result.push_back(name);
    }
    return result;
}

size_t SessionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::contains(const ClusterName& name) const {
    std::lock_guard lock(mutex_);
    return sessions_.count(name) > 0;
}

void SessionRegistry::close_session(const ClusterName& name,
                                    const std::shared_ptr<ISession>& session) {
    auto result = session->close();
    if (!result) {
        logger_.warn("failed to close session for cluster " + name + ": "
                     + result.error().describe());
        return;
    }
    logger_.debug("closed session for cluster " + name);
}

}  // namespace fabric_controller
