/**
 * @file event_recorder.hpp
 * @brief Event sink that logs every event and keeps a bounded history.
 */

#pragma once

#include "core/logger.hpp"
#include "store/collaborators.hpp"

#include <deque>
#include <mutex>
#include <vector>

namespace fabric_controller {

struct RecordedEvent {
    ClusterName cluster_name;
    EventType type{EventType::Normal};
    std::string reason;
    std::string message;
    Timestamp timestamp{};
};

class RecordingEventSink : public IEventRecorder {
public:
    explicit RecordingEventSink(Logger logger, size_t max_events = 1000);

    void event(const RemoteClusterRecord& target,
               EventType type,
               const std::string& reason,
               const std::string& message) override;

    [[nodiscard]] std::vector<RecordedEvent> events() const;
    [[nodiscard]] std::vector<RecordedEvent> events_for(const ClusterName& name) const;
    [[nodiscard]] size_t size() const;

private:
    Logger logger_;
    size_t max_events_;
    mutable std::mutex mutex_;
    std::deque<RecordedEvent> events_;
};

}  // namespace fabric_controller
