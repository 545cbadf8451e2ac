/**
 * @file event_recorder.cpp
 * @brief RecordingEventSink implementation.
 */

#include "store/event_recorder.hpp"

#include <chrono>

namespace fabric_controller {

RecordingEventSink::RecordingEventSink(Logger logger, size_t max_events)
    : logger_(std::move(logger)), max_events_(max_events == 0 ? 1 : max_events) {}

void RecordingEventSink::event(const RemoteClusterRecord& target,
                               EventType type,
                               const std::string& reason,
                               const std::string& message) {
    auto line = "event " + std::string{to_string(type)} + " " + reason
              + " on remote cluster " + target.name + ": " + message;
    if (type == EventType::Warning) {
        logger_.warn(line);
    } else {
        logger_.info(line);
    }

    std::lock_guard lock(mutex_);
    events_.push_back(RecordedEvent{
        .cluster_name = target.name,
        .type = type,
        .reason = reason,
        .message = message,
        .timestamp = std::chrono::system_clock::now()
    });
    while (events_.size() > max_events_) events_.pop_front();
}

std::vector<RecordedEvent> RecordingEventSink::events() const {
    std::lock_guard lock(mutex_);
    return {events_.begin(), events_.end()};
}

std::vector<RecordedEvent> RecordingEventSink::events_for(const ClusterName& name) const {
    std::lock_guard lock(mutex_);
    std::vector<RecordedEvent> result;
    for (const auto& e : events_) {
        if (e.cluster_name == name) result.push_back(e);
    }
    return result;
}

size_t RecordingEventSink::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

}  // namespace fabric_controller
