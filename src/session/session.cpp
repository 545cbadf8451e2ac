/**
 * @file session.cpp
 * @brief Event helpers.
 */

#include "session/session.hpp"

namespace fabric_controller {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // anonymous namespace

const ClusterName& event_cluster(const Event& event) {
    return std::visit([](const auto& e) -> const ClusterName& { return e.cluster_name; }, event);
}

std::string_view event_kind(const Event& event) {
    return std::visit(Overloaded{
        [](const RefreshUuidEvent&) -> std::string_view { return "refresh_uuid"; },
        [](const UpdateStatusEvent&) -> std::string_view { return "update_status"; },
        [](const RecordEventEvent&) -> std::string_view { return "record_event"; },
    }, event);
}

}  // namespace fabric_controller
