/**
 * @file snapshot.cpp
 * @brief Lookup helper for SchedulerSnapshot.
 */
#include "sluice/scheduler/snapshot.hpp"

namespace sluice::scheduler {

const InstanceList& SchedulerSnapshot::instances_of(
    const std::unordered_map<std::string, InstanceList>& by_service, const std::string& service_id) {
    static const InstanceList kEmpty;
    auto it = by_service.find(service_id);
    return it == by_service.end() ? kEmpty : it->second;
}

} // namespace sluice::scheduler
