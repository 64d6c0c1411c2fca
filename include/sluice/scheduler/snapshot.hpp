#pragma once
/**
 * @file snapshot.hpp
 * @brief Immutable scheduler state published to all subscribers.
 */

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

#include "sluice/scheduler/service_instance.hpp"

namespace sluice::scheduler {

/** @struct SchedulerSnapshot
 *  @brief One poll of the scheduler: known services and their instances by health.
 */
struct SchedulerSnapshot {
    std::set<std::string> available_service_ids;                       ///< Services the scheduler knows
    std::unordered_map<std::string, InstanceList> healthy_instances;   ///< service-id -> healthy
    std::unordered_map<std::string, InstanceList> unhealthy_instances; ///< service-id -> unhealthy
    std::unordered_map<std::string, InstanceList> killed_instances;    ///< service-id -> killed since last poll
    std::chrono::steady_clock::time_point time{std::chrono::steady_clock::now()}; ///< Poll time

    /// Instances of @p service_id in @p by_service (empty list when absent).
    static const InstanceList& instances_of(const std::unordered_map<std::string, InstanceList>& by_service,
                                            const std::string& service_id);
};

/// Snapshots are shared read-only between subscribers.
using SchedulerSnapshotPtr = std::shared_ptr<const SchedulerSnapshot>;

} // namespace sluice::scheduler
