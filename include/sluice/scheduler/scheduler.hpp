#pragma once
/**
 * @file scheduler.hpp
 * @brief Scheduler feed: the polled Scheduler interface, the snapshot broadcaster
 *        and the periodic syncer that connects them.
 *
 * Snapshots are immutable and shared read-only by every subscriber (fan-out,
 * never fan-in-mutated).
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/async/executor.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/compat/expected.hpp"
#include "sluice/scheduler/service_instance.hpp"
#include "sluice/scheduler/snapshot.hpp"

namespace sluice::scheduler {

/// Failure modes of a scheduler poll.
enum class SchedulerError : std::uint8_t {
    Unavailable, ///< Orchestrator unreachable or timed out (transient)
    Malformed    ///< Response could not be interpreted
};

const char* to_string(SchedulerError e) noexcept;

/** @class Scheduler
 *  @brief Orchestrator collaborator. Transient errors are retried by the syncer's next poll.
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /// Current view of services and instances.
    virtual sluice_detail::expected<SchedulerSnapshot, SchedulerError> poll() = 0;

    /// Ask the orchestrator to kill @p instance. Reported as killed on a later poll.
    virtual void process_instance_killed(const ServiceInstance& instance) = 0;
};

/** @class StaticScheduler
 *  @brief In-memory Scheduler for local runs and tests.
 *
 * Killed instances are reported once, on the next poll, then forgotten.
 */
class StaticScheduler final : public Scheduler {
public:
    sluice_detail::expected<SchedulerSnapshot, SchedulerError> poll() override;
    void process_instance_killed(const ServiceInstance& instance) override;

    /// Declare @p service_id with the given instances (replaces the previous lists).
    void set_instances(const std::string& service_id, InstanceList healthy, InstanceList unhealthy = {});

    /// Forget @p service_id.
    void remove_service(const std::string& service_id);

    /// Make the next polls fail with @p error until cleared with std::nullopt.
    void set_failure(std::optional<SchedulerError> error);

private:
    mutable std::mutex mu_;
    std::set<std::string> services_;
    std::unordered_map<std::string, InstanceList> healthy_;
    std::unordered_map<std::string, InstanceList> unhealthy_;
    std::unordered_map<std::string, InstanceList> killed_;
    std::optional<SchedulerError> failure_;
};

/** @class SchedulerBroadcaster
 *  @brief Fan-out of snapshots to subscribers; remembers the latest one.
 *
 * Subscribers run on the publishing thread and must only forward (post a
 * message, swap a pointer).
 */
class SchedulerBroadcaster final {
public:
    using SubscriberId = std::uint64_t;
    using Subscriber   = std::function<void(const SchedulerSnapshotPtr&)>;

    SubscriberId subscribe(Subscriber fn);
    void unsubscribe(SubscriberId id);

    /// Deliver @p snapshot to every subscriber.
    void publish(SchedulerSnapshotPtr snapshot);

    /// Last published snapshot (nullptr before the first publish).
    [[nodiscard]] SchedulerSnapshotPtr latest() const;

    [[nodiscard]] std::uint64_t published() const;

private:
    mutable std::mutex mu_;
    std::vector<std::pair<SubscriberId, Subscriber>> subscribers_;
    SubscriberId next_id_{1};
    SchedulerSnapshotPtr latest_;
    std::uint64_t published_{0};
};

/** @class SchedulerSyncer
 *  @brief Polls a Scheduler every interval and publishes the result.
 *
 * The timer only posts the poll onto the executor. Failed polls are logged
 * and skipped: subscribers keep the last good snapshot.
 * Must be owned by std::shared_ptr (ticks hold a weak reference).
 */
class SchedulerSyncer final : public std::enable_shared_from_this<SchedulerSyncer> {
public:
    SchedulerSyncer(Scheduler& scheduler, SchedulerBroadcaster& broadcaster,
                    async::Timer& timer, async::Executor& executor,
                    std::chrono::milliseconds interval);
    ~SchedulerSyncer();

    /// Poll once immediately, then every interval.
    void start();
    void stop();

    /// Poll and publish synchronously. Returns false when the poll failed.
    bool sync_once();

    [[nodiscard]] std::uint64_t failures() const noexcept { return failures_.load(std::memory_order_relaxed); }

private:
    Scheduler&                scheduler_;
    SchedulerBroadcaster&     broadcaster_;
    async::Timer&             timer_;
    async::Executor&          executor_;
    std::chrono::milliseconds interval_;
    async::Timer::TimerId     tick_{async::Timer::kNoTimer};
    std::mutex                sync_mu_; ///< One poll at a time
    std::atomic<std::uint64_t> failures_{0};
};

} // namespace sluice::scheduler
