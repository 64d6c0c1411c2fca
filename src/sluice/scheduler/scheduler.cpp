/**
 * @file scheduler.cpp
 * @brief StaticScheduler, snapshot broadcaster and periodic syncer.
 */
#include "sluice/scheduler/scheduler.hpp"

#include <algorithm>

#include "sluice/obs/logging.hpp"

namespace sluice::scheduler {

const char* to_string(SchedulerError e) noexcept {
    switch (e) {
        case SchedulerError::Unavailable: return "unavailable";
        case SchedulerError::Malformed:   return "malformed";
    }
    return "unknown";
}

// ---------------------------- StaticScheduler --------------------------------

sluice_detail::expected<SchedulerSnapshot, SchedulerError> StaticScheduler::poll() {
    std::lock_guard<std::mutex> lk(mu_);
    if (failure_) return sluice_detail::unexpected<SchedulerError>(*failure_);

    SchedulerSnapshot s;
    s.available_service_ids = services_;
    s.healthy_instances     = healthy_;
    s.unhealthy_instances   = unhealthy_;
    s.killed_instances.swap(killed_); // reported once
    return s;
}

void StaticScheduler::process_instance_killed(const ServiceInstance& instance) {
    std::lock_guard<std::mutex> lk(mu_);
    auto drop = [&instance](InstanceList& list) {
        std::erase_if(list, [&instance](const ServiceInstance& i) { return i.id == instance.id; });
    };
    drop(healthy_[instance.service_id]);
    drop(unhealthy_[instance.service_id]);
    killed_[instance.service_id].push_back(instance);
    obs::logger()->info("scheduler killed instance {} of {}", instance.id, instance.service_id);
}

void StaticScheduler::set_instances(const std::string& service_id, InstanceList healthy, InstanceList unhealthy) {
    std::lock_guard<std::mutex> lk(mu_);
    services_.insert(service_id);
    healthy_[service_id]   = std::move(healthy);
    unhealthy_[service_id] = std::move(unhealthy);
}

void StaticScheduler::remove_service(const std::string& service_id) {
    std::lock_guard<std::mutex> lk(mu_);
    services_.erase(service_id);
    healthy_.erase(service_id);
    unhealthy_.erase(service_id);
}

void StaticScheduler::set_failure(std::optional<SchedulerError> error) {
    std::lock_guard<std::mutex> lk(mu_);
    failure_ = error;
}

// ---------------------------- SchedulerBroadcaster ---------------------------

SchedulerBroadcaster::SubscriberId SchedulerBroadcaster::subscribe(Subscriber fn) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto id = next_id_++;
    subscribers_.emplace_back(id, std::move(fn));
    return id;
}

void SchedulerBroadcaster::unsubscribe(SubscriberId id) {
    std::lock_guard<std::mutex> lk(mu_);
    std::erase_if(subscribers_, [id](const auto& s) { return s.first == id; });
}

void SchedulerBroadcaster::publish(SchedulerSnapshotPtr snapshot) {
    if (!snapshot) return;
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        latest_ = snapshot;
        ++published_;
        targets.reserve(subscribers_.size());
        for (const auto& s : subscribers_) targets.push_back(s.second);
    }
    // Outside the lock: subscribers may read latest() or unsubscribe.
    for (auto& fn : targets) fn(snapshot);
}

SchedulerSnapshotPtr SchedulerBroadcaster::latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return latest_;
}

std::uint64_t SchedulerBroadcaster::published() const {
    std::lock_guard<std::mutex> lk(mu_);
    return published_;
}

// ---------------------------- SchedulerSyncer --------------------------------

SchedulerSyncer::SchedulerSyncer(Scheduler& scheduler, SchedulerBroadcaster& broadcaster,
                                 async::Timer& timer, async::Executor& executor,
                                 std::chrono::milliseconds interval)
    : scheduler_(scheduler), broadcaster_(broadcaster), timer_(timer), executor_(executor),
      interval_(std::max(interval, std::chrono::milliseconds{1})) {}

SchedulerSyncer::~SchedulerSyncer() { stop(); }

void SchedulerSyncer::start() {
    if (tick_ != async::Timer::kNoTimer) return;
    std::weak_ptr<SchedulerSyncer> weak = weak_from_this();
    auto post_poll = [weak, &executor = executor_] {
        const bool posted = executor.post([weak] {
            if (auto self = weak.lock()) self->sync_once();
        });
        if (!posted) obs::logger()->debug("scheduler poll skipped: executor stopping");
    };
    post_poll();
    tick_ = timer_.schedule_every(interval_, post_poll);
    obs::logger()->info("scheduler syncer started, interval {} ms", interval_.count());
}

void SchedulerSyncer::stop() {
    if (tick_ == async::Timer::kNoTimer) return;
    timer_.cancel(tick_);
    tick_ = async::Timer::kNoTimer;
}

bool SchedulerSyncer::sync_once() {
    std::lock_guard<std::mutex> lk(sync_mu_);
    auto result = scheduler_.poll();
    if (!result) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        obs::logger()->warn("scheduler poll failed: {}", to_string(result.error()));
        return false;
    }
    obs::logger()->debug("scheduler poll: {} services", result->available_service_ids.size());
    broadcaster_.publish(std::make_shared<const SchedulerSnapshot>(std::move(*result)));
    return true;
}

} // namespace sluice::scheduler
