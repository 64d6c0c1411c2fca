/**
 * @file interstitial_maintainer.cpp
 * @brief Scheduler-driven upkeep of interstitial promises and state queries.
 */
#include "sluice/interstitial/interstitial_maintainer.hpp"

#include <cstdint>
#include <type_traits>

#include "sluice/obs/logging.hpp"

namespace sluice::interstitial {

InterstitialMaintainer::InterstitialMaintainer(InterstitialGate& gate,
                                               const scheduler::ServiceDescriptionSource& descriptions,
                                               async::Executor& executor, std::size_t mailbox_capacity,
                                               obs::MetricsSink* metrics)
    : Actor("interstitial-maintainer", executor, mailbox_capacity),
      gate_(gate),
      descriptions_(descriptions),
      metrics_(metrics) {}

bool InterstitialMaintainer::publish(scheduler::SchedulerSnapshotPtr snapshot) {
    if (tell(imsg::Snapshot{std::move(snapshot)}) == async::SendResult::Ok) return true;
    obs::logger()->warn("interstitial-maintainer dropped scheduler snapshot (mailbox unavailable)");
    return false;
}

async::PromisePtr<nlohmann::json> InterstitialMaintainer::query(std::optional<std::string> service_id) {
    auto reply = async::Promise<nlohmann::json>::make();
    if (tell(imsg::Query{std::move(service_id), reply}) != async::SendResult::Ok) {
        reply->deliver(nlohmann::json{{"message", "interstitial-maintainer unavailable"}});
    }
    return reply;
}

void InterstitialMaintainer::handle(MaintainerMessage& m) {
    std::visit([this](auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            obs::logger()->info("interstitial-maintainer: unknown message dropped");
        } else if constexpr (std::is_same_v<T, imsg::Snapshot>) {
            if (v.snapshot) on_snapshot(*v.snapshot);
        } else if constexpr (std::is_same_v<T, imsg::Query>) {
            if (v.reply) v.reply->deliver(state(v.service_id));
        }
    }, m);
    if (metrics_) {
        metrics_->counter_set(obs::router_metric("interstitial", "counters", {"available-services"}),
                              static_cast<std::int64_t>(available_service_ids_.size()));
    }
}

void InterstitialMaintainer::on_exit(std::deque<MaintainerMessage>& undelivered) {
    for (auto& m : undelivered) {
        if (auto* q = std::get_if<imsg::Query>(&m); q && q->reply) {
            q->reply->deliver(nlohmann::json{{"message", "interstitial-maintainer stopped"}});
        }
    }
    obs::logger()->warn("stopping interstitial-maintainer");
}

void InterstitialMaintainer::on_snapshot(const scheduler::SchedulerSnapshot& s) {
    const auto& available = s.available_service_ids;

    // Includes pending promises that check() installed for ids the scheduler never listed.
    (void)gate_.remove_absent(available);

    for (const auto& sid : available) {
        auto d = descriptions_.lookup(sid);
        if (d && d->interstitial_secs > 0) (void)gate_.ensure(sid, d->interstitial_secs);
    }
    for (const auto& [sid, healthy] : s.healthy_instances) {
        if (healthy.empty()) continue;
        (void)gate_.resolve(sid, InterstitialResolution::HealthyInstanceFound);
    }

    available_service_ids_ = available;
    gate_.mark_initialized();
}

nlohmann::json InterstitialMaintainer::state(const std::optional<std::string>& service_id) const {
    if (service_id) {
        auto p = gate_.find(*service_id);
        return nlohmann::json{{"available", available_service_ids_.contains(*service_id)},
                              {"interstitial", p ? nlohmann::json(promise_state(p)) : nlohmann::json(nullptr)}};
    }
    return nlohmann::json{{"interstitial", gate_.to_json()},
                          {"maintainer", {{"available-service-ids", available_service_ids_}}}};
}

} // namespace sluice::interstitial
