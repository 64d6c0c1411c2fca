/**
 * @file work_stealing.cpp
 * @brief Capacity scan, reservation and offer bookkeeping of the work-stealing coordinator.
 */
#include "sluice/core/work_stealing.hpp"

#include <type_traits>
#include <vector>

#include "sluice/obs/logging.hpp"

namespace sluice::core {

nlohmann::json to_json(const WorkStealingStats& s) {
    return nlohmann::json{{"offers-sent", s.offers_sent},
                          {"accepted", s.accepted},
                          {"declined", s.declined},
                          {"timeout", s.timeout},
                          {"in-flight", s.in_flight}};
}

WorkStealingCoordinator::WorkStealingCoordinator(std::string router_id, WorkStealingConfig cfg, Deps deps)
    : Actor("work-stealing", *deps.executor, deps.mailbox_capacity),
      router_id_(std::move(router_id)),
      cfg_(cfg),
      deps_(deps) {}

void WorkStealingCoordinator::start() {
    if (tick_ != async::Timer::kNoTimer) return;
    std::weak_ptr<async::Actor<CoordinatorMessage>> weak = weak_from_this();
    tick_ = deps_.timer->schedule_every(std::chrono::milliseconds(cfg_.offer_help_interval_ms), [weak] {
        if (auto self = weak.lock()) {
            if (self->tell(wsmsg::Tick{}) != async::SendResult::Ok) {
                obs::logger()->debug("work-stealing tick skipped (mailbox unavailable)");
            }
        }
    });
    obs::logger()->info("work-stealing started every {} ms", cfg_.offer_help_interval_ms);
}

void WorkStealingCoordinator::shutdown() {
    if (tick_ != async::Timer::kNoTimer) {
        deps_.timer->cancel(tick_);
        tick_ = async::Timer::kNoTimer;
    }
    stop();
}

bool WorkStealingCoordinator::tick() {
    return tell(wsmsg::Tick{}) == async::SendResult::Ok;
}

async::PromisePtr<WorkStealingStats> WorkStealingCoordinator::query_stats() {
    auto reply = async::Promise<WorkStealingStats>::make();
    if (tell(wsmsg::QueryStats{reply}) != async::SendResult::Ok) reply->deliver(WorkStealingStats{});
    return reply;
}

void WorkStealingCoordinator::handle(CoordinatorMessage& m) {
    std::visit([this](auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            obs::logger()->warn("work-stealing: unknown message dropped");
        } else if constexpr (std::is_same_v<T, wsmsg::Tick>) {
            on_tick();
        } else if constexpr (std::is_same_v<T, wsmsg::Capacity>) {
            on_capacity(v);
        } else if constexpr (std::is_same_v<T, wsmsg::Reserved>) {
            on_reserved(v);
        } else if constexpr (std::is_same_v<T, wsmsg::OfferSettled>) {
            on_settled(v);
        } else if constexpr (std::is_same_v<T, wsmsg::QueryStats>) {
            if (!v.reply) return;
            auto s = stats_;
            s.in_flight = in_flight_.size();
            v.reply->deliver(s);
        }
    }, m);
}

void WorkStealingCoordinator::on_exit(std::deque<CoordinatorMessage>& undelivered) {
    for (auto& m : undelivered) {
        if (auto* r = std::get_if<wsmsg::Reserved>(&m)) {
            // Reservation made but never offered: let the Responder take it back.
            if (r->instance && r->response) r->response->deliver(OfferStatus::Declined);
        } else if (auto* q = std::get_if<wsmsg::QueryStats>(&m)) {
            if (q->reply) q->reply->deliver(WorkStealingStats{});
        }
    }
    obs::logger()->info("work-stealing stopped ({} offers sent, {} accepted)", stats_.offers_sent, stats_.accepted);
}

void WorkStealingCoordinator::on_tick() {
    const auto now = Clock::now();
    const auto query_timeout = std::chrono::milliseconds(cfg_.offer_help_interval_ms + cfg_.reserve_timeout_ms);
    if (query_pending_ && now - query_started_ < query_timeout) return;
    expire_stale(now);
    if (deps_.view->peer_router_ids().empty()) return;

    query_pending_ = true;
    query_started_ = now;
    std::weak_ptr<async::Actor<CoordinatorMessage>> weak = weak_from_this();
    deps_.dispatcher->query_all(std::chrono::milliseconds(cfg_.offer_help_interval_ms))
        ->on_deliver([weak](const AllStates& states) {
            if (auto self = weak.lock()) {
                if (self->tell(wsmsg::Capacity{states}) != async::SendResult::Ok) {
                    obs::logger()->debug("work-stealing capacity report dropped");
                }
            }
        });
}

void WorkStealingCoordinator::on_capacity(wsmsg::Capacity& m) {
    query_pending_ = false;
    const auto now = Clock::now();
    const auto peers = deps_.view->peer_router_ids();
    if (peers.empty()) return;

    for (const auto& [sid, s] : m.states) {
        if (s.phase != "active" || s.distribution_scheme != scheduler::DistributionScheme::Balanced) continue;
        if (s.idle_slots <= s.queued) continue;
        std::size_t spare = s.idle_slots - s.queued;

        for (const auto& peer : peers) {
            if (spare == 0) break;
            const PairKey key{sid, peer};
            if (in_flight_.contains(key)) continue;
            if (deps_.view->waiting_requests(peer, sid) <= 0) continue;

            const std::string cid = router_id_ + "." + sid + "." + std::to_string(++cid_seq_);
            auto response = async::Promise<OfferStatus>::make();
            auto reply    = async::Promise<std::optional<ServiceInstance>>::make();
            in_flight_.insert_or_assign(key, InFlight{cid, now});
            --spare;

            std::weak_ptr<async::Actor<CoordinatorMessage>> weak = weak_from_this();
            reply->on_deliver([weak, sid, peer, cid, response](const std::optional<ServiceInstance>& inst) {
                auto self = weak.lock();
                if (!self) {
                    if (inst) response->deliver(OfferStatus::Declined);
                    return;
                }
                if (self->tell(wsmsg::Reserved{sid, peer, cid, inst, response}) != async::SendResult::Ok) {
                    if (inst) response->deliver(OfferStatus::Declined);
                }
            });
            (void)deps_.timer->schedule_after(std::chrono::milliseconds(cfg_.reserve_timeout_ms),
                                              [reply] { reply->deliver(std::nullopt); });
            deps_.dispatcher->send(sid, msg::ReserveForOffer{peer, cid, response, reply});
        }
    }
}

void WorkStealingCoordinator::on_reserved(wsmsg::Reserved& m) {
    const PairKey key{m.service_id, m.peer};
    auto it = in_flight_.find(key);
    if (!m.instance) {
        if (it != in_flight_.end() && it->second.cid == m.cid) in_flight_.erase(it);
        return;
    }

    std::weak_ptr<async::Actor<CoordinatorMessage>> weak = weak_from_this();
    m.response->on_deliver([weak, sid = m.service_id, peer = m.peer, cid = m.cid](const OfferStatus& s) {
        if (auto self = weak.lock()) {
            if (self->tell(wsmsg::OfferSettled{sid, peer, cid, s}) != async::SendResult::Ok) {
                obs::logger()->debug("work-stealing: settlement of {} dropped", cid);
            }
        }
    });

    if (m.response->realized()) return; // reservation already timed out

    WorkStealingOffer offer{m.cid, m.cid, router_id_, m.service_id, *m.instance, m.response};
    ++stats_.offers_sent;
    mark("offers-sent");
    obs::logger()->debug("work-stealing: offering {} of {} to {} ({})", m.instance->id, m.service_id, m.peer, m.cid);
    if (!deps_.transport->send_offer(m.peer, std::move(offer))) {
        obs::logger()->info("work-stealing: {} unreachable, offer {} declined", m.peer, m.cid);
        m.response->deliver(OfferStatus::Declined);
    }
}

void WorkStealingCoordinator::on_settled(const wsmsg::OfferSettled& m) {
    auto it = in_flight_.find(PairKey{m.service_id, m.peer});
    if (it != in_flight_.end() && it->second.cid == m.cid) in_flight_.erase(it);
    switch (m.status) {
        case OfferStatus::Accepted:
            ++stats_.accepted;
            mark("offers-accepted");
            obs::logger()->info("work-stealing: {} accepted offer {} for {}", m.peer, m.cid, m.service_id);
            break;
        case OfferStatus::Declined:
            ++stats_.declined;
            mark("offers-declined");
            break;
        case OfferStatus::Timeout:
            ++stats_.timeout;
            mark("offers-timeout");
            break;
    }
}

void WorkStealingCoordinator::expire_stale(Clock::time_point now) {
    // Every offer settles within reserve-timeout of its reservation; older entries lost a message.
    const auto stale_after = std::chrono::milliseconds(2 * cfg_.reserve_timeout_ms + cfg_.offer_help_interval_ms);
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (now - it->second.started > stale_after) {
            obs::logger()->warn("work-stealing: forgetting stale offer {} for {}", it->second.cid, it->first.first);
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }
}

void WorkStealingCoordinator::mark(std::string_view name) {
    if (deps_.metrics) deps_.metrics->meter_mark(obs::router_metric("work-stealing", "meters", {name}));
}

} // namespace sluice::core
