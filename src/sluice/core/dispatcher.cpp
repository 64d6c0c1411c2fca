/**
 * @file dispatcher.cpp
 * @brief Responder table, scheduler fan-out and cross-service queries.
 */
#include "sluice/core/dispatcher.hpp"

#include <algorithm>
#include <mutex>
#include <type_traits>

#include "sluice/obs/logging.hpp"

namespace sluice::core {

namespace {

/// Collects parallel query replies; the first of "all answered" or the timeout delivers.
struct QueryJoin {
    std::mutex   mu;
    AllStates    states;
    std::size_t  remaining{0};
    async::PromisePtr<AllStates> reply;

    void finish_locked(std::unique_lock<std::mutex>& lk) {
        AllStates copy = states;
        lk.unlock();
        reply->deliver(std::move(copy));
    }
};

} // namespace

nlohmann::json to_json(const DispatcherStats& s) {
    return nlohmann::json{{"services", s.services},
                          {"draining", s.draining},
                          {"created", s.created},
                          {"terminated", s.terminated},
                          {"rejected", s.rejected}};
}

Dispatcher::Dispatcher(async::Executor& executor, async::Timer& timer, std::size_t mailbox_capacity)
    : Actor("dispatcher", executor, mailbox_capacity), timer_(timer) {}

std::shared_ptr<Dispatcher> Dispatcher::create(ResponderContext responder_context) {
    auto d = std::make_shared<Dispatcher>(*responder_context.executor, *responder_context.timer,
                                          responder_context.mailbox_capacity);
    std::weak_ptr<async::Actor<DispatcherMessage>> weak = d->weak_from_this();
    responder_context.on_idle = [weak](const std::string& service_id, const Responder* responder,
                                       std::uint64_t processed) {
        if (auto self = weak.lock()) {
            if (self->tell(dmsg::ResponderIdle{service_id, responder, processed}) != async::SendResult::Ok) {
                obs::logger()->debug("{}: idle report dropped", service_id);
            }
        }
    };
    d->ctx_ = std::make_shared<const ResponderContext>(std::move(responder_context));
    return d;
}

// ----------------------------- Public API ------------------------------------

bool Dispatcher::send(std::string service_id, ResponderMessage m) {
    DispatcherMessage dm{dmsg::ToService{std::move(service_id), std::move(m)}};
    if (tell(std::move(dm)) == async::SendResult::Ok) return true;
    auto& ts = std::get<dmsg::ToService>(dm);
    obs::logger()->warn("{}: dispatcher mailbox unavailable, rejecting {}", ts.service_id, message_name(ts.message));
    reject_message(ts.message, ts.service_id, RouterErrorCode::ServiceUnavailable);
    return false;
}

bool Dispatcher::publish(scheduler::SchedulerSnapshotPtr snapshot) {
    if (tell(dmsg::Snapshot{std::move(snapshot)}) == async::SendResult::Ok) return true;
    obs::logger()->warn("dispatcher dropped scheduler snapshot (mailbox unavailable)");
    return false;
}

bool Dispatcher::broadcast(ResponderMessage m) {
    if (tell(dmsg::Broadcast{std::move(m)}) == async::SendResult::Ok) return true;
    obs::logger()->warn("dispatcher dropped broadcast (mailbox unavailable)");
    return false;
}

async::PromisePtr<AllStates> Dispatcher::query_all(std::chrono::milliseconds timeout) {
    auto reply = async::Promise<AllStates>::make();
    if (tell(dmsg::QueryAll{timeout, reply}) != async::SendResult::Ok) reply->deliver(AllStates{});
    return reply;
}

async::PromisePtr<DispatcherStats> Dispatcher::query_stats() {
    auto reply = async::Promise<DispatcherStats>::make();
    if (tell(dmsg::QueryStats{reply}) != async::SendResult::Ok) reply->deliver(DispatcherStats{});
    return reply;
}

void Dispatcher::start_sweep(std::chrono::milliseconds interval) {
    if (sweep_ != async::Timer::kNoTimer) return;
    std::weak_ptr<async::Actor<DispatcherMessage>> weak = weak_from_this();
    sweep_ = timer_.schedule_every(interval, [weak] {
        if (auto self = weak.lock()) {
            if (self->tell(dmsg::Broadcast{msg::BlacklistSweep{}}) != async::SendResult::Ok) {
                obs::logger()->debug("blacklist sweep skipped (dispatcher busy)");
            }
        }
    });
}

void Dispatcher::shutdown() {
    if (sweep_ != async::Timer::kNoTimer) {
        timer_.cancel(sweep_);
        sweep_ = async::Timer::kNoTimer;
    }
    stop();
}

// ----------------------------- Turns -----------------------------------------

void Dispatcher::handle(DispatcherMessage& m) {
    std::visit([this](auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            obs::logger()->warn("dispatcher: unknown message dropped");
        } else if constexpr (std::is_same_v<T, dmsg::Snapshot>) {
            if (v.snapshot) on_snapshot(*v.snapshot);
        } else if constexpr (std::is_same_v<T, dmsg::ToService>) {
            if (v.service_id.empty()) {
                obs::logger()->warn("dispatcher: {} without service-id", message_name(v.message));
                reject_message(v.message, v.service_id, RouterErrorCode::InvalidRequest);
                return;
            }
            (void)route(v.service_id, std::move(v.message));
        } else if constexpr (std::is_same_v<T, dmsg::Broadcast>) {
            for (auto& [sid, e] : entries_) {
                sync_phase(sid, e);
                ResponderMessage copy = v.message;
                (void)route(sid, std::move(copy));
            }
        } else if constexpr (std::is_same_v<T, dmsg::ResponderIdle>) {
            on_idle(v);
        } else if constexpr (std::is_same_v<T, dmsg::QueryAll>) {
            on_query_all(v);
        } else if constexpr (std::is_same_v<T, dmsg::QueryStats>) {
            DispatcherStats s;
            for (const auto& [sid, e] : entries_) {
                s.services.push_back(sid);
                if (e.removed) s.draining.push_back(sid);
            }
            std::sort(s.services.begin(), s.services.end());
            std::sort(s.draining.begin(), s.draining.end());
            s.created    = created_;
            s.terminated = terminated_;
            s.rejected   = rejected_;
            if (v.reply) v.reply->deliver(std::move(s));
        }
    }, m);
}

void Dispatcher::on_exit(std::deque<DispatcherMessage>& undelivered) {
    for (auto& m : undelivered) {
        if (auto* ts = std::get_if<dmsg::ToService>(&m)) {
            reject_message(ts->message, ts->service_id, RouterErrorCode::ServiceUnavailable);
        } else if (auto* q = std::get_if<dmsg::QueryAll>(&m)) {
            if (q->reply) q->reply->deliver(AllStates{});
        } else if (auto* qs = std::get_if<dmsg::QueryStats>(&m)) {
            if (qs->reply) qs->reply->deliver(DispatcherStats{});
        }
    }
    for (auto& [sid, e] : entries_) e.responder->stop();
    terminated_ += entries_.size();
    entries_.clear();
    obs::logger()->info("dispatcher stopped");
}

void Dispatcher::on_snapshot(const scheduler::SchedulerSnapshot& s) {
    known_services_ = s.available_service_ids;
    seen_snapshot_  = true;

    for (const auto& sid : s.available_service_ids) {
        Entry* e = ensure(sid);
        if (!e) continue;
        set_removed(sid, *e, false);
        (void)route(sid, msg::SchedulerUpdate{scheduler::SchedulerSnapshot::instances_of(s.healthy_instances, sid),
                                              scheduler::SchedulerSnapshot::instances_of(s.unhealthy_instances, sid),
                                              scheduler::SchedulerSnapshot::instances_of(s.killed_instances, sid),
                                              s.time});
    }
    // Services that disappeared: deliver their kills, then drain.
    for (auto& [sid, e] : entries_) {
        if (s.available_service_ids.contains(sid)) continue;
        const auto& killed = scheduler::SchedulerSnapshot::instances_of(s.killed_instances, sid);
        if (!killed.empty()) (void)route(sid, msg::SchedulerUpdate{{}, {}, killed, s.time});
        set_removed(sid, e, true);
    }
}

void Dispatcher::on_idle(const dmsg::ResponderIdle& m) {
    auto it = entries_.find(m.service_id);
    if (it == entries_.end() || it->second.responder.get() != m.responder) return;
    // Anything still queued or in flight means a later report will follow.
    if (!it->second.removed || m.processed != it->second.sent) return;
    it->second.responder->stop();
    entries_.erase(it);
    ++terminated_;
    obs::logger()->info("{}: idle draining responder reclaimed", m.service_id);
}

void Dispatcher::on_query_all(dmsg::QueryAll& m) {
    if (!m.reply) return;
    if (entries_.empty()) {
        m.reply->deliver(AllStates{});
        return;
    }
    auto join = std::make_shared<QueryJoin>();
    join->remaining = entries_.size();
    join->reply     = m.reply;

    std::vector<std::pair<std::string, async::PromisePtr<StateResult>>> asks;
    asks.reserve(entries_.size());
    for (const auto& kv : entries_) asks.emplace_back(kv.first, async::Promise<StateResult>::make());
    for (auto& [sid, p] : asks) {
        p->on_deliver([join, sid](const StateResult& r) {
            std::unique_lock<std::mutex> lk(join->mu);
            if (r) join->states.emplace(sid, *r);
            if (--join->remaining == 0) join->finish_locked(lk);
        });
    }
    (void)timer_.schedule_after(m.timeout, [join] {
        std::unique_lock<std::mutex> lk(join->mu);
        join->finish_locked(lk);
    });
    for (auto& [sid, p] : asks) (void)route(sid, msg::QueryState{p});
}

Dispatcher::Entry* Dispatcher::ensure(const std::string& service_id) {
    if (auto it = entries_.find(service_id); it != entries_.end()) return &it->second;
    if (!ctx_) {
        obs::logger()->error("{}: dispatcher has no responder context", service_id);
        return nullptr;
    }
    auto [it, inserted] = entries_.emplace(service_id, Entry{Responder::create(service_id, ctx_), 0, false});
    ++created_;
    // Touched before the scheduler knows it: start draining so it is reclaimed when idle.
    if (seen_snapshot_ && !known_services_.contains(service_id)) set_removed(service_id, it->second, true);
    return &it->second;
}

void Dispatcher::set_removed(const std::string& service_id, Entry& e, bool removed) {
    if (e.removed != removed) {
        e.removed      = removed;
        e.phase_synced = false;
    }
    sync_phase(service_id, e);
}

void Dispatcher::sync_phase(const std::string& service_id, Entry& e) {
    if (e.phase_synced) return;
    e.phase_synced = route(service_id, e.removed ? ResponderMessage{msg::ServiceRemoved{}}
                                                 : ResponderMessage{msg::ServiceRestored{}});
    if (!e.phase_synced) obs::logger()->info("{}: phase change deferred until its mailbox has room", service_id);
}

bool Dispatcher::route(const std::string& service_id, ResponderMessage&& m) {
    Entry* e = ensure(service_id);
    if (!e) {
        reject_message(m, service_id, RouterErrorCode::ServiceUnavailable);
        return false;
    }
    const auto r = e->responder->tell(std::move(m));
    if (r == async::SendResult::Ok) {
        ++e->sent;
        return true;
    }
    ++rejected_;
    obs::logger()->warn("{}: responder mailbox {}, rejecting {}", service_id,
                        r == async::SendResult::Full ? "full" : "closed", message_name(m));
    reject_message(m, service_id, RouterErrorCode::ServiceUnavailable);
    return false;
}

} // namespace sluice::core
