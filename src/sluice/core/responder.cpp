/**
 * @file responder.cpp
 * @brief Per-service slot accounting, instance selection, blacklisting and offers.
 */
#include "sluice/core/responder.hpp"

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

#include "sluice/obs/logging.hpp"

namespace sluice::core {

namespace {

using ActorRef = std::weak_ptr<async::Actor<ResponderMessage>>;

/// Self-send from timer threads and promise callbacks.
void post_to(const ActorRef& weak, const std::string& service_id, ResponderMessage&& m) {
    auto self = weak.lock();
    if (!self) return;
    if (self->tell(std::move(m)) != async::SendResult::Ok) {
        obs::logger()->warn("{}: dropped {} (mailbox unavailable)", service_id, message_name(m));
    }
}

std::string slot_metric(const std::string& service_id, std::string_view name) {
    return obs::service_metric(service_id, "counters", {"instance-counts", name});
}

std::string request_metric(const std::string& service_id, std::string_view name) {
    return obs::service_metric(service_id, "counters", {"request-counts", name});
}

} // namespace

bool default_queue_order(const PendingRequest& a, const PendingRequest& b) noexcept {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.seq < b.seq;
}

const char* to_string(Responder::Phase p) noexcept {
    switch (p) {
        case Responder::Phase::Active:   return "active";
        case Responder::Phase::Draining: return "draining";
    }
    return "unknown";
}

Responder::Responder(std::string service_id, std::shared_ptr<const ResponderContext> ctx)
    : Actor("responder:" + service_id, *ctx->executor, ctx->mailbox_capacity),
      service_id_(std::move(service_id)),
      ctx_(std::move(ctx)),
      description_(scheduler::ServiceDescription::with_defaults(service_id_, ctx_->defaults)),
      blacklist_(ctx_->blacklist),
      // Distinct seqs keep the order strict even when the comparator reports a tie.
      queue_([order = ctx_->queue_order ? ctx_->queue_order : QueueOrder{default_queue_order}](
                 const PendingRequest& a, const PendingRequest& b) {
          if (order(a, b)) return true;
          if (order(b, a)) return false;
          return a.seq < b.seq;
      }) {
    refresh_description();
}

std::shared_ptr<Responder> Responder::create(std::string service_id, std::shared_ptr<const ResponderContext> ctx) {
    auto r = std::make_shared<Responder>(std::move(service_id), std::move(ctx));
    obs::logger()->info("{}: responder created", r->service_id());
    return r;
}

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------

void Responder::handle(ResponderMessage& m) {
    // Counted before handling so a throwing handler still matches the dispatcher's send count.
    if (!is_internal(m)) ++processed_;
    std::visit([this](auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            obs::logger()->warn("{}: unknown message dropped", service_id_);
        } else if constexpr (std::is_same_v<T, msg::SchedulerUpdate>) {
            on_update(v);
        } else if constexpr (std::is_same_v<T, msg::SelectInstance>) {
            on_select(v);
        } else if constexpr (std::is_same_v<T, msg::ReleaseInstance>) {
            on_release(v);
        } else if constexpr (std::is_same_v<T, msg::BlacklistInstance>) {
            on_blacklist(v);
        } else if constexpr (std::is_same_v<T, msg::OfferInstance>) {
            on_offer(v);
        } else if constexpr (std::is_same_v<T, msg::QueryState>) {
            on_query(v);
        } else if constexpr (std::is_same_v<T, msg::ReserveForOffer>) {
            on_reserve(v);
        } else if constexpr (std::is_same_v<T, msg::OfferResolved>) {
            on_offer_resolved(v);
        } else if constexpr (std::is_same_v<T, msg::OfferReturned>) {
            on_offer_returned(v);
        } else if constexpr (std::is_same_v<T, msg::BorrowExpired>) {
            on_borrow_expired(v);
        } else if constexpr (std::is_same_v<T, msg::QueueDeadline>) {
            on_queue_deadline(v);
        } else if constexpr (std::is_same_v<T, msg::BlacklistSweep>) {
            on_sweep();
        } else if constexpr (std::is_same_v<T, msg::ServiceRemoved>) {
            on_removed();
        } else if constexpr (std::is_same_v<T, msg::ServiceRestored>) {
            on_restored();
        } else if constexpr (std::is_same_v<T, msg::PeerDeparted>) {
            on_peer_departed(v);
        }
    }, m);
    publish_metrics();
    report_if_idle();
}

void Responder::on_exit(std::deque<ResponderMessage>& undelivered) {
    for (auto& m : undelivered) reject_message(m, service_id_, RouterErrorCode::ServiceUnavailable);

    fail_waiters(RouterErrorCode::ServiceUnavailable);
    for (auto& [id, r] : offered_) {
        ctx_->timer->cancel(r.timeout);
        if (r.response && !r.accepted) r.response->deliver(OfferStatus::Timeout);
    }
    offered_.clear();
    std::vector<std::string> lent;
    for (const auto& kv : borrowed_) lent.push_back(kv.first);
    for (const auto& id : lent) return_borrowed(id);

    obs::logger()->info("{}: responder terminated after {} messages ({} undelivered)",
                        service_id_, processed_, undelivered.size());
}

void Responder::fail_waiters(RouterErrorCode code) {
    while (!queue_.empty()) {
        auto reply = queue_.begin()->reply;
        remove_waiter(queue_.begin());
        reply->deliver(sluice_detail::unexpected<RouterError>(make_error(code, service_id_)));
    }
}

// -----------------------------------------------------------------------------
// Scheduler updates
// -----------------------------------------------------------------------------

void Responder::on_update(msg::SchedulerUpdate& m) {
    std::set<std::string> seen;
    const char* problem = nullptr;
    for (const auto* list : {&m.healthy, &m.unhealthy}) {
        for (const auto& inst : *list) {
            if (inst.id.empty()) problem = "empty instance id";
            else if (inst.service_id != service_id_) problem = "instance of another service";
            else if (!seen.insert(inst.id).second) problem = "duplicate instance id";
        }
    }
    for (const auto& inst : m.killed) {
        if (inst.id.empty() || inst.service_id != service_id_) problem = "bad killed instance";
    }
    if (problem) {
        obs::logger()->warn("{}: ignoring malformed scheduler update: {}", service_id_, problem);
        return;
    }

    refresh_description();
    std::set<std::string> healthy_ids;
    for (const auto& inst : m.healthy) healthy_ids.insert(inst.id);

    for (auto it = instances_.begin(); it != instances_.end();) {
        if (!healthy_ids.contains(it->first)) {
            available_.erase(it->first);
            it = instances_.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& inst : m.healthy) {
        const bool fresh = !instances_.contains(inst.id);
        instances_.insert_or_assign(inst.id, inst);
        if (fresh) make_available(inst.id);
    }
    unhealthy_.clear();
    for (const auto& inst : m.unhealthy) unhealthy_.insert(inst.id);

    // Killed last: an id reported both healthy and killed is gone.
    for (const auto& inst : m.killed) {
        purge(inst.id);
        ++killed_seen_;
        obs::logger()->info("{}: purged killed instance {}", service_id_, inst.id);
    }
    forget_vanished();

    last_update_time_ = m.time == Clock::time_point{} ? Clock::now() : m.time;
    serve_queue();
}

// -----------------------------------------------------------------------------
// Selection and release
// -----------------------------------------------------------------------------

void Responder::on_select(msg::SelectInstance& m) {
    if (!m.reply) {
        obs::logger()->warn("{}: select without reply cell", service_id_);
        return;
    }
    ctx_->metrics->counter_inc(request_metric(service_id_, "total"));
    const auto now = Clock::now();
    release_expired_blacklist(now);

    while (auto id = pick_candidate(now)) {
        auto inst = lookup(*id);
        if (!inst) {
            obs::logger()->error("{}: available id {} has no instance record", service_id_, *id);
            available_.erase(*id);
            continue;
        }
        InstanceLease lease{*inst, m.request_id, borrowed_.contains(*id)};
        if (m.reply->deliver(std::move(lease))) {
            commit_pick(*id);
            obs::logger()->debug("{}: request {} -> {}", service_id_, m.request_id, *id);
        } else {
            obs::logger()->debug("{}: request {} abandoned before assignment", service_id_, m.request_id);
        }
        return;
    }

    if (phase_ == Phase::Draining) {
        obs::logger()->debug("{}: draining, request {} not queued", service_id_, m.request_id);
        m.reply->deliver(sluice_detail::unexpected<RouterError>(
            make_error(RouterErrorCode::NoInstanceAvailable, service_id_)));
        return;
    }
    if (queue_.size() >= description_.max_queue_length) {
        ctx_->metrics->meter_mark(obs::service_metric(service_id_, "meters", {"queue-rejected"}));
        obs::logger()->warn("{}: max queue length {} exceeded, rejecting request {}",
                            service_id_, description_.max_queue_length, m.request_id);
        m.reply->deliver(sluice_detail::unexpected<RouterError>(
            make_error(RouterErrorCode::MaxQueueLengthExceeded, service_id_)));
        return;
    }

    PendingRequest p;
    p.seq        = ++queue_seq_;
    p.priority   = m.priority;
    p.request_id = m.request_id;
    p.enqueued   = now;
    p.reply      = m.reply;
    const auto deadline = m.deadline == Clock::time_point{} ? now + ctx_->queue_timeout : m.deadline;
    ActorRef weak = weak_from_this();
    p.deadline_timer = ctx_->timer->schedule_at(
        deadline, [weak, sid = service_id_, seq = p.seq] { post_to(weak, sid, msg::QueueDeadline{seq}); });
    const auto seq = p.seq;
    auto [it, inserted] = queue_.insert(std::move(p));
    if (inserted) queue_index_.emplace(seq, it);
    obs::logger()->debug("{}: request {} queued ({} waiting)", service_id_, m.request_id, queue_.size());
}

void Responder::on_release(msg::ReleaseInstance& m) {
    auto it = in_use_.find(m.instance_id);
    if (it == in_use_.end()) {
        obs::logger()->warn("{}: release of {} which is not in use (request {})",
                            service_id_, m.instance_id, m.request_id);
        return;
    }
    if (--it->second == 0) in_use_.erase(it);

    if (borrowed_.contains(m.instance_id)) {
        // Lent for one request only.
        if (!in_use_.contains(m.instance_id)) return_borrowed(m.instance_id);
    } else if (m.outcome == RequestOutcome::InstanceError || m.outcome == RequestOutcome::InstanceBusy) {
        const auto& e = blacklist_.blacklist(m.instance_id, 0, Clock::now());
        available_.erase(m.instance_id);
        obs::logger()->info("{}: blacklisted {} after failed request {} ({} consecutive failures)",
                            service_id_, m.instance_id, m.request_id, e.consecutive_failures);
    } else if (m.outcome == RequestOutcome::Success) {
        blacklist_.record_success(m.instance_id);
    }
    forget_if_vanished(m.instance_id);
    serve_queue();
}

void Responder::on_queue_deadline(msg::QueueDeadline& m) {
    auto idx = queue_index_.find(m.seq);
    if (idx == queue_index_.end()) return;
    auto reply = idx->second->reply;
    const auto request_id = idx->second->request_id;
    remove_waiter(idx->second);
    if (reply->deliver(sluice_detail::unexpected<RouterError>(
            make_error(RouterErrorCode::NoInstanceAvailable, service_id_)))) {
        obs::logger()->info("{}: request {} timed out waiting for an instance", service_id_, request_id);
    }
}

// -----------------------------------------------------------------------------
// Blacklisting
// -----------------------------------------------------------------------------

void Responder::on_blacklist(msg::BlacklistInstance& m) {
    if (!m.reply) {
        obs::logger()->warn("{}: blacklist without reply cell", service_id_);
        return;
    }
    const auto& id = m.instance_id;
    const bool known = instances_.contains(id) || in_use_.contains(id) ||
                       offered_.contains(id) || borrowed_.contains(id);
    if (!known) {
        m.reply->deliver(BlacklistResult{BlacklistStatus::NoSuchInstance, std::nullopt});
        return;
    }
    if (in_use_.contains(id) && !ctx_->blacklist.blacklist_busy_instances) {
        obs::logger()->info("{}: not blacklisting busy instance {}", service_id_, id);
        m.reply->deliver(BlacklistResult{BlacklistStatus::InUse, std::nullopt});
        return;
    }

    const BlacklistEntry entry = blacklist_.blacklist(id, m.period_ms, Clock::now());
    available_.erase(id);
    obs::logger()->info("{}: blacklisted {} (reason {}, {} consecutive failures)",
                        service_id_, id, m.reason, entry.consecutive_failures);
    if (borrowed_.contains(id) && !in_use_.contains(id)) return_borrowed(id);
    m.reply->deliver(BlacklistResult{BlacklistStatus::Blacklisted, entry});
}

void Responder::release_expired_blacklist(Clock::time_point now) {
    for (const auto& id : blacklist_.expire(now)) {
        make_available(id);
        obs::logger()->debug("{}: {} released from blacklist", service_id_, id);
    }
}

// -----------------------------------------------------------------------------
// Work stealing: inbound offers
// -----------------------------------------------------------------------------

void Responder::on_offer(msg::OfferInstance& m) {
    auto& o = m.offer;
    if (!o.response) {
        obs::logger()->warn("{}: offer {} without response cell", service_id_, o.cid);
        return;
    }
    const auto now = Clock::now();
    drop_resolved_waiters();
    const auto& id = o.instance.id;

    const char* reason = nullptr;
    if (phase_ != Phase::Active) reason = "service draining";
    else if (o.service_id != service_id_ || o.instance.service_id != service_id_) reason = "wrong service";
    else if (queue_.empty()) reason = "no waiting requests";
    else if (instances_.contains(id) || borrowed_.contains(id) || offered_.contains(id) ||
             blacklist_.is_blacklisted(id, now)) reason = "instance already known";
    if (reason) {
        o.response->deliver(OfferStatus::Declined);
        obs::logger()->debug("{}: declined offer {} from {}: {}", service_id_, o.cid, o.router_id, reason);
        return;
    }
    // Commit only if the offerer has not timed out already.
    if (!o.response->deliver(OfferStatus::Accepted)) {
        obs::logger()->info("{}: offer {} from {} resolved before acceptance", service_id_, o.cid, o.router_id);
        return;
    }

    Borrowed b{o.instance, o.router_id, o.cid, async::Timer::kNoTimer};
    ActorRef weak = weak_from_this();
    b.expiry = ctx_->timer->schedule_after(
        ctx_->reserve_timeout,
        [weak, sid = service_id_, id, cid = o.cid] { post_to(weak, sid, msg::BorrowExpired{id, cid}); });
    borrowed_.insert_or_assign(id, std::move(b));
    available_.insert(id);
    last_used_[id] = 0;
    obs::logger()->info("{}: accepted offer {} of {} from {}", service_id_, o.cid, id, o.router_id);
    serve_queue();
}

void Responder::on_borrow_expired(msg::BorrowExpired& m) {
    auto it = borrowed_.find(m.instance_id);
    if (it == borrowed_.end() || it->second.cid != m.cid) return;
    it->second.expiry = async::Timer::kNoTimer;
    if (in_use_.contains(m.instance_id)) return; // released later
    obs::logger()->info("{}: borrowed {} unused, returning to {}", service_id_, m.instance_id, it->second.router_id);
    return_borrowed(m.instance_id);
}

void Responder::return_borrowed(const std::string& id) {
    auto it = borrowed_.find(id);
    if (it == borrowed_.end()) return;
    Borrowed b = std::move(it->second);
    borrowed_.erase(it);
    ctx_->timer->cancel(b.expiry);
    available_.erase(id);
    last_used_.erase(id);
    if (ctx_->return_borrowed) ctx_->return_borrowed(b.router_id, service_id_, id, b.cid);
}

// -----------------------------------------------------------------------------
// Work stealing: outbound reservations
// -----------------------------------------------------------------------------

void Responder::on_reserve(msg::ReserveForOffer& m) {
    if (!m.reply) return;
    if (phase_ != Phase::Active || !m.response) {
        m.reply->deliver(std::nullopt);
        return;
    }
    const auto now = Clock::now();
    release_expired_blacklist(now);
    auto id = pick_idle_own(now);
    if (!id) {
        m.reply->deliver(std::nullopt);
        return;
    }
    if (!m.reply->deliver(lookup(*id))) return; // coordinator gave up

    available_.erase(*id);
    Reservation r{m.router_id, m.cid, false, m.response, async::Timer::kNoTimer};
    // The response cell decides the offer: whichever of Accepted or Timeout lands first.
    r.timeout = ctx_->timer->schedule_after(ctx_->reserve_timeout,
                                            [response = m.response] { response->deliver(OfferStatus::Timeout); });
    offered_.insert_or_assign(*id, std::move(r));
    ActorRef weak = weak_from_this();
    m.response->on_deliver([weak, sid = service_id_, iid = *id, cid = m.cid](const OfferStatus& s) {
        post_to(weak, sid, msg::OfferResolved{iid, cid, s});
    });
    obs::logger()->debug("{}: reserved {} for offer {} to {}", service_id_, *id, m.cid, m.router_id);
}

void Responder::on_offer_resolved(msg::OfferResolved& m) {
    auto it = offered_.find(m.instance_id);
    if (it == offered_.end() || it->second.cid != m.cid) return;
    if (m.status == OfferStatus::Accepted) {
        it->second.accepted = true;
        ctx_->timer->cancel(it->second.timeout);
        it->second.timeout = async::Timer::kNoTimer;
        obs::logger()->info("{}: offer {} of {} accepted by {}", service_id_, m.cid, m.instance_id,
                            it->second.router_id);
        return;
    }
    obs::logger()->debug("{}: offer {} of {} {}", service_id_, m.cid, m.instance_id, to_string(m.status));
    revert_reservation(m.instance_id);
    serve_queue();
}

void Responder::on_offer_returned(msg::OfferReturned& m) {
    auto it = offered_.find(m.instance_id);
    if (it == offered_.end() || it->second.cid != m.cid || !it->second.accepted) {
        obs::logger()->warn("{}: unexpected return of {} for offer {}", service_id_, m.instance_id, m.cid);
        return;
    }
    obs::logger()->info("{}: {} returned by {}", service_id_, m.instance_id, it->second.router_id);
    revert_reservation(m.instance_id);
    serve_queue();
}

void Responder::revert_reservation(const std::string& id) {
    auto it = offered_.find(id);
    if (it == offered_.end()) return;
    ctx_->timer->cancel(it->second.timeout);
    offered_.erase(it);
    make_available(id);
}

void Responder::on_peer_departed(msg::PeerDeparted& m) {
    std::vector<std::string> reverted;
    for (auto& [id, r] : offered_) {
        if (r.router_id != m.router_id) continue;
        if (!r.accepted && r.response) r.response->deliver(OfferStatus::Timeout);
        reverted.push_back(id);
    }
    for (const auto& id : reverted) revert_reservation(id);

    for (auto it = borrowed_.begin(); it != borrowed_.end();) {
        if (it->second.router_id != m.router_id) { ++it; continue; }
        ctx_->timer->cancel(it->second.expiry);
        available_.erase(it->first);
        it = borrowed_.erase(it);
    }
    if (!reverted.empty()) {
        obs::logger()->info("{}: {} reservations reverted, {} left the cluster",
                            service_id_, reverted.size(), m.router_id);
    }
    serve_queue();
}

// -----------------------------------------------------------------------------
// Maintenance and lifecycle
// -----------------------------------------------------------------------------

void Responder::on_sweep() {
    const auto now = Clock::now();
    release_expired_blacklist(now);
    drop_resolved_waiters();
    // Resolutions whose OfferResolved message was lost to a full mailbox.
    std::vector<std::pair<std::string, OfferStatus>> settled;
    for (const auto& [id, r] : offered_) {
        if (r.accepted || !r.response) continue;
        if (auto s = r.response->try_get()) settled.emplace_back(id, *s);
    }
    for (auto& [id, status] : settled) {
        msg::OfferResolved resolved{id, offered_.at(id).cid, status};
        on_offer_resolved(resolved);
    }
    forget_vanished();
    serve_queue();
}

void Responder::on_removed() {
    if (phase_ == Phase::Draining) return;
    phase_ = Phase::Draining;
    for (const auto& kv : instances_) available_.erase(kv.first);
    instances_.clear();
    unhealthy_.clear();
    std::vector<std::string> idle_borrowed;
    for (const auto& kv : borrowed_) {
        if (!in_use_.contains(kv.first)) idle_borrowed.push_back(kv.first);
    }
    for (const auto& id : idle_borrowed) return_borrowed(id);
    const auto waiters = queue_.size();
    fail_waiters(RouterErrorCode::NoInstanceAvailable);
    obs::logger()->info("{}: service removed, draining ({} in flight, {} waiters failed)",
                        service_id_, in_use_.size(), waiters);
}

void Responder::on_restored() {
    if (phase_ == Phase::Active) return;
    phase_ = Phase::Active;
    refresh_description();
    obs::logger()->info("{}: service restored", service_id_);
}

void Responder::on_query(msg::QueryState& m) {
    if (!m.reply) return;
    m.reply->deliver(snapshot(Clock::now()));
}

void Responder::report_if_idle() {
    if (phase_ != Phase::Draining || !ctx_->on_idle) return;
    if (!in_use_.empty() || !queue_.empty() || !offered_.empty() || !borrowed_.empty()) return;
    ctx_->on_idle(service_id_, this, processed_);
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

void Responder::refresh_description() {
    if (ctx_->descriptions) {
        if (auto d = ctx_->descriptions->lookup(service_id_)) description_ = std::move(*d);
    }
    description_.service_id = service_id_;
    if (description_.concurrency_level == 0) description_.concurrency_level = 1;
}

std::uint32_t Responder::slot_limit(const std::string& id) const {
    return borrowed_.contains(id) ? 1u : description_.concurrency_level;
}

std::optional<std::string> Responder::pick_candidate(Clock::time_point now) const {
    std::optional<std::string> best;
    bool best_borrowed = false;
    std::uint64_t best_used = 0;
    for (const auto& id : available_) {
        if (blacklist_.is_blacklisted(id, now)) continue;
        auto u = in_use_.find(id);
        const std::uint32_t used = u == in_use_.end() ? 0 : u->second;
        if (used >= slot_limit(id)) continue;
        const bool lent = borrowed_.contains(id);
        auto lu = last_used_.find(id);
        const std::uint64_t seq = lu == last_used_.end() ? 0 : lu->second;
        // Borrowed first, then least recently used; ties by id (set order).
        if (!best || (lent && !best_borrowed) || (lent == best_borrowed && seq < best_used)) {
            best = id;
            best_borrowed = lent;
            best_used = seq;
        }
    }
    return best;
}

std::optional<std::string> Responder::pick_idle_own(Clock::time_point now) const {
    std::optional<std::string> best;
    std::uint64_t best_used = 0;
    for (const auto& id : available_) {
        if (borrowed_.contains(id) || in_use_.contains(id) || blacklist_.is_blacklisted(id, now)) continue;
        auto lu = last_used_.find(id);
        const std::uint64_t seq = lu == last_used_.end() ? 0 : lu->second;
        if (!best || seq < best_used) {
            best = id;
            best_used = seq;
        }
    }
    return best;
}

void Responder::commit_pick(const std::string& id) {
    ++in_use_[id];
    last_used_[id] = ++use_seq_;
    if (auto b = borrowed_.find(id); b != borrowed_.end()) {
        available_.erase(id);
        ctx_->timer->cancel(b->second.expiry);
        b->second.expiry = async::Timer::kNoTimer;
    }
}

void Responder::make_available(const std::string& id) {
    if (offered_.contains(id)) return;
    if (!instances_.contains(id) && !borrowed_.contains(id)) return;
    if (blacklist_.is_blacklisted(id, Clock::now())) return;
    available_.insert(id);
}

std::optional<ServiceInstance> Responder::lookup(const std::string& id) const {
    if (auto it = instances_.find(id); it != instances_.end()) return it->second;
    if (auto it = borrowed_.find(id); it != borrowed_.end()) return it->second.instance;
    return std::nullopt;
}

void Responder::purge(const std::string& id) {
    available_.erase(id);
    in_use_.erase(id);
    last_used_.erase(id);
    if (auto it = offered_.find(id); it != offered_.end()) {
        ctx_->timer->cancel(it->second.timeout);
        if (!it->second.accepted && it->second.response) it->second.response->deliver(OfferStatus::Timeout);
        offered_.erase(it);
    }
    if (auto it = borrowed_.find(id); it != borrowed_.end()) {
        ctx_->timer->cancel(it->second.expiry);
        borrowed_.erase(it);
    }
    blacklist_.remove(id);
    instances_.erase(id);
}

void Responder::forget_if_vanished(const std::string& id) {
    if (instances_.contains(id) || unhealthy_.contains(id)) return;
    if (in_use_.contains(id) || offered_.contains(id) || borrowed_.contains(id)) return;
    available_.erase(id);
    last_used_.erase(id);
    if (blacklist_.remove(id)) obs::logger()->info("{}: dropped blacklist entry of vanished instance {}", service_id_, id);
}

// Ids no longer reported by the scheduler and not held by a request, a reservation or a loan.
void Responder::forget_vanished() {
    std::vector<std::string> ids = blacklist_.tracked_ids();
    for (const auto& kv : last_used_) ids.push_back(kv.first);
    for (const auto& id : ids) forget_if_vanished(id);
}

void Responder::remove_waiter(Queue::iterator it) {
    ctx_->timer->cancel(it->deadline_timer);
    queue_index_.erase(it->seq);
    queue_.erase(it);
}

void Responder::drop_resolved_waiters() {
    for (auto it = queue_.begin(); it != queue_.end();) {
        auto next = std::next(it);
        if (it->reply->realized()) remove_waiter(it);
        it = next;
    }
}

void Responder::serve_queue() {
    const auto now = Clock::now();
    while (!queue_.empty()) {
        auto head = queue_.begin();
        auto reply = head->reply;
        if (reply->realized()) {
            remove_waiter(head);
            continue;
        }
        auto id = pick_candidate(now);
        if (!id) break;
        auto inst = lookup(*id);
        if (!inst) {
            available_.erase(*id);
            continue;
        }
        const std::string request_id = head->request_id;
        InstanceLease lease{*inst, request_id, borrowed_.contains(*id)};
        remove_waiter(head);
        if (reply->deliver(std::move(lease))) {
            commit_pick(*id);
            obs::logger()->debug("{}: queued request {} -> {}", service_id_, request_id, *id);
        }
    }
}

std::size_t Responder::idle_slots(Clock::time_point now) const {
    std::size_t slots = 0;
    for (const auto& id : available_) {
        if (borrowed_.contains(id) || blacklist_.is_blacklisted(id, now)) continue;
        auto u = in_use_.find(id);
        const std::uint32_t used = u == in_use_.end() ? 0 : u->second;
        if (used < description_.concurrency_level) slots += description_.concurrency_level - used;
    }
    return slots;
}

ResponderStateSnapshot Responder::snapshot(Clock::time_point now) const {
    ResponderStateSnapshot s;
    s.service_id = service_id_;
    s.phase      = to_string(phase_);
    s.available.assign(available_.begin(), available_.end());
    auto used_seq = [this](const std::string& id) {
        auto it = last_used_.find(id);
        return it == last_used_.end() ? std::uint64_t{0} : it->second;
    };
    std::stable_sort(s.available.begin(), s.available.end(),
                     [&](const std::string& a, const std::string& b) { return used_seq(a) < used_seq(b); });
    s.in_use = in_use_;
    for (const auto& [id, r] : offered_) s.offered[id] = {r.router_id, r.cid, r.accepted};
    for (const auto& [id, b] : borrowed_) s.borrowed[id] = {b.router_id, b.cid};
    for (const auto& e : blacklist_.entries()) {
        if (e.expiry_time > now) s.blacklisted.push_back(e);
    }
    s.healthy             = instances_.size();
    s.unhealthy           = unhealthy_.size();
    s.queued              = queue_.size();
    s.idle_slots          = idle_slots(now);
    s.concurrency_level   = description_.concurrency_level;
    s.max_queue_length    = description_.max_queue_length;
    s.distribution_scheme = description_.distribution_scheme;
    s.last_update_time    = last_update_time_;
    s.processed           = processed_;
    s.taken_at            = now;
    return s;
}

void Responder::publish_metrics() {
    auto* m = ctx_->metrics;
    const auto now = Clock::now();
    std::int64_t in_flight = 0;
    for (const auto& kv : in_use_) in_flight += kv.second;
    std::int64_t blacklisted = 0;
    for (const auto& e : blacklist_.entries()) {
        if (e.expiry_time > now) ++blacklisted;
    }
    m->counter_set(slot_metric(service_id_, "slots-available"), static_cast<std::int64_t>(idle_slots(now)));
    m->counter_set(slot_metric(service_id_, "slots-in-use"), in_flight);
    m->counter_set(slot_metric(service_id_, "slots-offered"), static_cast<std::int64_t>(offered_.size()));
    m->counter_set(slot_metric(service_id_, "blacklisted"), blacklisted);
    m->counter_set(slot_metric(service_id_, "healthy"), static_cast<std::int64_t>(instances_.size()));
    m->counter_set(slot_metric(service_id_, "unhealthy"), static_cast<std::int64_t>(unhealthy_.size()));
    m->counter_set(slot_metric(service_id_, "killed"), static_cast<std::int64_t>(killed_seen_));
    m->counter_set(request_metric(service_id_, "waiting-for-available-instance"),
                   static_cast<std::int64_t>(queue_.size()));
    m->counter_set(request_metric(service_id_, "outstanding"), in_flight);
}

} // namespace sluice::core
