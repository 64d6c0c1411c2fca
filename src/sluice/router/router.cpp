/**
 * @file router.cpp
 * @brief Router wiring and the synchronous request/reply entry points.
 */
#include "sluice/router/router.hpp"

#include <stdexcept>
#include <utility>

#include "sluice/obs/logging.hpp"

namespace sluice::router {

namespace {

/// Grace on top of a Responder-side deadline before the caller gives up itself.
constexpr std::chrono::milliseconds kReplyGrace{1000};

class NoPeers final : public cluster::ClusterView {
public:
    std::vector<std::string> peer_router_ids() const override { return {}; }
    std::int64_t waiting_requests(const std::string&, const std::string&) const override { return 0; }
};

class NoTransport final : public cluster::InterRouterTransport {
public:
    bool send_offer(const std::string&, core::WorkStealingOffer) override { return false; }
    bool complete_offer(const std::string&, const std::string&, const std::string&, const std::string&) override {
        return false;
    }
};

/// Wait for @p reply; on timeout race it with @p fallback and return whichever value won.
template <class T>
T await_or(const async::PromisePtr<T>& reply, std::chrono::milliseconds timeout, T fallback) {
    if (auto v = reply->wait_for(timeout)) return std::move(*v);
    reply->deliver(std::move(fallback));
    return *reply->try_get();
}

} // namespace

Router::Router(config::RouterConfig cfg, RouterDeps deps)
    : cfg_(std::move(cfg)),
      scheduler_(deps.scheduler),
      default_descriptions_(deps.descriptions
                                ? nullptr
                                : std::make_unique<scheduler::StaticServiceDescriptions>(cfg_.service_defaults)),
      descriptions_(deps.descriptions ? deps.descriptions : default_descriptions_.get()),
      no_peers_(std::make_unique<NoPeers>()),
      no_transport_(std::make_unique<NoTransport>()),
      transport_(deps.transport ? deps.transport : no_transport_.get()),
      executor_(cfg_.runtime.executor_threads),
      gate_(timer_, &metrics_) {
    if (!scheduler_) throw std::invalid_argument("Router requires a scheduler");

    core::ResponderContext ctx;
    ctx.router_id        = cfg_.router_id;
    ctx.executor         = &executor_;
    ctx.timer            = &timer_;
    ctx.metrics          = &metrics_;
    ctx.descriptions     = descriptions_;
    ctx.blacklist        = cfg_.blacklist;
    ctx.reserve_timeout  = std::chrono::milliseconds(cfg_.work_stealing.reserve_timeout_ms);
    ctx.queue_timeout    = std::chrono::milliseconds(cfg_.runtime.queue_timeout_ms);
    ctx.mailbox_capacity = cfg_.runtime.mailbox_capacity;
    ctx.defaults         = cfg_.service_defaults;
    ctx.return_borrowed  = [transport = transport_](const std::string& owner, const std::string& service_id,
                                                    const std::string& instance_id, const std::string& cid) {
        if (!transport->complete_offer(owner, service_id, instance_id, cid)) {
            obs::logger()->warn("{}: could not return {} to {} (offer {})", service_id, instance_id, owner, cid);
        }
    };
    dispatcher_ = core::Dispatcher::create(std::move(ctx));

    maintainer_ = std::make_shared<interstitial::InterstitialMaintainer>(
        gate_, *descriptions_, executor_, cfg_.runtime.mailbox_capacity, &metrics_);

    core::WorkStealingCoordinator::Deps ws;
    ws.dispatcher       = dispatcher_.get();
    ws.view             = deps.cluster_view ? deps.cluster_view : no_peers_.get();
    ws.transport        = transport_;
    ws.executor         = &executor_;
    ws.timer            = &timer_;
    ws.metrics          = &metrics_;
    ws.mailbox_capacity = cfg_.runtime.mailbox_capacity;
    coordinator_ = std::make_shared<core::WorkStealingCoordinator>(cfg_.router_id, cfg_.work_stealing, ws);

    syncer_ = std::make_shared<scheduler::SchedulerSyncer>(
        *scheduler_, broadcaster_, timer_, executor_,
        std::chrono::milliseconds(std::chrono::seconds(cfg_.scheduler_syncer_interval_secs)));

    subscription_ = broadcaster_.subscribe([this](const scheduler::SchedulerSnapshotPtr& snapshot) {
        if (auto err = registry_.apply(*snapshot); err != scheduler::RegistryErr::Ok) {
            obs::logger()->warn("{}: registry rejected scheduler snapshot", cfg_.router_id);
        }
        dispatcher_->publish(snapshot);
        maintainer_->publish(snapshot);
    });
    obs::logger()->info("{}: router created ({} executor threads)", cfg_.router_id, executor_.thread_count());
}

Router::~Router() {
    shutdown();
}

void Router::start() {
    syncer_->start();
    dispatcher_->start_sweep(std::chrono::milliseconds(cfg_.runtime.blacklist_sweep_interval_ms));
    coordinator_->start();
    obs::logger()->info("{}: router started", cfg_.router_id);
}

void Router::shutdown() {
    if (stopped_) return;
    stopped_ = true;
    syncer_->stop();
    broadcaster_.unsubscribe(subscription_);
    coordinator_->shutdown();
    maintainer_->stop();
    dispatcher_->shutdown();
    // Exit turns still queued run before the workers join.
    executor_.shutdown();
    timer_.shutdown();
    obs::logger()->info("{}: router stopped", cfg_.router_id);
}

// ----------------------------- Routing ---------------------------------------

async::PromisePtr<core::SelectResult> Router::select_instance_async(const std::string& service_id,
                                                                    const std::string& request_id, int priority,
                                                                    core::Clock::time_point deadline) {
    auto reply = async::Promise<core::SelectResult>::make();
    if (service_id.empty()) {
        reply->deliver(sluice_detail::unexpected<core::RouterError>(
            core::make_error(core::RouterErrorCode::InvalidRequest, service_id)));
        return reply;
    }
    dispatcher_->send(service_id, core::msg::SelectInstance{request_id, priority, deadline, reply});
    return reply;
}

core::SelectResult Router::select_instance_for_request(const std::string& service_id,
                                                       const std::string& request_id, int priority) {
    const auto timeout = std::chrono::milliseconds(cfg_.runtime.queue_timeout_ms);
    auto reply = select_instance_async(service_id, request_id, priority, core::Clock::now() + timeout);
    auto result = await_or<core::SelectResult>(
        reply, timeout + kReplyGrace,
        sluice_detail::unexpected<core::RouterError>(core::make_error(core::RouterErrorCode::Timeout, service_id)));
    if (!result) {
        obs::logger()->info("{}: request {} not routed: {}", service_id, request_id, result.error().message);
    }
    return result;
}

bool Router::release_instance(const std::string& service_id, const std::string& instance_id,
                              const std::string& request_id, core::RequestOutcome outcome) {
    return dispatcher_->send(service_id, core::msg::ReleaseInstance{instance_id, request_id, outcome});
}

core::BlacklistResult Router::blacklist_instance(const std::string& service_id, const std::string& instance_id,
                                                 std::int64_t period_ms, const std::string& reason) {
    auto reply = async::Promise<core::BlacklistResult>::make();
    dispatcher_->send(service_id, core::msg::BlacklistInstance{instance_id, period_ms, reason, reply});
    return await_or(reply, std::chrono::milliseconds(cfg_.runtime.query_timeout_ms),
                    core::BlacklistResult{core::BlacklistStatus::Unavailable, std::nullopt});
}

core::OfferStatus Router::offer_instance(core::WorkStealingOffer offer) {
    if (!offer.response) offer.response = async::Promise<core::OfferStatus>::make();
    auto response = offer.response;
    const auto service_id = offer.service_id;
    dispatcher_->send(service_id, core::msg::OfferInstance{std::move(offer)});
    return await_or(response, std::chrono::milliseconds(cfg_.work_stealing.reserve_timeout_ms),
                    core::OfferStatus::Timeout);
}

bool Router::complete_offer(const std::string& service_id, const std::string& instance_id,
                            const std::string& cid) {
    return dispatcher_->send(service_id, core::msg::OfferReturned{instance_id, cid});
}

core::StateResult Router::query_state(const std::string& service_id) {
    if (!registry_.hasService(service_id)) {
        return sluice_detail::unexpected<core::RouterError>(
            core::make_error(core::RouterErrorCode::NoSuchService, service_id));
    }
    auto reply = async::Promise<core::StateResult>::make();
    dispatcher_->send(service_id, core::msg::QueryState{reply});
    return await_or<core::StateResult>(
        reply, std::chrono::milliseconds(cfg_.runtime.query_timeout_ms),
        sluice_detail::unexpected<core::RouterError>(core::make_error(core::RouterErrorCode::Timeout, service_id)));
}

core::AllStates Router::query_all_state() {
    const auto timeout = std::chrono::milliseconds(cfg_.runtime.query_timeout_ms);
    return await_or(dispatcher_->query_all(timeout), timeout + kReplyGrace, core::AllStates{});
}

core::DispatcherStats Router::dispatcher_stats() {
    return await_or(dispatcher_->query_stats(), std::chrono::milliseconds(cfg_.runtime.query_timeout_ms),
                    core::DispatcherStats{});
}

core::WorkStealingStats Router::work_stealing_stats() {
    return await_or(coordinator_->query_stats(), std::chrono::milliseconds(cfg_.runtime.query_timeout_ms),
                    core::WorkStealingStats{});
}

bool Router::trigger_work_stealing() {
    return coordinator_->tick();
}

// ----------------------------- Interstitial ----------------------------------

interstitial::InterstitialPromisePtr Router::ensure_interstitial_gate(const std::string& service_id,
                                                                     int interstitial_secs) {
    return gate_.ensure(service_id, interstitial_secs);
}

interstitial::GateDecision Router::check_interstitial(interstitial::GateRequest request) {
    if (auto d = descriptions_->lookup(request.service_id)) request.interstitial_secs = d->interstitial_secs;
    return gate_.check(request);
}

nlohmann::json Router::query_interstitial_state(const std::string& service_id) {
    return await_or(maintainer_->query(service_id), std::chrono::milliseconds(cfg_.runtime.query_timeout_ms),
                    nlohmann::json{{"message", "Request timed out!"}});
}

nlohmann::json Router::query_all_interstitial_state() {
    return await_or(maintainer_->query(), std::chrono::milliseconds(cfg_.runtime.query_timeout_ms),
                    nlohmann::json{{"message", "Request timed out!"}});
}

// ----------------------------- Scheduler feed --------------------------------

void Router::publish_snapshot(scheduler::SchedulerSnapshotPtr snapshot) {
    if (!snapshot) return;
    broadcaster_.publish(std::move(snapshot));
}

bool Router::sync_scheduler() {
    return syncer_->sync_once();
}

// ----------------------------- ClusterMember ---------------------------------

void Router::receive_offer(core::WorkStealingOffer offer) {
    obs::logger()->info("{}: received work-stealing offer {} of {} from {}", cfg_.router_id, offer.instance.id,
                        offer.service_id, offer.router_id);
    const auto service_id = offer.service_id;
    dispatcher_->send(service_id, core::msg::OfferInstance{std::move(offer)});
}

void Router::receive_offer_complete(const std::string& service_id, const std::string& instance_id,
                                    const std::string& cid) {
    dispatcher_->send(service_id, core::msg::OfferReturned{instance_id, cid});
}

std::int64_t Router::waiting_requests(const std::string& service_id) const {
    return metrics_.counter_value(
        obs::service_metric(service_id, "counters", {"request-counts", "waiting-for-available-instance"}));
}

void Router::peer_departed(const std::string& router_id) {
    obs::logger()->info("{}: peer {} departed", cfg_.router_id, router_id);
    dispatcher_->broadcast(core::msg::PeerDeparted{router_id});
}

} // namespace sluice::router
