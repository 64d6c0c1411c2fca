#pragma once
/**
 * @file router.hpp
 * @brief One router process: the scheduler feed, per-service Responders,
 *        interstitial gate and work stealing wired onto a shared executor and timer.
 *
 * The synchronous entry points below wait on reply cells with a timeout and
 * race the Responder with their own timeout marker, so a caller never blocks
 * forever and a late answer is never silently lost (see messages.hpp).
 *
 * A Router registered with a cluster must leave it before being destroyed.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "sluice/async/executor.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/cluster/cluster.hpp"
#include "sluice/config/config_loader.hpp"
#include "sluice/core/dispatcher.hpp"
#include "sluice/core/messages.hpp"
#include "sluice/core/work_stealing.hpp"
#include "sluice/interstitial/interstitial_gate.hpp"
#include "sluice/interstitial/interstitial_maintainer.hpp"
#include "sluice/obs/metrics.hpp"
#include "sluice/scheduler/instance_registry.hpp"
#include "sluice/scheduler/scheduler.hpp"
#include "sluice/scheduler/service_description.hpp"

namespace sluice::router {

/** @struct RouterDeps
 *  @brief External collaborators. Only the scheduler is required.
 */
struct RouterDeps {
    scheduler::Scheduler*                      scheduler{nullptr};
    const scheduler::ServiceDescriptionSource* descriptions{nullptr}; ///< Defaults-only source when null
    const cluster::ClusterView*                cluster_view{nullptr}; ///< No peers when null
    cluster::InterRouterTransport*             transport{nullptr};    ///< Peers unreachable when null
};

class Router final : public cluster::ClusterMember {
public:
    Router(config::RouterConfig cfg, RouterDeps deps);
    ~Router() override;

    Router(const Router&)            = delete;
    Router& operator=(const Router&) = delete;

    /// Start the scheduler syncer, the blacklist sweep and work stealing.
    void start();

    /// Stop every actor, then the executor and timer. Idempotent.
    void shutdown();

    // --------------------------- Routing -------------------------------------

    /// Select an instance, waiting up to queue-timeout while the request is queued.
    core::SelectResult select_instance_for_request(const std::string& service_id, const std::string& request_id,
                                                   int priority = 0);

    /// Non-blocking select; the reply resolves when an instance is assigned or the request fails.
    async::PromisePtr<core::SelectResult> select_instance_async(const std::string& service_id,
                                                                const std::string& request_id, int priority = 0,
                                                                core::Clock::time_point deadline = {});

    /// End a request started by select_instance_for_request.
    bool release_instance(const std::string& service_id, const std::string& instance_id,
                          const std::string& request_id, core::RequestOutcome outcome);

    core::BlacklistResult blacklist_instance(const std::string& service_id, const std::string& instance_id,
                                             std::int64_t period_ms, const std::string& reason);

    /// Hand an inbound offer to the local Responder and wait for its verdict (up to reserve-timeout).
    core::OfferStatus offer_instance(core::WorkStealingOffer offer);

    /// The local borrower finished with an instance lent by this router.
    bool complete_offer(const std::string& service_id, const std::string& instance_id, const std::string& cid);

    core::StateResult query_state(const std::string& service_id);
    core::AllStates query_all_state();
    core::DispatcherStats dispatcher_stats();
    core::WorkStealingStats work_stealing_stats();

    /// Run one work-stealing round now.
    bool trigger_work_stealing();

    // --------------------------- Interstitial --------------------------------

    interstitial::InterstitialPromisePtr ensure_interstitial_gate(const std::string& service_id,
                                                                  int interstitial_secs);

    /// Gate decision; interstitial-secs comes from the service description.
    interstitial::GateDecision check_interstitial(interstitial::GateRequest request);

    nlohmann::json query_interstitial_state(const std::string& service_id);
    nlohmann::json query_all_interstitial_state();

    // --------------------------- Scheduler feed ------------------------------

    /// Publish @p snapshot to the registry, the Dispatcher and the interstitial maintainer.
    void publish_snapshot(scheduler::SchedulerSnapshotPtr snapshot);

    /// Poll the scheduler once and publish the result.
    bool sync_scheduler();

    // --------------------------- ClusterMember -------------------------------

    [[nodiscard]] const std::string& router_id() const noexcept override { return cfg_.router_id; }
    void receive_offer(core::WorkStealingOffer offer) override;
    void receive_offer_complete(const std::string& service_id, const std::string& instance_id,
                                const std::string& cid) override;
    [[nodiscard]] std::int64_t waiting_requests(const std::string& service_id) const override;
    void peer_departed(const std::string& router_id) override;

    // --------------------------- Accessors -----------------------------------

    [[nodiscard]] const config::RouterConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] scheduler::Scheduler& scheduler() noexcept { return *scheduler_; }
    [[nodiscard]] const scheduler::InstanceRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const scheduler::ServiceDescriptionSource& descriptions() const noexcept { return *descriptions_; }
    [[nodiscard]] obs::MetricsRegistry& metrics() noexcept { return metrics_; }
    [[nodiscard]] const obs::MetricsRegistry& metrics() const noexcept { return metrics_; }

private:
    config::RouterConfig                              cfg_;
    scheduler::Scheduler*                             scheduler_;
    std::unique_ptr<scheduler::StaticServiceDescriptions> default_descriptions_;
    const scheduler::ServiceDescriptionSource*        descriptions_;
    std::unique_ptr<cluster::ClusterView>             no_peers_;
    std::unique_ptr<cluster::InterRouterTransport>    no_transport_;
    cluster::InterRouterTransport*                    transport_;

    obs::MetricsRegistry                              metrics_;
    async::Timer                                      timer_;
    async::Executor                                   executor_;
    interstitial::InterstitialGate                    gate_;
    scheduler::SchedulerBroadcaster                   broadcaster_;
    scheduler::InstanceRegistry                       registry_;

    std::shared_ptr<core::Dispatcher>                    dispatcher_;
    std::shared_ptr<interstitial::InterstitialMaintainer> maintainer_;
    std::shared_ptr<core::WorkStealingCoordinator>        coordinator_;
    std::shared_ptr<scheduler::SchedulerSyncer>           syncer_;
    scheduler::SchedulerBroadcaster::SubscriberId         subscription_{0};
    bool                                                  stopped_{false};
};

} // namespace sluice::router
