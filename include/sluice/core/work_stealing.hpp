#pragma once
/**
 * @file work_stealing.hpp
 * @brief Offers idle local capacity of balanced services to peers with waiting requests.
 *
 * Each tick the coordinator asks the Dispatcher for every Responder's state,
 * then for each (service, peer) pair with local spare slots and remote demand
 * reserves one instance and ships an offer. The offered instance's Responder
 * owns the reservation deadline; the coordinator only tracks which pairs have
 * an offer in flight (at most one each).
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "sluice/async/actor.hpp"
#include "sluice/async/promise.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/cluster/cluster.hpp"
#include "sluice/config/constants.hpp"
#include "sluice/core/dispatcher.hpp"
#include "sluice/core/messages.hpp"
#include "sluice/obs/metrics.hpp"

namespace sluice::core {

/** @struct WorkStealingConfig
 *  @brief work-stealing.* keys.
 */
struct WorkStealingConfig {
    std::uint32_t offer_help_interval_ms{sluice::config::constants::OFFER_HELP_INTERVAL_MS};
    std::uint32_t reserve_timeout_ms{sluice::config::constants::RESERVE_TIMEOUT_MS};
};

struct WorkStealingStats {
    std::uint64_t offers_sent{0};
    std::uint64_t accepted{0};
    std::uint64_t declined{0};
    std::uint64_t timeout{0};
    std::size_t   in_flight{0};
};

nlohmann::json to_json(const WorkStealingStats& s);

namespace wsmsg {

struct Tick {};

/// Result of the per-tick state query.
struct Capacity {
    AllStates states;
};

/// A Responder answered a reservation request.
struct Reserved {
    std::string service_id;
    std::string peer;
    std::string cid;
    std::optional<ServiceInstance> instance;
    async::PromisePtr<OfferStatus> response;
};

/// The peer (or the reservation deadline) decided an offer.
struct OfferSettled {
    std::string service_id;
    std::string peer;
    std::string cid;
    OfferStatus status{OfferStatus::Timeout};
};

struct QueryStats {
    async::PromisePtr<WorkStealingStats> reply;
};

} // namespace wsmsg

using CoordinatorMessage = std::variant<std::monostate,
                                        wsmsg::Tick,
                                        wsmsg::Capacity,
                                        wsmsg::Reserved,
                                        wsmsg::OfferSettled,
                                        wsmsg::QueryStats>;

class WorkStealingCoordinator final : public async::Actor<CoordinatorMessage> {
public:
    struct Deps {
        Dispatcher*                     dispatcher{nullptr};
        const cluster::ClusterView*     view{nullptr};
        cluster::InterRouterTransport*  transport{nullptr};
        async::Executor*                executor{nullptr};
        async::Timer*                   timer{nullptr};
        obs::MetricsSink*               metrics{nullptr};
        std::size_t                     mailbox_capacity{sluice::config::constants::MAILBOX_CAPACITY};
    };

    WorkStealingCoordinator(std::string router_id, WorkStealingConfig cfg, Deps deps);

    /// Tick every offer-help-interval.
    void start();
    void shutdown();

    /// Run one round now.
    bool tick();

    async::PromisePtr<WorkStealingStats> query_stats();

protected:
    void handle(CoordinatorMessage& m) override;
    void on_exit(std::deque<CoordinatorMessage>& undelivered) override;

private:
    struct InFlight {
        std::string       cid;
        Clock::time_point started{};
    };
    using PairKey = std::pair<std::string, std::string>; ///< (service-id, peer)

    void on_tick();
    void on_capacity(wsmsg::Capacity& m);
    void on_reserved(wsmsg::Reserved& m);
    void on_settled(const wsmsg::OfferSettled& m);
    void expire_stale(Clock::time_point now);
    void mark(std::string_view name);

    std::string               router_id_;
    WorkStealingConfig        cfg_;
    Deps                      deps_;
    std::map<PairKey, InFlight> in_flight_;
    std::uint64_t             cid_seq_{0};
    bool                      query_pending_{false};
    Clock::time_point         query_started_{};
    WorkStealingStats         stats_;
    async::Timer::TimerId     tick_{async::Timer::kNoTimer};
};

} // namespace sluice::core
