#pragma once
/**
 * @file responder.hpp
 * @brief Per-service actor owning instance slot state.
 *
 * One Responder exists per service-id (enforced by the Dispatcher). All state
 * below is touched only inside the actor's turns; other threads reach it by
 * message. Phases: Active -> Draining -> terminated (Actor::terminated()).
 *
 * Slot model:
 *  - available: ids that may take a request (LRU order via last_used_)
 *  - in_use:    id -> in-flight requests (an id may be in use and available
 *               when concurrency-level > 1)
 *  - offered:   ids reserved for a peer router (never also available)
 *  - borrowed:  ids lent by a peer, usable for a single request
 *  - blacklist: unexpired entries are never selected
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include "sluice/async/actor.hpp"
#include "sluice/async/executor.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/core/blacklist.hpp"
#include "sluice/core/messages.hpp"
#include "sluice/obs/metrics.hpp"
#include "sluice/scheduler/service_description.hpp"

namespace sluice::core {

class Responder;

/** @struct PendingRequest
 *  @brief A SelectInstance waiting for a free slot.
 */
struct PendingRequest {
    std::uint64_t     seq{0};      ///< Arrival order
    int               priority{0};
    std::string       request_id;
    Clock::time_point enqueued{};
    async::PromisePtr<SelectResult> reply;
    async::Timer::TimerId deadline_timer{async::Timer::kNoTimer};
};

/// Returns true when @p a should be served before @p b.
using QueueOrder = std::function<bool(const PendingRequest& a, const PendingRequest& b)>;

/// Higher priority first; equal priorities in arrival order.
bool default_queue_order(const PendingRequest& a, const PendingRequest& b) noexcept;

/** @struct ResponderContext
 *  @brief Collaborators and settings shared by every Responder of a router.
 */
struct ResponderContext {
    std::string                                router_id;
    async::Executor*                           executor{nullptr};
    async::Timer*                              timer{nullptr};
    obs::MetricsSink*                          metrics{nullptr};
    const scheduler::ServiceDescriptionSource* descriptions{nullptr};
    BlacklistConfig                            blacklist;
    std::chrono::milliseconds reserve_timeout{sluice::config::constants::RESERVE_TIMEOUT_MS};
    std::chrono::milliseconds queue_timeout{sluice::config::constants::QUEUE_TIMEOUT_MS};
    std::size_t               mailbox_capacity{sluice::config::constants::MAILBOX_CAPACITY};
    scheduler::ServiceDefaults defaults;
    QueueOrder                queue_order{default_queue_order};

    /// Give a borrowed instance back to the router that lent it.
    std::function<void(const std::string& owner_router_id, const std::string& service_id,
                       const std::string& instance_id, const std::string& cid)> return_borrowed;

    /// A draining Responder has nothing in flight; @p processed counts external messages handled.
    std::function<void(const std::string& service_id, const Responder* responder,
                       std::uint64_t processed)> on_idle;
};

class Responder final : public async::Actor<ResponderMessage> {
public:
    enum class Phase : std::uint8_t { Active, Draining };

    /// Prefer create(): Actor turns require shared ownership.
    Responder(std::string service_id, std::shared_ptr<const ResponderContext> ctx);

    static std::shared_ptr<Responder> create(std::string service_id, std::shared_ptr<const ResponderContext> ctx);

    [[nodiscard]] const std::string& service_id() const noexcept { return service_id_; }

protected:
    void handle(ResponderMessage& m) override;
    void on_exit(std::deque<ResponderMessage>& undelivered) override;

private:
    struct Reservation {
        std::string router_id;
        std::string cid;
        bool        accepted{false};
        async::PromisePtr<OfferStatus> response;
        async::Timer::TimerId timeout{async::Timer::kNoTimer};
    };
    struct Borrowed {
        ServiceInstance instance;
        std::string     router_id;
        std::string     cid;
        async::Timer::TimerId expiry{async::Timer::kNoTimer};
    };
    using Queue = std::set<PendingRequest, std::function<bool(const PendingRequest&, const PendingRequest&)>>;

    // Handlers
    void on_update(msg::SchedulerUpdate& m);
    void on_select(msg::SelectInstance& m);
    void on_release(msg::ReleaseInstance& m);
    void on_blacklist(msg::BlacklistInstance& m);
    void on_offer(msg::OfferInstance& m);
    void on_query(msg::QueryState& m);
    void on_reserve(msg::ReserveForOffer& m);
    void on_offer_resolved(msg::OfferResolved& m);
    void on_offer_returned(msg::OfferReturned& m);
    void on_borrow_expired(msg::BorrowExpired& m);
    void on_queue_deadline(msg::QueueDeadline& m);
    void on_sweep();
    void on_removed();
    void on_restored();
    void on_peer_departed(msg::PeerDeparted& m);

    // Slot helpers
    void refresh_description();
    [[nodiscard]] std::uint32_t slot_limit(const std::string& id) const;
    [[nodiscard]] std::optional<std::string> pick_candidate(Clock::time_point now) const;
    void commit_pick(const std::string& id);
    void release_expired_blacklist(Clock::time_point now);
    void revert_reservation(const std::string& id);
    void return_borrowed(const std::string& id);
    void purge(const std::string& id);
    void forget_if_vanished(const std::string& id);
    void forget_vanished();
    void serve_queue();
    void drop_resolved_waiters();
    void make_available(const std::string& id);
    [[nodiscard]] std::optional<ServiceInstance> lookup(const std::string& id) const;
    [[nodiscard]] std::size_t idle_slots(Clock::time_point now) const;
    [[nodiscard]] ResponderStateSnapshot snapshot(Clock::time_point now) const;
    void publish_metrics();
    void report_if_idle();
    void remove_waiter(Queue::iterator it);
    void fail_waiters(RouterErrorCode code);  ///< Answer every queued request with @p code
    [[nodiscard]] std::optional<std::string> pick_idle_own(Clock::time_point now) const;

    std::string service_id_;
    std::shared_ptr<const ResponderContext> ctx_;
    scheduler::ServiceDescription description_;
    Phase phase_{Phase::Active};

    std::unordered_map<std::string, ServiceInstance> instances_; ///< Healthy, from the scheduler
    std::set<std::string> unhealthy_;                            ///< Ids last reported unhealthy
    std::set<std::string> available_;
    std::unordered_map<std::string, std::uint64_t> last_used_;
    std::uint64_t use_seq_{0};
    std::map<std::string, std::uint32_t> in_use_;
    std::map<std::string, Reservation> offered_;
    std::map<std::string, Borrowed> borrowed_;
    BlacklistTracker blacklist_;

    Queue queue_;
    std::unordered_map<std::uint64_t, Queue::iterator> queue_index_;
    std::uint64_t queue_seq_{0};

    std::optional<Clock::time_point> last_update_time_;
    std::uint64_t processed_{0};
    std::uint64_t killed_seen_{0};
};

const char* to_string(Responder::Phase p) noexcept;

} // namespace sluice::core
