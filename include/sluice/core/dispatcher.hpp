#pragma once
/**
 * @file dispatcher.hpp
 * @brief Routes per-service messages to Responders and owns their lifecycle.
 *
 * The service-id -> Responder map is mutated only inside the Dispatcher's own
 * turns, so at most one Responder exists per service-id even when many
 * threads touch a new service at once.
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "sluice/async/actor.hpp"
#include "sluice/async/promise.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/core/messages.hpp"
#include "sluice/core/responder.hpp"
#include "sluice/scheduler/snapshot.hpp"

namespace sluice::core {

/// Per-service states that answered a cross-service query in time.
using AllStates = std::map<std::string, ResponderStateSnapshot>;

/** @struct DispatcherStats
 *  @brief Responder table counters.
 */
struct DispatcherStats {
    std::vector<std::string> services;   ///< Services with a live Responder
    std::vector<std::string> draining;   ///< Subset no longer reported by the scheduler
    std::uint64_t created{0};
    std::uint64_t terminated{0};
    std::uint64_t rejected{0};           ///< Messages refused by a full Responder mailbox
};

nlohmann::json to_json(const DispatcherStats& s);

namespace dmsg {

struct Snapshot {
    scheduler::SchedulerSnapshotPtr snapshot;
};

struct ToService {
    std::string      service_id;
    ResponderMessage message;
};

/// Copy of @p message to every Responder.
struct Broadcast {
    ResponderMessage message;
};

struct ResponderIdle {
    std::string      service_id;
    const Responder* responder{nullptr};
    std::uint64_t    processed{0};
};

struct QueryAll {
    std::chrono::milliseconds timeout{0};
    async::PromisePtr<AllStates> reply;
};

struct QueryStats {
    async::PromisePtr<DispatcherStats> reply;
};

} // namespace dmsg

using DispatcherMessage = std::variant<std::monostate,
                                       dmsg::Snapshot,
                                       dmsg::ToService,
                                       dmsg::Broadcast,
                                       dmsg::ResponderIdle,
                                       dmsg::QueryAll,
                                       dmsg::QueryStats>;

class Dispatcher final : public async::Actor<DispatcherMessage> {
public:
    /// Prefer create(), which wires the Responders' idle reports back to this Dispatcher.
    Dispatcher(async::Executor& executor, async::Timer& timer, std::size_t mailbox_capacity);

    static std::shared_ptr<Dispatcher> create(ResponderContext responder_context);

    /**
     * @brief Route @p m to the Responder of @p service_id, creating it if needed.
     * @return false when the message could not be queued; its reply cell has then
     *         been answered with ServiceUnavailable.
     */
    bool send(std::string service_id, ResponderMessage m);

    /// Queue a scheduler snapshot for fan-out.
    bool publish(scheduler::SchedulerSnapshotPtr snapshot);

    /// Copy @p m to every live Responder.
    bool broadcast(ResponderMessage m);

    /// Query every Responder in parallel; the reply holds the states received within @p timeout.
    async::PromisePtr<AllStates> query_all(std::chrono::milliseconds timeout);

    async::PromisePtr<DispatcherStats> query_stats();

    /// Broadcast a BlacklistSweep every @p interval.
    void start_sweep(std::chrono::milliseconds interval);

    /// Stop the sweep, then this actor and every Responder.
    void shutdown();

protected:
    void handle(DispatcherMessage& m) override;
    void on_exit(std::deque<DispatcherMessage>& undelivered) override;

private:
    struct Entry {
        std::shared_ptr<Responder> responder;
        std::uint64_t              sent{0};     ///< External messages queued to it
        bool                       removed{false};
        bool                       phase_synced{true};  ///< Responder was told the current `removed`
    };

    void on_snapshot(const scheduler::SchedulerSnapshot& s);
    void on_idle(const dmsg::ResponderIdle& m);
    void on_query_all(dmsg::QueryAll& m);
    Entry* ensure(const std::string& service_id);
    /// Flip the drain flag and tell the responder; a full mailbox leaves it for the next retry.
    void set_removed(const std::string& service_id, Entry& e, bool removed);
    void sync_phase(const std::string& service_id, Entry& e);
    bool route(const std::string& service_id, ResponderMessage&& m);

    async::Timer&                          timer_;
    std::shared_ptr<const ResponderContext> ctx_;
    std::unordered_map<std::string, Entry> entries_;
    std::set<std::string>                  known_services_;   ///< From the latest snapshot
    bool                                   seen_snapshot_{false};
    std::uint64_t                          created_{0};
    std::uint64_t                          terminated_{0};
    std::uint64_t                          rejected_{0};
    async::Timer::TimerId                  sweep_{async::Timer::kNoTimer};
};

} // namespace sluice::core
