#pragma once
/**
 * @file interstitial_maintainer.hpp
 * @brief Keeps the interstitial gate in step with scheduler snapshots.
 *
 * On each snapshot: ensure a promise for every available service with a
 * positive interstitial-secs, resolve promises of services that have healthy
 * instances, drop every promise of a service the snapshot does not list, and
 * mark the gate initialized.
 */

#include <deque>
#include <optional>
#include <set>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "sluice/async/actor.hpp"
#include "sluice/async/promise.hpp"
#include "sluice/interstitial/interstitial_gate.hpp"
#include "sluice/scheduler/service_description.hpp"
#include "sluice/scheduler/snapshot.hpp"

namespace sluice::interstitial {

namespace imsg {

struct Snapshot {
    scheduler::SchedulerSnapshotPtr snapshot;
};

/// Whole state when @p service_id is empty, else one service.
struct Query {
    std::optional<std::string> service_id;
    async::PromisePtr<nlohmann::json> reply;
};

} // namespace imsg

using MaintainerMessage = std::variant<std::monostate, imsg::Snapshot, imsg::Query>;

class InterstitialMaintainer final : public async::Actor<MaintainerMessage> {
public:
    InterstitialMaintainer(InterstitialGate& gate, const scheduler::ServiceDescriptionSource& descriptions,
                           async::Executor& executor, std::size_t mailbox_capacity,
                           obs::MetricsSink* metrics = nullptr);

    bool publish(scheduler::SchedulerSnapshotPtr snapshot);

    /**
     * @brief Per-service: {"available", "interstitial"}; whole state:
     *        {"interstitial": gate state, "maintainer": {"available-service-ids"}}.
     */
    async::PromisePtr<nlohmann::json> query(std::optional<std::string> service_id = std::nullopt);

protected:
    void handle(MaintainerMessage& m) override;
    void on_exit(std::deque<MaintainerMessage>& undelivered) override;

private:
    void on_snapshot(const scheduler::SchedulerSnapshot& s);
    [[nodiscard]] nlohmann::json state(const std::optional<std::string>& service_id) const;

    InterstitialGate&                           gate_;
    const scheduler::ServiceDescriptionSource&  descriptions_;
    obs::MetricsSink*                           metrics_;
    std::set<std::string>                       available_service_ids_;
};

} // namespace sluice::interstitial
