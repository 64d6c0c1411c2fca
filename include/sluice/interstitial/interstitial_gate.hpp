#pragma once
/**
 * @file interstitial_gate.hpp
 * @brief Holding-page gate for services that have no healthy instance yet.
 *
 * One write-once promise per service-id lives in an immutable map published
 * with atomic shared_ptr operations. Writers install a new map by
 * compare-and-swap and retry on conflict, so two threads ensuring the same
 * service agree on a single promise (the loser adopts the winner's). Only the
 * winner arms the interstitial-secs timeout. Readers never lock.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "sluice/async/promise.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/obs/metrics.hpp"

namespace sluice::interstitial {

/// How an interstitial promise was resolved.
enum class InterstitialResolution : std::uint8_t {
    HealthyInstanceFound,
    InterstitialTimeout
};

const char* to_string(InterstitialResolution r) noexcept;

using InterstitialPromise    = async::Promise<InterstitialResolution>;
using InterstitialPromisePtr = async::PromisePtr<InterstitialResolution>;
using PromiseMap             = std::map<std::string, InterstitialPromisePtr, std::less<>>;

/// True when the query string ends with the bypass parameter as its last parameter.
[[nodiscard]] bool has_bypass_param(std::string_view query_string) noexcept;

/// @p query_string without the trailing bypass parameter (and its separator).
[[nodiscard]] std::string strip_bypass_param(std::string_view query_string);

/// Retry URL for the holding page: "/<path>?[query&]<bypass-param>".
[[nodiscard]] std::string target_url(std::string_view path, std::string_view query_string);

/** @struct GateRequest
 *  @brief The parts of an inbound request the gate looks at.
 */
struct GateRequest {
    std::string service_id;
    int         interstitial_secs{0};
    bool        on_the_fly{false};
    std::string accept;          ///< Accept header
    std::string query_string;
    std::string uri;             ///< Path, starting with '/'
};

/** @struct GateDecision
 *  @brief Proceed with (possibly rewritten) query string, or redirect to the holding page.
 */
struct GateDecision {
    enum class Action : std::uint8_t { Proceed, Redirect };

    Action      action{Action::Proceed};
    int         status{0};                          ///< 303 on redirect
    std::string location;
    std::map<std::string, std::string> headers;
    std::string forward_query;                      ///< Query string to forward when proceeding
    std::string reason;                             ///< Short tag for logs and tests

    [[nodiscard]] bool proceed() const noexcept { return action == Action::Proceed; }
};

class InterstitialGate final {
public:
    explicit InterstitialGate(async::Timer& timer, obs::MetricsSink* metrics = nullptr);

    InterstitialGate(const InterstitialGate&)            = delete;
    InterstitialGate& operator=(const InterstitialGate&) = delete;

    /**
     * @brief Promise of @p service_id, installing one if absent.
     * @details The installing call arms a timeout resolving the promise to
     *          InterstitialTimeout after @p interstitial_secs (when positive).
     */
    InterstitialPromisePtr ensure(const std::string& service_id, int interstitial_secs);

    /// Promise of @p service_id, or nullptr.
    [[nodiscard]] InterstitialPromisePtr find(std::string_view service_id) const;

    /**
     * @brief Resolve the promise of @p service_id.
     * @return true if this call resolved it (false when absent or already resolved).
     */
    bool resolve(std::string_view service_id, InterstitialResolution resolution);

    /**
     * @brief Drop every promise whose service-id is not in @p service_ids, pending or resolved.
     * @return Number of promises removed.
     */
    std::size_t remove_absent(const std::set<std::string>& service_ids);

    /// Current published map.
    [[nodiscard]] std::shared_ptr<const PromiseMap> snapshot() const;

    /// True once the first scheduler snapshot has been processed.
    [[nodiscard]] bool initialized() const noexcept { return initialized_.load(std::memory_order_acquire); }
    void mark_initialized() noexcept;

    /// Decide whether @p request proceeds or is redirected to the holding page.
    [[nodiscard]] GateDecision check(const GateRequest& request);

    /// {"initialized?", "service-id->interstitial-promise": {sid: resolution | "not-realized"}}
    [[nodiscard]] nlohmann::json to_json() const;

private:
    async::Timer&                     timer_;
    obs::MetricsSink*                 metrics_;
    std::shared_ptr<const PromiseMap> map_;
    std::atomic<bool>                 initialized_{false};
};

/// Resolution name, or "not-realized" for a pending promise.
[[nodiscard]] std::string promise_state(const InterstitialPromisePtr& p);

} // namespace sluice::interstitial
