// InterstitialGate: copy-on-write promise map
//   • Readers: atomic_load (ACQUIRE), then look up without locking.
//   • Writers: copy, modify, atomic_compare_exchange (ACQ_REL); retry on conflict.
// The map only holds shared_ptrs, so a copy per write is cheap.

#include "sluice/interstitial/interstitial_gate.hpp"

#include <chrono>
#include <utility>

#include "sluice/config/constants.hpp"
#include "sluice/obs/logging.hpp"

namespace sluice::interstitial {

using sluice::config::constants::BYPASS_INTERSTITIAL_PARAM;
using sluice::config::constants::INTERSTITIAL_PATH_PREFIX;

namespace {

constexpr std::string_view kBypass{BYPASS_INTERSTITIAL_PARAM};

} // namespace

const char* to_string(InterstitialResolution r) noexcept {
    switch (r) {
        case InterstitialResolution::HealthyInstanceFound: return "healthy-instance-found";
        case InterstitialResolution::InterstitialTimeout:  return "interstitial-timeout";
    }
    return "unknown";
}

std::string promise_state(const InterstitialPromisePtr& p) {
    if (!p) return "not-realized";
    auto v = p->try_get();
    return v ? to_string(*v) : "not-realized";
}

//------------------------------- Query helpers --------------------------------

bool has_bypass_param(std::string_view query_string) noexcept {
    if (!query_string.ends_with(kBypass)) return false;
    // Whole parameter only: preceded by nothing or by a separator.
    const auto at = query_string.size() - kBypass.size();
    return at == 0 || query_string[at - 1] == '&';
}

std::string strip_bypass_param(std::string_view query_string) {
    if (!has_bypass_param(query_string)) return std::string(query_string);
    const auto cut = query_string.size() - kBypass.size();
    return std::string(query_string.substr(0, cut == 0 ? 0 : cut - 1));
}

std::string target_url(std::string_view path, std::string_view query_string) {
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);
    std::string out;
    out.reserve(path.size() + query_string.size() + kBypass.size() + 3);
    out.append("/").append(path).append("?");
    if (!query_string.empty()) out.append(query_string).append("&");
    // The bypass parameter must stay last.
    out.append(kBypass);
    return out;
}

//------------------------------- Gate -----------------------------------------

InterstitialGate::InterstitialGate(async::Timer& timer, obs::MetricsSink* metrics)
    : timer_(timer), metrics_(metrics), map_(std::make_shared<const PromiseMap>()) {}

std::shared_ptr<const PromiseMap> InterstitialGate::snapshot() const {
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

InterstitialPromisePtr InterstitialGate::find(std::string_view service_id) const {
    auto snap = snapshot();
    auto it = snap->find(service_id);
    return it == snap->end() ? nullptr : it->second;
}

InterstitialPromisePtr InterstitialGate::ensure(const std::string& service_id, int interstitial_secs) {
    if (auto existing = find(service_id)) return existing;

    auto fresh = InterstitialPromise::make();
    auto cur   = snapshot();
    for (;;) {
        if (auto it = cur->find(service_id); it != cur->end()) return it->second; // lost the race
        auto next = std::make_shared<PromiseMap>(*cur);
        next->emplace(service_id, fresh);
        std::shared_ptr<const PromiseMap> desired = std::move(next);
        if (std::atomic_compare_exchange_strong_explicit(&map_, &cur, desired, std::memory_order_acq_rel,
                                                         std::memory_order_acquire)) {
            break;
        }
        // cur now holds the map that beat us; retry against it.
    }

    obs::logger()->info("{}: created interstitial promise ({} s)", service_id, interstitial_secs);
    if (metrics_) metrics_->counter_inc(obs::router_metric("interstitial", "counters", {"promise", "total"}));
    if (interstitial_secs > 0) {
        auto* metrics = metrics_;
        (void)timer_.schedule_after(std::chrono::seconds(interstitial_secs), [fresh, service_id, metrics] {
            if (fresh->deliver(InterstitialResolution::InterstitialTimeout)) {
                obs::logger()->info("{}: interstitial resolved to interstitial-timeout", service_id);
                if (metrics) {
                    metrics->counter_inc(obs::router_metric("interstitial", "counters", {"promise", "resolved"}));
                    metrics->counter_inc(
                        obs::router_metric("interstitial", "counters", {"resolution", "interstitial-timeout"}));
                }
            }
        });
    } else {
        obs::logger()->error("{}: opted out of interstitial, no timeout installed", service_id);
    }
    return fresh;
}

bool InterstitialGate::resolve(std::string_view service_id, InterstitialResolution resolution) {
    auto p = find(service_id);
    if (!p || !p->deliver(resolution)) return false;
    obs::logger()->info("{}: interstitial resolved to {}", service_id, to_string(resolution));
    if (metrics_) {
        metrics_->counter_inc(obs::router_metric("interstitial", "counters", {"promise", "resolved"}));
        metrics_->counter_inc(obs::router_metric("interstitial", "counters", {"resolution", to_string(resolution)}));
    }
    return true;
}

std::size_t InterstitialGate::remove_absent(const std::set<std::string>& service_ids) {
    auto cur = snapshot();
    for (;;) {
        auto next = std::make_shared<PromiseMap>();
        for (const auto& [sid, p] : *cur) {
            if (service_ids.contains(sid)) next->emplace(sid, p);
        }
        const std::size_t removed = cur->size() - next->size();
        if (removed == 0) return 0;
        std::shared_ptr<const PromiseMap> desired = std::move(next);
        if (std::atomic_compare_exchange_strong_explicit(&map_, &cur, desired, std::memory_order_acq_rel,
                                                         std::memory_order_acquire)) {
            obs::logger()->debug("removed {} interstitial promises of services the scheduler no longer lists",
                                 removed);
            return removed;
        }
    }
}

void InterstitialGate::mark_initialized() noexcept {
    if (!initialized_.exchange(true, std::memory_order_acq_rel)) {
        obs::logger()->info("interstitial state has been initialized with services from the scheduler");
    }
}

GateDecision InterstitialGate::check(const GateRequest& request) {
    GateDecision d;
    const bool bypass = has_bypass_param(request.query_string);
    d.forward_query   = bypass ? strip_bypass_param(request.query_string) : request.query_string;

    if (bypass) d.reason = "bypass";
    else if (request.on_the_fly) d.reason = "on-the-fly";
    else if (request.interstitial_secs <= 0) d.reason = "disabled";
    else if (request.accept.find("text/html") == std::string::npos) d.reason = "not-html";
    else if (!initialized()) d.reason = "not-initialized";
    else {
        // Only a healthy instance opens the gate; a timeout alone keeps redirecting.
        auto state = ensure(request.service_id, request.interstitial_secs)->try_get();
        if (state && *state == InterstitialResolution::HealthyInstanceFound) d.reason = "healthy-instance-found";
    }
    if (!d.reason.empty()) return d;

    d.action   = GateDecision::Action::Redirect;
    d.status   = 303;
    d.reason   = "interstitial";
    d.location = std::string(INTERSTITIAL_PATH_PREFIX) + request.uri;
    if (!request.query_string.empty()) d.location.append("?").append(request.query_string);
    d.forward_query.clear();
    d.headers.emplace("location", d.location);
    d.headers.emplace("x-sluice-interstitial", "true");
    if (metrics_) {
        metrics_->counter_inc(obs::service_metric(request.service_id, "counters", {"request-counts", "interstitial"}));
        metrics_->meter_mark(obs::router_metric("interstitial", "meters", {"redirect"}));
    }
    obs::logger()->debug("{}: redirecting {} to the interstitial page", request.service_id, request.uri);
    return d;
}

nlohmann::json InterstitialGate::to_json() const {
    nlohmann::json promises = nlohmann::json::object();
    for (const auto& [sid, p] : *snapshot()) promises[sid] = promise_state(p);
    return nlohmann::json{{"initialized?", initialized()}, {"service-id->interstitial-promise", promises}};
}

} // namespace sluice::interstitial
