/**
 * @file service_description.cpp
 * @brief Distribution scheme parsing and the static description source.
 */
#include "sluice/scheduler/service_description.hpp"

namespace sluice::scheduler {

std::optional<DistributionScheme> parse_distribution_scheme(std::string_view s) noexcept {
    if (s == "balanced") return DistributionScheme::Balanced;
    if (s == "simple")   return DistributionScheme::Simple;
    return std::nullopt;
}

const char* to_string(DistributionScheme s) noexcept {
    switch (s) {
        case DistributionScheme::Balanced: return "balanced";
        case DistributionScheme::Simple:   return "simple";
    }
    return "unknown";
}

ServiceDescription ServiceDescription::with_defaults(std::string service_id, const ServiceDefaults& defaults) {
    ServiceDescription d;
    d.service_id          = std::move(service_id);
    d.interstitial_secs   = defaults.interstitial_secs;
    d.max_queue_length    = defaults.max_queue_length;
    d.concurrency_level   = defaults.concurrency_level;
    d.distribution_scheme = defaults.distribution_scheme;
    return d;
}

std::optional<ServiceDescription> StaticServiceDescriptions::lookup(std::string_view service_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(std::string(service_id));
    if (it != by_id_.end()) return it->second;
    return ServiceDescription::with_defaults(std::string(service_id), defaults_);
}

void StaticServiceDescriptions::put(ServiceDescription description) {
    std::lock_guard<std::mutex> lk(mu_);
    auto id = description.service_id;
    by_id_.insert_or_assign(std::move(id), std::move(description));
}

void StaticServiceDescriptions::erase(std::string_view service_id) {
    std::lock_guard<std::mutex> lk(mu_);
    by_id_.erase(std::string(service_id));
}

} // namespace sluice::scheduler
