/**
 * @file metrics.cpp
 * @brief Mutex-guarded metric maps and their nested JSON export.
 */
#include "sluice/obs/metrics.hpp"

#include <algorithm>
#include <vector>

namespace sluice::obs {

namespace {

std::string join_name(std::string_view head, std::string_view middle, std::string_view kind,
                      std::initializer_list<std::string_view> path) {
    std::string out;
    out.reserve(64);
    out.append(head).append(".").append(middle).append(".").append(kind);
    for (auto p : path) out.append(".").append(p);
    return out;
}

std::vector<std::string> split_name(std::string_view name) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= name.size()) {
        const auto dot = name.find('.', start);
        if (dot == std::string_view::npos) {
            parts.emplace_back(name.substr(start));
            break;
        }
        parts.emplace_back(name.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

void insert_nested(nlohmann::json& root, std::string_view name, nlohmann::json value) {
    const auto parts = split_name(name);
    nlohmann::json* node = &root;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& child = (*node)[parts[i]];
        if (!child.is_object()) child = nlohmann::json::object();
        node = &child;
    }
    (*node)[parts.back()] = std::move(value);
}

bool selected(std::string_view name, std::string_view prefix, bool exclude_services) {
    if (exclude_services) return name.rfind("services.", 0) != 0;
    return prefix.empty() || name.rfind(prefix, 0) == 0;
}

} // namespace

std::string service_metric(std::string_view service_id, std::string_view kind,
                           std::initializer_list<std::string_view> path) {
    return join_name("services", service_id, kind, path);
}

std::string router_metric(std::string_view classifier, std::string_view kind,
                          std::initializer_list<std::string_view> path) {
    return join_name("router", classifier, kind, path);
}

void MetricsRegistry::counter_inc(std::string_view name, std::int64_t delta) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = counters_.find(name);
    if (it == counters_.end()) it = counters_.emplace(std::string(name), 0).first;
    it->second += delta;
}

void MetricsRegistry::counter_set(std::string_view name, std::int64_t value) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = counters_.find(name);
    if (it == counters_.end()) counters_.emplace(std::string(name), value);
    else it->second = value;
}

void MetricsRegistry::meter_mark(std::string_view name, std::uint64_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = meters_.find(name);
    if (it == meters_.end()) it = meters_.emplace(std::string(name), 0).first;
    it->second += n;
}

void MetricsRegistry::timer_record(std::string_view name, std::chrono::nanoseconds elapsed) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = timers_.find(name);
    if (it == timers_.end()) it = timers_.emplace(std::string(name), TimerStats{}).first;
    auto& t = it->second;
    t.count++;
    t.total += elapsed;
    t.max = std::max(t.max, elapsed);
}

std::int64_t MetricsRegistry::counter_value(std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::uint64_t MetricsRegistry::meter_count(std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = meters_.find(name);
    return it == meters_.end() ? 0 : it->second;
}

TimerStats MetricsRegistry::timer_stats(std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = timers_.find(name);
    return it == timers_.end() ? TimerStats{} : it->second;
}

nlohmann::json MetricsRegistry::export_if(std::string_view prefix, bool exclude_services) const {
    nlohmann::json root = nlohmann::json::object();
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [name, value] : counters_) {
        if (selected(name, prefix, exclude_services)) insert_nested(root, name, value);
    }
    for (const auto& [name, value] : meters_) {
        if (selected(name, prefix, exclude_services)) insert_nested(root, name, {{"count", value}});
    }
    for (const auto& [name, t] : timers_) {
        if (!selected(name, prefix, exclude_services)) continue;
        const auto mean = t.count == 0 ? 0 : t.total.count() / static_cast<std::int64_t>(t.count);
        insert_nested(root, name, {{"count", t.count}, {"mean-ns", mean}, {"max-ns", t.max.count()}});
    }
    return root;
}

nlohmann::json MetricsRegistry::get_metrics() const {
    return export_if({}, false);
}

nlohmann::json MetricsRegistry::get_service_metrics(std::string_view service_id) const {
    std::string prefix = "services.";
    prefix.append(service_id).append(".");
    auto all = export_if(prefix, false);
    if (auto it = all.find("services"); it != all.end()) {
        if (auto svc = it->find(std::string(service_id)); svc != it->end()) return *svc;
    }
    return nlohmann::json::object();
}

nlohmann::json MetricsRegistry::get_router_metrics() const {
    return export_if({}, true);
}

} // namespace sluice::obs
