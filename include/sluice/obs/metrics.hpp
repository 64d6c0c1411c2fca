#pragma once
/**
 * @file metrics.hpp
 * @brief Metrics facade: counters, meters and timers keyed by dotted names.
 * @details Names follow "services.<service-id>.<kind>.<path...>" for per-service
 *          metrics and "router.<classifier>.<kind>.<path...>" for router-wide ones.
 *          Peer routers read each other's registries as the shared cluster state.
 */

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace sluice::obs {

/** @class MetricsSink
 *  @brief Narrow write interface consumed by the core.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    /// Add @p delta to a counter (may be negative).
    virtual void counter_inc(std::string_view name, std::int64_t delta = 1) = 0;
    /// Overwrite a counter value.
    virtual void counter_set(std::string_view name, std::int64_t value) = 0;
    /// Record @p n events on a meter.
    virtual void meter_mark(std::string_view name, std::uint64_t n = 1) = 0;
    /// Record one duration sample on a timer.
    virtual void timer_record(std::string_view name, std::chrono::nanoseconds elapsed) = 0;
};

/// "services.<service_id>.<kind>.<p0>.<p1>..."
std::string service_metric(std::string_view service_id, std::string_view kind,
                           std::initializer_list<std::string_view> path);

/// "router.<classifier>.<kind>.<p0>.<p1>..."
std::string router_metric(std::string_view classifier, std::string_view kind,
                          std::initializer_list<std::string_view> path);

/** @struct TimerStats
 *  @brief Aggregate of recorded durations.
 */
struct TimerStats {
    std::uint64_t count{0};
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds max{0};
};

/** @class MetricsRegistry
 *  @brief Thread-safe in-memory MetricsSink with read access and JSON export.
 */
class MetricsRegistry final : public MetricsSink {
public:
    void counter_inc(std::string_view name, std::int64_t delta = 1) override;
    void counter_set(std::string_view name, std::int64_t value) override;
    void meter_mark(std::string_view name, std::uint64_t n = 1) override;
    void timer_record(std::string_view name, std::chrono::nanoseconds elapsed) override;

    /// Current counter value (0 when never written).
    [[nodiscard]] std::int64_t counter_value(std::string_view name) const;
    /// Total events marked on a meter.
    [[nodiscard]] std::uint64_t meter_count(std::string_view name) const;
    [[nodiscard]] TimerStats timer_stats(std::string_view name) const;

    /// Nested map of every metric, split on '.'.
    [[nodiscard]] nlohmann::json get_metrics() const;
    /// The "services.<service_id>" subtree (empty object when unknown).
    [[nodiscard]] nlohmann::json get_service_metrics(std::string_view service_id) const;
    /// Every metric that does not belong to a service.
    [[nodiscard]] nlohmann::json get_router_metrics() const;

private:
    [[nodiscard]] nlohmann::json export_if(std::string_view prefix, bool exclude_services) const;

    mutable std::mutex mu_;
    std::map<std::string, std::int64_t, std::less<>>  counters_;
    std::map<std::string, std::uint64_t, std::less<>> meters_;
    std::map<std::string, TimerStats, std::less<>>    timers_;
};

} // namespace sluice::obs
