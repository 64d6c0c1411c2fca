#pragma once
/**
 * @file blacklist.hpp
 * @brief Temporary exclusion of instances with exponential backoff.
 * @details The tracker is plain data owned by one Responder; it is never shared
 *          between threads. Serialization comes from the owning actor.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "sluice/config/constants.hpp"

namespace sluice::core {

using Clock = std::chrono::steady_clock;

/** @struct BlacklistConfig
 *  @brief Backoff parameters (blacklist-config.* keys).
 */
struct BlacklistConfig {
    std::int64_t backoff_base_time_ms{sluice::config::constants::BLACKLIST_BACKOFF_BASE_TIME_MS};
    std::int64_t max_blacklist_time_ms{sluice::config::constants::MAX_BLACKLIST_TIME_MS};
    bool         blacklist_busy_instances{sluice::config::constants::BLACKLIST_BUSY_INSTANCES};
};

/** @struct BlacklistEntry
 *  @brief One excluded instance.
 */
struct BlacklistEntry {
    std::string       instance_id;
    Clock::time_point expiry_time{};
    std::uint32_t     consecutive_failures{0};

    bool operator==(const BlacklistEntry&) const = default;
};

/// JSON: {"instance-id", "consecutive-failures", "expires-in-ms"} relative to @p now.
nlohmann::json to_json(const BlacklistEntry& e, Clock::time_point now);

/** @class BlacklistPolicy
 *  @brief Stateless backoff computation.
 */
class BlacklistPolicy {
public:
    explicit BlacklistPolicy(BlacklistConfig cfg = {}) : cfg_(cfg) {}

    /**
     * @brief min(base * 2^(failures-1), max). Non-decreasing in @p failures and saturating.
     * @param failures Consecutive failures (0 is treated as 1).
     */
    [[nodiscard]] std::int64_t compute_backoff(std::uint32_t failures) const noexcept;

    /// Effective period for an explicit request: clamp(max(period, backoff), max).
    [[nodiscard]] std::int64_t effective_period(std::int64_t period_ms, std::uint32_t failures) const noexcept;

    [[nodiscard]] const BlacklistConfig& config() const noexcept { return cfg_; }

private:
    BlacklistConfig cfg_;
};

/** @class BlacklistTracker
 *  @brief Per-service map instance-id -> entry.
 *
 * Failure counts outlive expiry: an instance that fails again after its entry
 * expired backs off longer. A success (or removal) resets the count.
 */
class BlacklistTracker {
public:
    explicit BlacklistTracker(BlacklistConfig cfg = {}) : policy_(cfg) {}

    /// Increment failures of @p instance_id and recompute its expiry from @p now.
    const BlacklistEntry& blacklist(const std::string& instance_id, std::int64_t period_ms, Clock::time_point now);

    /// True while an unexpired entry exists.
    [[nodiscard]] bool is_blacklisted(std::string_view instance_id, Clock::time_point now) const;

    /// Drop expired entries; returns the ids that were released.
    std::vector<std::string> expire(Clock::time_point now);

    /// Drop an entry and its failure count outright (killed instance). Returns false if no entry existed.
    bool remove(std::string_view instance_id);

    /// Reset the consecutive-failure count of @p instance_id.
    void record_success(std::string_view instance_id);

    /// Consecutive failures recorded for @p instance_id.
    [[nodiscard]] std::uint32_t failures(std::string_view instance_id) const;

    [[nodiscard]] std::optional<BlacklistEntry> find(std::string_view instance_id) const;
    [[nodiscard]] std::vector<BlacklistEntry> entries() const;
    /// Ids holding an entry or a failure count.
    [[nodiscard]] std::vector<std::string> tracked_ids() const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// Earliest expiry, if any entry exists.
    [[nodiscard]] std::optional<Clock::time_point> next_expiry() const;

    [[nodiscard]] const BlacklistPolicy& policy() const noexcept { return policy_; }

private:
    BlacklistPolicy policy_;
    std::unordered_map<std::string, BlacklistEntry> entries_;
    std::unordered_map<std::string, std::uint32_t>  failures_;
};

} // namespace sluice::core
