/**
 * @file blacklist.cpp
 * @brief Backoff policy and per-service blacklist bookkeeping.
 */
#include "sluice/core/blacklist.hpp"

#include <algorithm>
#include <limits>
#include <set>

namespace sluice::core {

nlohmann::json to_json(const BlacklistEntry& e, Clock::time_point now) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(e.expiry_time - now).count();
    return nlohmann::json{{"instance-id", e.instance_id},
                          {"consecutive-failures", e.consecutive_failures},
                          {"expires-in-ms", std::max<std::int64_t>(left, 0)}};
}

std::int64_t BlacklistPolicy::compute_backoff(std::uint32_t failures) const noexcept {
    const std::int64_t base = std::max<std::int64_t>(cfg_.backoff_base_time_ms, 0);
    const std::int64_t cap  = std::max<std::int64_t>(cfg_.max_blacklist_time_ms, 0);
    if (failures == 0) failures = 1;
    // Double until the cap is reached; stops before overflow.
    std::int64_t v = base;
    for (std::uint32_t i = 1; i < failures && v < cap; ++i) {
        v = (v > cap / 2) ? cap : v * 2;
        if (v == 0) break;
    }
    return std::min(v, cap);
}

std::int64_t BlacklistPolicy::effective_period(std::int64_t period_ms, std::uint32_t failures) const noexcept {
    const std::int64_t cap = std::max<std::int64_t>(cfg_.max_blacklist_time_ms, 0);
    return std::min(std::max(period_ms, compute_backoff(failures)), cap);
}

const BlacklistEntry& BlacklistTracker::blacklist(const std::string& instance_id, std::int64_t period_ms,
                                                  Clock::time_point now) {
    auto& count = failures_[instance_id];
    if (count < std::numeric_limits<std::uint32_t>::max()) ++count;
    auto& e = entries_[instance_id];
    e.instance_id          = instance_id;
    e.consecutive_failures = count;
    // Last writer wins on expiry.
    e.expiry_time = now + std::chrono::milliseconds(policy_.effective_period(period_ms, e.consecutive_failures));
    return e;
}

bool BlacklistTracker::is_blacklisted(std::string_view instance_id, Clock::time_point now) const {
    auto it = entries_.find(std::string(instance_id));
    return it != entries_.end() && it->second.expiry_time > now;
}

std::vector<std::string> BlacklistTracker::expire(Clock::time_point now) {
    std::vector<std::string> released;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expiry_time <= now) {
            released.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return released;
}

bool BlacklistTracker::remove(std::string_view instance_id) {
    const std::string id(instance_id);
    failures_.erase(id);
    return entries_.erase(id) > 0;
}

void BlacklistTracker::record_success(std::string_view instance_id) {
    failures_.erase(std::string(instance_id));
}

std::uint32_t BlacklistTracker::failures(std::string_view instance_id) const {
    auto it = failures_.find(std::string(instance_id));
    return it == failures_.end() ? 0 : it->second;
}

std::optional<BlacklistEntry> BlacklistTracker::find(std::string_view instance_id) const {
    auto it = entries_.find(std::string(instance_id));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<BlacklistEntry> BlacklistTracker::entries() const {
    std::vector<BlacklistEntry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(),
              [](const BlacklistEntry& a, const BlacklistEntry& b) { return a.instance_id < b.instance_id; });
    return out;
}

std::vector<std::string> BlacklistTracker::tracked_ids() const {
    std::set<std::string> ids;
    for (const auto& kv : entries_) ids.insert(kv.first);
    for (const auto& kv : failures_) ids.insert(kv.first);
    return {ids.begin(), ids.end()};
}

std::optional<Clock::time_point> BlacklistTracker::next_expiry() const {
    std::optional<Clock::time_point> out;
    for (const auto& kv : entries_) {
        if (!out || kv.second.expiry_time < *out) out = kv.second.expiry_time;
    }
    return out;
}

} // namespace sluice::core
