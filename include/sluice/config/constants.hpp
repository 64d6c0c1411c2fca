#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for control-plane components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace sluice::config::constants {

// =====================
// Blacklist Defaults
// Expiry = min(base * 2^(failures-1), max); explicit periods are clamped to max.
// =====================
inline constexpr std::int64_t BLACKLIST_BACKOFF_BASE_TIME_MS = 10000;  ///< 10 s first-failure backoff
inline constexpr std::int64_t MAX_BLACKLIST_TIME_MS          = 300000; ///< 5 min ceiling
inline constexpr bool         BLACKLIST_BUSY_INSTANCES       = false;  ///< Refuse to blacklist in-flight instances

// =====================
// Work-Stealing Defaults
// =====================
inline constexpr std::uint32_t OFFER_HELP_INTERVAL_MS = 100;  ///< Coordinator tick
inline constexpr std::uint32_t RESERVE_TIMEOUT_MS     = 1000; ///< Offer reply / reservation window

// =====================
// Scheduler Feed Defaults
// =====================
inline constexpr std::uint32_t SCHEDULER_SYNCER_INTERVAL_SECS = 5; ///< Poll period of the scheduler syncer

// =====================
// Per-Service Defaults (used when the description omits a field)
// =====================
inline constexpr int           INTERSTITIAL_SECS  = 0;       ///< 0 disables the interstitial page
inline constexpr std::size_t   MAX_QUEUE_LENGTH   = 1000000; ///< Waiting requests per service per router
inline constexpr std::uint32_t CONCURRENCY_LEVEL  = 1;       ///< Concurrent requests per instance

// =====================
// Runtime Defaults
// =====================
inline constexpr std::size_t   EXECUTOR_THREADS            = 4;      ///< Workers shared by all actors
inline constexpr std::size_t   MAILBOX_CAPACITY            = 1024;   ///< Bounded actor inbox
inline constexpr std::uint32_t QUEUE_TIMEOUT_MS            = 300000; ///< Max wait for an instance
inline constexpr std::uint32_t QUERY_TIMEOUT_MS            = 10000;  ///< Max wait for a state query
inline constexpr std::uint32_t BLACKLIST_SWEEP_INTERVAL_MS = 1000;   ///< Expiry sweep period

// =====================
// Interstitial
// =====================
/// Query parameter that skips the gate for one request (must be the last parameter).
inline constexpr const char* BYPASS_INTERSTITIAL_PARAM = "x-sluice-bypass-interstitial=1";
/// Path prefix of the holding page.
inline constexpr const char* INTERSTITIAL_PATH_PREFIX  = "/sluice-interstitial";

} // namespace sluice::config::constants
