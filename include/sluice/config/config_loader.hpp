#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults overridden by a JSON document.
 * @details All defaults reference named constants to avoid magic numbers.
 *          Unknown keys are ignored; present keys must have the right type and range.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "sluice/compat/expected.hpp"
#include "sluice/config/constants.hpp"
#include "sluice/core/blacklist.hpp"
#include "sluice/core/work_stealing.hpp"
#include "sluice/scheduler/service_description.hpp"

namespace sluice::config {

/** @struct RuntimeConfig
 *  @brief Executor, mailbox and timeout settings (runtime.* keys).
 */
struct RuntimeConfig {
    std::size_t   executor_threads{constants::EXECUTOR_THREADS};
    std::size_t   mailbox_capacity{constants::MAILBOX_CAPACITY};
    std::uint32_t queue_timeout_ms{constants::QUEUE_TIMEOUT_MS};
    std::uint32_t query_timeout_ms{constants::QUERY_TIMEOUT_MS};
    std::uint32_t blacklist_sweep_interval_ms{constants::BLACKLIST_SWEEP_INTERVAL_MS};
};

/** @struct RouterConfig
 *  @brief Aggregate of sub-configs required by the control plane.
 */
struct RouterConfig {
    std::string                    router_id{"router-0"};
    std::string                    log_level{"info"};
    core::BlacklistConfig          blacklist;        ///< blacklist-config.*
    core::WorkStealingConfig       work_stealing;    ///< work-stealing.*
    std::uint32_t                  scheduler_syncer_interval_secs{constants::SCHEDULER_SYNCER_INTERVAL_SECS};
    scheduler::ServiceDefaults     service_defaults; ///< service-defaults.*
    RuntimeConfig                  runtime;          ///< runtime.*
};

/// Why a configuration could not be produced.
enum class ConfigError : std::uint8_t {
    FileNotFound, ///< Path missing or unreadable
    ParseError,   ///< Not valid JSON
    Invalid       ///< Wrong type or out-of-range value
};

const char* to_string(ConfigError e) noexcept;

/// JSON form of @p cfg, using the same keys the loader reads.
nlohmann::json to_json(const RouterConfig& cfg);

/** @class Loader
 *  @brief Source of router configuration (defaults or parsed files).
 */
class Loader {
public:
    /// Configuration made of defaults only.
    static RouterConfig defaults();

    /**
     * @brief Read and parse a JSON file.
     * @param path File path.
     * @return RouterConfig with defaults for absent keys, or the first error found.
     */
    static sluice_detail::expected<RouterConfig, ConfigError> load_from_file(const std::string& path);

    /// Apply @p doc on top of the defaults.
    static sluice_detail::expected<RouterConfig, ConfigError> load_from_json(const nlohmann::json& doc);
};

} // namespace sluice::config
