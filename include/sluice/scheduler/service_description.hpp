#pragma once
/**
 * @file service_description.hpp
 * @brief Per-service routing parameters and the lookup interface that serves them.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sluice/config/constants.hpp"

namespace sluice::scheduler {

/** @enum DistributionScheme
 *  @brief How load of a service is spread across routers.
 */
enum class DistributionScheme : std::uint8_t {
    Balanced, ///< Work-stealing enabled
    Simple    ///< Each router serves its own instances only
};

/// Parse "balanced" / "simple".
std::optional<DistributionScheme> parse_distribution_scheme(std::string_view s) noexcept;
const char* to_string(DistributionScheme s) noexcept;

/** @struct ServiceDefaults
 *  @brief Values applied when a description omits a field.
 */
struct ServiceDefaults {
    int                interstitial_secs{sluice::config::constants::INTERSTITIAL_SECS};
    std::size_t        max_queue_length{sluice::config::constants::MAX_QUEUE_LENGTH};
    std::uint32_t      concurrency_level{sluice::config::constants::CONCURRENCY_LEVEL};
    DistributionScheme distribution_scheme{DistributionScheme::Balanced};
};

/** @struct ServiceDescription
 *  @brief Routing-relevant subset of a service's description.
 */
struct ServiceDescription {
    std::string        service_id;
    int                interstitial_secs{sluice::config::constants::INTERSTITIAL_SECS};
    std::size_t        max_queue_length{sluice::config::constants::MAX_QUEUE_LENGTH};
    std::uint32_t      concurrency_level{sluice::config::constants::CONCURRENCY_LEVEL};
    DistributionScheme distribution_scheme{DistributionScheme::Balanced};

    /// Description carrying @p defaults for @p service_id.
    static ServiceDescription with_defaults(std::string service_id, const ServiceDefaults& defaults);
};

/** @class ServiceDescriptionSource
 *  @brief Read-mostly lookup of service descriptions (backed by a kv-store elsewhere).
 */
class ServiceDescriptionSource {
public:
    virtual ~ServiceDescriptionSource() = default;
    /// Description of @p service_id, or std::nullopt when unknown.
    virtual std::optional<ServiceDescription> lookup(std::string_view service_id) const = 0;
};

/** @class StaticServiceDescriptions
 *  @brief In-memory source; unknown services resolve to the configured defaults.
 */
class StaticServiceDescriptions final : public ServiceDescriptionSource {
public:
    explicit StaticServiceDescriptions(ServiceDefaults defaults = {}) : defaults_(defaults) {}

    std::optional<ServiceDescription> lookup(std::string_view service_id) const override;

    /// Insert or replace a description.
    void put(ServiceDescription description);

    /// Forget a description (lookups fall back to defaults).
    void erase(std::string_view service_id);

private:
    ServiceDefaults defaults_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, ServiceDescription> by_id_;
};

} // namespace sluice::scheduler
