#pragma once
// sluice: InstanceRegistry
// Last scheduler view of every service, readable from any thread.
//   • Handlers and the blacklist "killed" path read a shared_ptr copy of the map (acquire).
//   • The broadcast subscriber builds the next map from a snapshot and swaps it in (release).
//   • An old map lives until its last reader drops the copy.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sluice/scheduler/service_instance.hpp"
#include "sluice/scheduler/snapshot.hpp"

namespace sluice::scheduler {

/// Outcome of a registry mutation.
enum class RegistryErr {
    Ok,
    NotFound,   ///< No such service-id
    Invalid,    ///< Bad service-id, or an upserted record holding an invalid instance
    Capacity    ///< Service count or bucket size over Limits
};

/// Bounds on what one scheduler snapshot may load into the registry.
struct Limits {
    static constexpr std::size_t MaxServices            = 65536;
    static constexpr std::size_t MaxInstancesPerService = 4096; ///< Per health bucket
    static constexpr std::size_t MaxIdLen               = 256;  ///< Service and instance ids
    static constexpr std::size_t MaxHostLen             = 255;
};

/** @struct ServiceRecord
 *  @brief Instances of one service as last reported by the scheduler.
 */
struct ServiceRecord {
    InstanceList healthy;
    InstanceList unhealthy;
    InstanceList killed;

    bool operator==(const ServiceRecord&) const = default;
};

/** @class SchedulerStateSource
 *  @brief Narrow read interface: "current instance/health state for a service".
 */
class SchedulerStateSource {
public:
    virtual ~SchedulerStateSource() = default;
    /// Copy of the service's record, std::nullopt when the scheduler does not know it.
    virtual std::optional<ServiceRecord> service_state(std::string_view service_id) const = 0;
    /// Ids of every known service.
    virtual std::vector<std::string> service_ids() const = 0;
};

/** @class InstanceRegistry
 *  @brief service-id -> ServiceRecord, replaced wholesale on every scheduler snapshot.
 *  @details Instances failing validation are dropped from their bucket and counted.
 *           One writer (the scheduler subscriber); readers are lock-free.
 */
class InstanceRegistry final : public SchedulerStateSource {
public:
    // string_view lookups without building a std::string key.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Map = std::unordered_map<std::string, ServiceRecord, SKeyHash, SKeyEq>;

    /// The current map; stays valid and unchanged while held.
    std::shared_ptr<const Map> snapshot() const noexcept;

    // --------------------------- SchedulerStateSource ------------------------
    std::optional<ServiceRecord> service_state(std::string_view service_id) const override;
    std::vector<std::string> service_ids() const override;

    // --------------------------- Read utilities ------------------------------
    [[nodiscard]] bool hasService(std::string_view service_id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /// Find a healthy or unhealthy instance by id.
    [[nodiscard]] std::optional<ServiceInstance> findInstance(std::string_view service_id,
                                                              std::string_view instance_id) const;

    /// Bumped by every published map.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Replace the whole map with the contents of a scheduler snapshot.
    RegistryErr apply(const SchedulerSnapshot& snapshot);

    /// Insert or replace one service. Fails if the record is invalid.
    RegistryErr upsertService(std::string_view service_id, ServiceRecord record);

    /// Remove a service.
    RegistryErr removeService(std::string_view service_id) noexcept;

    /// Forget every service.
    void clear() noexcept;

    // --------------------------- Counters ------------------------------------
    struct Stats {
        uint64_t applies{0}, upserts{0}, removes{0}, failures{0}, dropped_instances{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

    // --------------------------- Validation ----------------------------------
    static bool validateId(std::string_view id) noexcept;
    static bool validateInstance(const ServiceInstance& inst, std::string_view service_id) noexcept;

private:
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};

    std::atomic<uint64_t> applies_{0}, upserts_{0}, removes_{0}, failures_{0}, dropped_{0};

    /// Drop invalid and duplicate entries from @p list, counting drops.
    InstanceList sanitize(const InstanceList& list, std::string_view service_id);

    void publish(std::shared_ptr<Map> next) noexcept;
};

} // namespace sluice::scheduler
