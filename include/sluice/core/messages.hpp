#pragma once
/**
 * @file messages.hpp
 * @brief Results, errors and the message set understood by a Responder.
 *
 * Every request carrying a reply cell is answered exactly once: by the
 * Responder, by reject_message() when it cannot be delivered, or by the
 * caller's own timeout marker. Whoever delivers first wins.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "sluice/async/promise.hpp"
#include "sluice/compat/expected.hpp"
#include "sluice/core/blacklist.hpp"
#include "sluice/scheduler/service_description.hpp"
#include "sluice/scheduler/service_instance.hpp"

namespace sluice::core {

using scheduler::InstanceList;
using scheduler::ServiceInstance;

// -----------------------------------------------------------------------------
// Errors
// -----------------------------------------------------------------------------

/// Why a request could not be routed or a message not handled.
enum class RouterErrorCode : std::uint8_t {
    NoInstanceAvailable,    ///< Queue deadline passed without a free slot (503)
    MaxQueueLengthExceeded, ///< Waiting queue full (503)
    ServiceUnavailable,     ///< Responder mailbox full or terminated (503)
    Timeout,                ///< Caller stopped waiting (503)
    InvalidRequest,         ///< Missing or malformed fields (400)
    NoSuchService           ///< Unknown service-id (404)
};

const char* to_string(RouterErrorCode c) noexcept;

/** @struct RouterError
 *  @brief Error surfaced to the handler layer with its HTTP-equivalent status.
 */
struct RouterError {
    RouterErrorCode code{RouterErrorCode::ServiceUnavailable};
    int             status{503};
    std::string     message;
    std::string     service_id;
};

/// Error with the canonical status and message for @p code.
RouterError make_error(RouterErrorCode code, std::string service_id);

/// {"message", "status", "service-id", "error"}
nlohmann::json to_json(const RouterError& e);

// -----------------------------------------------------------------------------
// Results
// -----------------------------------------------------------------------------

/** @struct InstanceLease
 *  @brief An instance handed to one request. Must be released exactly once.
 */
struct InstanceLease {
    ServiceInstance instance;
    std::string     request_id;
    bool            borrowed{false}; ///< Lent by a peer router for this request only
};

using SelectResult = sluice_detail::expected<InstanceLease, RouterError>;

enum class BlacklistStatus : std::uint8_t {
    Blacklisted,
    InUse,          ///< Has in-flight requests and busy instances may not be blacklisted
    NoSuchInstance,
    Unavailable     ///< Responder unreachable or caller gave up
};

const char* to_string(BlacklistStatus s) noexcept;

struct BlacklistResult {
    BlacklistStatus               status{BlacklistStatus::Unavailable};
    std::optional<BlacklistEntry> entry;
};

enum class OfferStatus : std::uint8_t { Accepted, Declined, Timeout };

const char* to_string(OfferStatus s) noexcept;

/// How a routed request ended.
enum class RequestOutcome : std::uint8_t {
    Success,
    InstanceError, ///< Backend failed: blacklist with backoff
    InstanceBusy,  ///< Backend refused (503 from instance): blacklist with backoff
    ClientError    ///< Caller aborted; instance is fine
};

std::optional<RequestOutcome> parse_request_outcome(std::string_view s) noexcept;

/** @struct WorkStealingOffer
 *  @brief A peer router lends one idle instance.
 *  @details `response` is shared with the offering router; the first deliver
 *           decides the offer (the offerer's timeout delivers Timeout).
 */
struct WorkStealingOffer {
    std::string     cid;
    std::string     request_id;
    std::string     router_id;   ///< Offering router
    std::string     service_id;
    ServiceInstance instance;
    async::PromisePtr<OfferStatus> response;
};

/** @struct ResponderStateSnapshot
 *  @brief Point-in-time copy of one Responder's state.
 */
struct ResponderStateSnapshot {
    struct Reservation {
        std::string router_id;
        std::string cid;
        bool        accepted{false};
    };
    struct Borrowed {
        std::string router_id;
        std::string cid;
    };

    std::string service_id;
    std::string phase;                                 ///< "active" | "draining"
    std::vector<std::string> available;                ///< Least recently used first
    std::map<std::string, std::uint32_t> in_use;
    std::map<std::string, Reservation> offered;
    std::map<std::string, Borrowed> borrowed;
    std::vector<BlacklistEntry> blacklisted;
    std::size_t healthy{0};
    std::size_t unhealthy{0};
    std::size_t queued{0};
    std::size_t idle_slots{0};                         ///< Free slots on available, non-blacklisted instances
    std::uint32_t concurrency_level{1};
    std::size_t max_queue_length{0};
    scheduler::DistributionScheme distribution_scheme{scheduler::DistributionScheme::Balanced};
    std::optional<Clock::time_point> last_update_time;
    std::uint64_t processed{0};
    Clock::time_point taken_at{};
};

nlohmann::json to_json(const ResponderStateSnapshot& s);

using StateResult = sluice_detail::expected<ResponderStateSnapshot, RouterError>;

// -----------------------------------------------------------------------------
// Responder messages
// -----------------------------------------------------------------------------
namespace msg {

/// Scheduler state for this service.
struct SchedulerUpdate {
    InstanceList      healthy;
    InstanceList      unhealthy;
    InstanceList      killed;
    Clock::time_point time{};
};

/// Ask for an instance; queued when none is free.
struct SelectInstance {
    std::string       request_id;
    int               priority{0};
    Clock::time_point deadline{};
    async::PromisePtr<SelectResult> reply;
};

/// End of a request started by SelectInstance.
struct ReleaseInstance {
    std::string    instance_id;
    std::string    request_id;
    RequestOutcome outcome{RequestOutcome::Success};
};

struct BlacklistInstance {
    std::string  instance_id;
    std::int64_t period_ms{0};
    std::string  reason;
    async::PromisePtr<BlacklistResult> reply;
};

/// Inbound work-stealing offer from a peer.
struct OfferInstance {
    WorkStealingOffer offer;
};

struct QueryState {
    async::PromisePtr<StateResult> reply;
};

/// Reserve one idle instance for an outbound offer to @p router_id.
struct ReserveForOffer {
    std::string router_id;
    std::string cid;
    async::PromisePtr<OfferStatus> response;                    ///< Decides the offer
    async::PromisePtr<std::optional<ServiceInstance>> reply;    ///< Reserved instance, if any
};

/// Resolution of an outbound offer (internal, from the response cell).
struct OfferResolved {
    std::string instance_id;
    std::string cid;
    OfferStatus status{OfferStatus::Timeout};
};

/// Borrower finished with an accepted offer.
struct OfferReturned {
    std::string instance_id;
    std::string cid;
};

/// A borrowed instance was not used in time (internal).
struct BorrowExpired {
    std::string instance_id;
    std::string cid;
};

/// A queued request reached its deadline (internal).
struct QueueDeadline {
    std::uint64_t seq{0};
};

/// Periodic maintenance: blacklist expiry, stale queue entries, reservations.
struct BlacklistSweep {};

struct ServiceRemoved {};
struct ServiceRestored {};

/// A peer router left the cluster.
struct PeerDeparted {
    std::string router_id;
};

} // namespace msg

/// std::monostate is the "unknown message" branch: logged and dropped.
using ResponderMessage = std::variant<std::monostate,
                                      msg::SchedulerUpdate,
                                      msg::SelectInstance,
                                      msg::ReleaseInstance,
                                      msg::BlacklistInstance,
                                      msg::OfferInstance,
                                      msg::QueryState,
                                      msg::ReserveForOffer,
                                      msg::OfferResolved,
                                      msg::OfferReturned,
                                      msg::BorrowExpired,
                                      msg::QueueDeadline,
                                      msg::BlacklistSweep,
                                      msg::ServiceRemoved,
                                      msg::ServiceRestored,
                                      msg::PeerDeparted>;

/// Name of the active alternative (for logs).
const char* message_name(const ResponderMessage& m) noexcept;

/// True for messages a Responder sends to itself.
bool is_internal(const ResponderMessage& m) noexcept;

/// Answer any reply cell carried by @p m with @p code (message will not be handled).
void reject_message(ResponderMessage& m, const std::string& service_id, RouterErrorCode code);

} // namespace sluice::core
