#pragma once
/**
 * @file handlers.hpp
 * @brief JSON request handlers over a Router.
 *
 * Transport-agnostic: each handler takes the already-extracted body or
 * parameters and returns a status, a JSON body and extra headers. Malformed
 * input is answered with 400 and never reaches a Responder.
 */

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "sluice/router/router.hpp"

namespace sluice::router {

/** @struct Response
 *  @brief Handler result.
 */
struct Response {
    int                                status{200};
    nlohmann::json                     body = nlohmann::json::object();
    std::map<std::string, std::string> headers;
};

/**
 * @brief Blacklist an instance at this router.
 * @param body {"instance": {"id", "service-id", ...}, "period-in-ms", "reason"}
 * @return 200 {"instance-id", "blacklist-period"}; 400 on missing fields;
 *         423 when the instance is busy; 503 otherwise.
 * @details A successful blacklist with reason "killed" also asks the scheduler to kill the instance.
 */
Response blacklist_handler(Router& router, std::string_view body);

/// 200 {"blacklisted-instances": [ids]}; 400 when @p service_id is blank.
Response blacklisted_instances_handler(Router& router, std::string_view service_id);

/**
 * @brief Inbound work-stealing offer from a peer.
 * @param body {"cid", "instance", "request-id", "router-id", "service-id"}
 * @return 200 with the offer keys and "response-status"; 400 when a key is missing.
 */
Response work_stealing_handler(Router& router, std::string_view body);

/// Borrower's completion of an accepted offer: {"service-id", "instance-id", "cid"}.
Response offer_complete_handler(Router& router, std::string_view body);

/// 200 {"router-id", "state"}; error status and body when the state is unavailable.
Response service_state_handler(Router& router, std::string_view service_id);

/// Every Responder's state plus dispatcher and work-stealing counters.
Response router_state_handler(Router& router);

/// Interstitial state of one service, or of all services when @p service_id is empty.
Response interstitial_state_handler(Router& router, std::optional<std::string> service_id);

/**
 * @brief Metrics export.
 * @param params "exclude-services" ("true" drops per-service metrics), "service-id".
 */
Response metrics_handler(Router& router, const std::map<std::string, std::string>& params);

/**
 * @brief Holding page data for a redirected request.
 * @param path Original path, without the interstitial prefix.
 * @return 200 {"service-id", "interstitial-secs", "target-url"}; target-url retries with the bypass parameter.
 */
Response display_interstitial_handler(Router& router, std::string_view service_id, std::string_view path,
                                      std::string_view query_string);

} // namespace sluice::router
