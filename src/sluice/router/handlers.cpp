/**
 * @file handlers.cpp
 * @brief Validation, dispatch and JSON shaping for the router handlers.
 */
#include "sluice/router/handlers.hpp"

#include <algorithm>
#include <cctype>

#include "sluice/interstitial/interstitial_gate.hpp"
#include "sluice/obs/logging.hpp"
#include "sluice/version.hpp"

namespace sluice::router {

using nlohmann::json;

namespace {

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

/// Blank when absent, not a string, or whitespace only.
bool blank_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it == obj.end() || !it->is_string() || is_blank(it->get_ref<const std::string&>());
}

Response error_response(int status, std::string message) {
    return Response{status, json{{"message", std::move(message)}}, {}};
}

Response error_response(const core::RouterError& e) {
    return Response{e.status, core::to_json(e), {}};
}

} // namespace

Response blacklist_handler(Router& router, std::string_view body) {
    try {
        const json doc = json::parse(body);
        const json instance = doc.is_object() ? doc.value("instance", json::object()) : json::object();
        const auto period = doc.is_object() ? doc.find("period-in-ms") : doc.end();
        const bool period_ok = doc.is_object() && period != doc.end() && period->is_number_integer() &&
                               period->get<std::int64_t>() >= 0;
        if (!doc.is_object() || !instance.is_object() || blank_field(doc, "reason") ||
            blank_field(instance, "id") || blank_field(instance, "service-id") || !period_ok) {
            return Response{400,
                            json{{"message", "Must provide the service-id, the instance id, the reason, "
                                             "and a positive period"},
                                 {"input-data", doc}},
                            {}};
        }

        const auto instance_id = instance.at("id").get<std::string>();
        const auto service_id  = instance.at("service-id").get<std::string>();
        const auto reason      = doc.at("reason").get<std::string>();
        const auto period_ms   = period->get<std::int64_t>();

        const auto result = router.blacklist_instance(service_id, instance_id, period_ms, reason);
        const bool ok = result.status == core::BlacklistStatus::Blacklisted;
        if (ok) {
            obs::logger()->info("blacklist {} of {} response: {}", instance_id, service_id, to_string(result.status));
        } else {
            obs::logger()->warn("blacklist {} of {} response: {}", instance_id, service_id, to_string(result.status));
        }
        if (!ok) {
            return Response{result.status == core::BlacklistStatus::InUse ? 423 : 503,
                            json{{"message", "Unable to blacklist instance."},
                                 {"instance-id", instance_id},
                                 {"reason", to_string(result.status)}},
                            {}};
        }
        if (reason == "killed") {
            auto known = router.registry().findInstance(service_id, instance_id);
            router.scheduler().process_instance_killed(known ? *known : instance.get<scheduler::ServiceInstance>());
        }
        return Response{200, json{{"instance-id", instance_id}, {"blacklist-period", period_ms}}, {}};
    } catch (const json::parse_error& e) {
        obs::logger()->warn("blacklist request body is not JSON: {}", e.what());
        return error_response(400, "Blacklisting instance failed.");
    } catch (const json::exception& e) {
        obs::logger()->error("blacklisting instance failed: {}", e.what());
        return error_response(500, "Blacklisting instance failed.");
    }
}

Response blacklisted_instances_handler(Router& router, std::string_view service_id) {
    if (is_blank(service_id)) return Response{400, json{{"error", "Missing service-id!"}}, {}};
    const std::string sid(service_id);
    json ids = json::array();
    if (auto state = router.query_state(sid)) {
        for (const auto& e : state->blacklisted) ids.push_back(e.instance_id);
    }
    obs::logger()->info("{} has {} blacklisted instance(s).", sid, ids.size());
    return Response{200, json{{"blacklisted-instances", ids}}, {}};
}

Response work_stealing_handler(Router& router, std::string_view body) {
    try {
        const json doc = json::parse(body);
        const bool complete = doc.is_object() && !blank_field(doc, "cid") && !blank_field(doc, "request-id") &&
                              !blank_field(doc, "router-id") && !blank_field(doc, "service-id") &&
                              doc.contains("instance") && doc.at("instance").is_object();
        if (!complete) {
            return Response{400,
                            json{{"error", "Missing one of cid, instance, request-id, router-id or service-id!"},
                                 {"input-data", doc}},
                            {}};
        }
        core::WorkStealingOffer offer;
        offer.cid        = doc.at("cid").get<std::string>();
        offer.request_id = doc.at("request-id").get<std::string>();
        offer.router_id  = doc.at("router-id").get<std::string>();
        offer.service_id = doc.at("service-id").get<std::string>();
        offer.instance   = doc.at("instance").get<scheduler::ServiceInstance>();
        offer.response   = async::Promise<core::OfferStatus>::make();
        obs::logger()->info("received work-stealing offer {} of {} from {}", offer.instance.id, offer.service_id,
                            offer.router_id);

        json out{{"cid", offer.cid},
                 {"request-id", offer.request_id},
                 {"router-id", offer.router_id},
                 {"service-id", offer.service_id}};
        out["response-status"] = to_string(router.offer_instance(std::move(offer)));
        return Response{200, std::move(out), {}};
    } catch (const json::parse_error& e) {
        return Response{400, json{{"error", e.what()}}, {}};
    } catch (const json::exception& e) {
        return Response{500, json{{"error", e.what()}}, {}};
    }
}

Response offer_complete_handler(Router& router, std::string_view body) {
    try {
        const json doc = json::parse(body);
        if (!doc.is_object() || blank_field(doc, "service-id") || blank_field(doc, "instance-id") ||
            blank_field(doc, "cid")) {
            return Response{400, json{{"error", "Missing one of cid, instance-id or service-id!"}}, {}};
        }
        const auto service_id = doc.at("service-id").get<std::string>();
        if (!router.complete_offer(service_id, doc.at("instance-id").get<std::string>(),
                                   doc.at("cid").get<std::string>())) {
            return error_response(core::make_error(core::RouterErrorCode::ServiceUnavailable, service_id));
        }
        return Response{200, json{{"success", true}}, {}};
    } catch (const json::exception& e) {
        return Response{400, json{{"error", e.what()}}, {}};
    }
}

Response service_state_handler(Router& router, std::string_view service_id) {
    if (is_blank(service_id)) return Response{400, json{{"error", "Missing service-id!"}}, {}};
    auto state = router.query_state(std::string(service_id));
    if (!state) return error_response(state.error());
    return Response{200, json{{"router-id", router.router_id()}, {"state", core::to_json(*state)}}, {}};
}

Response router_state_handler(Router& router) {
    json services = json::object();
    for (const auto& [sid, s] : router.query_all_state()) services[sid] = core::to_json(s);
    return Response{200,
                    json{{"router-id", router.router_id()},
                         {"version", version_string},
                         {"services", std::move(services)},
                         {"dispatcher", core::to_json(router.dispatcher_stats())},
                         {"work-stealing", core::to_json(router.work_stealing_stats())}},
                    {}};
}

Response interstitial_state_handler(Router& router, std::optional<std::string> service_id) {
    json state = service_id && !is_blank(*service_id) ? router.query_interstitial_state(*service_id)
                                                      : router.query_all_interstitial_state();
    return Response{200, json{{"router-id", router.router_id()}, {"state", std::move(state)}}, {}};
}

Response metrics_handler(Router& router, const std::map<std::string, std::string>& params) {
    auto param = [&params](const char* key) -> std::optional<std::string> {
        auto it = params.find(key);
        if (it == params.end()) return std::nullopt;
        return it->second;
    };
    const auto exclude = param("exclude-services");
    const auto sid     = param("service-id");
    if (exclude && *exclude == "true") return Response{200, router.metrics().get_router_metrics(), {}};
    if (sid) return Response{200, router.metrics().get_service_metrics(*sid), {}};
    return Response{200, router.metrics().get_metrics(), {}};
}

Response display_interstitial_handler(Router& router, std::string_view service_id, std::string_view path,
                                      std::string_view query_string) {
    if (is_blank(service_id)) return Response{400, json{{"error", "Missing service-id!"}}, {}};
    const auto description = router.descriptions().lookup(service_id);
    return Response{200,
                    json{{"service-id", std::string(service_id)},
                         {"interstitial-secs", description ? description->interstitial_secs : 0},
                         {"target-url", interstitial::target_url(path, query_string)}},
                    {}};
}

} // namespace sluice::router
