/**
 * @file messages.cpp
 * @brief Error construction, JSON views and message rejection.
 */
#include "sluice/core/messages.hpp"

#include <iterator>
#include <type_traits>

namespace sluice::core {

const char* to_string(RouterErrorCode c) noexcept {
    switch (c) {
        case RouterErrorCode::NoInstanceAvailable:    return "no-instance-available";
        case RouterErrorCode::MaxQueueLengthExceeded: return "max-queue-length-exceeded";
        case RouterErrorCode::ServiceUnavailable:     return "service-unavailable";
        case RouterErrorCode::Timeout:                return "timeout";
        case RouterErrorCode::InvalidRequest:         return "invalid-request";
        case RouterErrorCode::NoSuchService:          return "no-such-service";
    }
    return "unknown";
}

RouterError make_error(RouterErrorCode code, std::string service_id) {
    RouterError e;
    e.code       = code;
    e.service_id = std::move(service_id);
    switch (code) {
        case RouterErrorCode::NoInstanceAvailable:
            e.status = 503; e.message = "No instance available"; break;
        case RouterErrorCode::MaxQueueLengthExceeded:
            e.status = 503; e.message = "Max queue length exceeded!"; break;
        case RouterErrorCode::ServiceUnavailable:
            e.status = 503; e.message = "Service unavailable"; break;
        case RouterErrorCode::Timeout:
            e.status = 503; e.message = "Timed out waiting for instance"; break;
        case RouterErrorCode::InvalidRequest:
            e.status = 400; e.message = "Invalid request"; break;
        case RouterErrorCode::NoSuchService:
            e.status = 404; e.message = "No such service"; break;
    }
    return e;
}

nlohmann::json to_json(const RouterError& e) {
    return nlohmann::json{{"message", e.message},
                          {"status", e.status},
                          {"service-id", e.service_id},
                          {"error", to_string(e.code)}};
}

const char* to_string(BlacklistStatus s) noexcept {
    switch (s) {
        case BlacklistStatus::Blacklisted:    return "blacklisted";
        case BlacklistStatus::InUse:          return "in-use";
        case BlacklistStatus::NoSuchInstance: return "no-such-instance";
        case BlacklistStatus::Unavailable:    return "unavailable";
    }
    return "unknown";
}

const char* to_string(OfferStatus s) noexcept {
    switch (s) {
        case OfferStatus::Accepted: return "accepted";
        case OfferStatus::Declined: return "declined";
        case OfferStatus::Timeout:  return "timeout";
    }
    return "unknown";
}

std::optional<RequestOutcome> parse_request_outcome(std::string_view s) noexcept {
    if (s == "success")        return RequestOutcome::Success;
    if (s == "instance-error") return RequestOutcome::InstanceError;
    if (s == "instance-busy")  return RequestOutcome::InstanceBusy;
    if (s == "client-error")   return RequestOutcome::ClientError;
    return std::nullopt;
}

nlohmann::json to_json(const ResponderStateSnapshot& s) {
    using nlohmann::json;
    json offered = json::object();
    for (const auto& [id, r] : s.offered) {
        offered[id] = json{{"router-id", r.router_id}, {"cid", r.cid}, {"accepted", r.accepted}};
    }
    json borrowed = json::object();
    for (const auto& [id, b] : s.borrowed) {
        borrowed[id] = json{{"router-id", b.router_id}, {"cid", b.cid}};
    }
    json blacklisted = json::array();
    for (const auto& e : s.blacklisted) blacklisted.push_back(to_json(e, s.taken_at));

    json j{{"service-id", s.service_id},
           {"phase", s.phase},
           {"available", s.available},
           {"in-use", s.in_use},
           {"offered", std::move(offered)},
           {"borrowed", std::move(borrowed)},
           {"blacklisted", std::move(blacklisted)},
           {"counts", {{"healthy", s.healthy},
                       {"unhealthy", s.unhealthy},
                       {"queued", s.queued},
                       {"idle-slots", s.idle_slots}}},
           {"concurrency-level", s.concurrency_level},
           {"max-queue-length", s.max_queue_length},
           {"distribution-scheme", scheduler::to_string(s.distribution_scheme)},
           {"processed", s.processed}};
    if (s.last_update_time) {
        j["last-update-age-ms"] =
            std::chrono::duration_cast<std::chrono::milliseconds>(s.taken_at - *s.last_update_time).count();
    }
    return j;
}

const char* message_name(const ResponderMessage& m) noexcept {
    static constexpr const char* kNames[] = {
        "unknown", "scheduler-update", "select-instance", "release-instance",
        "blacklist-instance", "offer-instance", "query-state", "reserve-for-offer",
        "offer-resolved", "offer-returned", "borrow-expired", "queue-deadline",
        "blacklist-sweep", "service-removed", "service-restored", "peer-departed"};
    static_assert(std::size(kNames) == std::variant_size_v<ResponderMessage>);
    return m.valueless_by_exception() ? "unknown" : kNames[m.index()];
}

bool is_internal(const ResponderMessage& m) noexcept {
    return std::holds_alternative<msg::OfferResolved>(m) ||
           std::holds_alternative<msg::BorrowExpired>(m) ||
           std::holds_alternative<msg::QueueDeadline>(m);
}

void reject_message(ResponderMessage& m, const std::string& service_id, RouterErrorCode code) {
    std::visit([&](auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, msg::SelectInstance>) {
            if (v.reply) v.reply->deliver(sluice_detail::unexpected<RouterError>(make_error(code, service_id)));
        } else if constexpr (std::is_same_v<T, msg::BlacklistInstance>) {
            if (v.reply) v.reply->deliver(BlacklistResult{BlacklistStatus::Unavailable, std::nullopt});
        } else if constexpr (std::is_same_v<T, msg::OfferInstance>) {
            if (v.offer.response) v.offer.response->deliver(OfferStatus::Declined);
        } else if constexpr (std::is_same_v<T, msg::QueryState>) {
            if (v.reply) v.reply->deliver(sluice_detail::unexpected<RouterError>(make_error(code, service_id)));
        } else if constexpr (std::is_same_v<T, msg::ReserveForOffer>) {
            if (v.reply) v.reply->deliver(std::nullopt);
        }
    }, m);
}

} // namespace sluice::core
