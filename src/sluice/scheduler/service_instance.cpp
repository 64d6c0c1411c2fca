/**
 * @file service_instance.cpp
 * @brief JSON conversions for ServiceInstance.
 */
#include "sluice/scheduler/service_instance.hpp"

namespace sluice::scheduler {

std::string end_point(const ServiceInstance& instance) {
    return "http://" + instance.host + ":" + std::to_string(instance.port);
}

void to_json(nlohmann::json& j, const ServiceInstance& instance) {
    j = nlohmann::json{{"id", instance.id},
                       {"service-id", instance.service_id},
                       {"host", instance.host},
                       {"port", instance.port},
                       {"healthy", instance.healthy}};
    if (instance.log_directory) j["log-directory"] = *instance.log_directory;
    if (instance.started_at) j["started-at"] = *instance.started_at;
}

void from_json(const nlohmann::json& j, ServiceInstance& instance) {
    instance.id         = j.value("id", std::string{});
    instance.service_id = j.value("service-id", std::string{});
    instance.host       = j.value("host", std::string{});
    instance.port       = j.value("port", std::uint16_t{0});
    instance.healthy    = j.value("healthy", false);
    if (auto it = j.find("log-directory"); it != j.end() && it->is_string()) {
        instance.log_directory = it->get<std::string>();
    } else {
        instance.log_directory.reset();
    }
    if (auto it = j.find("started-at"); it != j.end() && it->is_string()) {
        instance.started_at = it->get<std::string>();
    } else {
        instance.started_at.reset();
    }
}

} // namespace sluice::scheduler
