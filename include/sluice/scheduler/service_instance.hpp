/**
 * @file service_instance.hpp
 * @brief Backend instance model shared across scheduler, responder and cluster code.
 *
 * A ServiceInstance is an immutable value: when the scheduler reports the same id
 * with different attributes the old value is replaced, never mutated in place.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sluice::scheduler {

/**
 * @brief One backend process serving a service.
 *
 * Equality is defaulted so instance lists compare element-wise (used to detect
 * unchanged scheduler reports).
 */
struct ServiceInstance final {
  /// Unique instance identifier, e.g. "s-abc123.node7-0".
  std::string id;

  /// Service this instance belongs to.
  std::string service_id;

  /// Host name or address the backend listens on.
  std::string host;

  /// Backend port (1..65535 for a routable instance).
  std::uint16_t port{0};

  /// Optional sandbox/log directory on the host.
  std::optional<std::string> log_directory;

  /// Health as last reported by the scheduler.
  bool healthy{false};
  /// Start time as reported by the scheduler (ISO-8601), if known.
  std::optional<std::string> started_at;

  /// Structural equality (compares all fields).
  bool operator==(const ServiceInstance&) const = default;
};

/// Convenience alias for a list of instances.
using InstanceList = std::vector<ServiceInstance>;

/// "http://host:port" style endpoint for logs and error payloads.
std::string end_point(const ServiceInstance& instance);

/// JSON keys: "id", "service-id", "host", "port", "log-directory", "healthy", "started-at".
void to_json(nlohmann::json& j, const ServiceInstance& instance);

/// Missing optional keys keep their defaults; type mismatches throw nlohmann::json::exception.
void from_json(const nlohmann::json& j, ServiceInstance& instance);

} // namespace sluice::scheduler
