#pragma once
/**
 * @file logging.hpp
 * @brief Process-wide spdlog logger shared by all control-plane components.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sluice::obs {

/// Default line layout: timestamp, level, thread, message.
inline constexpr const char* kDefaultLogPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [%t] %v";

/// The shared "sluice" logger (created on first use with a colored stdout sink).
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Configure level and layout of the shared logger.
 * @param level spdlog level name ("trace", "debug", "info", "warn", "error", "critical", "off").
 * @return false if @p level is not a known level name (the level is left unchanged).
 */
bool init_logging(std::string_view level, std::string_view pattern = kDefaultLogPattern);

} // namespace sluice::obs
