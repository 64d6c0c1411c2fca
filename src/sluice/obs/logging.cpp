/**
 * @file logging.cpp
 * @brief Lazily constructed spdlog logger.
 */
#include "sluice/obs/logging.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sluice::obs {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("sluice")) return existing;
        auto created = spdlog::stdout_color_mt("sluice");
        created->set_pattern(kDefaultLogPattern);
        return created;
    }();
    return instance;
}

bool init_logging(std::string_view level, std::string_view pattern) {
    auto log = logger();
    log->set_pattern(std::string(pattern));
    const auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"; only accept "off" when asked for explicitly.
    if (parsed == spdlog::level::off && level != "off") {
        log->warn("unknown log level '{}', keeping {}", level,
                  spdlog::level::to_string_view(log->level()));
        return false;
    }
    log->set_level(parsed);
    return true;
}

} // namespace sluice::obs
