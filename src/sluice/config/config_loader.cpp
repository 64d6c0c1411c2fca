/**
 * @file config_loader.cpp
 * @brief JSON loader over named defaults.
 */
#include "sluice/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <set>
#include <string_view>

#include "sluice/obs/logging.hpp"

namespace sluice::config {
    using namespace sluice::config::constants;
    using nlohmann::json;

    namespace {

        const std::set<std::string_view> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

        bool invalid(std::string_view key, std::string_view why) {
            obs::logger()->error("config: {} {}", key, why);
            return false;
        }

        /// Integer in [lo, hi] at obj[key]; absent keys leave @p out unchanged.
        template <class T>
        bool read_int(const json& obj, const char* key, T& out, std::int64_t lo,
                      std::int64_t hi = std::numeric_limits<std::int64_t>::max()) {
            auto it = obj.find(key);
            if (it == obj.end()) return true;
            if (!it->is_number_integer()) return invalid(key, "must be an integer");
            const auto v = it->get<std::int64_t>();
            if (v < lo || v > hi) return invalid(key, "is out of range");
            out = static_cast<T>(v);
            return true;
        }

        bool read_bool(const json& obj, const char* key, bool& out) {
            auto it = obj.find(key);
            if (it == obj.end()) return true;
            if (!it->is_boolean()) return invalid(key, "must be a boolean");
            out = it->get<bool>();
            return true;
        }

        bool read_string(const json& obj, const char* key, std::string& out) {
            auto it = obj.find(key);
            if (it == obj.end()) return true;
            if (!it->is_string() || it->get<std::string>().empty()) return invalid(key, "must be a non-empty string");
            out = it->get<std::string>();
            return true;
        }

        /// Sub-object at obj[key]; absent yields an empty object, a non-object fails.
        bool section(const json& obj, const char* key, json& out) {
            auto it = obj.find(key);
            if (it == obj.end()) {
                out = json::object();
                return true;
            }
            if (!it->is_object()) return invalid(key, "must be an object");
            out = *it;
            return true;
        }

        constexpr std::int64_t kU32Max = std::numeric_limits<std::uint32_t>::max();

        bool load_blacklist(const json& doc, core::BlacklistConfig& bc) {
            json s;
            if (!section(doc, "blacklist-config", s)) return false;
            if (!read_int(s, "blacklist-backoff-base-time-ms", bc.backoff_base_time_ms, 1)) return false;
            if (!read_int(s, "max-blacklist-time-ms", bc.max_blacklist_time_ms, 1)) return false;
            if (!read_bool(s, "blacklist-busy-instances", bc.blacklist_busy_instances)) return false;
            if (bc.max_blacklist_time_ms < bc.backoff_base_time_ms) {
                return invalid("max-blacklist-time-ms", "must not be below blacklist-backoff-base-time-ms");
            }
            return true;
        }

        bool load_work_stealing(const json& doc, core::WorkStealingConfig& wc) {
            json s;
            if (!section(doc, "work-stealing", s)) return false;
            return read_int(s, "offer-help-interval-ms", wc.offer_help_interval_ms, 1, kU32Max) &&
                   read_int(s, "reserve-timeout-ms", wc.reserve_timeout_ms, 1, kU32Max);
        }

        bool load_service_defaults(const json& doc, scheduler::ServiceDefaults& sd) {
            json s;
            if (!section(doc, "service-defaults", s)) return false;
            if (!read_int(s, "interstitial-secs", sd.interstitial_secs, 0, std::numeric_limits<int>::max()) ||
                !read_int(s, "max-queue-length", sd.max_queue_length, 1) ||
                !read_int(s, "concurrency-level", sd.concurrency_level, 1, kU32Max)) {
                return false;
            }
            if (auto it = s.find("distribution-scheme"); it != s.end()) {
                if (!it->is_string()) return invalid("distribution-scheme", "must be a string");
                auto scheme = scheduler::parse_distribution_scheme(it->get<std::string>());
                if (!scheme) return invalid("distribution-scheme", "must be \"balanced\" or \"simple\"");
                sd.distribution_scheme = *scheme;
            }
            return true;
        }

        bool load_runtime(const json& doc, RuntimeConfig& rc) {
            json s;
            if (!section(doc, "runtime", s)) return false;
            return read_int(s, "executor-threads", rc.executor_threads, 1, 1024) &&
                   read_int(s, "mailbox-capacity", rc.mailbox_capacity, 1) &&
                   read_int(s, "queue-timeout-ms", rc.queue_timeout_ms, 1, kU32Max) &&
                   read_int(s, "query-timeout-ms", rc.query_timeout_ms, 1, kU32Max) &&
                   read_int(s, "blacklist-sweep-interval-ms", rc.blacklist_sweep_interval_ms, 1, kU32Max);
        }

    } // namespace

    const char* to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file-not-found";
            case ConfigError::ParseError:   return "parse-error";
            case ConfigError::Invalid:      return "invalid";
        }
        return "unknown";
    }

    json to_json(const RouterConfig& cfg) {
        return json{
            {"router-id", cfg.router_id},
            {"log-level", cfg.log_level},
            {"blacklist-config",
             {{"blacklist-backoff-base-time-ms", cfg.blacklist.backoff_base_time_ms},
              {"max-blacklist-time-ms", cfg.blacklist.max_blacklist_time_ms},
              {"blacklist-busy-instances", cfg.blacklist.blacklist_busy_instances}}},
            {"work-stealing",
             {{"offer-help-interval-ms", cfg.work_stealing.offer_help_interval_ms},
              {"reserve-timeout-ms", cfg.work_stealing.reserve_timeout_ms}}},
            {"scheduler-syncer-interval-secs", cfg.scheduler_syncer_interval_secs},
            {"service-defaults",
             {{"interstitial-secs", cfg.service_defaults.interstitial_secs},
              {"max-queue-length", cfg.service_defaults.max_queue_length},
              {"concurrency-level", cfg.service_defaults.concurrency_level},
              {"distribution-scheme", scheduler::to_string(cfg.service_defaults.distribution_scheme)}}},
            {"runtime",
             {{"executor-threads", cfg.runtime.executor_threads},
              {"mailbox-capacity", cfg.runtime.mailbox_capacity},
              {"queue-timeout-ms", cfg.runtime.queue_timeout_ms},
              {"query-timeout-ms", cfg.runtime.query_timeout_ms},
              {"blacklist-sweep-interval-ms", cfg.runtime.blacklist_sweep_interval_ms}}}};
    }

    RouterConfig Loader::defaults() {
        return RouterConfig{}; // every field picks its default from constants
    }

    sluice_detail::expected<RouterConfig, ConfigError> Loader::load_from_json(const json& doc) {
        if (!doc.is_object()) {
            obs::logger()->error("config: document must be a JSON object");
            return sluice_detail::unexpected<ConfigError>(ConfigError::Invalid);
        }
        RouterConfig rc = defaults();
        const bool ok = read_string(doc, "router-id", rc.router_id) &&
                        read_string(doc, "log-level", rc.log_level) &&
                        load_blacklist(doc, rc.blacklist) &&
                        load_work_stealing(doc, rc.work_stealing) &&
                        read_int(doc, "scheduler-syncer-interval-secs", rc.scheduler_syncer_interval_secs, 1,
                                 kU32Max) &&
                        load_service_defaults(doc, rc.service_defaults) &&
                        load_runtime(doc, rc.runtime);
        if (!ok) return sluice_detail::unexpected<ConfigError>(ConfigError::Invalid);
        if (!kLogLevels.contains(rc.log_level)) {
            invalid("log-level", "is not a known level");
            return sluice_detail::unexpected<ConfigError>(ConfigError::Invalid);
        }
        return rc;
    }

    sluice_detail::expected<RouterConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            obs::logger()->error("config: cannot open {}", path);
            return sluice_detail::unexpected<ConfigError>(ConfigError::FileNotFound);
        }
        json doc;
        try {
            doc = json::parse(in);
        } catch (const json::parse_error& e) {
            obs::logger()->error("config: {} is not valid JSON: {}", path, e.what());
            return sluice_detail::unexpected<ConfigError>(ConfigError::ParseError);
        }
        return load_from_json(doc);
    }

} // namespace sluice::config
