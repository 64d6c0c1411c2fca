/**
 * @file main.cpp
 * @brief sluice_router: bootstrap one router against an in-memory scheduler.
 *
 * **Bootstrap**
 * - Load config (JSON file from argv[1], defaults otherwise); set the log level.
 * - Construct the Router: executor, timer, scheduler syncer, Dispatcher,
 *   interstitial maintainer and work-stealing coordinator.
 *
 * **Demo traffic**
 * - Declare a "demo" service with two instances, sync once, route a few
 *   requests, blacklist one instance, and print the resulting state.
 *
 * The orchestrator and HTTP front-end are external; StaticScheduler stands in
 * for the former and the handlers are called directly.
 */

#include <iostream>
#include <optional>
#include <string>

#include "sluice/config/config_loader.hpp"
#include "sluice/obs/logging.hpp"
#include "sluice/router/handlers.hpp"
#include "sluice/router/router.hpp"
#include "sluice/scheduler/scheduler.hpp"
#include "sluice/version.hpp"

int main(int argc, char** argv) {
  using namespace sluice;

  auto cfg = argc > 1 ? config::Loader::load_from_file(argv[1])
                      : sluice_detail::expected<config::RouterConfig, config::ConfigError>(config::Loader::defaults());
  if (!cfg) {
    std::cerr << "sluice_router: configuration error: " << config::to_string(cfg.error()) << "\n";
    return 2;
  }
  if (!obs::init_logging(cfg->log_level)) {
    std::cerr << "sluice_router: unknown log level " << cfg->log_level << "\n";
    return 2;
  }
  obs::logger()->info("sluice_router {} starting as {}", sluice::version_string, cfg->router_id);

  scheduler::StaticScheduler orchestrator;
  orchestrator.set_instances("demo", {{"demo.i1", "demo", "127.0.0.1", 8081, std::nullopt, true, std::nullopt},
                                      {"demo.i2", "demo", "127.0.0.1", 8082, std::nullopt, true, std::nullopt}});

  router::Router r(*cfg, router::RouterDeps{&orchestrator, nullptr, nullptr, nullptr});
  r.start();
  if (!r.sync_scheduler()) {
    obs::logger()->error("initial scheduler sync failed");
    return 1;
  }

  for (int i = 0; i < 3; ++i) {
    const std::string request_id = "req-" + std::to_string(i);
    auto lease = r.select_instance_for_request("demo", request_id);
    if (!lease) {
      std::cout << request_id << ": " << core::to_json(lease.error()).dump() << "\n";
      continue;
    }
    std::cout << request_id << " -> " << lease->instance.id << " (" << scheduler::end_point(lease->instance) << ")\n";
    (void)r.release_instance("demo", lease->instance.id, request_id, core::RequestOutcome::Success);
  }

  auto bl = router::blacklist_handler(
      r, R"({"instance": {"id": "demo.i2", "service-id": "demo"}, "period-in-ms": 5000, "reason": "demo"})");
  std::cout << "blacklist: " << bl.status << " " << bl.body.dump() << "\n";
  std::cout << router::service_state_handler(r, "demo").body.dump(2) << "\n";

  r.shutdown();
  return 0;
}
