/**
 * @file test_work_stealing.cpp
 * @brief Work stealing between routers sharing an in-process cluster.
 *
 * Validates:
 *  - An idle instance is lent to the peer with waiting requests and serves exactly one of them
 *  - While lent it is never selectable at the owner; the borrower's release hands it back
 *  - Unreachable peers decline; silent peers time out; in both cases the instance reverts
 *  - A departing peer releases every reservation held for it
 *  - Simple-distribution services are never offered
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "sluice/cluster/cluster.hpp"
#include "sluice/cluster/in_process_cluster.hpp"
#include "sluice/config/config_loader.hpp"
#include "sluice/core/messages.hpp"
#include "sluice/router/router.hpp"
#include "sluice/scheduler/scheduler.hpp"
#include "sluice/scheduler/service_description.hpp"

using namespace std::chrono_literals;
using namespace sluice;
using core::OfferStatus;
using router::Router;
using scheduler::ServiceInstance;

namespace {

template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
  const auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

ServiceInstance inst(const std::string& id) {
  return ServiceInstance{id, "svc", "10.0.0.1", 8080, std::nullopt, true, std::nullopt};
}

config::RouterConfig router_config(const std::string& id, std::uint32_t reserve_timeout_ms = 2000) {
  auto cfg = config::Loader::defaults();
  cfg.router_id                           = id;
  cfg.runtime.executor_threads            = 2;
  cfg.runtime.queue_timeout_ms            = 5000;
  cfg.runtime.query_timeout_ms            = 2000;
  cfg.work_stealing.offer_help_interval_ms = 60000; // rounds are triggered by hand
  cfg.work_stealing.reserve_timeout_ms    = reserve_timeout_ms;
  return cfg;
}

/// Instance id a select resolved to; empty when it failed or did not resolve in time.
std::string picked(const async::PromisePtr<core::SelectResult>& reply, std::chrono::milliseconds wait = 3s) {
  auto v = reply->wait_for(wait);
  if (!v || !*v) return {};
  return (*v)->instance.id;
}

core::ResponderStateSnapshot state_of(Router& r) {
  auto s = r.query_state("svc");
  EXPECT_TRUE(s);
  return s ? *s : core::ResponderStateSnapshot{};
}

/// One peer "P" that always has a waiting request.
class DemandView final : public cluster::ClusterView {
public:
  std::vector<std::string> peer_router_ids() const override { return {"P"}; }
  std::int64_t waiting_requests(const std::string&, const std::string&) const override { return 1; }
};

/// Peer that cannot be reached.
class DownTransport final : public cluster::InterRouterTransport {
public:
  bool send_offer(const std::string&, core::WorkStealingOffer) override { return false; }
  bool complete_offer(const std::string&, const std::string&, const std::string&, const std::string&) override {
    return false;
  }
};

/// Peer that takes offers and never answers.
class SilentTransport final : public cluster::InterRouterTransport {
public:
  bool send_offer(const std::string&, core::WorkStealingOffer offer) override {
    std::lock_guard<std::mutex> lk(mu_);
    offers_.push_back(std::move(offer));
    return true;
  }
  bool complete_offer(const std::string&, const std::string&, const std::string&, const std::string&) override {
    return true;
  }
  std::vector<core::WorkStealingOffer> offers() {
    std::lock_guard<std::mutex> lk(mu_);
    return offers_;
  }

private:
  std::mutex mu_;
  std::vector<core::WorkStealingOffer> offers_;
};

} // namespace

// --------------------------- Two routers -----------------------------------

namespace {

class TwoRouters : public ::testing::Test {
protected:
  void SetUp() override {
    sched_a_.set_instances("svc", {inst("a1")});
    sched_b_.set_instances("svc", {});
    a_ = std::make_unique<Router>(router_config("A"),
                                  router::RouterDeps{&sched_a_, nullptr, view_a_.get(), transport_a_.get()});
    b_ = std::make_unique<Router>(router_config("B"),
                                  router::RouterDeps{&sched_b_, nullptr, view_b_.get(), transport_b_.get()});
    ASSERT_TRUE(cluster_.join(*a_));
    ASSERT_TRUE(cluster_.join(*b_));
    ASSERT_TRUE(a_->sync_scheduler());
    ASSERT_TRUE(b_->sync_scheduler());
  }

  void TearDown() override {
    cluster_.leave("A");
    cluster_.leave("B");
    a_->shutdown();
    b_->shutdown();
  }

  /// Queue one request at B and lend it A's instance.
  async::PromisePtr<core::SelectResult> steal_into_b() {
    auto waiting = b_->select_instance_async("svc", "qb");
    EXPECT_TRUE(eventually([&] { return b_->waiting_requests("svc") > 0; }));
    EXPECT_TRUE(a_->trigger_work_stealing());
    return waiting;
  }

  cluster::InProcessCluster cluster_;
  std::unique_ptr<cluster::ClusterView> view_a_ = cluster_.view("A");
  std::unique_ptr<cluster::ClusterView> view_b_ = cluster_.view("B");
  std::unique_ptr<cluster::InterRouterTransport> transport_a_ = cluster_.transport("A");
  std::unique_ptr<cluster::InterRouterTransport> transport_b_ = cluster_.transport("B");
  scheduler::StaticScheduler sched_a_;
  scheduler::StaticScheduler sched_b_;
  std::unique_ptr<Router> a_;
  std::unique_ptr<Router> b_;
};

} // namespace

/**
 * @test Idle_Instance_Lent_And_Returned
 * @brief A lends a1 to B's waiting request; a1 is held at A until B releases it.
 */
TEST_F(TwoRouters, Idle_Instance_Lent_And_Returned) {
  auto waiting = steal_into_b();
  auto lease = waiting->wait_for(3s);
  ASSERT_TRUE(lease && *lease);
  EXPECT_EQ((*lease)->instance.id, "a1");
  EXPECT_TRUE((*lease)->borrowed);

  ASSERT_TRUE(eventually([&] { return a_->work_stealing_stats().accepted == 1u; }));
  auto ws = a_->work_stealing_stats();
  EXPECT_EQ(ws.offers_sent, 1u);
  EXPECT_EQ(ws.in_flight, 0u);

  auto held = state_of(*a_);
  ASSERT_EQ(held.offered.count("a1"), 1u);
  EXPECT_TRUE(held.offered.at("a1").accepted);
  EXPECT_EQ(held.offered.at("a1").router_id, "B");

  // Never selectable at the owner while lent.
  auto local = a_->select_instance_async("svc", "qa", 0, core::Clock::now() + 100ms);
  auto refused = local->wait_for(3s);
  ASSERT_TRUE(refused);
  ASSERT_FALSE(*refused);
  EXPECT_EQ(refused->error().code, core::RouterErrorCode::NoInstanceAvailable);

  ASSERT_TRUE(b_->release_instance("svc", "a1", "qb", core::RequestOutcome::Success));
  ASSERT_TRUE(eventually([&] { return state_of(*a_).offered.empty(); }));
  EXPECT_TRUE(state_of(*b_).borrowed.empty());

  auto again = a_->select_instance_for_request("svc", "qa2");
  ASSERT_TRUE(again);
  EXPECT_EQ(again->instance.id, "a1");
  EXPECT_FALSE(again->borrowed);
}

/**
 * @test Borrowed_Serves_One_Request
 * @brief Two requests wait at B; one lent instance serves only the first.
 */
TEST_F(TwoRouters, Borrowed_Serves_One_Request) {
  auto first  = b_->select_instance_async("svc", "q1");
  auto second = b_->select_instance_async("svc", "q2");
  ASSERT_TRUE(eventually([&] { return b_->waiting_requests("svc") == 2; }));
  ASSERT_TRUE(a_->trigger_work_stealing());

  EXPECT_EQ(picked(first), "a1");
  ASSERT_TRUE(b_->release_instance("svc", "a1", "q1", core::RequestOutcome::Success));
  ASSERT_TRUE(eventually([&] { return state_of(*a_).offered.empty(); }));
  EXPECT_FALSE(second->realized());
}

/**
 * @test No_Offer_Without_Demand
 */
TEST_F(TwoRouters, No_Offer_Without_Demand) {
  ASSERT_TRUE(a_->trigger_work_stealing());
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(a_->work_stealing_stats().offers_sent, 0u);
  EXPECT_EQ(state_of(*a_).available, std::vector<std::string>{"a1"});
}

/**
 * @test Peer_Departure_Releases_Reservation
 */
TEST_F(TwoRouters, Peer_Departure_Releases_Reservation) {
  auto waiting = steal_into_b();
  ASSERT_EQ(picked(waiting), "a1");
  ASSERT_TRUE(eventually([&] { return !state_of(*a_).offered.empty(); }));

  cluster_.leave("B");
  ASSERT_TRUE(eventually([&] { return state_of(*a_).offered.empty(); }));
  auto again = a_->select_instance_for_request("svc", "qa");
  ASSERT_TRUE(again);
  EXPECT_EQ(again->instance.id, "a1");
}

// --------------------------- Failed offers ---------------------------------

namespace {

class LoneRouter : public ::testing::Test {
protected:
  void make(cluster::InterRouterTransport* transport, std::uint32_t reserve_timeout_ms,
            const scheduler::ServiceDescriptionSource* descriptions = nullptr) {
    sched_.set_instances("svc", {inst("a1")});
    router_ = std::make_unique<Router>(router_config("A", reserve_timeout_ms),
                                       router::RouterDeps{&sched_, descriptions, &view_, transport});
    ASSERT_TRUE(router_->sync_scheduler());
  }

  void TearDown() override {
    if (router_) router_->shutdown();
  }

  DemandView view_;
  DownTransport down_;
  SilentTransport silent_;
  scheduler::StaticServiceDescriptions descriptions_;
  scheduler::StaticScheduler sched_;
  std::unique_ptr<Router> router_;
};

} // namespace

/**
 * @test Unreachable_Peer_Declines
 */
TEST_F(LoneRouter, Unreachable_Peer_Declines) {
  make(&down_, 2000);
  ASSERT_TRUE(router_->trigger_work_stealing());

  ASSERT_TRUE(eventually([&] { return router_->work_stealing_stats().declined == 1u; }));
  EXPECT_EQ(router_->work_stealing_stats().offers_sent, 1u);
  ASSERT_TRUE(eventually([&] { return state_of(*router_).offered.empty(); }));
  auto lease = router_->select_instance_for_request("svc", "q1");
  ASSERT_TRUE(lease);
  EXPECT_EQ(lease->instance.id, "a1");
}

/**
 * @test Silent_Peer_Times_Out
 * @brief No answer within reserve-timeout: Timeout, instance reverts, a late accept loses.
 */
TEST_F(LoneRouter, Silent_Peer_Times_Out) {
  make(&silent_, 100);
  ASSERT_TRUE(router_->trigger_work_stealing());

  ASSERT_TRUE(eventually([&] { return silent_.offers().size() == 1u; }));
  auto offer = silent_.offers().front();
  EXPECT_EQ(offer.router_id, "A");
  EXPECT_EQ(offer.instance.id, "a1");
  ASSERT_TRUE(offer.response);

  ASSERT_TRUE(eventually([&] { return router_->work_stealing_stats().timeout == 1u; }));
  EXPECT_FALSE(offer.response->deliver(OfferStatus::Accepted));
  ASSERT_TRUE(eventually([&] { return state_of(*router_).offered.empty(); }));
  EXPECT_EQ(picked(router_->select_instance_async("svc", "q1")), "a1");
}

/**
 * @test Simple_Distribution_Never_Offered
 */
TEST_F(LoneRouter, Simple_Distribution_Never_Offered) {
  scheduler::ServiceDescription d;
  d.service_id          = "svc";
  d.distribution_scheme = scheduler::DistributionScheme::Simple;
  descriptions_.put(d);
  make(&silent_, 2000, &descriptions_);

  ASSERT_TRUE(router_->trigger_work_stealing());
  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(silent_.offers().empty());
  EXPECT_EQ(router_->work_stealing_stats().offers_sent, 0u);
}
