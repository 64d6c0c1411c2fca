/**
 * @file test_interstitial.cpp
 * @brief Tests for the interstitial gate, its query helpers and the maintainer actor.
 *
 * Validates:
 *  - Bypass parameter detection, stripping and retry URL construction
 *  - One promise per service under concurrent ensure(); resolution is write-once
 *  - Gate decisions: redirect until a healthy instance is found, timeout alone keeps redirecting
 *  - remove_absent() drops promises of unlisted services, pending ones included
 *  - Maintainer: promises follow scheduler snapshots; state queries
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "sluice/async/executor.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/interstitial/interstitial_gate.hpp"
#include "sluice/interstitial/interstitial_maintainer.hpp"
#include "sluice/obs/metrics.hpp"
#include "sluice/scheduler/service_description.hpp"
#include "sluice/scheduler/snapshot.hpp"

using namespace std::chrono_literals;
using namespace sluice;
using interstitial::GateDecision;
using interstitial::GateRequest;
using interstitial::InterstitialGate;
using interstitial::InterstitialResolution;

namespace {

GateRequest html_request(const std::string& query = "a=1", int secs = 2) {
  GateRequest r;
  r.service_id        = "svc";
  r.interstitial_secs = secs;
  r.accept            = "text/html,application/xhtml+xml";
  r.query_string      = query;
  r.uri               = "/path";
  return r;
}

class GateTest : public ::testing::Test {
protected:
  void TearDown() override { timer_.shutdown(); }

  async::Timer timer_;
  obs::MetricsRegistry metrics_;
  InterstitialGate gate_{timer_, &metrics_};
};

} // namespace

// --------------------------- Query helpers ---------------------------------

/**
 * @test Bypass_Param_Must_Be_Last_And_Whole
 */
TEST(InterstitialQuery, Bypass_Param_Must_Be_Last_And_Whole) {
  EXPECT_TRUE(interstitial::has_bypass_param("x-sluice-bypass-interstitial=1"));
  EXPECT_TRUE(interstitial::has_bypass_param("a=1&x-sluice-bypass-interstitial=1"));
  EXPECT_FALSE(interstitial::has_bypass_param("x-sluice-bypass-interstitial=1&a=1"));
  EXPECT_FALSE(interstitial::has_bypass_param("zx-sluice-bypass-interstitial=1"));
  EXPECT_FALSE(interstitial::has_bypass_param(""));
}

/**
 * @test Strip_Bypass_Param
 */
TEST(InterstitialQuery, Strip_Bypass_Param) {
  EXPECT_EQ(interstitial::strip_bypass_param("a=1&x-sluice-bypass-interstitial=1"), "a=1");
  EXPECT_EQ(interstitial::strip_bypass_param("x-sluice-bypass-interstitial=1"), "");
  EXPECT_EQ(interstitial::strip_bypass_param("a=1&b=2"), "a=1&b=2");
}

/**
 * @test Target_Url_Appends_Bypass_Last
 */
TEST(InterstitialQuery, Target_Url_Appends_Bypass_Last) {
  EXPECT_EQ(interstitial::target_url("/p", "a=1"), "/p?a=1&x-sluice-bypass-interstitial=1");
  EXPECT_EQ(interstitial::target_url("p", ""), "/p?x-sluice-bypass-interstitial=1");
  EXPECT_TRUE(interstitial::has_bypass_param(interstitial::target_url("//deep/p", "x=y")));
}

// --------------------------- Promise map -----------------------------------

/**
 * @test Ensure_Concurrent_Single_Promise
 * @brief Racing ensure() calls agree on one promise; only one is counted as created.
 */
TEST_F(GateTest, Ensure_Concurrent_Single_Promise) {
  constexpr int kThreads = 16;
  std::vector<interstitial::InterstitialPromisePtr> got(kThreads);
  std::atomic<bool> go{false};
  std::vector<std::thread> ts;
  for (int i = 0; i < kThreads; ++i) {
    ts.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      got[i] = gate_.ensure("svc", 60);
    });
  }
  go = true;
  for (auto& t : ts) t.join();

  for (const auto& p : got) EXPECT_EQ(p, got[0]);
  EXPECT_EQ(gate_.snapshot()->size(), 1u);
  EXPECT_EQ(metrics_.counter_value("router.interstitial.counters.promise.total"), 1);
}

/**
 * @test Resolve_Once
 */
TEST_F(GateTest, Resolve_Once) {
  EXPECT_FALSE(gate_.resolve("svc", InterstitialResolution::HealthyInstanceFound));
  auto p = gate_.ensure("svc", 60);
  EXPECT_TRUE(gate_.resolve("svc", InterstitialResolution::HealthyInstanceFound));
  EXPECT_FALSE(gate_.resolve("svc", InterstitialResolution::InterstitialTimeout));
  EXPECT_EQ(interstitial::promise_state(p), "healthy-instance-found");
  EXPECT_EQ(gate_.ensure("svc", 60), p);
}

/**
 * @test RemoveAbsent_Drops_Pending_Too
 */
TEST_F(GateTest, RemoveAbsent_Drops_Pending_Too) {
  (void)gate_.ensure("done", 60);
  (void)gate_.ensure("pending", 60);
  (void)gate_.ensure("listed", 60);
  ASSERT_TRUE(gate_.resolve("done", InterstitialResolution::HealthyInstanceFound));

  EXPECT_EQ(gate_.remove_absent({"listed", "absent"}), 2u);
  EXPECT_FALSE(gate_.find("done"));
  EXPECT_FALSE(gate_.find("pending"));
  EXPECT_TRUE(gate_.find("listed"));
  EXPECT_EQ(gate_.remove_absent({"listed"}), 0u);
}

/**
 * @test Timeout_Resolves_Promise
 */
TEST_F(GateTest, Timeout_Resolves_Promise) {
  auto p = gate_.ensure("svc", 1);
  auto v = p->wait_for(3s);
  ASSERT_TRUE(v);
  EXPECT_EQ(*v, InterstitialResolution::InterstitialTimeout);
}

/**
 * @test ToJson_Shape
 */
TEST_F(GateTest, ToJson_Shape) {
  (void)gate_.ensure("svc", 60);
  auto j = gate_.to_json();
  EXPECT_EQ(j.at("initialized?"), false);
  EXPECT_EQ(j.at("service-id->interstitial-promise").at("svc"), "not-realized");
}

// --------------------------- Decisions -------------------------------------

/**
 * @test Check_Proceeds_Before_Initialization
 */
TEST_F(GateTest, Check_Proceeds_Before_Initialization) {
  auto d = gate_.check(html_request());
  EXPECT_TRUE(d.proceed());
  EXPECT_EQ(d.reason, "not-initialized");
  EXPECT_EQ(d.forward_query, "a=1");
}

/**
 * @test Check_Exemptions
 * @brief Non-HTML, disabled and on-the-fly requests are never redirected.
 */
TEST_F(GateTest, Check_Exemptions) {
  gate_.mark_initialized();

  auto json = html_request();
  json.accept = "application/json";
  EXPECT_EQ(gate_.check(json).reason, "not-html");

  EXPECT_EQ(gate_.check(html_request("a=1", 0)).reason, "disabled");

  auto fly = html_request();
  fly.on_the_fly = true;
  EXPECT_EQ(gate_.check(fly).reason, "on-the-fly");
  EXPECT_FALSE(gate_.find("svc"));
}

/**
 * @test Check_Redirect_Until_Healthy
 * @brief interstitial-secs=2: redirected at first, bypass proceeds, healthy instance opens the gate.
 */
TEST_F(GateTest, Check_Redirect_Until_Healthy) {
  gate_.mark_initialized();

  auto d = gate_.check(html_request());
  ASSERT_FALSE(d.proceed());
  EXPECT_EQ(d.status, 303);
  EXPECT_EQ(d.location, "/sluice-interstitial/path?a=1");
  EXPECT_EQ(d.headers.at("location"), d.location);
  EXPECT_EQ(d.headers.at("x-sluice-interstitial"), "true");
  EXPECT_TRUE(d.forward_query.empty());
  EXPECT_EQ(metrics_.counter_value("services.svc.counters.request-counts.interstitial"), 1);

  auto bypass = gate_.check(html_request("a=1&x-sluice-bypass-interstitial=1"));
  EXPECT_TRUE(bypass.proceed());
  EXPECT_EQ(bypass.reason, "bypass");
  EXPECT_EQ(bypass.forward_query, "a=1");

  ASSERT_TRUE(gate_.resolve("svc", InterstitialResolution::HealthyInstanceFound));
  auto open = gate_.check(html_request());
  EXPECT_TRUE(open.proceed());
  EXPECT_EQ(open.reason, "healthy-instance-found");
  EXPECT_EQ(open.forward_query, "a=1");
}

/**
 * @test Check_Timeout_Alone_Keeps_Redirecting
 * @brief After the interstitial period with no healthy instance, direct requests still redirect.
 */
TEST_F(GateTest, Check_Timeout_Alone_Keeps_Redirecting) {
  gate_.mark_initialized();
  ASSERT_FALSE(gate_.check(html_request("", 1)).proceed());

  auto v = gate_.find("svc")->wait_for(3s);
  ASSERT_TRUE(v);
  ASSERT_EQ(*v, InterstitialResolution::InterstitialTimeout);

  auto d = gate_.check(html_request("", 1));
  EXPECT_FALSE(d.proceed());
  EXPECT_EQ(d.location, "/sluice-interstitial/path");
  EXPECT_TRUE(gate_.check(html_request("x-sluice-bypass-interstitial=1", 1)).proceed());
}

// --------------------------- Maintainer ------------------------------------

namespace {

class MaintainerTest : public ::testing::Test {
protected:
  void SetUp() override {
    scheduler::ServiceDescription slow;
    slow.service_id        = "slow";
    slow.interstitial_secs = 60;
    descriptions_.put(slow);
    scheduler::ServiceDescription held;
    held.service_id        = "held";
    held.interstitial_secs = 60;
    descriptions_.put(held);
    maintainer_ = std::make_shared<interstitial::InterstitialMaintainer>(gate_, descriptions_, executor_, 64,
                                                                         &metrics_);
  }

  void TearDown() override {
    maintainer_->stop();
    executor_.shutdown();
    timer_.shutdown();
  }

  nlohmann::json query(std::optional<std::string> sid = std::nullopt) {
    auto v = maintainer_->query(std::move(sid))->wait_for(2s);
    EXPECT_TRUE(v);
    return v ? *v : nlohmann::json{};
  }

  static scheduler::SchedulerSnapshotPtr snapshot(std::set<std::string> services,
                                                  std::set<std::string> with_healthy = {}) {
    auto s = std::make_shared<scheduler::SchedulerSnapshot>();
    s->available_service_ids = std::move(services);
    for (const auto& sid : with_healthy) {
      s->healthy_instances[sid] = {scheduler::ServiceInstance{sid + "-1", sid, "10.0.0.1", 8080, std::nullopt,
                                                              true, std::nullopt}};
    }
    return s;
  }

  async::Executor executor_{2};
  async::Timer timer_;
  obs::MetricsRegistry metrics_;
  scheduler::StaticServiceDescriptions descriptions_;
  InterstitialGate gate_{timer_, &metrics_};
  std::shared_ptr<interstitial::InterstitialMaintainer> maintainer_;
};

} // namespace

/**
 * @test Snapshot_Creates_And_Resolves_Promises
 */
TEST_F(MaintainerTest, Snapshot_Creates_And_Resolves_Promises) {
  ASSERT_TRUE(maintainer_->publish(snapshot({"slow", "plain"})));
  auto all = query();
  EXPECT_EQ(all.at("interstitial").at("initialized?"), true);
  const auto& promises = all.at("interstitial").at("service-id->interstitial-promise");
  EXPECT_EQ(promises.at("slow"), "not-realized");
  EXPECT_FALSE(promises.contains("plain"));
  EXPECT_TRUE(gate_.initialized());

  ASSERT_TRUE(maintainer_->publish(snapshot({"slow", "plain"}, {"slow"})));
  auto one = query("slow");
  EXPECT_EQ(one.at("available"), true);
  EXPECT_EQ(one.at("interstitial"), "healthy-instance-found");
}

/**
 * @test Gone_Services_Drop_Every_Promise
 */
TEST_F(MaintainerTest, Gone_Services_Drop_Every_Promise) {
  ASSERT_TRUE(maintainer_->publish(snapshot({"slow", "held"}, {"slow"})));
  ASSERT_TRUE(maintainer_->publish(snapshot({})));

  auto slow = query("slow");
  EXPECT_EQ(slow.at("available"), false);
  EXPECT_TRUE(slow.at("interstitial").is_null());

  auto held = query("held");
  EXPECT_EQ(held.at("available"), false);
  EXPECT_TRUE(held.at("interstitial").is_null());

  auto all = query();
  EXPECT_TRUE(all.at("maintainer").at("available-service-ids").empty());
  EXPECT_TRUE(all.at("interstitial").at("service-id->interstitial-promise").empty());
}

/**
 * @test Unlisted_Service_Promise_Dropped_By_Next_Snapshot
 * @brief A promise check() installs for an id the scheduler does not list lasts one snapshot.
 */
TEST_F(MaintainerTest, Unlisted_Service_Promise_Dropped_By_Next_Snapshot) {
  ASSERT_TRUE(maintainer_->publish(snapshot({"slow"})));
  (void)query();

  GateRequest req;
  req.service_id        = "stray";
  req.interstitial_secs = 60;
  req.accept            = "text/html";
  req.uri               = "/index.html";
  EXPECT_FALSE(gate_.check(req).proceed());
  ASSERT_TRUE(gate_.find("stray"));

  ASSERT_TRUE(maintainer_->publish(snapshot({"slow"})));
  (void)query();
  EXPECT_FALSE(gate_.find("stray"));
  EXPECT_TRUE(gate_.find("slow"));
}
