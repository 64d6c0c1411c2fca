/**
 * @file test_registry.cpp
 * @brief Tests for InstanceRegistry RCU semantics and the scheduler feed.
 *
 * Validates:
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - apply / upsertService / removeService behavior and validation
 *  - Heterogeneous lookup with std::string_view keys
 *  - No torn reads under 1 writer / many readers
 *  - StaticScheduler reports kills once; the syncer publishes and skips failed polls
 *  - ServiceInstance JSON keys
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "sluice/async/executor.hpp"
#include "sluice/async/timer.hpp"
#include "sluice/scheduler/instance_registry.hpp"
#include "sluice/scheduler/scheduler.hpp"
#include "sluice/scheduler/service_instance.hpp"

using namespace std::chrono_literals;
using sluice::scheduler::InstanceList;
using sluice::scheduler::InstanceRegistry;
using sluice::scheduler::RegistryErr;
using sluice::scheduler::SchedulerBroadcaster;
using sluice::scheduler::SchedulerError;
using sluice::scheduler::SchedulerSnapshot;
using sluice::scheduler::SchedulerSnapshotPtr;
using sluice::scheduler::SchedulerSyncer;
using sluice::scheduler::ServiceInstance;
using sluice::scheduler::ServiceRecord;
using sluice::scheduler::StaticScheduler;

///
/// Helpers: instances with just enough fields to pass validation.
///
static ServiceInstance inst(const char* id, const char* sid, std::uint16_t port = 8080) {
  return ServiceInstance{.id = id, .service_id = sid, .host = "10.0.0.1", .port = port,
                         .log_directory = std::nullopt, .healthy = true, .started_at = std::nullopt};
}

static SchedulerSnapshot snapshot_of(const char* sid, InstanceList healthy) {
  SchedulerSnapshot s;
  s.available_service_ids.insert(sid);
  s.healthy_instances[sid] = std::move(healthy);
  return s;
}

// --------------------------- Basic construction ----------------------------

/**
 * @test Registry_Construct_Empty
 * @brief Fresh registry publishes a valid empty snapshot.
 */
TEST(InstanceRegistry, Registry_Construct_Empty) {
  InstanceRegistry reg;

  auto snap = reg.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->empty());
  EXPECT_EQ(reg.version(), 0u);
}

// --------------------------- Apply / Upsert / Remove -----------------------

/**
 * @test Registry_Apply_And_Lookup
 * @brief Apply a scheduler snapshot, verify heterogeneous find and findInstance.
 */
TEST(InstanceRegistry, Registry_Apply_And_Lookup) {
  InstanceRegistry reg;

  auto s = snapshot_of("svc1", {inst("a", "svc1", 1), inst("b", "svc1", 2)});
  s.unhealthy_instances["svc1"] = {inst("c", "svc1", 3)};
  ASSERT_EQ(reg.apply(s), RegistryErr::Ok);

  auto snap = reg.snapshot();
  auto it = snap->find(std::string_view{"svc1"});   // hetero lookup
  ASSERT_NE(it, snap->end());
  EXPECT_EQ(it->second.healthy.size(), 2u);
  EXPECT_EQ(it->second.unhealthy.size(), 1u);

  EXPECT_TRUE(reg.hasService("svc1"));
  EXPECT_FALSE(reg.hasService("svc2"));
  ASSERT_TRUE(reg.findInstance("svc1", "c"));
  EXPECT_EQ(reg.findInstance("svc1", "c")->port, 3);
  EXPECT_FALSE(reg.findInstance("svc1", "zz"));
  EXPECT_EQ(reg.service_ids(), std::vector<std::string>{"svc1"});
}

/**
 * @test Registry_Apply_Replaces_Whole_Map
 * @brief Services missing from the next snapshot disappear.
 */
TEST(InstanceRegistry, Registry_Apply_Replaces_Whole_Map) {
  InstanceRegistry reg;
  ASSERT_EQ(reg.apply(snapshot_of("x", {inst("x1", "x")})), RegistryErr::Ok);
  ASSERT_EQ(reg.apply(snapshot_of("y", {inst("y1", "y")})), RegistryErr::Ok);
  EXPECT_FALSE(reg.hasService("x"));
  EXPECT_TRUE(reg.hasService("y"));
  EXPECT_EQ(reg.stats().applies, 2u);
  EXPECT_EQ(reg.version(), 2u);
}

/**
 * @test Registry_Apply_Drops_Invalid_Instances
 * @brief Bad ids, foreign service ids, zero ports and duplicates are dropped and counted.
 */
TEST(InstanceRegistry, Registry_Apply_Drops_Invalid_Instances) {
  InstanceRegistry reg;
  auto s = snapshot_of("svc", {inst("ok", "svc"), inst("bad id", "svc"), inst("other", "elsewhere"),
                               inst("noport", "svc", 0), inst("ok", "svc")});
  ASSERT_EQ(reg.apply(s), RegistryErr::Ok);

  auto rec = reg.service_state("svc");
  ASSERT_TRUE(rec);
  ASSERT_EQ(rec->healthy.size(), 1u);
  EXPECT_EQ(rec->healthy[0].id, "ok");
  EXPECT_EQ(reg.stats().dropped_instances, 4u);
}

/**
 * @test Registry_Upsert_Idempotent
 * @brief Upserting identical content should not change logical contents.
 */
TEST(InstanceRegistry, Registry_Upsert_Idempotent) {
  InstanceRegistry reg;

  ServiceRecord rec{.healthy = {inst("a1", "svc"), inst("a2", "svc")}, .unhealthy = {}, .killed = {}};
  ASSERT_EQ(reg.upsertService("svc", rec), RegistryErr::Ok);
  auto s1 = reg.snapshot();
  ASSERT_EQ(reg.upsertService("svc", rec), RegistryErr::Ok);
  auto s2 = reg.snapshot();

  auto it1 = s1->find(std::string_view{"svc"});
  auto it2 = s2->find(std::string_view{"svc"});
  ASSERT_NE(it1, s1->end());
  ASSERT_NE(it2, s2->end());
  EXPECT_EQ(it1->second, it2->second);  // content equal (pointer identity not required)
}

/**
 * @test Registry_Validation_Rejections_DoNotPublish
 * @brief Invalid upserts are rejected without publishing a new snapshot.
 */
TEST(InstanceRegistry, Registry_Validation_Rejections_DoNotPublish) {
  InstanceRegistry reg;
  const auto v0 = reg.version();

  EXPECT_EQ(reg.upsertService("bad service", ServiceRecord{}), RegistryErr::Invalid);
  ServiceRecord foreign{.healthy = {inst("a", "other")}, .unhealthy = {}, .killed = {}};
  EXPECT_EQ(reg.upsertService("svc", foreign), RegistryErr::Invalid);

  EXPECT_EQ(reg.version(), v0);
  EXPECT_TRUE(reg.snapshot()->empty());
  EXPECT_EQ(reg.stats().failures, 2u);
}

/**
 * @test Registry_Remove_And_Clear
 */
TEST(InstanceRegistry, Registry_Remove_And_Clear) {
  InstanceRegistry reg;
  ASSERT_EQ(reg.upsertService("a", ServiceRecord{}), RegistryErr::Ok);
  ASSERT_EQ(reg.upsertService("b", ServiceRecord{}), RegistryErr::Ok);

  EXPECT_EQ(reg.removeService("a"), RegistryErr::Ok);
  EXPECT_EQ(reg.removeService("a"), RegistryErr::NotFound);
  EXPECT_EQ(reg.size(), 1u);

  reg.clear();
  EXPECT_TRUE(reg.snapshot()->empty());
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Registry_Concurrency_1W_MR
 * @brief One writer toggles content; readers only observe valid states.
 *
 * This is a lightweight sanity test (not a full linearizability proof).
 */
TEST(InstanceRegistry, Registry_Concurrency_1W_MR) {
  InstanceRegistry reg;

  const auto snapA = snapshot_of("svc", {inst("a1", "svc"), inst("a2", "svc")});
  const auto snapB = snapshot_of("svc", {inst("b1", "svc")});

  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&]{
    for (int i = 0; i < 4000; ++i) {
      (void)reg.apply((i & 1) == 0 ? snapA : snapB);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&]{
    while (running.load(std::memory_order_relaxed)) {
      auto s = reg.snapshot();
      if (!s) continue;
      auto it = s->find(std::string_view{"svc"});
      if (it != s->end()) {
        const auto n = it->second.healthy.size();
        // Must be exactly one of the published sizes; never torn
        if (n == 2 || n == 1) {
          ok_reads.fetch_add(1, std::memory_order_relaxed);
        } else {
          ADD_FAILURE() << "Observed invalid size: " << n;
          break;
        }
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();

  EXPECT_GT(ok_reads.load(), 0);
}

// --------------------------- Scheduler feed --------------------------------

/**
 * @test StaticScheduler_Reports_Kill_Once
 * @brief A killed instance leaves the healthy list and shows up as killed on one poll only.
 */
TEST(SchedulerFeed, StaticScheduler_Reports_Kill_Once) {
  StaticScheduler sched;
  sched.set_instances("svc", {inst("i1", "svc"), inst("i2", "svc")});
  sched.process_instance_killed(inst("i1", "svc"));

  auto first = sched.poll();
  ASSERT_TRUE(first);
  ASSERT_EQ(first->healthy_instances.at("svc").size(), 1u);
  EXPECT_EQ(first->healthy_instances.at("svc")[0].id, "i2");
  ASSERT_EQ(first->killed_instances.at("svc").size(), 1u);
  EXPECT_EQ(first->killed_instances.at("svc")[0].id, "i1");

  auto second = sched.poll();
  ASSERT_TRUE(second);
  EXPECT_TRUE(SchedulerSnapshot::instances_of(second->killed_instances, "svc").empty());
}

/**
 * @test Syncer_Publishes_And_Skips_Failures
 * @brief Failed polls keep the last good snapshot and are counted.
 */
TEST(SchedulerFeed, Syncer_Publishes_And_Skips_Failures) {
  sluice::async::Timer timer;
  sluice::async::Executor executor(1);
  StaticScheduler sched;
  SchedulerBroadcaster bus;

  std::atomic<int> received{0};
  auto sub = bus.subscribe([&](const SchedulerSnapshotPtr& s) {
    if (s && s->available_service_ids.contains("svc")) ++received;
  });

  auto syncer = std::make_shared<SchedulerSyncer>(sched, bus, timer, executor, 1000ms);
  sched.set_instances("svc", {inst("i1", "svc")});
  EXPECT_TRUE(syncer->sync_once());
  EXPECT_EQ(received.load(), 1);

  sched.set_failure(SchedulerError::Unavailable);
  EXPECT_FALSE(syncer->sync_once());
  EXPECT_EQ(syncer->failures(), 1u);
  EXPECT_EQ(bus.published(), 1u);
  ASSERT_TRUE(bus.latest());
  EXPECT_TRUE(bus.latest()->available_service_ids.contains("svc"));

  bus.unsubscribe(sub);
  sched.set_failure(std::nullopt);
  EXPECT_TRUE(syncer->sync_once());
  EXPECT_EQ(received.load(), 1);
  EXPECT_EQ(bus.published(), 2u);

  syncer->stop();
  executor.shutdown();
  timer.shutdown();
}

// --------------------------- Instance JSON ---------------------------------

/**
 * @test ServiceInstance_Json_Keys
 * @brief Dashed keys on the way out; missing optionals keep defaults on the way in.
 */
TEST(ServiceInstance, ServiceInstance_Json_Keys) {
  auto i = inst("i1", "svc", 9000);
  i.started_at = "2024-01-01T00:00:00Z";
  nlohmann::json j = i;
  EXPECT_EQ(j.at("service-id"), "svc");
  EXPECT_EQ(j.at("port"), 9000);
  EXPECT_EQ(j.at("started-at"), "2024-01-01T00:00:00Z");

  auto parsed = nlohmann::json::parse(R"({"id": "i2", "service-id": "svc", "host": "h", "port": 1})")
                    .get<ServiceInstance>();
  EXPECT_EQ(parsed.id, "i2");
  EXPECT_FALSE(parsed.log_directory);
  EXPECT_FALSE(parsed.started_at);
  EXPECT_EQ(sluice::scheduler::end_point(parsed), "http://h:1");
}
