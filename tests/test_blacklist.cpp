/**
 * @file test_blacklist.cpp
 * @brief Tests for BlacklistPolicy backoff and BlacklistTracker bookkeeping.
 *
 * Validates:
 *  - compute_backoff doubles from the base, never decreases and saturates at the cap
 *  - Explicit periods are raised to the backoff and clamped to the cap
 *  - Failure counts survive expiry and reset on success or removal
 *  - Expiry boundaries and the released-id list
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>

#include "sluice/core/blacklist.hpp"

using namespace std::chrono_literals;
using sluice::core::BlacklistConfig;
using sluice::core::BlacklistPolicy;
using sluice::core::BlacklistTracker;
using sluice::core::Clock;

// --------------------------- Policy ----------------------------------------

/**
 * @test Backoff_Doubles_From_Base
 */
TEST(BlacklistPolicy, Backoff_Doubles_From_Base) {
  BlacklistPolicy p(BlacklistConfig{10000, 300000, false});
  EXPECT_EQ(p.compute_backoff(0), 10000);
  EXPECT_EQ(p.compute_backoff(1), 10000);
  EXPECT_EQ(p.compute_backoff(2), 20000);
  EXPECT_EQ(p.compute_backoff(3), 40000);
  EXPECT_EQ(p.compute_backoff(5), 160000);
  EXPECT_EQ(p.compute_backoff(6), 300000);
}

/**
 * @test Backoff_Monotonic_And_Capped
 * @brief compute_backoff(n+1) >= compute_backoff(n) and never exceeds the cap, up to huge n.
 */
TEST(BlacklistPolicy, Backoff_Monotonic_And_Capped) {
  BlacklistPolicy p(BlacklistConfig{7, 1000003, false});
  std::int64_t prev = 0;
  for (std::uint32_t n = 1; n < 200; ++n) {
    const auto v = p.compute_backoff(n);
    EXPECT_GE(v, prev) << "n=" << n;
    EXPECT_LE(v, 1000003) << "n=" << n;
    prev = v;
  }
  EXPECT_EQ(p.compute_backoff(std::numeric_limits<std::uint32_t>::max()), 1000003);
}

/**
 * @test EffectivePeriod_Raised_And_Clamped
 */
TEST(BlacklistPolicy, EffectivePeriod_Raised_And_Clamped) {
  BlacklistPolicy p(BlacklistConfig{10000, 300000, false});
  EXPECT_EQ(p.effective_period(500, 1), 10000);       // below backoff
  EXPECT_EQ(p.effective_period(50000, 1), 50000);     // explicit wins
  EXPECT_EQ(p.effective_period(5000000, 1), 300000);  // clamped
  EXPECT_EQ(p.effective_period(0, 3), 40000);
}

// --------------------------- Tracker ---------------------------------------

/**
 * @test Tracker_Blacklist_And_Expire
 * @brief An entry excludes until its expiry, then expire() releases it.
 */
TEST(BlacklistTracker, Tracker_Blacklist_And_Expire) {
  BlacklistTracker t(BlacklistConfig{100, 1000, false});
  const auto now = Clock::now();
  const auto& e = t.blacklist("i1", 0, now);
  EXPECT_EQ(e.consecutive_failures, 1u);
  EXPECT_EQ(e.expiry_time, now + 100ms);

  EXPECT_TRUE(t.is_blacklisted("i1", now + 99ms));
  EXPECT_FALSE(t.is_blacklisted("i1", now + 100ms));
  EXPECT_FALSE(t.is_blacklisted("i2", now));
  ASSERT_TRUE(t.next_expiry());
  EXPECT_EQ(*t.next_expiry(), now + 100ms);

  EXPECT_TRUE(t.expire(now + 50ms).empty());
  auto released = t.expire(now + 100ms);
  ASSERT_EQ(released.size(), 1u);
  EXPECT_EQ(released[0], "i1");
  EXPECT_EQ(t.size(), 0u);
  EXPECT_FALSE(t.next_expiry());
}

/**
 * @test Tracker_Failures_Persist_Past_Expiry
 * @brief A second failure after expiry backs off longer than the first.
 */
TEST(BlacklistTracker, Tracker_Failures_Persist_Past_Expiry) {
  BlacklistTracker t(BlacklistConfig{100, 10000, false});
  const auto now = Clock::now();
  (void)t.blacklist("i1", 0, now);
  (void)t.expire(now + 1s);
  EXPECT_EQ(t.failures("i1"), 1u);

  const auto later = now + 2s;
  const auto& e = t.blacklist("i1", 0, later);
  EXPECT_EQ(e.consecutive_failures, 2u);
  EXPECT_EQ(e.expiry_time, later + 200ms);
}

/**
 * @test Tracker_Success_Resets_Count
 */
TEST(BlacklistTracker, Tracker_Success_Resets_Count) {
  BlacklistTracker t(BlacklistConfig{100, 10000, false});
  const auto now = Clock::now();
  (void)t.blacklist("i1", 0, now);
  (void)t.blacklist("i1", 0, now);
  EXPECT_EQ(t.failures("i1"), 2u);
  t.record_success("i1");
  EXPECT_EQ(t.failures("i1"), 0u);
  EXPECT_EQ(t.blacklist("i1", 0, now).consecutive_failures, 1u);
}

/**
 * @test Tracker_Remove_Drops_Entry_And_Count
 * @brief Killed instances disappear outright.
 */
TEST(BlacklistTracker, Tracker_Remove_Drops_Entry_And_Count) {
  BlacklistTracker t;
  const auto now = Clock::now();
  (void)t.blacklist("i1", 0, now);
  EXPECT_TRUE(t.remove("i1"));
  EXPECT_FALSE(t.remove("i1"));
  EXPECT_FALSE(t.find("i1"));
  EXPECT_EQ(t.failures("i1"), 0u);
  EXPECT_FALSE(t.is_blacklisted("i1", now));
}

/**
 * @test Tracker_LastWriter_Wins_On_Expiry
 * @brief A shorter explicit period after a long one still recomputes from its own call.
 */
TEST(BlacklistTracker, Tracker_LastWriter_Wins_On_Expiry) {
  BlacklistTracker t(BlacklistConfig{10, 100000, false});
  const auto now = Clock::now();
  (void)t.blacklist("i1", 50000, now);
  const auto& e = t.blacklist("i1", 0, now);
  EXPECT_EQ(e.consecutive_failures, 2u);
  EXPECT_EQ(e.expiry_time, now + 20ms);

  auto entries = t.entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0], e);
}
