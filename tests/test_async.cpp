/**
 * @file test_async.cpp
 * @brief Tests for the actor runtime: Promise, Channel, Executor, Timer, Actor.
 *
 * Validates:
 *  - Promise is write-once; the first deliver wins and callbacks run once
 *  - Channel is bounded and leaves rejected values with the caller
 *  - Executor runs posted tasks and refuses work after shutdown
 *  - Timer one-shot, periodic and cancel semantics
 *  - Actor turns are FIFO, stop() overtakes queued data, undelivered data reaches on_exit()
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "sluice/async/actor.hpp"
#include "sluice/async/channel.hpp"
#include "sluice/async/executor.hpp"
#include "sluice/async/promise.hpp"
#include "sluice/async/timer.hpp"

using namespace std::chrono_literals;
using sluice::async::Actor;
using sluice::async::Channel;
using sluice::async::Executor;
using sluice::async::Promise;
using sluice::async::SendResult;
using sluice::async::Timer;

namespace {

template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

/// Records every int it handles; negative values throw, a gate can hold the first turn.
class RecordingActor final : public Actor<int> {
public:
  RecordingActor(Executor& ex, std::size_t capacity) : Actor("recording", ex, capacity) {}

  void hold_first(std::shared_future<void> gate, std::promise<void>* entered) {
    gate_ = std::move(gate);
    entered_ = entered;
  }

  std::vector<int> seen() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seen_;
  }

  std::size_t undelivered() const { return undelivered_.load(); }
  bool exited() const { return exited_.load(); }

protected:
  void handle(int& v) override {
    if (entered_) {
      entered_->set_value();
      entered_ = nullptr;
      gate_.wait();
    }
    if (v < 0) throw std::runtime_error("negative");
    std::lock_guard<std::mutex> lk(mu_);
    seen_.push_back(v);
  }

  void on_exit(std::deque<int>& rest) override {
    undelivered_ = rest.size();
    exited_ = true;
  }

private:
  mutable std::mutex       mu_;
  std::vector<int>         seen_;
  std::shared_future<void> gate_;
  std::promise<void>*      entered_{nullptr};
  std::atomic<std::size_t> undelivered_{0};
  std::atomic<bool>        exited_{false};
};

} // namespace

// --------------------------- Promise ---------------------------------------

/**
 * @test Promise_FirstDeliverWins
 * @brief A second deliver returns false and leaves the value untouched.
 */
TEST(Promise, Promise_FirstDeliverWins) {
  auto p = Promise<int>::make();
  EXPECT_FALSE(p->realized());
  EXPECT_TRUE(p->deliver(1));
  EXPECT_FALSE(p->deliver(2));
  ASSERT_TRUE(p->try_get());
  EXPECT_EQ(*p->try_get(), 1);
}

/**
 * @test Promise_Callbacks_RunOnce
 * @brief Callbacks registered before and after resolution each run exactly once.
 */
TEST(Promise, Promise_Callbacks_RunOnce) {
  auto p = Promise<std::string>::make();
  int before = 0, after = 0;
  p->on_deliver([&](const std::string& v) { EXPECT_EQ(v, "x"); ++before; });
  p->deliver("x");
  p->deliver("y");
  p->on_deliver([&](const std::string& v) { EXPECT_EQ(v, "x"); ++after; });
  EXPECT_EQ(before, 1);
  EXPECT_EQ(after, 1);
}

/**
 * @test Promise_WaitFor_TimesOut
 * @brief wait_for returns nullopt when nobody delivers, the value once someone does.
 */
TEST(Promise, Promise_WaitFor_TimesOut) {
  auto p = Promise<int>::make();
  EXPECT_FALSE(p->wait_for(20ms));

  std::thread t([p] {
    std::this_thread::sleep_for(10ms);
    p->deliver(7);
  });
  auto v = p->wait_for(2s);
  t.join();
  ASSERT_TRUE(v);
  EXPECT_EQ(*v, 7);
}

/**
 * @test Promise_ConcurrentDeliver_OneWinner
 * @brief Many racing deliverers: exactly one reports success.
 */
TEST(Promise, Promise_ConcurrentDeliver_OneWinner) {
  auto p = Promise<int>::make();
  std::atomic<int> wins{0};
  std::vector<std::thread> ts;
  for (int i = 0; i < 8; ++i) {
    ts.emplace_back([&, i] { if (p->deliver(i)) ++wins; });
  }
  for (auto& t : ts) t.join();
  EXPECT_EQ(wins.load(), 1);
}

// --------------------------- Channel ---------------------------------------

/**
 * @test Channel_Bounded_RejectsWhenFull
 * @brief A full channel refuses and leaves the rejected value with the caller.
 */
TEST(Channel, Channel_Bounded_RejectsWhenFull) {
  Channel<std::string> ch(2);
  std::string a = "a", b = "b", c = "c";
  EXPECT_EQ(ch.try_send(std::move(a)), SendResult::Ok);
  EXPECT_EQ(ch.try_send(std::move(b)), SendResult::Ok);
  EXPECT_EQ(ch.try_send(std::move(c)), SendResult::Full);
  EXPECT_EQ(c, "c");
  EXPECT_EQ(ch.size(), 2u);
  EXPECT_EQ(*ch.try_recv(), "a");
}

/**
 * @test Channel_Close_KeepsBuffered
 * @brief After close sends fail, buffered values are still received.
 */
TEST(Channel, Channel_Close_KeepsBuffered) {
  Channel<int> ch(4);
  ASSERT_EQ(ch.try_send(1), SendResult::Ok);
  ch.close();
  EXPECT_EQ(ch.try_send(2), SendResult::Closed);
  auto v = ch.recv_for(10ms);
  ASSERT_TRUE(v);
  EXPECT_EQ(*v, 1);
  EXPECT_FALSE(ch.recv_for(10ms));
}

// --------------------------- Executor / Timer ------------------------------

/**
 * @test Executor_RunsTasks_RefusesAfterShutdown
 */
TEST(Executor, Executor_RunsTasks_RefusesAfterShutdown) {
  Executor ex(2);
  EXPECT_EQ(ex.thread_count(), 2u);
  std::atomic<int> ran{0};
  for (int i = 0; i < 100; ++i) ASSERT_TRUE(ex.post([&] { ++ran; }));
  ex.shutdown();
  EXPECT_EQ(ran.load(), 100);
  EXPECT_FALSE(ex.post([] {}));
}

/**
 * @test Timer_OneShot_And_Cancel
 * @brief A cancelled entry never fires; an armed one fires once.
 */
TEST(Timer, Timer_OneShot_And_Cancel) {
  Timer t;
  std::atomic<int> fired{0}, cancelled{0};
  t.schedule_after(10ms, [&] { ++fired; });
  auto id = t.schedule_after(50ms, [&] { ++cancelled; });
  EXPECT_TRUE(t.cancel(id));
  EXPECT_TRUE(eventually([&] { return fired.load() == 1; }));
  std::this_thread::sleep_for(80ms);
  EXPECT_EQ(cancelled.load(), 0);
  EXPECT_EQ(fired.load(), 1);
}

/**
 * @test Timer_Periodic_StopsOnCancel
 */
TEST(Timer, Timer_Periodic_StopsOnCancel) {
  Timer t;
  std::atomic<int> ticks{0};
  auto id = t.schedule_every(5ms, [&] { ++ticks; });
  EXPECT_TRUE(eventually([&] { return ticks.load() >= 3; }));
  EXPECT_TRUE(t.cancel(id));
  std::this_thread::sleep_for(20ms);
  const int settled = ticks.load();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(ticks.load(), settled);
}

/**
 * @test Timer_AfterShutdown_NoTimer
 */
TEST(Timer, Timer_AfterShutdown_NoTimer) {
  Timer t;
  t.shutdown();
  EXPECT_EQ(t.schedule_after(1ms, [] {}), Timer::kNoTimer);
  EXPECT_FALSE(t.cancel(Timer::kNoTimer));
}

// --------------------------- Actor -----------------------------------------

/**
 * @test Actor_Fifo_And_SurvivesThrow
 * @brief Messages are handled in arrival order; a throwing handle() drops only that message.
 */
TEST(Actor, Actor_Fifo_And_SurvivesThrow) {
  Executor ex(4);
  auto a = std::make_shared<RecordingActor>(ex, 1024);
  for (int i = 0; i < 200; ++i) {
    ASSERT_EQ(a->tell(i == 50 ? -1 : int{i}), SendResult::Ok);
  }
  ASSERT_TRUE(eventually([&] { return a->seen().size() == 199; }));
  auto seen = a->seen();
  for (std::size_t i = 1; i < seen.size(); ++i) EXPECT_LT(seen[i - 1], seen[i]);
  a->stop();
  EXPECT_TRUE(eventually([&] { return a->terminated(); }));
}

/**
 * @test Actor_Stop_OvertakesData
 * @brief stop() while a turn is busy: queued data goes to on_exit() instead of handle().
 */
TEST(Actor, Actor_Stop_OvertakesData) {
  Executor ex(1);
  auto a = std::make_shared<RecordingActor>(ex, 2);
  std::promise<void> release;
  std::promise<void> entered;
  a->hold_first(release.get_future().share(), &entered);

  ASSERT_EQ(a->tell(1), SendResult::Ok);
  entered.get_future().wait();
  EXPECT_EQ(a->tell(2), SendResult::Ok);
  EXPECT_EQ(a->tell(3), SendResult::Ok);
  EXPECT_EQ(a->tell(4), SendResult::Full);
  a->stop();
  release.set_value();

  ASSERT_TRUE(eventually([&] { return a->exited(); }));
  EXPECT_TRUE(a->terminated());
  EXPECT_EQ(a->undelivered(), 2u);
  EXPECT_EQ(a->seen(), std::vector<int>{1});
  EXPECT_EQ(a->tell(5), SendResult::Closed);
}

/**
 * @test Actor_ExecutorGone_ExitsInline
 * @brief Telling an actor whose executor has shut down still runs on_exit().
 */
TEST(Actor, Actor_ExecutorGone_ExitsInline) {
  Executor ex(1);
  auto a = std::make_shared<RecordingActor>(ex, 8);
  ex.shutdown();
  EXPECT_EQ(a->tell(1), SendResult::Ok);
  EXPECT_TRUE(a->terminated());
  EXPECT_TRUE(a->exited());
  EXPECT_EQ(a->undelivered(), 1u);
}
