#pragma once
/**
 * @file timer.hpp
 * @brief Single-threaded deadline scheduler.
 *
 * Callbacks run on the timer thread and must stay short: post a message to an
 * actor or deliver a promise, nothing more. Periodic entries keep their id
 * across re-arms so a single cancel() stops them.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace sluice::async {

class Timer final {
public:
    using Clock    = std::chrono::steady_clock;
    using TimerId  = std::uint64_t;
    using Callback = std::function<void()>;

    /// Id never handed out; safe "no timer" marker.
    static constexpr TimerId kNoTimer = 0;

    Timer();
    ~Timer();

    Timer(const Timer&)            = delete;
    Timer& operator=(const Timer&) = delete;

    /// Run @p fn once after @p delay. Returns kNoTimer after shutdown.
    TimerId schedule_after(Clock::duration delay, Callback fn);

    /// Run @p fn once at @p when.
    TimerId schedule_at(Clock::time_point when, Callback fn);

    /// Run @p fn every @p interval, first after one interval.
    TimerId schedule_every(Clock::duration interval, Callback fn);

    /// Cancel a pending or periodic entry. Returns false if it already fired or is unknown.
    bool cancel(TimerId id);

    /// Drop pending entries and join the timer thread. Idempotent.
    void shutdown() noexcept;

    /// Number of armed entries (observer).
    [[nodiscard]] std::size_t pending() const;

private:
    struct Entry {
        Callback         fn;
        Clock::duration  interval{Clock::duration::zero()};
    };
    using Key = std::pair<Clock::time_point, TimerId>;

    TimerId arm(Clock::time_point when, Clock::duration interval, Callback fn);
    void run();

    mutable std::mutex                    mu_;
    std::condition_variable               cv_;
    std::map<Key, Entry>                  queue_;   ///< Ordered by deadline then id
    std::unordered_map<TimerId, Key>      index_;   ///< id -> queue_ key
    TimerId                               next_id_{1};
    bool                                  stopping_{false};
    std::thread                           thread_;
};

} // namespace sluice::async
