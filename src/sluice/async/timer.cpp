/**
 * @file timer.cpp
 * @brief Deadline scheduler backed by an ordered map.
 */
#include "sluice/async/timer.hpp"

#include <algorithm>
#include <exception>

#include "sluice/obs/logging.hpp"

namespace sluice::async {

Timer::Timer() : thread_([this] { run(); }) {}

Timer::~Timer() {
    shutdown();
}

Timer::TimerId Timer::schedule_after(Clock::duration delay, Callback fn) {
    return arm(Clock::now() + delay, Clock::duration::zero(), std::move(fn));
}

Timer::TimerId Timer::schedule_at(Clock::time_point when, Callback fn) {
    return arm(when, Clock::duration::zero(), std::move(fn));
}

Timer::TimerId Timer::schedule_every(Clock::duration interval, Callback fn) {
    if (interval <= Clock::duration::zero()) interval = std::chrono::milliseconds(1);
    return arm(Clock::now() + interval, interval, std::move(fn));
}

Timer::TimerId Timer::arm(Clock::time_point when, Clock::duration interval, Callback fn) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return kNoTimer;
        id = next_id_++;
        const Key key{when, id};
        queue_.emplace(key, Entry{std::move(fn), interval});
        index_.emplace(id, key);
    }
    cv_.notify_one();
    return id;
}

bool Timer::cancel(TimerId id) {
    if (id == kNoTimer) return false;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(id);
    if (it == index_.end()) return false;
    queue_.erase(it->second);
    index_.erase(it);
    return true;
}

void Timer::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
        queue_.clear();
        index_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) thread_.detach();
        else thread_.join();
    }
}

std::size_t Timer::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

void Timer::run() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            continue;
        }
        const auto deadline = queue_.begin()->first.first;
        if (Clock::now() < deadline) {
            cv_.wait_until(lk, deadline);
            continue;
        }

        auto node = queue_.extract(queue_.begin());
        const TimerId id = node.key().second;
        Callback fn;
        if (node.mapped().interval > Clock::duration::zero()) {
            // Re-arm before running so cancel() from inside the callback sees it.
            fn = node.mapped().fn;
            const Key next{std::max(deadline + node.mapped().interval, Clock::now()), id};
            node.key() = next;
            queue_.insert(std::move(node));
            index_[id] = next;
        } else {
            fn = std::move(node.mapped().fn);
            index_.erase(id);
        }

        lk.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            obs::logger()->error("timer callback {} failed: {}", id, e.what());
        }
        lk.lock();
    }
}

} // namespace sluice::async
