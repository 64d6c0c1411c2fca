/**
 * @file executor.cpp
 * @brief Worker pool implementation.
 */
#include "sluice/async/executor.hpp"

#include <algorithm>
#include <exception>

#include "sluice/obs/logging.hpp"

namespace sluice::async {

Executor::Executor(std::size_t threads) {
    const auto n = std::max<std::size_t>(1, threads);
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

Executor::~Executor() {
    shutdown();
}

bool Executor::post(Task task) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void Executor::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (!w.joinable()) continue;
        // A task that triggers shutdown cannot join its own worker.
        if (w.get_id() == std::this_thread::get_id()) w.detach();
        else w.join();
    }
    std::lock_guard<std::mutex> lk(mu_);
    workers_.clear();
}

void Executor::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return; // stopping and drained
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            obs::logger()->error("executor task failed: {}", e.what());
        }
    }
}

} // namespace sluice::async
