#pragma once
/**
 * @file executor.hpp
 * @brief Fixed-size worker pool running actor turns and short callbacks.
 *
 * Tasks run in FIFO submission order per worker pick-up; there is no ordering
 * guarantee between tasks executed by different workers. Actors obtain their
 * per-actor serialization from their own scheduling flag (see actor.hpp).
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sluice::async {

class Executor final {
public:
    using Task = std::function<void()>;

    /// Start @p threads workers (at least one).
    explicit Executor(std::size_t threads);

    /// Stops accepting work, runs what is already queued, joins workers.
    ~Executor();

    Executor(const Executor&)            = delete;
    Executor& operator=(const Executor&) = delete;

    /// Queue a task. Returns false once shutdown has begun.
    bool post(Task task);

    /// Begin shutdown and join workers. Idempotent.
    void shutdown() noexcept;

    [[nodiscard]] std::size_t thread_count() const noexcept { return workers_.size(); }

private:
    void worker_loop();

    std::mutex              mu_;
    std::condition_variable cv_;
    std::deque<Task>        tasks_;
    bool                    stopping_{false};
    std::vector<std::thread> workers_;
};

} // namespace sluice::async
