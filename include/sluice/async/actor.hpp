/**
 * @file actor.hpp
 * @brief Mailbox-driven actor scheduled on a shared Executor.
 *
 * Concurrency model:
 *  - tell() enqueues into a bounded mailbox and schedules one turn on the executor
 *    if none is pending. A turn handles up to kMaxBatch messages, then yields.
 *  - At most one turn per actor runs at any time, so handle() never races with
 *    itself and messages are processed strictly in arrival order.
 *  - The control channel (Exit) is polled before every data message, so a stop
 *    request overtakes queued data. Data still queued at exit is handed to
 *    on_exit() so replies can be answered instead of dropped.
 *
 * Actors must be owned by std::shared_ptr (turns hold a strong reference).
 *
 * @tparam Message Inbound message type (typically a std::variant).
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "sluice/async/channel.hpp"
#include "sluice/async/executor.hpp"
#include "sluice/obs/logging.hpp"

namespace sluice::async {

/// Signals carried on an actor's control channel.
enum class ControlSignal : std::uint8_t { Exit };

template <class Message>
class Actor : public std::enable_shared_from_this<Actor<Message>> {
public:
  static constexpr std::size_t kMaxBatch = 64;

  Actor(std::string name, Executor& executor, std::size_t mailbox_capacity)
    : name_(std::move(name)), executor_(executor), mailbox_(mailbox_capacity) {}

  virtual ~Actor() = default;

  Actor(const Actor&)            = delete;
  Actor& operator=(const Actor&) = delete;

  /**
   * @brief Enqueue a message.
   * @return SendResult::Ok, or Full/Closed with @p msg left untouched.
   */
  SendResult tell(Message&& msg) {
    const auto r = mailbox_.try_send(std::move(msg));
    if (r == SendResult::Ok) schedule();
    return r;
  }

  /// Ask the actor to exit before its next data message.
  void stop() {
    if (control_.try_send(ControlSignal::Exit) == SendResult::Ok) schedule();
  }

  [[nodiscard]] bool terminated() const noexcept { return terminated_.load(std::memory_order_acquire); }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] std::size_t pending() const { return mailbox_.size(); }

protected:
  /// Process one message. Runs on an executor worker, never concurrently.
  virtual void handle(Message& msg) = 0;

  /// Called once, inside the final turn, with data messages that will never be handled.
  virtual void on_exit(std::deque<Message>& undelivered) { (void)undelivered; }

  /// Request termination after the current message (from inside handle()).
  void exit_after_current() noexcept { exit_requested_ = true; }

private:
  void schedule() {
    if (scheduled_.exchange(true, std::memory_order_acq_rel)) return;
    auto self = this->shared_from_this();
    if (!executor_.post([self] { self->run_turn(); })) {
      // Executor is shutting down: finish here so replies are still answered.
      run_exit();
    }
  }

  void run_turn() {
    if (terminated()) return;
    for (std::size_t n = 0; n < kMaxBatch; ++n) {
      if (auto sig = control_.try_recv(); sig && *sig == ControlSignal::Exit) {
        run_exit();
        return;
      }
      auto msg = mailbox_.try_recv();
      if (!msg) break;
      try {
        handle(*msg);
      } catch (const std::exception& e) {
        // Invariant violation: drop the message, keep serving.
        obs::logger()->error("actor {} dropped message: {}", name_, e.what());
      }
      if (exit_requested_) {
        run_exit();
        return;
      }
    }
    scheduled_.store(false, std::memory_order_release);
    if ((!mailbox_.empty() || !control_.empty()) && !scheduled_.exchange(true, std::memory_order_acq_rel)) {
      auto self = this->shared_from_this();
      if (!executor_.post([self] { self->run_turn(); })) run_exit();
    }
  }

  void run_exit() {
    if (terminated_.exchange(true, std::memory_order_acq_rel)) return;
    mailbox_.close();
    control_.close();
    auto rest = mailbox_.drain();
    on_exit(rest);
  }

  std::string            name_;
  Executor&              executor_;
  Channel<Message>       mailbox_;
  Channel<ControlSignal> control_{4};
  std::atomic<bool>      scheduled_{false};
  std::atomic<bool>      terminated_{false};
  bool                   exit_requested_{false}; ///< Touched only inside turns
};

} // namespace sluice::async
