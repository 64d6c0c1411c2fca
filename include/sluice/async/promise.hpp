/**
 * @file promise.hpp
 * @brief Write-once reply cell shared between a requester and a responder.
 *
 * The first deliver() wins; later ones return false and change nothing. Both
 * sides may race to deliver (e.g. a responder's answer against the requester's
 * own timeout marker) and use the return value to learn who won.
 * Callbacks registered with on_deliver() run exactly once, on the delivering
 * thread (or immediately on the registering thread if already realized).
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace sluice::async {

template <class T>
class Promise final {
public:
  using Callback = std::function<void(const T&)>;

  /// Allocate a shared cell.
  static std::shared_ptr<Promise> make() { return std::make_shared<Promise>(); }

  /**
   * @brief Resolve the cell.
   * @return true if this call resolved it, false if it was already realized.
   */
  bool deliver(T v) {
    std::vector<Callback> callbacks;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (value_) return false;
      value_.emplace(std::move(v));
      callbacks.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto& cb : callbacks) cb(*value_);
    return true;
  }

  /// True once resolved.
  bool realized() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_.has_value();
  }

  /// Value if realized, std::nullopt otherwise (deref with zero timeout).
  std::optional<T> try_get() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_;
  }

  /// Wait up to @p timeout for resolution.
  template <class Rep, class Period>
  std::optional<T> wait_for(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return value_.has_value(); });
    return value_;
  }

  /// Run @p cb once the cell is resolved.
  void on_deliver(Callback cb) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!value_) {
        callbacks_.push_back(std::move(cb));
        return;
      }
    }
    cb(*value_);
  }

private:
  mutable std::mutex      mu_;
  mutable std::condition_variable cv_;
  std::optional<T>        value_;
  std::vector<Callback>   callbacks_;
};

template <class T>
using PromisePtr = std::shared_ptr<Promise<T>>;

} // namespace sluice::async
