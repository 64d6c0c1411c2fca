/**
 * @file channel.hpp
 * @brief Bounded multi-producer/single-consumer channel.
 *
 * Design goals:
 *  - Bounded: a full channel rejects instead of growing (back-pressure to the sender).
 *  - A rejected send leaves the value with the caller (rvalue is only moved on success),
 *    so the caller can still answer any reply cell the message carries.
 *  - close() wakes receivers; further sends fail, buffered values remain receivable.
 *
 * @tparam T Element type. Must be nothrow-movable.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace sluice::async {

/// Outcome of a send attempt.
enum class SendResult : std::uint8_t {
  Ok = 0,   ///< Value enqueued
  Full,     ///< Capacity reached, value not consumed
  Closed    ///< Channel closed, value not consumed
};

template <class T>
class Channel final {
  static_assert(std::is_nothrow_move_constructible_v<T>,
                "Channel elements must be nothrow-movable");

public:
  using value_type = T;

  /// @param capacity Maximum buffered elements (0 is treated as 1).
  explicit Channel(std::size_t capacity) noexcept
    : capacity_(capacity == 0 ? 1 : capacity) {}

  Channel(const Channel&)            = delete;
  Channel& operator=(const Channel&) = delete;

  /**
   * @brief Enqueue without blocking.
   * @param v Value to move in; untouched unless the result is SendResult::Ok.
   */
  SendResult try_send(T&& v) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return SendResult::Closed;
      if (buf_.size() >= capacity_) return SendResult::Full;
      buf_.push_back(std::move(v));
    }
    cv_.notify_one();
    return SendResult::Ok;
  }

  /// @brief Dequeue without blocking.
  std::optional<T> try_recv() {
    std::lock_guard<std::mutex> lk(mu_);
    if (buf_.empty()) return std::nullopt;
    std::optional<T> out{std::move(buf_.front())};
    buf_.pop_front();
    return out;
  }

  /**
   * @brief Dequeue, waiting up to @p timeout for a value.
   * @return std::nullopt on timeout or when closed and drained.
   */
  template <class Rep, class Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return closed_ || !buf_.empty(); });
    if (buf_.empty()) return std::nullopt;
    std::optional<T> out{std::move(buf_.front())};
    buf_.pop_front();
    return out;
  }

  /// @brief Reject further sends and wake waiting receivers.
  void close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  /// @brief Remove and return everything buffered.
  std::deque<T> drain() {
    std::lock_guard<std::mutex> lk(mu_);
    std::deque<T> out;
    out.swap(buf_);
    return out;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return buf_.empty();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return buf_.size();
  }

  std::size_t capacity() const noexcept { return capacity_; }

private:
  mutable std::mutex      mu_;
  std::condition_variable cv_;
  std::deque<T>           buf_;
  const std::size_t       capacity_;
  bool                    closed_{false};
};

} // namespace sluice::async
