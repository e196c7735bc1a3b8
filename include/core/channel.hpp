#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "core/cancellation.hpp"

namespace glonax_agent::core {

enum class PushResult : std::uint8_t {
  OK,
  FULL,
  CLOSED,
};

inline const char* push_result_name(const PushResult result) {
  switch (result) {
    case PushResult::OK:
      return "ok";
    case PushResult::FULL:
      return "full";
    case PushResult::CLOSED:
      return "closed";
  }
  return "closed";
}

// Bounded multi-producer queue. Producers never block: a full queue rejects
// the newest item and the caller decides what to log.
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  PushResult try_push(T item) {
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return PushResult::CLOSED;
      }
      if (items_.size() >= capacity_) {
        return PushResult::FULL;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return PushResult::OK;
  }

  // Waits up to timeout for an item. Returns nullopt on timeout or when the
  // channel is closed and drained.
  template <typename Rep, typename Period>
  std::optional<T> pop(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
      return std::nullopt;
    }
    return take_front();
  }

  // Polls in short slices so a cancelled token ends the wait.
  std::optional<T> pop(const CancellationToken& token,
                       const std::chrono::milliseconds slice = std::chrono::milliseconds(100)) {
    while (!token.cancelled()) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, slice, [this] { return closed_ || !items_.empty(); })) {
          return take_front();
        }
      }
    }
    return std::nullopt;
  }

  std::optional<T> try_pop() {
    const std::lock_guard<std::mutex> lock(mutex_);
    return take_front();
  }

  void close() {
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

 private:
  std::optional<T> take_front() {
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_{};
  std::condition_variable cv_{};
  std::deque<T> items_{};
  bool closed_{false};
};

}  // namespace glonax_agent::core
