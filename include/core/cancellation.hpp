#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace glonax_agent::core {

// Shared stop signal. Every loop waits on it instead of sleeping so that a
// cancel is observed promptly.
class CancellationToken {
 public:
  void cancel() {
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool cancelled() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Returns true when cancelled before the timeout elapsed.
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
  }

  void wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_; });
  }

 private:
  mutable std::mutex mutex_{};
  mutable std::condition_variable cv_{};
  bool cancelled_{false};
};

// Joins the thread unless the caller is that thread, in which case it is
// detached and finishes on its own.
inline void join_or_detach(std::thread& thread) {
  if (!thread.joinable()) {
    return;
  }
  if (thread.get_id() == std::this_thread::get_id()) {
    thread.detach();
  } else {
    thread.join();
  }
}

}  // namespace glonax_agent::core
