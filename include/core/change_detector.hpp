#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

#include "model/messages.hpp"

namespace glonax_agent::core {

// Suppresses signals whose payload equals the last one sent under the same
// key, until that send is older than the staleness window. Module statuses
// are keyed per module name, everything else per topic.
class ChangeDetector {
 public:
  using Clock = std::chrono::steady_clock;

  explicit ChangeDetector(std::chrono::milliseconds staleness = std::chrono::seconds(5)) : staleness_(staleness) {}

  // Returns true when the signal should be sent and records it as sent.
  bool should_send(const model::Signal& signal, Clock::time_point now = Clock::now());

  void reset() { last_sent_.clear(); }

  [[nodiscard]] std::size_t tracked_keys() const noexcept { return last_sent_.size(); }

  static std::string key_for(const model::Signal& signal);

 private:
  struct Entry {
    model::Payload payload;
    Clock::time_point sent_at;
  };

  std::chrono::milliseconds staleness_;
  std::unordered_map<std::string, Entry> last_sent_{};
};

}  // namespace glonax_agent::core
