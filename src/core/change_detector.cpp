#include "core/change_detector.hpp"

#include <variant>

namespace glonax_agent::core {

std::string ChangeDetector::key_for(const model::Signal& signal) {
  if (const auto* status = std::get_if<model::ModuleStatus>(&signal.payload)) {
    return signal.topic + "/" + status->name;
  }
  return signal.topic;
}

bool ChangeDetector::should_send(const model::Signal& signal, const Clock::time_point now) {
  const std::string key = key_for(signal);

  const auto it = last_sent_.find(key);
  if (it != last_sent_.end() && it->second.payload == signal.payload && now - it->second.sent_at < staleness_) {
    return false;
  }

  last_sent_.insert_or_assign(key, Entry{signal.payload, now});
  return true;
}

}  // namespace glonax_agent::core
