#include "core/machine_state.hpp"

#include <chrono>
#include <variant>

#include "model/json_codec.hpp"

namespace glonax_agent::core {

namespace {

template <typename T>
nlohmann::json to_json_or_null(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return nlohmann::json(*value);
}

}  // namespace

void MachineState::set_instance(const model::Instance& instance) {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    instance_ = instance;
  }
  instance_cv_.notify_all();
}

void MachineState::update(const model::Signal& signal) {
  if (const auto* instance = std::get_if<model::Instance>(&signal.payload)) {
    set_instance(*instance);
    return;
  }

  const std::lock_guard<std::mutex> lock(mutex_);
  if (const auto* engine = std::get_if<model::Engine>(&signal.payload)) {
    engine_ = *engine;
  } else if (const auto* motion = std::get_if<model::Motion>(&signal.payload)) {
    motion_ = *motion;
  } else if (const auto* status = std::get_if<model::ModuleStatus>(&signal.payload)) {
    module_statuses_.insert_or_assign(status->name, *status);
  }
}

std::optional<model::Instance> MachineState::instance() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return instance_;
}

std::optional<model::Engine> MachineState::engine() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return engine_;
}

std::optional<model::Motion> MachineState::motion() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return motion_;
}

std::optional<model::ModuleStatus> MachineState::module_status(const std::string& name) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = module_statuses_.find(name);
  if (it == module_statuses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::ModuleStatus> MachineState::module_statuses() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::ModuleStatus> statuses;
  statuses.reserve(module_statuses_.size());
  for (const auto& [_, status] : module_statuses_) {
    statuses.push_back(status);
  }
  return statuses;
}

std::optional<model::Instance> MachineState::wait_for_instance(const CancellationToken& token) const {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!instance_.has_value()) {
    if (token.cancelled()) {
      return std::nullopt;
    }
    instance_cv_.wait_for(lock, std::chrono::milliseconds(100));
  }
  return instance_;
}

void MachineState::register_methods(rpc::Dispatcher& dispatcher) {
  dispatcher.add("glonax_instance", [this] { return to_json_or_null(instance()); });
  dispatcher.add("glonax_engine", [this] { return to_json_or_null(engine()); });
  dispatcher.add("glonax_motion", [this] { return to_json_or_null(motion()); });
  dispatcher.add("glonax_module_status", {"name"},
                 [this](const std::string& name) { return to_json_or_null(module_status(name)); });
}

}  // namespace glonax_agent::core
