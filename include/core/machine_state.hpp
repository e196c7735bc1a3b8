#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/cancellation.hpp"
#include "model/messages.hpp"
#include "rpc/dispatcher.hpp"

namespace glonax_agent::core {

// Last known machine identity and signal values, shared between the machine
// link, the cloud link and the introspection RPCs.
class MachineState {
 public:
  void set_instance(const model::Instance& instance);
  void update(const model::Signal& signal);

  [[nodiscard]] std::optional<model::Instance> instance() const;
  [[nodiscard]] std::optional<model::Engine> engine() const;
  [[nodiscard]] std::optional<model::Motion> motion() const;
  [[nodiscard]] std::optional<model::ModuleStatus> module_status(const std::string& name) const;
  [[nodiscard]] std::vector<model::ModuleStatus> module_statuses() const;

  // Blocks until the instance is known. Returns nullopt when cancelled first.
  std::optional<model::Instance> wait_for_instance(const CancellationToken& token) const;

  // Registers glonax_instance, glonax_engine, glonax_motion and
  // glonax_module_status. Each returns null while nothing is cached.
  void register_methods(rpc::Dispatcher& dispatcher);

 private:
  mutable std::mutex mutex_{};
  mutable std::condition_variable instance_cv_{};
  std::optional<model::Instance> instance_{};
  std::optional<model::Engine> engine_{};
  std::optional<model::Motion> motion_{};
  std::map<std::string, model::ModuleStatus> module_statuses_{};
};

}  // namespace glonax_agent::core
