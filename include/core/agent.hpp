#pragma once

#include <memory>

#include "core/cancellation.hpp"
#include "core/cloud_link.hpp"
#include "core/config.hpp"
#include "core/machine_link.hpp"
#include "core/machine_state.hpp"
#include "core/router.hpp"
#include "rpc/dispatcher.hpp"
#include "tunnel/rtc_service.hpp"
#include "tunnel/video_relay.hpp"

namespace glonax_agent::core {

// Owns every piece of runtime state: the machine state cache, the signal and
// command queues, the RTC service and the two links.
class Agent {
 public:
  explicit Agent(AgentConfig config = {});
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Runs the machine link, the signal pump and, when a base URL is set, the
  // cloud link. Blocks until the token is cancelled, then shuts down.
  void run(const CancellationToken& token);

  [[nodiscard]] const rpc::Dispatcher& dispatcher() const noexcept { return dispatcher_; }
  [[nodiscard]] const MachineState& machine_state() const noexcept { return machine_state_; }

 private:
  void register_methods();

  AgentConfig config_;
  MachineState machine_state_{};
  SignalChannel signals_;
  CommandChannel commands_;
  tunnel::VideoRelay video_relay_{};
  tunnel::RtcService rtc_service_;
  rpc::Dispatcher dispatcher_{};
  Router router_;
  MachineLink machine_link_;
  SignalForwarder forwarder_;
  std::unique_ptr<CloudLink> cloud_link_{};
};

}  // namespace glonax_agent::core
