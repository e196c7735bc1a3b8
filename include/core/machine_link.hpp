#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

#include "core/cancellation.hpp"
#include "core/channel.hpp"
#include "core/machine_state.hpp"
#include "core/router.hpp"
#include "model/messages.hpp"
#include "session/session.hpp"

namespace glonax_agent::core {

using SignalChannel = BoundedChannel<model::Signal>;

// Returns a connected session, usually before its handshake, or throws
// protocol::ConnectionError. run_once() completes a pending handshake.
using MachineConnector = std::function<std::unique_ptr<session::Session>()>;

struct MachineLinkOptions {
  std::chrono::milliseconds reconnect_delay{1000};
  bool log_signals{false};
};

// Keeps one session to the machine daemon alive. While connected, inbound
// signals feed the machine state and the signal queue, and the command queue
// is drained into the session.
class MachineLink {
 public:
  MachineLink(MachineLinkOptions options, MachineConnector connector, MachineState& state, SignalChannel& signals,
              CommandChannel& commands);

  MachineLink(const MachineLink&) = delete;
  MachineLink& operator=(const MachineLink&) = delete;

  // Reconnect loop. Returns once the token is cancelled.
  void run(const CancellationToken& token);

  // Serves a single connection until it fails or the token is cancelled.
  // Returns false if the connection could not be established.
  bool run_once(const CancellationToken& token);

  // Wakes the reader of the current session, if any, including one that is
  // still waiting for the INSTANCE reply.
  void interrupt() noexcept;

  [[nodiscard]] std::size_t dropped_signals() const noexcept { return dropped_signals_.load(); }

  // Writes a COMMAND or CONTROL envelope to the session by payload type.
  // Returns false for payloads the machine does not accept.
  static bool apply_command(session::Session& session, const model::ChannelMessage& message);

 private:
  void read_signals(session::Session& session, const CancellationToken& token);
  void pump_commands(session::Session& session, const CancellationToken& token, const CancellationToken& link);
  void release(session::Session& session);

  MachineLinkOptions options_;
  MachineConnector connector_;
  MachineState& state_;
  SignalChannel& signals_;
  CommandChannel& commands_;

  std::mutex session_mutex_{};
  std::shared_ptr<session::Session> session_{};
  std::atomic<std::size_t> dropped_signals_{0};
};

}  // namespace glonax_agent::core
