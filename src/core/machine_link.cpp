#include "core/machine_link.hpp"

#include <exception>
#include <iostream>
#include <thread>
#include <utility>
#include <variant>

#include "model/json_codec.hpp"
#include "protocol/byte_stream.hpp"
#include "protocol/frame.hpp"

namespace glonax_agent::core {

MachineLink::MachineLink(MachineLinkOptions options, MachineConnector connector, MachineState& state,
                         SignalChannel& signals, CommandChannel& commands)
    : options_(options), connector_(std::move(connector)), state_(state), signals_(signals), commands_(commands) {}

void MachineLink::run(const CancellationToken& token) {
  while (!token.cancelled()) {
    run_once(token);
    if (token.wait_for(options_.reconnect_delay)) {
      break;
    }
  }
}

bool MachineLink::run_once(const CancellationToken& token) {
  std::shared_ptr<session::Session> session;
  try {
    session = connector_();
  } catch (const protocol::ConnectionError& ex) {
    std::cerr << "[machine] connect failed: " << ex.what() << '\n';
    return false;
  }

  {
    const std::lock_guard<std::mutex> lock(session_mutex_);
    session_ = session;
  }
  if (token.cancelled()) {
    session->interrupt();
  }

  try {
    if (session->state() == session::SessionState::HANDSHAKING) {
      session->handshake();
    }
  } catch (const std::runtime_error& ex) {
    if (!token.cancelled()) {
      std::cerr << "[machine] handshake failed: " << ex.what() << '\n';
    }
    release(*session);
    return false;
  }

  const model::Instance instance = session->instance().value_or(model::Instance{});
  std::cerr << "[machine] connected to " << instance.id.to_string() << " (" << instance.model << ", "
            << model::machine_type_name(instance.machine_type) << ", " << instance.version_string() << ")\n";
  state_.set_instance(instance);

  CancellationToken link;
  std::thread command_pump([this, session, &token, &link] { pump_commands(*session, token, link); });

  read_signals(*session, token);

  link.cancel();
  join_or_detach(command_pump);

  release(*session);
  std::cerr << "[machine] session closed\n";
  return true;
}

void MachineLink::release(session::Session& session) {
  {
    const std::lock_guard<std::mutex> lock(session_mutex_);
    session_.reset();
  }
  session.close();
}

void MachineLink::interrupt() noexcept {
  const std::lock_guard<std::mutex> lock(session_mutex_);
  if (session_ != nullptr) {
    session_->interrupt();
  }
}

void MachineLink::read_signals(session::Session& session, const CancellationToken& token) {
  while (!token.cancelled()) {
    std::optional<model::Signal> signal;
    try {
      signal = session.recv();
    } catch (const protocol::ConnectionError& ex) {
      if (!token.cancelled()) {
        std::cerr << "[machine] connection lost: " << ex.what() << '\n';
      }
      return;
    } catch (const protocol::ProtocolError& ex) {
      std::cerr << "[machine] protocol error: " << ex.what() << '\n';
      return;
    }

    if (!signal.has_value()) {
      continue;
    }

    state_.update(*signal);
    if (options_.log_signals) {
      std::cerr << "[machine] " << signal->topic << ' ' << model::to_text(nlohmann::json(signal->payload)) << '\n';
    }

    const std::string topic = signal->topic;
    const PushResult result = signals_.try_push(std::move(*signal));
    if (result == PushResult::FULL) {
      ++dropped_signals_;
      std::cerr << "[machine] signal queue full, dropping '" << topic << "'\n";
    } else if (result == PushResult::CLOSED) {
      return;
    }
  }
}

void MachineLink::pump_commands(session::Session& session, const CancellationToken& token,
                                const CancellationToken& link) {
  while (!token.cancelled() && !link.cancelled()) {
    auto message = commands_.pop(std::chrono::milliseconds(100));
    if (!message.has_value()) {
      if (commands_.closed()) {
        return;
      }
      continue;
    }

    try {
      if (!apply_command(session, *message)) {
        std::cerr << "[machine] dropping command '" << message->topic << "' with unsupported payload\n";
      }
    } catch (const std::exception& ex) {
      std::cerr << "[machine] command write failed: " << ex.what() << '\n';
      session.interrupt();
      return;
    }
  }
}

bool MachineLink::apply_command(session::Session& session, const model::ChannelMessage& message) {
  if (const auto* motion = std::get_if<model::Motion>(&message.payload)) {
    session.send_motion(*motion);
    return true;
  }
  if (const auto* control = std::get_if<model::Control>(&message.payload)) {
    session.send_control(*control);
    return true;
  }
  if (const auto* engine = std::get_if<model::Engine>(&message.payload)) {
    session.send_engine(*engine);
    return true;
  }
  return false;
}

}  // namespace glonax_agent::core
