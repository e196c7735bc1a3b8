#include "session/session.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "protocol/payload.hpp"
#include "session/message_factory.hpp"

namespace glonax_agent::session {

using protocol::Frame;
using protocol::MessageType;

const char* session_state_name(const SessionState state) {
  switch (state) {
    case SessionState::UNCONNECTED:
      return "unconnected";
    case SessionState::HANDSHAKING:
      return "handshaking";
    case SessionState::ESTABLISHED:
      return "established";
    case SessionState::CLOSED:
      return "closed";
  }
  return "unconnected";
}

Session::Session(std::unique_ptr<protocol::ByteStream> stream, std::string user_agent)
    : stream_(std::move(stream)), user_agent_(std::move(user_agent)) {
  if (stream_ != nullptr && stream_->is_open()) {
    state_ = SessionState::HANDSHAKING;
  }
}

Session::~Session() { close(); }

std::unique_ptr<Session> Session::open(const protocol::StreamAddress& address, std::string user_agent) {
  return std::make_unique<Session>(protocol::connect_stream(address), std::move(user_agent));
}

const model::Instance& Session::handshake() {
  require_state(SessionState::HANDSHAKING, "handshake");

  send_frame(Frame(MessageType::SESSION, protocol::session_to_bytes(user_agent_)));

  const Frame frame = protocol::read_frame(*stream_);
  if (!frame.is(MessageType::INSTANCE)) {
    throw protocol::ProtocolError(std::string("expected INSTANCE during handshake, received ") +
                                  protocol::message_type_name(frame.type));
  }

  instance_ = protocol::instance_from_bytes(frame.payload);
  state_ = SessionState::ESTABLISHED;
  return *instance_;
}

std::optional<model::Signal> Session::recv() {
  const Frame frame = recv_frame();
  auto decoded = decode_message(frame);
  if (auto* signal = std::get_if<model::Signal>(&decoded)) {
    return std::move(*signal);
  }

  const auto& ignored = std::get<Ignored>(decoded);
  if (ignored.reason != IgnoreReason::NOT_IMPLEMENTED) {
    std::cerr << "[session] ignoring " << protocol::message_type_name(ignored.type) << " frame (0x" << std::hex
              << static_cast<int>(ignored.type) << std::dec << "): " << ignore_reason_name(ignored.reason) << '\n';
  }
  return std::nullopt;
}

Frame Session::recv_frame() {
  require_state(SessionState::ESTABLISHED, "recv");
  return protocol::read_frame(*stream_);
}

void Session::write_frame(const Frame& frame) {
  require_state(SessionState::ESTABLISHED, "write");
  send_frame(frame);
}

void Session::send_control(const model::Control& control) {
  write_frame(Frame(MessageType::CONTROL, protocol::to_bytes(control)));
}

void Session::send_engine(const model::Engine& engine) {
  write_frame(Frame(MessageType::ENGINE, protocol::to_bytes(engine)));
}

void Session::send_motion(const model::Motion& motion) {
  write_frame(Frame(MessageType::MOTION, protocol::to_bytes(motion)));
}

void Session::machine_horn(const bool value) { send_control({model::ControlType::MACHINE_HORN, value}); }

void Session::machine_lights(const bool value) { send_control({model::ControlType::MACHINE_LIGHTS, value}); }

void Session::machine_illumination(const bool value) {
  send_control({model::ControlType::MACHINE_ILLUMINATION, value});
}

void Session::machine_shutdown() { send_control({model::ControlType::MACHINE_SHUTDOWN, true}); }

void Session::machine_strobe_light(const bool value) {
  send_control({model::ControlType::MACHINE_STROBE_LIGHT, value});
}

void Session::machine_travel_alarm(const bool value) {
  send_control({model::ControlType::MACHINE_TRAVEL_ALARM, value});
}

void Session::hydraulic_lock(const bool value) { send_control({model::ControlType::HYDRAULIC_LOCK, value}); }

void Session::hydraulic_quick_disconnect(const bool value) {
  send_control({model::ControlType::HYDRAULIC_QUICK_DISCONNECT, value});
}

void Session::hydraulic_boost(const bool value) { send_control({model::ControlType::HYDRAULIC_BOOST, value}); }

void Session::hydraulic_boom_conflux(const bool value) {
  send_control({model::ControlType::HYDRAULIC_BOOM_CONFLUX, value});
}

void Session::hydraulic_arm_conflux(const bool value) {
  send_control({model::ControlType::HYDRAULIC_ARM_CONFLUX, value});
}

void Session::hydraulic_boom_float(const bool value) {
  send_control({model::ControlType::HYDRAULIC_BOOM_FLOAT, value});
}

void Session::engine_request(const std::uint16_t rpm) { send_engine(model::Engine::request_rpm(rpm)); }

void Session::engine_shutdown() { send_engine(model::Engine::shutdown()); }

void Session::motion_stop_all() { send_motion(model::Motion::stop_all()); }

void Session::motion_resume_all() { send_motion(model::Motion::resume_all()); }

void Session::motion_reset_all() { send_motion(model::Motion::reset_all()); }

void Session::motion_straight_drive(const std::int16_t value) { send_motion(model::Motion::straight(value)); }

void Session::interrupt() noexcept {
  if (stream_ != nullptr) {
    stream_->shutdown();
  }
}

void Session::close() noexcept {
  if (state_.exchange(SessionState::CLOSED) == SessionState::CLOSED) {
    return;
  }
  if (stream_ != nullptr) {
    stream_->shutdown();
    stream_->close();
  }
}

void Session::require_state(const SessionState expected, const char* operation) const {
  const SessionState current = state();
  if (current == SessionState::CLOSED) {
    throw protocol::ConnectionError(std::string(operation) + " on closed session");
  }
  if (current != expected) {
    throw std::logic_error(std::string(operation) + " requires " + session_state_name(expected) + " session, state is " +
                           session_state_name(current));
  }
}

void Session::send_frame(const Frame& frame) {
  const std::lock_guard<std::mutex> lock(write_mutex_);
  protocol::write_frame(*stream_, frame);
}

}  // namespace glonax_agent::session
