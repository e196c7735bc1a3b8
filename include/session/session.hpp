#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "model/messages.hpp"
#include "protocol/byte_stream.hpp"
#include "protocol/frame.hpp"

namespace glonax_agent::session {

inline constexpr const char* kDefaultUserAgent = "glonax-agent/1.0";

enum class SessionState : std::uint8_t {
  UNCONNECTED,
  HANDSHAKING,
  ESTABLISHED,
  CLOSED,
};

const char* session_state_name(SessionState state);

// One framed connection to the machine daemon.
//
// Reads are expected from a single thread. Writes may come from any thread
// and are serialized so frames never interleave on the wire. interrupt() and
// close() are safe to call concurrently with a blocked read.
class Session {
 public:
  explicit Session(std::unique_ptr<protocol::ByteStream> stream, std::string user_agent = kDefaultUserAgent);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Connects the transport; the returned session is HANDSHAKING.
  static std::unique_ptr<Session> open(const protocol::StreamAddress& address,
                                       std::string user_agent = kDefaultUserAgent);

  // Sends SESSION, then requires INSTANCE as the first inbound frame.
  const model::Instance& handshake();

  // Next typed signal, or nullopt for frames that carry no signal.
  std::optional<model::Signal> recv();

  protocol::Frame recv_frame();
  void write_frame(const protocol::Frame& frame);

  void send_control(const model::Control& control);
  void send_engine(const model::Engine& engine);
  void send_motion(const model::Motion& motion);

  void machine_horn(bool value);
  void machine_lights(bool value);
  void machine_illumination(bool value);
  void machine_shutdown();
  void machine_strobe_light(bool value);
  void machine_travel_alarm(bool value);

  void hydraulic_lock(bool value);
  void hydraulic_quick_disconnect(bool value);
  void hydraulic_boost(bool value);
  void hydraulic_boom_conflux(bool value);
  void hydraulic_arm_conflux(bool value);
  void hydraulic_boom_float(bool value);

  void engine_request(std::uint16_t rpm);
  void engine_shutdown();

  void motion_stop_all();
  void motion_resume_all();
  void motion_reset_all();
  void motion_straight_drive(std::int16_t value);

  // Unblocks a pending recv from another thread without closing the socket.
  void interrupt() noexcept;

  // Idempotent.
  void close() noexcept;

  [[nodiscard]] SessionState state() const noexcept { return state_.load(); }
  [[nodiscard]] bool is_established() const noexcept { return state() == SessionState::ESTABLISHED; }
  [[nodiscard]] const std::optional<model::Instance>& instance() const noexcept { return instance_; }
  [[nodiscard]] const std::string& user_agent() const noexcept { return user_agent_; }

 private:
  void require_state(SessionState expected, const char* operation) const;
  void send_frame(const protocol::Frame& frame);

  std::unique_ptr<protocol::ByteStream> stream_;
  std::string user_agent_;
  std::atomic<SessionState> state_{SessionState::UNCONNECTED};
  std::optional<model::Instance> instance_{};
  std::mutex write_mutex_{};
};

}  // namespace glonax_agent::session
