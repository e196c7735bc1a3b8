#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/cancellation.hpp"
#include "model/messages.hpp"
#include "session/session.hpp"
#include "tunnel/peer_link.hpp"
#include "tunnel/rtc_params.hpp"
#include "tunnel/video_relay.hpp"

namespace glonax_agent::tunnel {

inline constexpr const char* kSignalChannel = "signal";
inline constexpr const char* kCommandChannel = "command";

// Opens a session to the machine using the given user agent. The tunnel
// runs the handshake itself when the session is still HANDSHAKING.
using SessionFactory = std::function<std::unique_ptr<session::Session>(const std::string& user_agent)>;

struct TunnelOptions {
  std::int64_t connection_id{0};
  std::string user_agent{kDefaultRtcUserAgent};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds reconnect_delay{1000};
};

// One WebRTC peer connection carrying the machine protocol.
//
// The "signal" channel receives every machine frame verbatim, preceded by a
// STOP_ALL motion on the machine and the INSTANCE frame. The "command"
// channel carries one frame per message toward the machine; ECHO frames are
// answered on the channel and never forwarded.
//
// Must be owned by a std::shared_ptr: worker threads keep the tunnel alive
// until they exit.
class RtcTunnel : public std::enable_shared_from_this<RtcTunnel> {
 public:
  using ClosedCallback = std::function<void(RtcTunnel&)>;

  RtcTunnel(TunnelOptions options, std::unique_ptr<PeerLink> peer, SessionFactory session_factory,
            VideoRelay* video_relay, ClosedCallback on_closed);
  ~RtcTunnel();

  RtcTunnel(const RtcTunnel&) = delete;
  RtcTunnel& operator=(const RtcTunnel&) = delete;

  // Applies the offer and returns the answer SDP. Starts the connect
  // watchdog.
  std::string start(const model::SessionDescription& offer);

  void add_candidate(const IceCandidateParams& params);

  // Closes the peer connection; teardown follows.
  void close();

  // Idempotent. Stops the relay and the watchdog, stops machine motion,
  // closes the machine session, releases the peer and reports the tunnel
  // closed. Each step is best effort.
  void teardown() noexcept;

  [[nodiscard]] std::int64_t connection_id() const noexcept { return options_.connection_id; }
  [[nodiscard]] LinkState state() const noexcept { return state_.load(); }
  [[nodiscard]] bool torn_down() const noexcept { return torn_down_.load(); }
  [[nodiscard]] bool has_session() const;

 private:
  void handle_state(LinkState state);
  void handle_data_channel(const std::shared_ptr<DataLink>& channel);
  void handle_command(DataLink& channel, const protocol::Bytes& message);
  void start_signal_relay(const std::shared_ptr<DataLink>& channel);
  void run_signal_relay(const std::shared_ptr<DataLink>& channel);
  void run_watchdog();
  void stop_session() noexcept;

  [[nodiscard]] std::shared_ptr<session::Session> current_session() const;

  TunnelOptions options_;
  std::unique_ptr<PeerLink> peer_;
  SessionFactory session_factory_;
  VideoRelay* video_relay_;
  ClosedCallback on_closed_;

  std::atomic<LinkState> state_{LinkState::NEW};
  std::atomic<bool> torn_down_{false};
  std::atomic<bool> peer_released_{false};
  core::CancellationToken token_{};
  std::string offer_sdp_{};

  mutable std::mutex session_mutex_{};
  std::shared_ptr<session::Session> session_{};

  std::mutex thread_mutex_{};
  std::thread relay_thread_{};
  std::thread watchdog_thread_{};
  bool relay_started_{false};

  std::shared_ptr<MediaLink> video_track_{};
  VideoRelay::Subscription video_subscription_{};
  // Dropping a channel wrapper detaches its callbacks.
  std::shared_ptr<DataLink> signal_channel_{};
  std::shared_ptr<DataLink> command_channel_{};
};

}  // namespace glonax_agent::tunnel
