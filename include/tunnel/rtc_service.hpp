#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "model/messages.hpp"
#include "rpc/dispatcher.hpp"
#include "tunnel/peer_link.hpp"
#include "tunnel/rtc_params.hpp"
#include "tunnel/rtc_tunnel.hpp"
#include "tunnel/video_relay.hpp"

namespace glonax_agent::tunnel {

using PeerFactory = std::function<std::unique_ptr<PeerLink>()>;

struct RtcServiceOptions {
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds reconnect_delay{1000};
  std::string user_agent{kDefaultRtcUserAgent};
};

// Owns the single active tunnel of the process.
//
// Released tunnels are retired rather than destroyed, because release is
// usually triggered from a peer-connection callback; they are reaped on the
// next RPC or at shutdown. Application errors surface as RpcRuntimeError.
class RtcService {
 public:
  RtcService(RtcServiceOptions options, PeerFactory peer_factory, SessionFactory session_factory,
             VideoRelay* video_relay);
  ~RtcService();

  RtcService(const RtcService&) = delete;
  RtcService& operator=(const RtcService&) = delete;

  // Returns the answer SDP.
  std::string setup_rtc(const PeerConnectionParams& params, const model::SessionDescription& offer);
  void update_rtc(const PeerConnectionParams& params, const IceCandidateParams& candidate);
  void disconnect_rtc(const PeerConnectionParams& params);

  // Registers setup_rtc, update_rtc and disconnect_rtc.
  void register_methods(rpc::Dispatcher& dispatcher);

  [[nodiscard]] std::optional<std::int64_t> active_connection_id() const;
  [[nodiscard]] std::size_t retired_count() const;

  // Closes the active tunnel and reaps everything retired.
  void shutdown();

  void reap_retired();

 private:
  [[nodiscard]] std::shared_ptr<RtcTunnel> active() const;
  void retire(RtcTunnel& tunnel);
  void retire(std::shared_ptr<RtcTunnel> tunnel);

  RtcServiceOptions options_;
  PeerFactory peer_factory_;
  SessionFactory session_factory_;
  VideoRelay* video_relay_;

  std::mutex setup_mutex_{};
  mutable std::mutex slot_mutex_{};
  std::shared_ptr<RtcTunnel> active_{};
  std::vector<std::shared_ptr<RtcTunnel>> retired_{};
};

}  // namespace glonax_agent::tunnel
