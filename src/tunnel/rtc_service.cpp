#include "tunnel/rtc_service.hpp"

#include <iostream>
#include <utility>

#include "model/json_codec.hpp"
#include "rpc/jsonrpc.hpp"

namespace glonax_agent::tunnel {

RtcService::RtcService(RtcServiceOptions options, PeerFactory peer_factory, SessionFactory session_factory,
                       VideoRelay* video_relay)
    : options_(options),
      peer_factory_(std::move(peer_factory)),
      session_factory_(std::move(session_factory)),
      video_relay_(video_relay) {}

RtcService::~RtcService() { shutdown(); }

std::string RtcService::setup_rtc(const PeerConnectionParams& params, const model::SessionDescription& offer) {
  reap_retired();
  const std::lock_guard<std::mutex> setup_lock(setup_mutex_);

  if (params.connection_id == 0) {
    throw rpc::RpcRuntimeError("No connection ID");
  }
  if (offer.type != "offer") {
    throw rpc::RpcRuntimeError("Invalid offer type, expected offer");
  }
  if (active() != nullptr) {
    throw rpc::RpcRuntimeError("RTC connection already established");
  }
  if (params.video_track != VideoRelay::kSourceTrack) {
    throw rpc::RpcRuntimeError("Invalid video track " + std::to_string(params.video_track));
  }

  std::shared_ptr<RtcTunnel> tunnel;
  try {
    std::cerr << "[rtc] setting up connection " << params.connection_id << '\n';

    TunnelOptions tunnel_options{
        .connection_id = params.connection_id,
        .user_agent = params.user_agent.value_or(options_.user_agent),
        .connect_timeout = options_.connect_timeout,
        .reconnect_delay = options_.reconnect_delay,
    };
    tunnel = std::make_shared<RtcTunnel>(std::move(tunnel_options), peer_factory_(), session_factory_, video_relay_,
                                         [this](RtcTunnel& closed) { retire(closed); });

    std::string answer = tunnel->start(offer);

    const std::lock_guard<std::mutex> slot_lock(slot_mutex_);
    if (tunnel->torn_down()) {
      retired_.push_back(std::move(tunnel));
      throw std::runtime_error("peer connection closed during setup");
    }
    active_ = tunnel;
    return answer;
  } catch (const std::exception& ex) {
    std::cerr << "[rtc] error setting up connection " << params.connection_id << ": " << ex.what() << '\n';
    if (tunnel != nullptr) {
      tunnel->close();
      retire(std::move(tunnel));
    }
    throw rpc::RpcRuntimeError("Error setting up RTC connection");
  }
}

void RtcService::update_rtc(const PeerConnectionParams& params, const IceCandidateParams& candidate) {
  reap_retired();
  const std::lock_guard<std::mutex> setup_lock(setup_mutex_);

  if (params.connection_id == 0) {
    throw rpc::RpcRuntimeError("No connection ID");
  }
  const auto tunnel = active();
  if (tunnel == nullptr) {
    throw rpc::RpcRuntimeError("No RTC connection established");
  }
  if (params.connection_id != tunnel->connection_id()) {
    throw rpc::RpcRuntimeError("Invalid connection ID " + std::to_string(params.connection_id) +
                               ", current connection ID " + std::to_string(tunnel->connection_id()));
  }
  if (candidate.candidate.empty()) {
    throw rpc::RpcRuntimeError("No ICE candidate");
  }

  try {
    std::cerr << "[rtc] updating connection " << params.connection_id << " with ICE candidate\n";
    tunnel->add_candidate(candidate);
  } catch (const std::exception& ex) {
    std::cerr << "[rtc] error updating connection " << params.connection_id << ": " << ex.what() << '\n';
    throw rpc::RpcRuntimeError("Error updating RTC connection");
  }
}

void RtcService::disconnect_rtc(const PeerConnectionParams& params) {
  reap_retired();
  const std::lock_guard<std::mutex> setup_lock(setup_mutex_);

  if (params.connection_id == 0) {
    throw rpc::RpcRuntimeError("Invalid connection ID");
  }
  const auto tunnel = active();
  if (tunnel == nullptr) {
    throw rpc::RpcRuntimeError("No RTC connection established");
  }
  if (params.connection_id != tunnel->connection_id()) {
    throw rpc::RpcRuntimeError("Invalid connection ID");
  }

  try {
    std::cerr << "[rtc] disconnecting connection " << params.connection_id << '\n';
    tunnel->close();
  } catch (const std::exception& ex) {
    std::cerr << "[rtc] error disconnecting connection " << params.connection_id << ": " << ex.what() << '\n';
    retire(*tunnel);
    throw rpc::RpcRuntimeError("Error disconnecting RTC connection");
  }
  retire(*tunnel);
}

void RtcService::register_methods(rpc::Dispatcher& dispatcher) {
  dispatcher.add("setup_rtc", {"params", "offer"},
                 [this](const PeerConnectionParams& params, const model::SessionDescription& offer) {
                   return setup_rtc(params, offer);
                 });
  dispatcher.add("update_rtc", {"params", "candidate"},
                 [this](const PeerConnectionParams& params, const IceCandidateParams& candidate) {
                   update_rtc(params, candidate);
                 });
  dispatcher.add("disconnect_rtc", [this](const PeerConnectionParams& params) { disconnect_rtc(params); });
}

std::optional<std::int64_t> RtcService::active_connection_id() const {
  const auto tunnel = active();
  if (tunnel == nullptr) {
    return std::nullopt;
  }
  return tunnel->connection_id();
}

std::size_t RtcService::retired_count() const {
  const std::lock_guard<std::mutex> lock(slot_mutex_);
  return retired_.size();
}

void RtcService::shutdown() {
  const std::lock_guard<std::mutex> setup_lock(setup_mutex_);
  if (const auto tunnel = active()) {
    try {
      tunnel->close();
    } catch (const std::exception& ex) {
      std::cerr << "[rtc] closing connection " << tunnel->connection_id() << " failed: " << ex.what() << '\n';
    }
    retire(*tunnel);
  }
  reap_retired();
}

void RtcService::reap_retired() {
  std::vector<std::shared_ptr<RtcTunnel>> reaped;
  {
    const std::lock_guard<std::mutex> lock(slot_mutex_);
    reaped.swap(retired_);
  }
  reaped.clear();
}

std::shared_ptr<RtcTunnel> RtcService::active() const {
  const std::lock_guard<std::mutex> lock(slot_mutex_);
  return active_;
}

void RtcService::retire(RtcTunnel& tunnel) {
  const std::lock_guard<std::mutex> lock(slot_mutex_);
  if (active_.get() == &tunnel) {
    retired_.push_back(std::move(active_));
    active_.reset();
  }
}

void RtcService::retire(std::shared_ptr<RtcTunnel> tunnel) {
  const std::lock_guard<std::mutex> lock(slot_mutex_);
  if (active_ == tunnel) {
    active_.reset();
  }
  retired_.push_back(std::move(tunnel));
}

}  // namespace glonax_agent::tunnel
