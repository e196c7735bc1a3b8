#include "tunnel/rtc_tunnel.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "protocol/frame.hpp"
#include "protocol/payload.hpp"

namespace glonax_agent::tunnel {

using protocol::MessageType;

const char* link_state_name(const LinkState state) {
  switch (state) {
    case LinkState::NEW:
      return "new";
    case LinkState::CONNECTING:
      return "connecting";
    case LinkState::CONNECTED:
      return "connected";
    case LinkState::DISCONNECTED:
      return "disconnected";
    case LinkState::FAILED:
      return "failed";
    case LinkState::CLOSED:
      return "closed";
  }
  return "closed";
}

RtcTunnel::RtcTunnel(TunnelOptions options, std::unique_ptr<PeerLink> peer, SessionFactory session_factory,
                     VideoRelay* video_relay, ClosedCallback on_closed)
    : options_(std::move(options)),
      peer_(std::move(peer)),
      session_factory_(std::move(session_factory)),
      video_relay_(video_relay),
      on_closed_(std::move(on_closed)) {
  if (peer_ == nullptr) {
    throw std::invalid_argument("tunnel requires a peer connection");
  }
  if (!session_factory_) {
    throw std::invalid_argument("tunnel requires a session factory");
  }
}

RtcTunnel::~RtcTunnel() { teardown(); }

std::string RtcTunnel::start(const model::SessionDescription& offer) {
  offer_sdp_ = offer.sdp;

  const std::weak_ptr<RtcTunnel> weak = weak_from_this();
  peer_->on_state_change([weak](const LinkState state) {
    if (const auto self = weak.lock()) {
      self->handle_state(state);
    }
  });
  peer_->on_data_channel([weak](std::shared_ptr<DataLink> channel) {
    if (const auto self = weak.lock()) {
      self->handle_data_channel(channel);
    }
  });

  peer_->set_remote_offer(offer.sdp);

  if (video_relay_ != nullptr) {
    if (const auto mid = sdp_video_mid(offer.sdp)) {
      video_track_ = peer_->add_video_track(*mid);
      video_subscription_ = video_relay_->subscribe(video_track_);
    }
  }

  std::string answer = peer_->create_answer();

  {
    const std::lock_guard<std::mutex> lock(thread_mutex_);
    if (torn_down_.load()) {
      throw std::runtime_error("peer connection closed during setup");
    }
    watchdog_thread_ = std::thread([self = shared_from_this()] { self->run_watchdog(); });
  }

  return answer;
}

void RtcTunnel::add_candidate(const IceCandidateParams& params) {
  if (torn_down_.load()) {
    throw std::runtime_error("tunnel is closed");
  }

  IceCandidate candidate = parse_ice_candidate(params);
  if (candidate.sdp_mid.empty()) {
    const auto mid = candidate.sdp_mline_index.has_value() ? sdp_mid_at(offer_sdp_, *candidate.sdp_mline_index)
                                                           : std::nullopt;
    if (!mid.has_value()) {
      throw std::invalid_argument("candidate names no media section");
    }
    candidate.sdp_mid = *mid;
  }
  peer_->add_remote_candidate(candidate);
}

void RtcTunnel::close() {
  if (!peer_released_.exchange(true)) {
    peer_->close();
  }
  teardown();
}

void RtcTunnel::teardown() noexcept {
  if (torn_down_.exchange(true)) {
    return;
  }
  std::cerr << "[rtc] connection " << options_.connection_id << " disconnecting\n";

  token_.cancel();
  if (const auto session = current_session()) {
    session->interrupt();
  }

  std::thread relay;
  std::thread watchdog;
  {
    const std::lock_guard<std::mutex> lock(thread_mutex_);
    relay = std::move(relay_thread_);
    watchdog = std::move(watchdog_thread_);
  }
  try {
    core::join_or_detach(relay);
    core::join_or_detach(watchdog);
  } catch (const std::system_error& ex) {
    std::cerr << "[rtc] joining tunnel workers failed: " << ex.what() << '\n';
  }

  stop_session();

  video_subscription_.reset();
  try {
    peer_->on_state_change(nullptr);
    peer_->on_data_channel(nullptr);
  } catch (const std::exception& ex) {
    std::cerr << "[rtc] detaching peer callbacks failed: " << ex.what() << '\n';
  }
  if (!peer_released_.exchange(true)) {
    peer_->close();
  }

  try {
    if (on_closed_) {
      on_closed_(*this);
    }
  } catch (const std::exception& ex) {
    std::cerr << "[rtc] releasing connection slot failed: " << ex.what() << '\n';
  }
  std::cerr << "[rtc] connection " << options_.connection_id << " disconnected\n";
}

bool RtcTunnel::has_session() const { return current_session() != nullptr; }

void RtcTunnel::handle_state(const LinkState state) {
  state_ = state;
  std::cerr << "[rtc] connection " << options_.connection_id << " state is " << link_state_name(state) << '\n';

  switch (state) {
    case LinkState::CONNECTED:
      std::cerr << "[rtc] connection " << options_.connection_id << " established\n";
      break;
    case LinkState::FAILED:
      close();
      break;
    case LinkState::CLOSED:
      teardown();
      break;
    case LinkState::NEW:
    case LinkState::CONNECTING:
    case LinkState::DISCONNECTED:
      break;
  }
}

void RtcTunnel::handle_data_channel(const std::shared_ptr<DataLink>& channel) {
  const std::string label = channel->label();
  const std::weak_ptr<RtcTunnel> weak_self = weak_from_this();
  const std::weak_ptr<DataLink> weak_channel = channel;

  if (label == kSignalChannel) {
    {
      const std::lock_guard<std::mutex> lock(thread_mutex_);
      signal_channel_ = channel;
    }
    channel->on_open([weak_self, weak_channel] {
      const auto self = weak_self.lock();
      const auto link = weak_channel.lock();
      if (self != nullptr && link != nullptr) {
        self->start_signal_relay(link);
      }
    });
    channel->on_closed([weak_self] {
      if (const auto self = weak_self.lock()) {
        if (const auto session = self->current_session()) {
          session->interrupt();
        }
      }
    });
    if (channel->is_open()) {
      start_signal_relay(channel);
    }
  } else if (label == kCommandChannel) {
    {
      const std::lock_guard<std::mutex> lock(thread_mutex_);
      command_channel_ = channel;
    }
    channel->on_message([weak_self, weak_channel](const protocol::Bytes& message) {
      const auto self = weak_self.lock();
      const auto link = weak_channel.lock();
      if (self != nullptr && link != nullptr) {
        self->handle_command(*link, message);
      }
    });
  } else {
    std::cerr << "[rtc] ignoring data channel '" << label << "'\n";
  }
}

void RtcTunnel::handle_command(DataLink& channel, const protocol::Bytes& message) {
  try {
    const protocol::Frame frame = protocol::decode(message);
    if (frame.is(MessageType::ECHO)) {
      channel.send(message);
      return;
    }

    const auto session = current_session();
    if (session != nullptr && session->is_established()) {
      session->write_frame(frame);
    }
  } catch (const protocol::ProtocolError& ex) {
    std::cerr << "[rtc] dropping undecodable command message: " << ex.what() << '\n';
  } catch (const std::exception& ex) {
    std::cerr << "[rtc] command message not delivered: " << ex.what() << '\n';
  }
}

void RtcTunnel::start_signal_relay(const std::shared_ptr<DataLink>& channel) {
  const std::lock_guard<std::mutex> lock(thread_mutex_);
  if (relay_started_ || torn_down_.load()) {
    return;
  }
  relay_started_ = true;
  relay_thread_ = std::thread([self = shared_from_this(), channel] { self->run_signal_relay(channel); });
}

void RtcTunnel::run_signal_relay(const std::shared_ptr<DataLink>& channel) {
  while (!token_.cancelled()) {
    std::shared_ptr<session::Session> session;
    try {
      session = current_session();
      if (session == nullptr || !session->is_established()) {
        session = std::shared_ptr<session::Session>(session_factory_(options_.user_agent));
        const std::lock_guard<std::mutex> lock(session_mutex_);
        session_ = session;
      }
      if (token_.cancelled()) {
        return;
      }
      if (session->state() == session::SessionState::HANDSHAKING) {
        session->handshake();
      }

      session->motion_stop_all();
      channel->send(protocol::encode(MessageType::INSTANCE, protocol::to_bytes(*session->instance())));

      while (!token_.cancelled()) {
        const protocol::Frame frame = session->recv_frame();
        channel->send(protocol::encode(frame));
      }
      return;
    } catch (const ChannelClosedError& ex) {
      std::cerr << "[rtc] signal channel closed: " << ex.what() << '\n';
      return;
    } catch (const protocol::ConnectionError& ex) {
      if (token_.cancelled()) {
        return;
      }
      std::cerr << "[rtc] machine connection error: " << ex.what() << '\n';
    } catch (const protocol::ProtocolError& ex) {
      std::cerr << "[rtc] machine protocol error: " << ex.what() << '\n';
    } catch (const std::exception& ex) {
      std::cerr << "[rtc] signal relay failed: " << ex.what() << '\n';
    }

    if (token_.cancelled()) {
      return;
    }
    if (session != nullptr) {
      {
        const std::lock_guard<std::mutex> lock(session_mutex_);
        if (session_ == session) {
          session_.reset();
        }
      }
      session->close();
    }
    if (!channel->is_open()) {
      std::cerr << "[rtc] signal channel closed\n";
      return;
    }

    std::cerr << "[rtc] reconnecting to machine\n";
    if (token_.wait_for(options_.reconnect_delay)) {
      return;
    }
  }
}

void RtcTunnel::run_watchdog() {
  if (token_.wait_for(options_.connect_timeout)) {
    return;
  }
  if (state_.load() != LinkState::CONNECTED) {
    std::cerr << "[rtc] connection " << options_.connection_id << " timed out\n";
    close();
  }
}

void RtcTunnel::stop_session() noexcept {
  std::shared_ptr<session::Session> session;
  {
    const std::lock_guard<std::mutex> lock(session_mutex_);
    session = std::move(session_);
  }
  if (session == nullptr) {
    return;
  }

  try {
    if (session->is_established()) {
      session->motion_stop_all();
    }
  } catch (const std::exception& ex) {
    std::cerr << "[rtc] stopping machine motion failed: " << ex.what() << '\n';
  }
  session->close();
}

std::shared_ptr<session::Session> RtcTunnel::current_session() const {
  const std::lock_guard<std::mutex> lock(session_mutex_);
  return session_;
}

}  // namespace glonax_agent::tunnel
