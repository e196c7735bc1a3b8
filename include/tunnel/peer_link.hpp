#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "protocol/frame.hpp"
#include "tunnel/rtc_params.hpp"

namespace glonax_agent::tunnel {

// The data channel went away; terminal for whoever was sending on it.
class ChannelClosedError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class LinkState : std::uint8_t {
  NEW,
  CONNECTING,
  CONNECTED,
  DISCONNECTED,
  FAILED,
  CLOSED,
};

const char* link_state_name(LinkState state);

// One encoded access unit and its presentation time.
struct VideoSample {
  protocol::Bytes data{};
  std::chrono::duration<double> timestamp{};
};

class DataLink {
 public:
  virtual ~DataLink() = default;

  [[nodiscard]] virtual std::string label() const = 0;
  [[nodiscard]] virtual bool is_open() const = 0;

  // Throws ChannelClosedError when the channel is gone.
  virtual void send(const protocol::Bytes& data) = 0;

  virtual void on_open(std::function<void()> callback) = 0;
  virtual void on_message(std::function<void(const protocol::Bytes&)> callback) = 0;
  virtual void on_closed(std::function<void()> callback) = 0;

  virtual void close() noexcept = 0;
};

class MediaLink {
 public:
  virtual ~MediaLink() = default;

  [[nodiscard]] virtual bool is_open() const = 0;
  virtual void send_sample(const VideoSample& sample) = 0;
};

// One WebRTC peer connection in the answering role.
class PeerLink {
 public:
  virtual ~PeerLink() = default;

  virtual void on_state_change(std::function<void(LinkState)> callback) = 0;
  virtual void on_data_channel(std::function<void(std::shared_ptr<DataLink>)> callback) = 0;

  virtual void set_remote_offer(const std::string& sdp) = 0;

  // Adds a send-only H264 track answering the offer's video m-line.
  virtual std::shared_ptr<MediaLink> add_video_track(const std::string& mid) = 0;

  // Creates and applies the local answer, returning its SDP once ICE
  // gathering has completed.
  virtual std::string create_answer() = 0;

  virtual void add_remote_candidate(const IceCandidate& candidate) = 0;

  [[nodiscard]] virtual LinkState state() const = 0;
  virtual void close() noexcept = 0;
};

struct PeerOptions {
  std::vector<std::string> ice_servers{};
  std::chrono::milliseconds gathering_timeout{10000};
};

// libdatachannel-backed peer connection.
std::unique_ptr<PeerLink> make_datachannel_peer(const PeerOptions& options);

}  // namespace glonax_agent::tunnel
