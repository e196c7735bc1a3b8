#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <random>
#include <utility>

#include <rtc/rtc.hpp>

#include "tunnel/peer_link.hpp"

namespace glonax_agent::tunnel {

namespace {

constexpr int kH264PayloadType = 96;

LinkState to_link_state(const rtc::PeerConnection::State state) {
  switch (state) {
    case rtc::PeerConnection::State::New:
      return LinkState::NEW;
    case rtc::PeerConnection::State::Connecting:
      return LinkState::CONNECTING;
    case rtc::PeerConnection::State::Connected:
      return LinkState::CONNECTED;
    case rtc::PeerConnection::State::Disconnected:
      return LinkState::DISCONNECTED;
    case rtc::PeerConnection::State::Failed:
      return LinkState::FAILED;
    case rtc::PeerConnection::State::Closed:
      return LinkState::CLOSED;
  }
  return LinkState::CLOSED;
}

class DataChannelLink final : public DataLink {
 public:
  explicit DataChannelLink(std::shared_ptr<rtc::DataChannel> channel) : channel_(std::move(channel)) {}

  ~DataChannelLink() override { channel_->resetCallbacks(); }

  std::string label() const override { return channel_->label(); }
  bool is_open() const override { return channel_->isOpen(); }

  void send(const protocol::Bytes& data) override {
    if (!channel_->isOpen()) {
      throw ChannelClosedError("data channel '" + channel_->label() + "' is closed");
    }
    try {
      channel_->send(reinterpret_cast<const std::byte*>(data.data()), data.size());
    } catch (const std::exception& ex) {
      throw ChannelClosedError("data channel '" + channel_->label() + "' send failed: " + ex.what());
    }
  }

  void on_open(std::function<void()> callback) override { channel_->onOpen(std::move(callback)); }

  void on_message(std::function<void(const protocol::Bytes&)> callback) override {
    channel_->onMessage([callback = std::move(callback)](rtc::message_variant message) {
      if (const auto* binary = std::get_if<rtc::binary>(&message)) {
        const auto* begin = reinterpret_cast<const std::uint8_t*>(binary->data());
        callback(protocol::Bytes(begin, begin + binary->size()));
      } else if (const auto* text = std::get_if<std::string>(&message)) {
        callback(protocol::Bytes(text->begin(), text->end()));
      }
    });
  }

  void on_closed(std::function<void()> callback) override { channel_->onClosed(std::move(callback)); }

  void close() noexcept override {
    try {
      channel_->close();
    } catch (const std::exception& ex) {
      std::cerr << "[rtc] closing data channel failed: " << ex.what() << '\n';
    }
  }

 private:
  std::shared_ptr<rtc::DataChannel> channel_;
};

class VideoTrackLink final : public MediaLink {
 public:
  explicit VideoTrackLink(std::shared_ptr<rtc::Track> track) : track_(std::move(track)) {}

  ~VideoTrackLink() override { track_->resetCallbacks(); }

  bool is_open() const override { return track_->isOpen(); }

  void send_sample(const VideoSample& sample) override {
    track_->sendFrame(reinterpret_cast<const std::byte*>(sample.data.data()), sample.data.size(),
                      rtc::FrameInfo(sample.timestamp));
  }

 private:
  std::shared_ptr<rtc::Track> track_;
};

class DataChannelPeer final : public PeerLink {
 public:
  explicit DataChannelPeer(const PeerOptions& options) : gathering_timeout_(options.gathering_timeout) {
    rtc::Configuration config;
    for (const auto& server : options.ice_servers) {
      config.iceServers.emplace_back(server);
    }
    // The answer is created explicitly once the video track is attached.
    config.disableAutoNegotiation = true;

    pc_ = std::make_shared<rtc::PeerConnection>(config);

    pc_->onStateChange([this](const rtc::PeerConnection::State state) {
      const LinkState link_state = to_link_state(state);
      state_ = link_state;
      std::function<void(LinkState)> callback;
      {
        const std::lock_guard<std::mutex> lock(mutex_);
        callback = state_callback_;
      }
      if (callback) {
        callback(link_state);
      }
    });

    pc_->onGatheringStateChange([this](const rtc::PeerConnection::GatheringState state) {
      if (state != rtc::PeerConnection::GatheringState::Complete) {
        return;
      }
      {
        const std::lock_guard<std::mutex> lock(mutex_);
        gathering_complete_ = true;
      }
      gathering_cv_.notify_all();
    });

    pc_->onDataChannel([this](std::shared_ptr<rtc::DataChannel> channel) {
      std::function<void(std::shared_ptr<DataLink>)> callback;
      {
        const std::lock_guard<std::mutex> lock(mutex_);
        callback = channel_callback_;
      }
      if (callback) {
        callback(std::make_shared<DataChannelLink>(std::move(channel)));
      }
    });
  }

  ~DataChannelPeer() override {
    pc_->resetCallbacks();
    close();
  }

  DataChannelPeer(const DataChannelPeer&) = delete;
  DataChannelPeer& operator=(const DataChannelPeer&) = delete;

  void on_state_change(std::function<void(LinkState)> callback) override {
    const std::lock_guard<std::mutex> lock(mutex_);
    state_callback_ = std::move(callback);
  }

  void on_data_channel(std::function<void(std::shared_ptr<DataLink>)> callback) override {
    const std::lock_guard<std::mutex> lock(mutex_);
    channel_callback_ = std::move(callback);
  }

  void set_remote_offer(const std::string& sdp) override {
    pc_->setRemoteDescription(rtc::Description(sdp, "offer"));
  }

  std::shared_ptr<MediaLink> add_video_track(const std::string& mid) override {
    std::random_device seed;
    const auto ssrc = static_cast<rtc::SSRC>(seed());

    rtc::Description::Video media(mid, rtc::Description::Direction::SendOnly);
    media.addH264Codec(kH264PayloadType);
    media.addSSRC(ssrc, "video", "glonax", "video");
    auto track = pc_->addTrack(media);

    auto rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(ssrc, "video", kH264PayloadType,
                                                                     rtc::H264RtpPacketizer::ClockRate);
    auto packetizer = std::make_shared<rtc::H264RtpPacketizer>(rtc::H264RtpPacketizer::Separator::LongStartSequence,
                                                                rtp_config);
    track->setMediaHandler(packetizer);

    track->onError([](const std::string& error) { std::cerr << "[rtc] video track error: " << error << '\n'; });
    return std::make_shared<VideoTrackLink>(std::move(track));
  }

  std::string create_answer() override {
    pc_->setLocalDescription(rtc::Description::Type::Answer);

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (!gathering_cv_.wait_for(lock, gathering_timeout_, [this] { return gathering_complete_; })) {
        std::cerr << "[rtc] ICE gathering incomplete after " << gathering_timeout_.count()
                  << " ms, answering with the candidates gathered so far\n";
      }
    }

    const auto description = pc_->localDescription();
    if (!description.has_value()) {
      throw std::runtime_error("peer connection produced no local description");
    }
    return std::string(*description);
  }

  void add_remote_candidate(const IceCandidate& candidate) override {
    pc_->addRemoteCandidate(rtc::Candidate("candidate:" + candidate.to_sdp(), candidate.sdp_mid));
  }

  LinkState state() const override { return state_.load(); }

  void close() noexcept override {
    try {
      pc_->close();
    } catch (const std::exception& ex) {
      std::cerr << "[rtc] closing peer connection failed: " << ex.what() << '\n';
    }
  }

 private:
  std::chrono::milliseconds gathering_timeout_;
  std::shared_ptr<rtc::PeerConnection> pc_{};
  std::atomic<LinkState> state_{LinkState::NEW};

  std::mutex mutex_{};
  std::condition_variable gathering_cv_{};
  bool gathering_complete_{false};
  std::function<void(LinkState)> state_callback_{};
  std::function<void(std::shared_ptr<DataLink>)> channel_callback_{};
};

}  // namespace

std::unique_ptr<PeerLink> make_datachannel_peer(const PeerOptions& options) {
  return std::make_unique<DataChannelPeer>(options);
}

}  // namespace glonax_agent::tunnel
