#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>

#include <nlohmann/json.hpp>

#include "model/messages.hpp"
#include "model/uuid.hpp"
#include "protocol/byte_stream.hpp"
#include "protocol/frame.hpp"
#include "protocol/payload.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/jsonrpc.hpp"
#include "session/session.hpp"
#include "tunnel/peer_link.hpp"
#include "tunnel/rtc_params.hpp"
#include "tunnel/rtc_service.hpp"
#include "tunnel/rtc_tunnel.hpp"
#include "tunnel/video_relay.hpp"

using glonax_agent::model::Control;
using glonax_agent::model::ControlType;
using glonax_agent::model::Instance;
using glonax_agent::model::ModuleStatus;
using glonax_agent::model::Motion;
using glonax_agent::model::SessionDescription;
using glonax_agent::model::Uuid;
using glonax_agent::protocol::Bytes;
using glonax_agent::protocol::ConnectionError;
using glonax_agent::protocol::Frame;
using glonax_agent::protocol::MessageType;
using glonax_agent::protocol::SocketStream;
using glonax_agent::rpc::Dispatcher;
using glonax_agent::rpc::RpcRuntimeError;
using glonax_agent::session::Session;
using glonax_agent::tunnel::ChannelClosedError;
using glonax_agent::tunnel::DataLink;
using glonax_agent::tunnel::IceCandidate;
using glonax_agent::tunnel::IceCandidateParams;
using glonax_agent::tunnel::LinkState;
using glonax_agent::tunnel::MediaLink;
using glonax_agent::tunnel::PeerConnectionParams;
using glonax_agent::tunnel::PeerLink;
using glonax_agent::tunnel::RtcService;
using glonax_agent::tunnel::RtcServiceOptions;
using glonax_agent::tunnel::RtcTunnel;
using glonax_agent::tunnel::SessionFactory;
using glonax_agent::tunnel::TunnelOptions;
using glonax_agent::tunnel::VideoRelay;
using glonax_agent::tunnel::VideoSample;

namespace {

constexpr const char* kOfferSdp =
    "v=0\r\n"
    "o=- 4611731400430051336 2 IN IP4 127.0.0.1\r\n"
    "s=-\r\n"
    "t=0 0\r\n"
    "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
    "a=mid:0\r\n"
    "m=video 9 UDP/TLS/RTP/SAVPF 96\r\n"
    "a=mid:1\r\n"
    "a=recvonly\r\n";

constexpr const char* kCandidate =
    "candidate:842163049 1 udp 1677729535 192.0.2.10 45664 typ srflx raddr 10.0.0.2 rport 45664 generation 0";

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

template <typename Pred>
bool eventually(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

Instance sample_instance() {
  Instance instance{};
  instance.id = Uuid::parse("5c1f2a9e-7d34-4b6a-9e2f-1a3b5c7d9e0f");
  instance.model = "Volvo EC240CL";
  instance.machine_type = 1;
  instance.version = {3, 4, 0};
  instance.serial_number = "EC240C-12345";
  return instance;
}

class FakeDataLink final : public DataLink {
 public:
  FakeDataLink(std::string label, bool open) : label_(std::move(label)), open_(open) {}

  [[nodiscard]] std::string label() const override { return label_; }
  [[nodiscard]] bool is_open() const override { return open_.load(); }

  void send(const Bytes& data) override {
    if (!open_.load()) {
      throw ChannelClosedError("channel '" + label_ + "' is closed");
    }
    const std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(data);
  }

  void on_open(std::function<void()> callback) override { set(open_cb_, std::move(callback)); }
  void on_message(std::function<void(const Bytes&)> callback) override { set(message_cb_, std::move(callback)); }
  void on_closed(std::function<void()> callback) override { set(closed_cb_, std::move(callback)); }

  void close() noexcept override { open_ = false; }

  void open() {
    open_ = true;
    if (const auto callback = get(open_cb_)) {
      callback();
    }
  }

  void deliver(const Bytes& message) {
    if (const auto callback = get(message_cb_)) {
      callback(message);
    }
  }

  void remote_close() {
    open_ = false;
    if (const auto callback = get(closed_cb_)) {
      callback();
    }
  }

  [[nodiscard]] std::vector<Bytes> sent() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

 private:
  template <typename Fn>
  void set(Fn& slot, Fn callback) {
    const std::lock_guard<std::mutex> lock(mutex_);
    slot = std::move(callback);
  }

  template <typename Fn>
  Fn get(const Fn& slot) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return slot;
  }

  std::string label_;
  std::atomic<bool> open_;
  mutable std::mutex mutex_{};
  std::vector<Bytes> sent_{};
  std::function<void()> open_cb_{};
  std::function<void(const Bytes&)> message_cb_{};
  std::function<void()> closed_cb_{};
};

class FakeVideoTrack final : public MediaLink {
 public:
  [[nodiscard]] bool is_open() const override { return open.load(); }
  void send_sample(const VideoSample& /*sample*/) override { ++samples; }

  std::atomic<bool> open{false};
  std::atomic<int> samples{0};
};

// What a fake peer saw, kept by the test after the peer moved into a tunnel.
struct PeerRecord {
  std::mutex mutex;
  std::function<void(LinkState)> state_cb;
  std::function<void(std::shared_ptr<DataLink>)> channel_cb;
  std::string remote_offer;
  std::optional<std::string> video_mid;
  std::shared_ptr<FakeVideoTrack> video_track;
  std::vector<IceCandidate> candidates;
  bool fail_answer{false};
  std::atomic<bool> closed{false};

  void emit_state(LinkState state) {
    std::function<void(LinkState)> callback;
    {
      const std::lock_guard<std::mutex> lock(mutex);
      callback = state_cb;
    }
    if (callback) {
      callback(state);
    }
  }

  void emit_channel(const std::shared_ptr<DataLink>& channel) {
    std::function<void(std::shared_ptr<DataLink>)> callback;
    {
      const std::lock_guard<std::mutex> lock(mutex);
      callback = channel_cb;
    }
    if (callback) {
      callback(channel);
    }
  }
};

class FakePeer final : public PeerLink {
 public:
  explicit FakePeer(std::shared_ptr<PeerRecord> record) : record_(std::move(record)) {}

  void on_state_change(std::function<void(LinkState)> callback) override {
    const std::lock_guard<std::mutex> lock(record_->mutex);
    record_->state_cb = std::move(callback);
  }

  void on_data_channel(std::function<void(std::shared_ptr<DataLink>)> callback) override {
    const std::lock_guard<std::mutex> lock(record_->mutex);
    record_->channel_cb = std::move(callback);
  }

  void set_remote_offer(const std::string& sdp) override {
    const std::lock_guard<std::mutex> lock(record_->mutex);
    record_->remote_offer = sdp;
  }

  std::shared_ptr<MediaLink> add_video_track(const std::string& mid) override {
    const std::lock_guard<std::mutex> lock(record_->mutex);
    record_->video_mid = mid;
    record_->video_track = std::make_shared<FakeVideoTrack>();
    return record_->video_track;
  }

  std::string create_answer() override {
    const std::lock_guard<std::mutex> lock(record_->mutex);
    if (record_->fail_answer) {
      throw std::runtime_error("gathering failed");
    }
    return "v=0\r\ns=answer\r\n";
  }

  void add_remote_candidate(const IceCandidate& candidate) override {
    const std::lock_guard<std::mutex> lock(record_->mutex);
    record_->candidates.push_back(candidate);
  }

  [[nodiscard]] LinkState state() const override { return LinkState::NEW; }

  void close() noexcept override { record_->closed = true; }

 private:
  std::shared_ptr<PeerRecord> record_;
};

// Machine daemon side of every session a factory opens, over socketpair(2).
class FakeMachine {
 public:
  // A machine that does not answer leaves every session in its handshake.
  explicit FakeMachine(bool answers = true) : answers_(answers) {}
  FakeMachine(const FakeMachine&) = delete;
  FakeMachine& operator=(const FakeMachine&) = delete;

  ~FakeMachine() {
    std::vector<std::thread> threads;
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      for (auto& daemon : daemons_) {
        daemon->shutdown();
      }
      threads.swap(threads_);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }

  SessionFactory factory() {
    return [this](const std::string& user_agent) {
      int fds[2] = {-1, -1};
      if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw ConnectionError("socketpair failed");
      }
      auto daemon = std::make_unique<SocketStream>(fds[1]);
      SocketStream* raw = daemon.get();
      {
        const std::lock_guard<std::mutex> lock(mutex_);
        daemons_.push_back(std::move(daemon));
        threads_.emplace_back([this, raw] { serve(*raw); });
        current_ = raw;
        last_user_agent_ = user_agent;
      }

      return std::make_unique<Session>(std::make_unique<SocketStream>(fds[0]), user_agent);
    };
  }

  void send(const Frame& frame) {
    SocketStream* stream = nullptr;
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      stream = current_;
    }
    glonax_agent::protocol::write_frame(*stream, frame);
  }

  [[nodiscard]] std::vector<Frame> received() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  [[nodiscard]] std::size_t count(MessageType type) const {
    std::size_t n = 0;
    for (const auto& frame : received()) {
      n += frame.is(type) ? 1 : 0;
    }
    return n;
  }

  [[nodiscard]] std::string last_user_agent() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return last_user_agent_;
  }

 private:
  void serve(SocketStream& stream) {
    try {
      (void)glonax_agent::protocol::read_frame(stream);
      if (answers_) {
        glonax_agent::protocol::write_frame(
            stream, Frame(MessageType::INSTANCE, glonax_agent::protocol::to_bytes(sample_instance())));
      }
      while (true) {
        Frame frame = glonax_agent::protocol::read_frame(stream);
        const std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(std::move(frame));
      }
    } catch (const std::exception&) {
      // Peer went away or the test is over.
    }
  }

  const bool answers_;
  mutable std::mutex mutex_{};
  std::vector<std::unique_ptr<SocketStream>> daemons_{};
  std::vector<std::thread> threads_{};
  std::vector<Frame> received_{};
  SocketStream* current_{nullptr};
  std::string last_user_agent_{};
};

SessionFactory unreachable_machine() {
  return [](const std::string& /*user_agent*/) -> std::unique_ptr<Session> {
    throw ConnectionError("machine unreachable");
  };
}

template <typename Fn>
std::string runtime_error_message(Fn&& fn) {
  try {
    fn();
  } catch (const RpcRuntimeError& ex) {
    return ex.what();
  }
  return "";
}

struct ServiceFixture {
  std::vector<std::shared_ptr<PeerRecord>> records;
  VideoRelay relay;
  RtcService service;

  explicit ServiceFixture(SessionFactory sessions = unreachable_machine())
      : service(RtcServiceOptions{.connect_timeout = std::chrono::seconds(30),
                                  .reconnect_delay = std::chrono::milliseconds(50)},
                [this] {
                  auto record = std::make_shared<PeerRecord>();
                  records.push_back(record);
                  return std::make_unique<FakePeer>(record);
                },
                std::move(sessions), &relay) {}
};

int test_ice_candidate_parsing() {
  const IceCandidate candidate =
      glonax_agent::tunnel::parse_ice_candidate(IceCandidateParams{.candidate = kCandidate, .sdp_mid = "0"});
  if (candidate.foundation != "842163049" || candidate.component != 1 || candidate.transport != "udp" ||
      candidate.priority != 1677729535U || candidate.address != "192.0.2.10" || candidate.port != 45664 ||
      candidate.type != "srflx") {
    return fail("test_ice_candidate_parsing", "candidate fields mismatch");
  }
  if (candidate.related_address != "10.0.0.2" || candidate.related_port != 45664 || candidate.sdp_mid != "0") {
    return fail("test_ice_candidate_parsing", "related address or mid mismatch");
  }
  if ("candidate:" + candidate.to_sdp() != kCandidate) {
    return fail("test_ice_candidate_parsing", "to_sdp should reproduce the attribute");
  }

  const auto rejects = [](const std::string& text) {
    try {
      (void)glonax_agent::tunnel::parse_ice_candidate(IceCandidateParams{.candidate = text});
    } catch (const std::invalid_argument&) {
      return true;
    }
    return false;
  };
  if (!rejects("candidate:1 1 sctp 1 192.0.2.1 5000 typ host") || !rejects("candidate:1 1 udp 1 192.0.2.1 5000") ||
      !rejects("candidate:1 1 udp 1 192.0.2.1 5000 type host") || !rejects("candidate:1 1 udp 1 192.0.2.1 99999 typ host")) {
    return fail("test_ice_candidate_parsing", "malformed candidates should be rejected");
  }

  return 0;
}

int test_sdp_and_params_helpers() {
  if (glonax_agent::tunnel::sdp_video_mid(kOfferSdp) != "1") {
    return fail("test_sdp_and_params_helpers", "video mid should come from the video m-line");
  }
  if (glonax_agent::tunnel::sdp_video_mid("v=0\r\nm=application 9 UDP/DTLS/SCTP x\r\na=mid:0\r\n").has_value()) {
    return fail("test_sdp_and_params_helpers", "offer without video should have no video mid");
  }
  if (glonax_agent::tunnel::sdp_mid_at(kOfferSdp, 0) != "0" || glonax_agent::tunnel::sdp_mid_at(kOfferSdp, 1) != "1" ||
      glonax_agent::tunnel::sdp_mid_at(kOfferSdp, 2).has_value()) {
    return fail("test_sdp_and_params_helpers", "mid lookup by m-line index mismatch");
  }

  const auto params = nlohmann::json::parse(R"({"connection_id": 7})").get<PeerConnectionParams>();
  if (params.connection_id != 7 || params.video_track != 0 || params.user_agent.has_value()) {
    return fail("test_sdp_and_params_helpers", "defaults for optional params mismatch");
  }

  bool threw = false;
  try {
    (void)nlohmann::json::parse(R"({"connection_id": "7"})").get<PeerConnectionParams>();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_sdp_and_params_helpers", "non-integer connection id should be rejected");
  }

  const auto candidate =
      nlohmann::json::parse(R"({"candidate":"candidate:x","sdpMid":null,"sdpMLineIndex":1})").get<IceCandidateParams>();
  if (candidate.sdp_mid.has_value() || candidate.sdp_mline_index != 1 || candidate.username_fragment.has_value()) {
    return fail("test_sdp_and_params_helpers", "candidate init fields mismatch");
  }

  return 0;
}

int test_video_relay_fan_out() {
  auto subscription = std::optional<VideoRelay::Subscription>{};
  auto track = std::make_shared<FakeVideoTrack>();
  {
    VideoRelay relay;
    int direct = 0;
    auto sink = relay.subscribe([&direct](const VideoSample&) { ++direct; });
    subscription = relay.subscribe(track);

    const VideoSample sample{Bytes{0, 0, 0, 1, 0x65}, std::chrono::duration<double>(0.04)};
    if (relay.publish(sample) != 2 || direct != 1 || track->samples != 0) {
      return fail("test_video_relay_fan_out", "closed tracks should miss samples without failing the relay");
    }

    track->open = true;
    relay.publish(sample);
    if (track->samples != 1 || direct != 2) {
      return fail("test_video_relay_fan_out", "open tracks should receive published samples");
    }

    sink.reset();
    if (relay.subscriber_count() != 1) {
      return fail("test_video_relay_fan_out", "reset subscriptions should leave the relay");
    }
  }

  subscription.reset();
  return 0;
}

int test_signal_relay_and_command_channel() {
  FakeMachine machine;
  VideoRelay relay;
  auto record = std::make_shared<PeerRecord>();
  std::atomic<int> closed{0};

  auto tunnel = std::make_shared<RtcTunnel>(
      TunnelOptions{.connection_id = 7,
                    .user_agent = "tunnel-ua/1.0",
                    .connect_timeout = std::chrono::seconds(30),
                    .reconnect_delay = std::chrono::milliseconds(50)},
      std::make_unique<FakePeer>(record), machine.factory(), &relay, [&closed](RtcTunnel&) { ++closed; });

  const std::string answer = tunnel->start(SessionDescription{"offer", kOfferSdp});
  if (answer != "v=0\r\ns=answer\r\n" || record->remote_offer != kOfferSdp || record->video_mid != "1" ||
      relay.subscriber_count() != 1) {
    return fail("test_signal_relay_and_command_channel", "start should apply the offer and attach the video track");
  }

  auto signal = std::make_shared<FakeDataLink>("signal", false);
  record->emit_channel(signal);
  signal->open();

  if (!eventually([&] { return !signal->sent().empty() && machine.count(MessageType::MOTION) == 1; })) {
    return fail("test_signal_relay_and_command_channel", "relay should stop motion and announce the instance");
  }
  if (machine.last_user_agent() != "tunnel-ua/1.0") {
    return fail("test_signal_relay_and_command_channel", "tunnel session should use the tunnel user agent");
  }
  const Frame announced = glonax_agent::protocol::decode(signal->sent().front());
  if (!announced.is(MessageType::INSTANCE) ||
      glonax_agent::protocol::instance_from_bytes(announced.payload) != sample_instance()) {
    return fail("test_signal_relay_and_command_channel", "first signal message should be the INSTANCE frame");
  }
  const Frame first_command = machine.received().front();
  if (!first_command.is(MessageType::MOTION) ||
      glonax_agent::protocol::motion_from_bytes(first_command.payload) != Motion::stop_all()) {
    return fail("test_signal_relay_and_command_channel", "first frame to the machine should be STOP_ALL");
  }

  const Frame status(MessageType::STATUS, glonax_agent::protocol::to_bytes(ModuleStatus{"engine", 1, 0}));
  machine.send(status);
  if (!eventually([&] { return signal->sent().size() == 2; }) ||
      signal->sent()[1] != glonax_agent::protocol::encode(status)) {
    return fail("test_signal_relay_and_command_channel", "machine frames should be relayed verbatim");
  }

  auto command = std::make_shared<FakeDataLink>("command", true);
  record->emit_channel(command);

  const Bytes echo = glonax_agent::protocol::encode(MessageType::ECHO, Bytes{0xCA, 0xFE});
  command->deliver(echo);
  if (command->sent().size() != 1 || command->sent().front() != echo) {
    return fail("test_signal_relay_and_command_channel", "ECHO should be answered on the command channel");
  }

  command->deliver(Bytes{0x01, 0x02, 0x03});
  const Bytes horn = glonax_agent::protocol::encode(
      MessageType::CONTROL, glonax_agent::protocol::to_bytes(Control{ControlType::MACHINE_HORN, true}));
  command->deliver(horn);
  if (!eventually([&] { return machine.count(MessageType::CONTROL) == 1; })) {
    return fail("test_signal_relay_and_command_channel", "command frames should reach the machine");
  }
  if (machine.count(MessageType::ECHO) != 0) {
    return fail("test_signal_relay_and_command_channel", "ECHO must never reach the machine");
  }

  record->emit_state(LinkState::CONNECTED);
  if (tunnel->state() != LinkState::CONNECTED) {
    return fail("test_signal_relay_and_command_channel", "state changes should be tracked");
  }

  tunnel->close();
  if (!tunnel->torn_down() || closed != 1 || !record->closed || relay.subscriber_count() != 0) {
    return fail("test_signal_relay_and_command_channel", "close should tear the tunnel down once");
  }
  if (!eventually([&] { return machine.count(MessageType::MOTION) == 2; })) {
    return fail("test_signal_relay_and_command_channel", "teardown should stop machine motion");
  }

  tunnel->teardown();
  record->emit_state(LinkState::CLOSED);
  if (closed != 1) {
    return fail("test_signal_relay_and_command_channel", "teardown should be idempotent");
  }

  return 0;
}

int test_close_during_machine_handshake() {
  FakeMachine machine(false);
  VideoRelay relay;
  auto record = std::make_shared<PeerRecord>();

  auto tunnel = std::make_shared<RtcTunnel>(
      TunnelOptions{.connection_id = 12,
                    .connect_timeout = std::chrono::seconds(30),
                    .reconnect_delay = std::chrono::milliseconds(50)},
      std::make_unique<FakePeer>(record), machine.factory(), &relay, [](RtcTunnel&) {});
  (void)tunnel->start(SessionDescription{"offer", kOfferSdp});

  auto signal = std::make_shared<FakeDataLink>("signal", false);
  record->emit_channel(signal);
  signal->open();
  if (!eventually([&] { return tunnel->has_session(); })) {
    return fail("test_close_during_machine_handshake", "relay should publish the session before its handshake");
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread closer([tunnel, done] {
    tunnel->close();
    *done = true;
  });
  if (!eventually([&] { return done->load(); })) {
    closer.detach();
    return fail("test_close_during_machine_handshake", "close should not wait on a machine that never answers");
  }
  closer.join();

  if (!signal->sent().empty() || tunnel->has_session()) {
    return fail("test_close_during_machine_handshake", "an unanswered handshake should announce nothing");
  }

  return 0;
}

int test_watchdog_closes_unconnected_tunnel() {
  VideoRelay relay;
  auto record = std::make_shared<PeerRecord>();
  std::atomic<int> closed{0};

  auto tunnel = std::make_shared<RtcTunnel>(
      TunnelOptions{.connection_id = 9, .connect_timeout = std::chrono::milliseconds(100)},
      std::make_unique<FakePeer>(record), unreachable_machine(), &relay, [&closed](RtcTunnel&) { ++closed; });
  (void)tunnel->start(SessionDescription{"offer", kOfferSdp});

  if (!eventually([&] { return tunnel->torn_down(); })) {
    return fail("test_watchdog_closes_unconnected_tunnel", "watchdog should close a tunnel that never connects");
  }
  if (!eventually([&] { return tunnel.use_count() == 1; }) || closed != 1 || !record->closed) {
    return fail("test_watchdog_closes_unconnected_tunnel", "watchdog close should release the peer once");
  }

  bool refused = false;
  try {
    tunnel->add_candidate(IceCandidateParams{.candidate = kCandidate, .sdp_mid = "0"});
  } catch (const std::runtime_error&) {
    refused = true;
  }
  if (!refused) {
    return fail("test_watchdog_closes_unconnected_tunnel", "closed tunnels should refuse candidates");
  }

  return 0;
}

int test_failed_state_tears_down() {
  VideoRelay relay;
  auto record = std::make_shared<PeerRecord>();
  std::atomic<int> closed{0};

  auto tunnel = std::make_shared<RtcTunnel>(TunnelOptions{.connection_id = 3}, std::make_unique<FakePeer>(record),
                                            unreachable_machine(), &relay, [&closed](RtcTunnel&) { ++closed; });
  (void)tunnel->start(SessionDescription{"offer", kOfferSdp});

  record->emit_state(LinkState::FAILED);
  if (!tunnel->torn_down() || closed != 1 || !record->closed) {
    return fail("test_failed_state_tears_down", "FAILED should close and tear down the tunnel");
  }

  return 0;
}

int test_service_setup_rules() {
  ServiceFixture fixture;
  RtcService& service = fixture.service;
  const SessionDescription offer{"offer", kOfferSdp};

  if (runtime_error_message([&] { (void)service.setup_rtc(PeerConnectionParams{.connection_id = 0}, offer); }) !=
      "No connection ID") {
    return fail("test_service_setup_rules", "zero connection id should be refused");
  }
  if (runtime_error_message([&] {
        (void)service.setup_rtc(PeerConnectionParams{.connection_id = 7}, SessionDescription{"answer", kOfferSdp});
      }) != "Invalid offer type, expected offer") {
    return fail("test_service_setup_rules", "non-offer descriptions should be refused");
  }
  if (runtime_error_message([&] {
        (void)service.setup_rtc(PeerConnectionParams{.connection_id = 7, .video_track = 1}, offer);
      }) != "Invalid video track 1") {
    return fail("test_service_setup_rules", "unknown video tracks should be refused");
  }
  if (!fixture.records.empty()) {
    return fail("test_service_setup_rules", "refused setups should not create peers");
  }

  const std::string answer = service.setup_rtc(PeerConnectionParams{.connection_id = 7}, offer);
  if (answer.empty() || service.active_connection_id() != 7) {
    return fail("test_service_setup_rules", "setup should answer and occupy the slot");
  }

  if (runtime_error_message([&] { (void)service.setup_rtc(PeerConnectionParams{.connection_id = 8}, offer); }) !=
      "RTC connection already established") {
    return fail("test_service_setup_rules", "second setup should be refused while one is active");
  }

  service.shutdown();
  if (service.active_connection_id().has_value() || service.retired_count() != 0 || !fixture.records.front()->closed) {
    return fail("test_service_setup_rules", "shutdown should close and reap the active tunnel");
  }

  return 0;
}

int test_service_setup_failure_frees_slot() {
  ServiceFixture fixture;
  RtcService& service = fixture.service;

  // The first peer fails to produce an answer.
  auto failing = std::make_shared<PeerRecord>();
  failing->fail_answer = true;
  RtcService failing_service(RtcServiceOptions{}, [failing] { return std::make_unique<FakePeer>(failing); },
                             unreachable_machine(), &fixture.relay);

  if (runtime_error_message([&] {
        (void)failing_service.setup_rtc(PeerConnectionParams{.connection_id = 4},
                                        SessionDescription{"offer", kOfferSdp});
      }) != "Error setting up RTC connection") {
    return fail("test_service_setup_failure_frees_slot", "setup errors should be reported generically");
  }
  if (failing_service.active_connection_id().has_value() || !failing->closed) {
    return fail("test_service_setup_failure_frees_slot", "failed setup should leave the slot empty");
  }

  (void)service.setup_rtc(PeerConnectionParams{.connection_id = 4}, SessionDescription{"offer", kOfferSdp});
  if (service.active_connection_id() != 4) {
    return fail("test_service_setup_failure_frees_slot", "a fresh service should accept the setup");
  }

  return 0;
}

int test_service_update_rules() {
  ServiceFixture fixture;
  RtcService& service = fixture.service;

  const IceCandidateParams by_index{.candidate = kCandidate, .sdp_mline_index = 1};

  if (runtime_error_message([&] { service.update_rtc(PeerConnectionParams{.connection_id = 0}, by_index); }) !=
      "No connection ID") {
    return fail("test_service_update_rules", "zero connection id should be refused");
  }
  if (runtime_error_message([&] { service.update_rtc(PeerConnectionParams{.connection_id = 7}, by_index); }) !=
      "No RTC connection established") {
    return fail("test_service_update_rules", "updates without a tunnel should be refused");
  }

  (void)service.setup_rtc(PeerConnectionParams{.connection_id = 7}, SessionDescription{"offer", kOfferSdp});

  if (runtime_error_message([&] { service.update_rtc(PeerConnectionParams{.connection_id = 8}, by_index); }) !=
      "Invalid connection ID 8, current connection ID 7") {
    return fail("test_service_update_rules", "mismatched ids should name both ids");
  }
  if (runtime_error_message([&] {
        service.update_rtc(PeerConnectionParams{.connection_id = 7}, IceCandidateParams{.candidate = ""});
      }) != "No ICE candidate") {
    return fail("test_service_update_rules", "empty candidates should be refused");
  }
  if (runtime_error_message([&] {
        service.update_rtc(PeerConnectionParams{.connection_id = 7},
                           IceCandidateParams{.candidate = "candidate:bogus", .sdp_mid = "0"});
      }) != "Error updating RTC connection") {
    return fail("test_service_update_rules", "malformed candidates should be reported generically");
  }

  service.update_rtc(PeerConnectionParams{.connection_id = 7}, by_index);
  const auto& record = fixture.records.front();
  if (record->candidates.size() != 1 || record->candidates.front().sdp_mid != "1" ||
      record->candidates.front().port != 45664) {
    return fail("test_service_update_rules", "candidate should reach the peer with its mid resolved");
  }

  return 0;
}

int test_service_disconnect_rules() {
  ServiceFixture fixture;
  RtcService& service = fixture.service;

  if (runtime_error_message([&] { service.disconnect_rtc(PeerConnectionParams{.connection_id = 0}); }) !=
      "Invalid connection ID") {
    return fail("test_service_disconnect_rules", "zero connection id should be refused");
  }
  if (runtime_error_message([&] { service.disconnect_rtc(PeerConnectionParams{.connection_id = 7}); }) !=
      "No RTC connection established") {
    return fail("test_service_disconnect_rules", "disconnect without a tunnel should be refused");
  }

  (void)service.setup_rtc(PeerConnectionParams{.connection_id = 7}, SessionDescription{"offer", kOfferSdp});

  if (runtime_error_message([&] { service.disconnect_rtc(PeerConnectionParams{.connection_id = 6}); }) !=
      "Invalid connection ID") {
    return fail("test_service_disconnect_rules", "mismatched ids should be refused");
  }

  service.disconnect_rtc(PeerConnectionParams{.connection_id = 7});
  if (service.active_connection_id().has_value() || service.retired_count() != 1 ||
      !fixture.records.front()->closed) {
    return fail("test_service_disconnect_rules", "disconnect should close and retire the tunnel");
  }

  if (runtime_error_message([&] { service.disconnect_rtc(PeerConnectionParams{.connection_id = 7}); }) !=
      "No RTC connection established") {
    return fail("test_service_disconnect_rules", "second disconnect should find no tunnel");
  }
  if (service.retired_count() != 0) {
    return fail("test_service_disconnect_rules", "retired tunnels should be reaped on the next call");
  }

  (void)service.setup_rtc(PeerConnectionParams{.connection_id = 8}, SessionDescription{"offer", kOfferSdp});
  fixture.records.back()->emit_state(LinkState::CLOSED);
  if (service.active_connection_id().has_value()) {
    return fail("test_service_disconnect_rules", "a peer closing on its own should free the slot");
  }

  return 0;
}

int test_service_over_json_rpc() {
  ServiceFixture fixture;
  Dispatcher dispatcher;
  fixture.service.register_methods(dispatcher);

  nlohmann::json setup = {
      {"jsonrpc", "2.0"},
      {"method", "setup_rtc"},
      {"params", {{"params", {{"connection_id", 11}}}, {"offer", {{"type", "offer"}, {"sdp", kOfferSdp}}}}},
      {"id", 1},
  };
  const auto answer = dispatcher.invoke_json(setup);
  if (!answer.has_value() || !answer->at("result").is_string() || fixture.service.active_connection_id() != 11) {
    return fail("test_service_over_json_rpc", "setup_rtc should answer with the SDP");
  }

  const auto again = dispatcher.invoke_json(setup);
  if (!again.has_value() || again->at("error").at("code") != -32000 ||
      again->at("error").at("message") != "RTC connection already established") {
    return fail("test_service_over_json_rpc", "application errors should surface as -32000");
  }

  const auto update = dispatcher.invoke(
      R"({"jsonrpc":"2.0","method":"rpc_update_rtc","params":[{"connection_id":11},{"candidate":")" +
      std::string(kCandidate) + R"(","sdpMid":"0"}],"id":2})");
  if (!update.has_value() || !update->at("result").is_null()) {
    return fail("test_service_over_json_rpc", "update_rtc should accept positional params");
  }

  const auto bad_params = dispatcher.invoke(R"({"jsonrpc":"2.0","method":"disconnect_rtc","params":{"connection_id":"x"},"id":3})");
  if (!bad_params.has_value() || bad_params->at("error").at("code") != -32602) {
    return fail("test_service_over_json_rpc", "malformed params should be -32602");
  }

  const auto disconnect =
      dispatcher.invoke(R"({"jsonrpc":"2.0","method":"disconnect_rtc","params":{"connection_id":11},"id":4})");
  if (!disconnect.has_value() || !disconnect->at("result").is_null() ||
      fixture.service.active_connection_id().has_value()) {
    return fail("test_service_over_json_rpc", "disconnect_rtc should take the params record directly");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_ice_candidate_parsing(); rc != 0) return rc;
  if (int rc = test_sdp_and_params_helpers(); rc != 0) return rc;
  if (int rc = test_video_relay_fan_out(); rc != 0) return rc;
  if (int rc = test_signal_relay_and_command_channel(); rc != 0) return rc;
  if (int rc = test_close_during_machine_handshake(); rc != 0) return rc;
  if (int rc = test_watchdog_closes_unconnected_tunnel(); rc != 0) return rc;
  if (int rc = test_failed_state_tears_down(); rc != 0) return rc;
  if (int rc = test_service_setup_rules(); rc != 0) return rc;
  if (int rc = test_service_setup_failure_frees_slot(); rc != 0) return rc;
  if (int rc = test_service_update_rules(); rc != 0) return rc;
  if (int rc = test_service_disconnect_rules(); rc != 0) return rc;
  if (int rc = test_service_over_json_rpc(); rc != 0) return rc;

  std::cout << "[PASS] tunnel unit tests\n";
  return 0;
}
