#include "core/agent.hpp"

#include <iostream>
#include <string>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>
#include <rtc/rtc.hpp>

#include "session/session.hpp"
#include "tunnel/peer_link.hpp"

namespace glonax_agent::core {
namespace {

// Stands in for the cloud link when none is configured.
class DetachedSocket final : public CloudSocket {
 public:
  [[nodiscard]] bool is_open() const override { return false; }
  bool send_text(const std::string& /*text*/) override { return false; }
};

tunnel::RtcServiceOptions rtc_service_options(const AgentConfig& config) {
  return tunnel::RtcServiceOptions{
      .connect_timeout = config.rtc.connect_timeout,
      .reconnect_delay = config.reconnect_delay,
      .user_agent = config.rtc.user_agent,
  };
}

}  // namespace

Agent::Agent(AgentConfig config)
    : config_(std::move(config)),
      signals_(config_.queue_capacity),
      commands_(config_.queue_capacity),
      rtc_service_(
          rtc_service_options(config_),
          [ice_servers = config_.rtc.ice_servers] {
            return tunnel::make_datachannel_peer(tunnel::PeerOptions{.ice_servers = ice_servers});
          },
          [address = config_.machine.address](const std::string& user_agent) {
            return session::Session::open(address, user_agent);
          },
          &video_relay_),
      router_(dispatcher_, commands_),
      machine_link_(
          MachineLinkOptions{.reconnect_delay = config_.reconnect_delay, .log_signals = config_.log_signals},
          [address = config_.machine.address, user_agent = config_.machine.user_agent] {
            return session::Session::open(address, user_agent);
          },
          machine_state_, signals_, commands_),
      forwarder_(config_.signal_staleness, config_.log_signals) {
  rtc::InitLogger(rtc::LogLevel::Warning);

  if (!config_.control.base_url.empty()) {
    cloud_link_ = std::make_unique<CloudLink>(
        CloudLinkOptions{.base_url = config_.control.base_url, .reconnect_delay = config_.reconnect_delay}, router_,
        machine_state_);
  } else {
    std::cerr << "[agent] control.base_url not set; cloud link disabled\n";
  }

  register_methods();
}

Agent::~Agent() { rtc_service_.shutdown(); }

void Agent::run(const CancellationToken& token) {
  DetachedSocket detached;
  CloudSocket& outbound =
      cloud_link_ != nullptr ? static_cast<CloudSocket&>(*cloud_link_) : static_cast<CloudSocket&>(detached);

  std::thread machine_thread([this, &token] { machine_link_.run(token); });
  std::thread pump_thread([this, &token, &outbound] { run_signal_pump(signals_, forwarder_, outbound, token); });
  std::thread cloud_thread;
  if (cloud_link_ != nullptr) {
    cloud_thread = std::thread([this, &token] { cloud_link_->run(token); });
  }

  std::cerr << "[agent] running\n";
  token.wait();
  std::cerr << "[agent] shutting down\n";

  machine_link_.interrupt();
  signals_.close();
  commands_.close();
  rtc_service_.shutdown();

  join_or_detach(machine_thread);
  join_or_detach(pump_thread);
  join_or_detach(cloud_thread);
}

void Agent::register_methods() {
  dispatcher_.add("echo", {"value"}, [](const nlohmann::json& value) { return value; });
  machine_state_.register_methods(dispatcher_);
  rtc_service_.register_methods(dispatcher_);
}

}  // namespace glonax_agent::core
