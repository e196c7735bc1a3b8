#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "protocol/byte_stream.hpp"
#include "session/session.hpp"
#include "tunnel/rtc_params.hpp"

namespace glonax_agent::core {

struct MachineConfig {
  protocol::StreamAddress address{.unix_socket = "/var/run/glonax.sock"};
  std::string user_agent{session::kDefaultUserAgent};
};

struct ControlConfig {
  // Empty disables the cloud link.
  std::string base_url{};
};

struct RtcConfig {
  std::string user_agent{tunnel::kDefaultRtcUserAgent};
  std::chrono::seconds connect_timeout{60};
  std::vector<std::string> ice_servers{};
};

struct AgentConfig {
  MachineConfig machine{};
  ControlConfig control{};
  RtcConfig rtc{};
  std::size_t queue_capacity{8};
  std::chrono::milliseconds reconnect_delay{1000};
  std::chrono::seconds signal_staleness{5};
  bool log_signals{false};
};

AgentConfig load_agent_config(const std::string& path);

// Applies one dotted key. Unknown keys are ignored; invalid values throw
// std::runtime_error naming the key.
void apply_config_value(AgentConfig& config, const std::string& key, const std::string& value);

// http(s):// becomes ws(s)://, trailing slashes are dropped.
std::string normalize_websocket_url(const std::string& base_url);

std::string format_config_settings(const AgentConfig& config, const std::string& config_path);

}  // namespace glonax_agent::core
