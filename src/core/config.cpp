#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace glonax_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const auto parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer");
  }
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::istringstream in(value);
  for (std::string item; std::getline(in, item, ',');) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

}  // namespace

void apply_config_value(AgentConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "machine.address") {
    if (value.empty()) {
      throw std::runtime_error("machine.address must not be empty");
    }
    try {
      config.machine.address = protocol::parse_stream_address(value);
    } catch (const std::exception& ex) {
      throw std::runtime_error(std::string("machine.address: ") + ex.what());
    }
    return;
  }

  if (key == "machine.user_agent") {
    config.machine.user_agent = value;
    return;
  }

  if (key == "control.base_url") {
    config.control.base_url = normalize_websocket_url(value);
    return;
  }

  if (key == "rtc.user_agent") {
    config.rtc.user_agent = value;
    return;
  }

  if (key == "rtc.connect_timeout_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds <= 0) {
      throw std::runtime_error("rtc.connect_timeout_s must be greater than 0");
    }
    config.rtc.connect_timeout = std::chrono::seconds(seconds);
    return;
  }

  if (key == "rtc.ice_servers") {
    config.rtc.ice_servers = split_list(value);
    return;
  }

  if (key == "agent.queue_capacity") {
    const auto capacity = parse_integer(key, value);
    if (capacity <= 0) {
      throw std::runtime_error("agent.queue_capacity must be greater than 0");
    }
    config.queue_capacity = static_cast<std::size_t>(capacity);
    return;
  }

  if (key == "agent.reconnect_delay_ms") {
    const auto delay = parse_integer(key, value);
    if (delay < 0) {
      throw std::runtime_error("agent.reconnect_delay_ms must be greater than or equal to 0");
    }
    config.reconnect_delay = std::chrono::milliseconds(delay);
    return;
  }

  if (key == "agent.signal_staleness_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds < 0) {
      throw std::runtime_error("agent.signal_staleness_s must be greater than or equal to 0");
    }
    config.signal_staleness = std::chrono::seconds(seconds);
    return;
  }

  if (key == "agent.log_signals") {
    config.log_signals = parse_bool(value);
  }
}

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_config_value(config, full_key.str(), value);
  }

  return config;
}

std::string normalize_websocket_url(const std::string& base_url) {
  std::string url = trim(base_url);
  if (url.rfind("https://", 0) == 0) {
    url = "wss://" + url.substr(std::string("https://").size());
  } else if (url.rfind("http://", 0) == 0) {
    url = "ws://" + url.substr(std::string("http://").size());
  }
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

std::string format_config_settings(const AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | machine_address=" << config.machine.address.to_string()
         << " | machine_user_agent=" << config.machine.user_agent
         << " | control_base_url=" << (config.control.base_url.empty() ? "(disabled)" : config.control.base_url)
         << " | rtc_user_agent=" << config.rtc.user_agent
         << " | rtc_connect_timeout_s=" << config.rtc.connect_timeout.count()
         << " | rtc_ice_servers=" << config.rtc.ice_servers.size()
         << " | queue_capacity=" << config.queue_capacity
         << " | reconnect_delay_ms=" << config.reconnect_delay.count()
         << " | signal_staleness_s=" << config.signal_staleness.count()
         << " | log_signals=" << (config.log_signals ? "true" : "false");
  return output.str();
}

}  // namespace glonax_agent::core
