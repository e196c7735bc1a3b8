#include "tunnel/rtc_params.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace glonax_agent::tunnel {

namespace {

constexpr const char* kCandidatePrefix = "candidate:";

template <typename T>
std::optional<T> optional_field(const nlohmann::json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

std::uint64_t parse_unsigned(const std::string& token, const char* field, const std::uint64_t max) {
  if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument(std::string("candidate ") + field + " is not a number: '" + token + "'");
  }
  const auto value = std::stoull(token);
  if (value > max) {
    throw std::invalid_argument(std::string("candidate ") + field + " out of range");
  }
  return value;
}

std::string lowercase(std::string value) {
  for (auto& c : value) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return value;
}

}  // namespace

void to_json(nlohmann::json& j, const PeerConnectionParams& params) {
  j = nlohmann::json{
      {"connection_id", params.connection_id},
      {"video_track", params.video_track},
  };
  if (params.user_agent.has_value()) {
    j["user_agent"] = *params.user_agent;
  }
}

void from_json(const nlohmann::json& j, PeerConnectionParams& params) {
  const auto& id = j.at("connection_id");
  if (!id.is_number_integer()) {
    throw std::invalid_argument("connection_id must be an integer");
  }
  params.connection_id = id.get<std::int64_t>();
  params.video_track = optional_field<std::int64_t>(j, "video_track").value_or(0);
  params.user_agent = optional_field<std::string>(j, "user_agent");
}

void to_json(nlohmann::json& j, const IceCandidateParams& params) {
  j = nlohmann::json{{"candidate", params.candidate}};
  j["sdpMid"] = params.sdp_mid.has_value() ? nlohmann::json(*params.sdp_mid) : nlohmann::json(nullptr);
  j["sdpMLineIndex"] =
      params.sdp_mline_index.has_value() ? nlohmann::json(*params.sdp_mline_index) : nlohmann::json(nullptr);
  j["usernameFragment"] =
      params.username_fragment.has_value() ? nlohmann::json(*params.username_fragment) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, IceCandidateParams& params) {
  params.candidate = j.at("candidate").get<std::string>();
  params.sdp_mid = optional_field<std::string>(j, "sdpMid");
  params.sdp_mline_index = optional_field<int>(j, "sdpMLineIndex");
  params.username_fragment = optional_field<std::string>(j, "usernameFragment");
}

std::string IceCandidate::to_sdp() const {
  std::ostringstream out;
  out << foundation << ' ' << component << ' ' << transport << ' ' << priority << ' ' << address << ' ' << port
      << " typ " << type;
  if (related_address.has_value()) {
    out << " raddr " << *related_address;
  }
  if (related_port.has_value()) {
    out << " rport " << *related_port;
  }
  for (const auto& extension : extensions) {
    out << ' ' << extension;
  }
  return out.str();
}

IceCandidate parse_ice_candidate(const IceCandidateParams& params) {
  std::string attribute = params.candidate;
  if (attribute.rfind(kCandidatePrefix, 0) == 0) {
    attribute.erase(0, std::char_traits<char>::length(kCandidatePrefix));
  }

  std::istringstream in(attribute);
  std::vector<std::string> tokens;
  for (std::string token; in >> token;) {
    tokens.push_back(token);
  }
  if (tokens.size() < 8) {
    throw std::invalid_argument("candidate attribute has too few fields");
  }
  if (tokens[6] != "typ") {
    throw std::invalid_argument("candidate attribute is missing 'typ'");
  }

  IceCandidate candidate{};
  candidate.foundation = tokens[0];
  candidate.component = static_cast<std::uint16_t>(parse_unsigned(tokens[1], "component", 256));
  candidate.transport = lowercase(tokens[2]);
  candidate.priority =
      static_cast<std::uint32_t>(parse_unsigned(tokens[3], "priority", std::numeric_limits<std::uint32_t>::max()));
  candidate.address = tokens[4];
  candidate.port = static_cast<std::uint16_t>(parse_unsigned(tokens[5], "port", 65535));
  candidate.type = tokens[7];

  for (std::size_t i = 8; i < tokens.size(); ++i) {
    if (tokens[i] == "raddr" && i + 1 < tokens.size()) {
      candidate.related_address = tokens[++i];
    } else if (tokens[i] == "rport" && i + 1 < tokens.size()) {
      candidate.related_port = static_cast<std::uint16_t>(parse_unsigned(tokens[++i], "rport", 65535));
    } else {
      candidate.extensions.push_back(tokens[i]);
    }
  }

  if (candidate.transport != "udp" && candidate.transport != "tcp") {
    throw std::invalid_argument("unsupported candidate transport '" + candidate.transport + "'");
  }

  candidate.sdp_mid = params.sdp_mid.value_or("");
  candidate.sdp_mline_index = params.sdp_mline_index;
  return candidate;
}

std::optional<std::string> sdp_video_mid(const std::string& sdp) {
  std::istringstream in(sdp);
  bool in_video = false;
  for (std::string line; std::getline(in, line);) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.rfind("m=", 0) == 0) {
      in_video = line.rfind("m=video", 0) == 0;
    } else if (in_video && line.rfind("a=mid:", 0) == 0) {
      return line.substr(6);
    }
  }
  return std::nullopt;
}

std::optional<std::string> sdp_mid_at(const std::string& sdp, const int mline_index) {
  if (mline_index < 0) {
    return std::nullopt;
  }
  std::istringstream in(sdp);
  int index = -1;
  for (std::string line; std::getline(in, line);) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.rfind("m=", 0) == 0) {
      ++index;
    } else if (index == mline_index && line.rfind("a=mid:", 0) == 0) {
      return line.substr(6);
    }
  }
  return std::nullopt;
}

}  // namespace glonax_agent::tunnel
