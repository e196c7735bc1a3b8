#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rpc/dispatcher.hpp"

namespace glonax_agent::tunnel {

inline constexpr const char* kDefaultRtcUserAgent = "glonax-rtc/1.0";

// Identifies one requested peer connection.
struct PeerConnectionParams {
  std::int64_t connection_id{0};
  std::int64_t video_track{0};
  // Absent selects the service default.
  std::optional<std::string> user_agent{};
};

struct IceCandidateParams {
  std::string candidate{};
  std::optional<std::string> sdp_mid{};
  std::optional<int> sdp_mline_index{};
  std::optional<std::string> username_fragment{};
};

void to_json(nlohmann::json& j, const PeerConnectionParams& params);
void from_json(const nlohmann::json& j, PeerConnectionParams& params);

// Field names follow the browser's RTCIceCandidateInit.
void to_json(nlohmann::json& j, const IceCandidateParams& params);
void from_json(const nlohmann::json& j, IceCandidateParams& params);

// A parsed "candidate:" SDP attribute.
struct IceCandidate {
  std::string foundation{};
  std::uint16_t component{0};
  std::string transport{};
  std::uint32_t priority{0};
  std::string address{};
  std::uint16_t port{0};
  std::string type{};
  std::optional<std::string> related_address{};
  std::optional<std::uint16_t> related_port{};
  std::vector<std::string> extensions{};
  std::string sdp_mid{};
  std::optional<int> sdp_mline_index{};

  // Attribute value without the "candidate:" prefix.
  [[nodiscard]] std::string to_sdp() const;
};

// Strips an optional "candidate:" prefix and parses the attribute. Throws
// std::invalid_argument on malformed input.
IceCandidate parse_ice_candidate(const IceCandidateParams& params);

// mid of the first video m-line of an SDP blob, if any.
std::optional<std::string> sdp_video_mid(const std::string& sdp);

// mid of the m-line at the given zero-based index, if any.
std::optional<std::string> sdp_mid_at(const std::string& sdp, int mline_index);

}  // namespace glonax_agent::tunnel

namespace glonax_agent::rpc {

template <>
struct is_record<tunnel::PeerConnectionParams> : std::true_type {};

template <>
struct is_record<tunnel::IceCandidateParams> : std::true_type {};

}  // namespace glonax_agent::rpc
