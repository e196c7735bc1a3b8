#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "model/messages.hpp"

namespace glonax_agent::model {

enum class ChannelMessageType : std::uint8_t {
  COMMAND = 0,
  SIGNAL = 1,
  CONTROL = 2,
  PEER = 3,
  ERROR = 4,
};

const char* channel_message_type_name(ChannelMessageType type);
std::optional<ChannelMessageType> parse_channel_message_type(const std::string& name);

// Envelope exchanged with the cloud over the control websocket.
struct ChannelMessage {
  ChannelMessageType type{ChannelMessageType::ERROR};
  std::string topic{};
  Payload payload{};

  friend bool operator==(const ChannelMessage&, const ChannelMessage&) = default;
};

// Tries payload candidates in a fixed order (Instance, ModuleStatus, Engine,
// Motion, Control, SessionDescription). A candidate matches only with all of
// its required fields and none other. Never throws: anything that does not
// decode comes back as an ERROR message carrying whatever topic was readable.
ChannelMessage decode_channel_message(const nlohmann::json& j);

nlohmann::json encode_channel_message(const ChannelMessage& message);

}  // namespace glonax_agent::model
