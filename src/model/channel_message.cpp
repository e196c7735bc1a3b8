#include "model/channel_message.hpp"

#include <algorithm>
#include <exception>
#include <initializer_list>
#include <string>

#include "model/json_codec.hpp"

namespace glonax_agent::model {
namespace {

struct FieldSet {
  std::initializer_list<const char*> required;
  std::initializer_list<const char*> optional;
};

bool has_exact_fields(const nlohmann::json& j, const FieldSet& fields) {
  if (!j.is_object()) {
    return false;
  }

  for (const char* key : fields.required) {
    if (!j.contains(key)) {
      return false;
    }
  }

  for (const auto& item : j.items()) {
    const auto& key = item.key();
    const auto known = [&key](const char* candidate) { return key == candidate; };
    if (std::none_of(fields.required.begin(), fields.required.end(), known) &&
        std::none_of(fields.optional.begin(), fields.optional.end(), known)) {
      return false;
    }
  }

  return true;
}

template <typename T>
bool try_candidate(const nlohmann::json& j, const FieldSet& fields, Payload& out) {
  if (!has_exact_fields(j, fields)) {
    return false;
  }

  try {
    out = j.get<T>();
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool decode_payload(const nlohmann::json& j, Payload& out) {
  return try_candidate<Instance>(j, {{"id", "model", "machine_type", "version", "serial_number"}, {}}, out) ||
         try_candidate<ModuleStatus>(j, {{"name", "state", "error_code"}, {}}, out) ||
         try_candidate<Engine>(j, {{"driver_demand", "actual_engine", "rpm", "state"}, {}}, out) ||
         try_candidate<Motion>(j, {{"type"}, {"straight_drive", "change"}}, out) ||
         try_candidate<Control>(j, {{"type", "value"}, {}}, out) ||
         try_candidate<SessionDescription>(j, {{"type", "sdp"}, {}}, out);
}

}  // namespace

const char* channel_message_type_name(const ChannelMessageType type) {
  switch (type) {
    case ChannelMessageType::COMMAND:
      return "command";
    case ChannelMessageType::SIGNAL:
      return "signal";
    case ChannelMessageType::CONTROL:
      return "control";
    case ChannelMessageType::PEER:
      return "peer";
    case ChannelMessageType::ERROR:
      return "error";
  }
  return "error";
}

std::optional<ChannelMessageType> parse_channel_message_type(const std::string& name) {
  for (const auto type : {ChannelMessageType::COMMAND, ChannelMessageType::SIGNAL, ChannelMessageType::CONTROL,
                          ChannelMessageType::PEER, ChannelMessageType::ERROR}) {
    if (name == channel_message_type_name(type)) {
      return type;
    }
  }
  return std::nullopt;
}

ChannelMessage decode_channel_message(const nlohmann::json& j) {
  ChannelMessage message{};
  if (!j.is_object()) {
    return message;
  }

  const auto topic_it = j.find("topic");
  if (topic_it != j.end() && topic_it->is_string()) {
    message.topic = topic_it->get<std::string>();
  }

  const auto type_it = j.find("type");
  if (type_it == j.end() || !type_it->is_string() || topic_it == j.end() || !topic_it->is_string()) {
    return message;
  }

  const auto type = parse_channel_message_type(type_it->get<std::string>());
  if (!type.has_value()) {
    return message;
  }

  const auto payload_it = j.find("payload");
  if (payload_it == j.end() || !decode_payload(*payload_it, message.payload)) {
    message.payload = std::monostate{};
    return message;
  }

  message.type = *type;
  return message;
}

nlohmann::json encode_channel_message(const ChannelMessage& message) {
  return nlohmann::json{
      {"type", channel_message_type_name(message.type)}, {"topic", message.topic}, {"payload", message.payload}};
}

}  // namespace glonax_agent::model
