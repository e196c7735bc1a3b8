#include "core/router.hpp"

#include <iostream>

#include "model/json_codec.hpp"

namespace glonax_agent::core {

std::optional<std::string> Router::route(const std::string& text) {
  const auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    const auto response = dispatcher_.invoke(text);
    return response.has_value() ? std::optional<std::string>(model::to_text(*response)) : std::nullopt;
  }

  if (parsed.is_array() || (parsed.is_object() && parsed.contains("jsonrpc"))) {
    const auto response = dispatcher_.invoke_json(parsed);
    return response.has_value() ? std::optional<std::string>(model::to_text(*response)) : std::nullopt;
  }

  if (parsed.is_object() && parsed.contains("type") && parsed.contains("topic")) {
    route_envelope(parsed);
    return std::nullopt;
  }

  std::cerr << "[cloud] dropping unrecognized message\n";
  return std::nullopt;
}

void Router::route_envelope(const nlohmann::json& envelope) {
  model::ChannelMessage message = model::decode_channel_message(envelope);

  switch (message.type) {
    case model::ChannelMessageType::COMMAND:
    case model::ChannelMessageType::CONTROL: {
      const std::string topic = message.topic;
      const PushResult result = commands_.try_push(std::move(message));
      if (result != PushResult::OK) {
        ++dropped_commands_;
        std::cerr << "[cloud] command queue " << push_result_name(result) << ", dropping '" << topic << "'\n";
      }
      return;
    }
    case model::ChannelMessageType::ERROR:
      std::cerr << "[cloud] dropping undecodable channel message on topic '" << message.topic << "'\n";
      return;
    case model::ChannelMessageType::SIGNAL:
    case model::ChannelMessageType::PEER:
      std::cerr << "[cloud] ignoring " << model::channel_message_type_name(message.type) << " message on topic '"
                << message.topic << "'\n";
      return;
  }
}

}  // namespace glonax_agent::core
