#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>

#include "core/channel.hpp"
#include "model/channel_message.hpp"
#include "rpc/dispatcher.hpp"

namespace glonax_agent::core {

using CommandChannel = BoundedChannel<model::ChannelMessage>;

// Routes inbound cloud websocket text: JSON-RPC requests and batches go to
// the dispatcher, COMMAND and CONTROL envelopes go to the command queue, and
// everything else is logged and dropped.
class Router {
 public:
  Router(const rpc::Dispatcher& dispatcher, CommandChannel& commands) : dispatcher_(dispatcher), commands_(commands) {}

  // Returns the reply to send back, if any.
  std::optional<std::string> route(const std::string& text);

  [[nodiscard]] std::size_t dropped_commands() const noexcept { return dropped_commands_.load(); }

 private:
  void route_envelope(const nlohmann::json& envelope);

  const rpc::Dispatcher& dispatcher_;
  CommandChannel& commands_;
  std::atomic<std::size_t> dropped_commands_{0};
};

}  // namespace glonax_agent::core
