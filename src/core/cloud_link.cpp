#include "core/cloud_link.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <variant>

#include <rtc/rtc.hpp>

#include "core/config.hpp"
#include "model/channel_message.hpp"
#include "model/json_codec.hpp"

namespace glonax_agent::core {

namespace {

// State shared between one websocket's callbacks and the link thread.
struct Connection {
  explicit Connection(std::size_t capacity) : inbound(capacity) {}

  BoundedChannel<std::string> inbound;
};

}  // namespace

bool SignalForwarder::forward(const model::Signal& signal, CloudSocket& socket,
                              const ChangeDetector::Clock::time_point now) {
  if (!socket.is_open()) {
    return false;
  }
  if (!detector_.should_send(signal, now)) {
    return false;
  }

  const model::ChannelMessage message{
      .type = model::ChannelMessageType::SIGNAL,
      .topic = signal.topic,
      .payload = signal.payload,
  };
  const std::string text = model::to_text(model::encode_channel_message(message));
  if (log_signals_) {
    std::cerr << "[cloud] -> " << text << '\n';
  }
  return socket.send_text(text);
}

void run_signal_pump(SignalChannel& signals, SignalForwarder& forwarder, CloudSocket& socket,
                     const CancellationToken& token) {
  while (!token.cancelled()) {
    auto signal = signals.pop(token);
    if (!signal.has_value()) {
      if (signals.closed()) {
        return;
      }
      continue;
    }
    try {
      forwarder.forward(*signal, socket);
    } catch (const std::exception& ex) {
      std::cerr << "[cloud] dropping signal '" << signal->topic << "': " << ex.what() << '\n';
    }
  }
}

CloudLink::CloudLink(CloudLinkOptions options, Router& router, const MachineState& state)
    : options_(std::move(options)), router_(router), state_(state) {}

CloudLink::~CloudLink() {
  std::shared_ptr<rtc::WebSocket> socket;
  {
    const std::lock_guard<std::mutex> lock(socket_mutex_);
    socket = std::move(socket_);
  }
  if (socket != nullptr) {
    socket->resetCallbacks();
    socket->close();
  }
}

std::string CloudLink::websocket_url(const std::string& base_url, const model::Instance& instance) {
  return normalize_websocket_url(base_url) + "/" + instance.id.to_string() + "/ws";
}

void CloudLink::run(const CancellationToken& token) {
  const auto instance = state_.wait_for_instance(token);
  if (!instance.has_value()) {
    return;
  }

  const std::string url = websocket_url(options_.base_url, *instance);
  while (!token.cancelled()) {
    serve(url, token);
    if (token.wait_for(options_.reconnect_delay)) {
      break;
    }
  }
}

bool CloudLink::is_open() const {
  const std::lock_guard<std::mutex> lock(socket_mutex_);
  return socket_ != nullptr && socket_->isOpen();
}

bool CloudLink::send_text(const std::string& text) {
  const std::lock_guard<std::mutex> lock(socket_mutex_);
  if (socket_ == nullptr || !socket_->isOpen()) {
    return false;
  }
  try {
    return socket_->send(text);
  } catch (const std::exception& ex) {
    std::cerr << "[cloud] send failed: " << ex.what() << '\n';
    return false;
  }
}

void CloudLink::serve(const std::string& url, const CancellationToken& token) {
  auto connection = std::make_shared<Connection>(options_.inbound_capacity);
  auto socket = std::make_shared<rtc::WebSocket>();

  socket->onOpen([url] { std::cerr << "[cloud] connected to " << url << '\n'; });
  socket->onClosed([connection] { connection->inbound.close(); });
  socket->onError([connection](const std::string& error) {
    std::cerr << "[cloud] websocket error: " << error << '\n';
    connection->inbound.close();
  });
  socket->onMessage([connection](rtc::message_variant data) {
    if (!std::holds_alternative<std::string>(data)) {
      std::cerr << "[cloud] dropping binary message\n";
      return;
    }
    if (connection->inbound.try_push(std::get<std::string>(std::move(data))) == PushResult::FULL) {
      std::cerr << "[cloud] inbound queue full, dropping message\n";
    }
  });

  try {
    socket->open(url);
  } catch (const std::exception& ex) {
    std::cerr << "[cloud] cannot open " << url << ": " << ex.what() << '\n';
    socket->resetCallbacks();
    return;
  }

  {
    const std::lock_guard<std::mutex> lock(socket_mutex_);
    socket_ = socket;
  }

  while (!token.cancelled()) {
    auto text = connection->inbound.pop(token);
    if (!text.has_value()) {
      if (connection->inbound.closed()) {
        break;
      }
      continue;
    }

    try {
      const auto reply = router_.route(*text);
      if (reply.has_value() && !send_text(*reply)) {
        std::cerr << "[cloud] reply lost, socket not open\n";
      }
    } catch (const std::exception& ex) {
      std::cerr << "[cloud] dropping message: " << ex.what() << '\n';
    }
  }

  {
    const std::lock_guard<std::mutex> lock(socket_mutex_);
    socket_.reset();
  }
  socket->resetCallbacks();
  socket->close();
  std::cerr << "[cloud] disconnected from " << url << '\n';
}

}  // namespace glonax_agent::core
