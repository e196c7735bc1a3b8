#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "core/cancellation.hpp"
#include "core/change_detector.hpp"
#include "core/machine_link.hpp"
#include "core/machine_state.hpp"
#include "core/router.hpp"
#include "model/messages.hpp"

namespace rtc {
class WebSocket;
}

namespace glonax_agent::core {

// Outbound half of the cloud control channel.
class CloudSocket {
 public:
  virtual ~CloudSocket() = default;

  [[nodiscard]] virtual bool is_open() const = 0;

  // Returns false when the text could not be handed to the transport.
  virtual bool send_text(const std::string& text) = 0;
};

// Wraps machine signals into SIGNAL envelopes, suppressing repeats.
class SignalForwarder {
 public:
  explicit SignalForwarder(std::chrono::milliseconds staleness = std::chrono::seconds(5), bool log_signals = false)
      : detector_(staleness), log_signals_(log_signals) {}

  // Returns true when the signal went out on the socket.
  bool forward(const model::Signal& signal, CloudSocket& socket,
               ChangeDetector::Clock::time_point now = ChangeDetector::Clock::now());

 private:
  ChangeDetector detector_;
  bool log_signals_;
};

// Drains the signal queue into the forwarder until cancelled or the queue
// closes. Signals popped while the socket is down are discarded.
void run_signal_pump(SignalChannel& signals, SignalForwarder& forwarder, CloudSocket& socket,
                     const CancellationToken& token);

struct CloudLinkOptions {
  std::string base_url{};
  std::chrono::milliseconds reconnect_delay{1000};
  std::size_t inbound_capacity{32};
};

// Websocket to {base_url}/{instance id}/ws. Inbound text is handed to the
// router on the link thread; replies go back on the same socket.
class CloudLink final : public CloudSocket {
 public:
  CloudLink(CloudLinkOptions options, Router& router, const MachineState& state);
  ~CloudLink() override;

  CloudLink(const CloudLink&) = delete;
  CloudLink& operator=(const CloudLink&) = delete;

  // Waits for the machine instance, then keeps the websocket connected until
  // the token is cancelled.
  void run(const CancellationToken& token);

  [[nodiscard]] bool is_open() const override;
  bool send_text(const std::string& text) override;

  static std::string websocket_url(const std::string& base_url, const model::Instance& instance);

 private:
  void serve(const std::string& url, const CancellationToken& token);

  CloudLinkOptions options_;
  Router& router_;
  const MachineState& state_;

  mutable std::mutex socket_mutex_{};
  std::shared_ptr<rtc::WebSocket> socket_{};
};

}  // namespace glonax_agent::core
