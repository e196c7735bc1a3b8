#pragma once

#include <cstdint>
#include <variant>

#include "model/messages.hpp"
#include "protocol/frame.hpp"

namespace glonax_agent::session {

enum class IgnoreReason : std::uint8_t {
  UNKNOWN_TYPE,
  DEPRECATED,
  OUTBOUND_ONLY,
  NOT_IMPLEMENTED,
};

const char* ignore_reason_name(IgnoreReason reason);

// A frame the agent accepts on the wire but does not turn into a signal.
struct Ignored {
  std::uint8_t type{0};
  IgnoreReason reason{IgnoreReason::UNKNOWN_TYPE};
};

using Decoded = std::variant<model::Signal, Ignored>;

// Maps a machine frame to a typed signal. Unknown, deprecated, outbound-only
// and not-yet-implemented types come back as Ignored rather than as errors so
// that newer machine daemons stay compatible. Malformed payloads of the
// implemented types still throw ProtocolError.
Decoded decode_message(const protocol::Frame& frame);

}  // namespace glonax_agent::session
