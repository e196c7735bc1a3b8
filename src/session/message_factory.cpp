#include "session/message_factory.hpp"

#include "protocol/payload.hpp"

namespace glonax_agent::session {

using protocol::MessageType;

const char* ignore_reason_name(const IgnoreReason reason) {
  switch (reason) {
    case IgnoreReason::UNKNOWN_TYPE:
      return "unknown type";
    case IgnoreReason::DEPRECATED:
      return "deprecated";
    case IgnoreReason::OUTBOUND_ONLY:
      return "outbound only";
    case IgnoreReason::NOT_IMPLEMENTED:
      return "not implemented";
  }
  return "unknown type";
}

Decoded decode_message(const protocol::Frame& frame) {
  if (!protocol::is_known_message_type(frame.type)) {
    return Ignored{frame.type, IgnoreReason::UNKNOWN_TYPE};
  }

  switch (frame.message_type()) {
    case MessageType::INSTANCE:
      return model::Signal{"instance", protocol::instance_from_bytes(frame.payload)};
    case MessageType::STATUS:
      return model::Signal{"status", protocol::module_status_from_bytes(frame.payload)};
    case MessageType::ENGINE:
      return model::Signal{"engine", protocol::engine_from_bytes(frame.payload)};
    case MessageType::MOTION:
      return model::Signal{"motion", protocol::motion_from_bytes(frame.payload)};
    case MessageType::SESSION:
      return Ignored{frame.type, IgnoreReason::OUTBOUND_ONLY};
    case MessageType::VMS:
    case MessageType::GNSS:
      return Ignored{frame.type, IgnoreReason::DEPRECATED};
    case MessageType::ERROR:
    case MessageType::ECHO:
    case MessageType::SHUTDOWN:
    case MessageType::REQUEST:
    case MessageType::SIGNAL:
    case MessageType::ACTOR:
    case MessageType::TARGET:
    case MessageType::CONTROL:
    case MessageType::ROTATOR:
      return Ignored{frame.type, IgnoreReason::NOT_IMPLEMENTED};
  }

  return Ignored{frame.type, IgnoreReason::UNKNOWN_TYPE};
}

}  // namespace glonax_agent::session
