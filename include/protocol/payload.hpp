#pragma once

#include <string>

#include "model/messages.hpp"
#include "protocol/frame.hpp"

// Binary layouts of the typed payloads. Integers are big-endian, strings are
// u16-length-prefixed UTF-8. Decoders throw ProtocolError on short or
// malformed input.
namespace glonax_agent::protocol {

Bytes to_bytes(const model::Instance& instance);
Bytes to_bytes(const model::Engine& engine);
Bytes to_bytes(const model::Motion& motion);
Bytes to_bytes(const model::Control& control);
Bytes to_bytes(const model::ModuleStatus& status);

model::Instance instance_from_bytes(const Bytes& data);
model::Engine engine_from_bytes(const Bytes& data);
model::Motion motion_from_bytes(const Bytes& data);
model::Control control_from_bytes(const Bytes& data);
model::ModuleStatus module_status_from_bytes(const Bytes& data);

// SESSION payload: protocol version byte followed by the user agent.
Bytes session_to_bytes(const std::string& user_agent);
std::string session_user_agent_from_bytes(const Bytes& data);

}  // namespace glonax_agent::protocol
