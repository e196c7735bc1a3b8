#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace glonax_agent::protocol {

class ByteStream;

// Malformed wire data. The stream that produced it is unusable; callers close
// it and reconnect rather than try to resynchronise.
class ProtocolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class MessageType : std::uint8_t {
  ERROR = 0x00,
  ECHO = 0x01,
  SESSION = 0x10,
  SHUTDOWN = 0x11,
  REQUEST = 0x12,
  INSTANCE = 0x15,
  STATUS = 0x16,
  MOTION = 0x20,
  SIGNAL = 0x31,
  ACTOR = 0x40,
  VMS = 0x41,
  GNSS = 0x42,
  ENGINE = 0x43,
  TARGET = 0x44,
  CONTROL = 0x45,
  ROTATOR = 0x46,
};

bool is_known_message_type(std::uint8_t code) noexcept;
bool is_deprecated_message_type(MessageType type) noexcept;
const char* message_type_name(std::uint8_t code) noexcept;

constexpr std::array<std::uint8_t, 3> kFrameMagic{'L', 'X', 'R'};
constexpr std::uint8_t kProtocolVersion = 3;
constexpr std::size_t kHeaderSize = 10;
constexpr std::size_t kMaxPayloadSize = 0xFFFF;

using Bytes = std::vector<std::uint8_t>;

// The type is kept as the raw code so frames of unknown type survive a relay.
struct Frame {
  std::uint8_t type{0};
  Bytes payload{};

  Frame() = default;
  Frame(MessageType message_type, Bytes data) : type(static_cast<std::uint8_t>(message_type)), payload(std::move(data)) {}
  Frame(std::uint8_t code, Bytes data) : type(code), payload(std::move(data)) {}

  [[nodiscard]] MessageType message_type() const noexcept { return static_cast<MessageType>(type); }
  [[nodiscard]] bool is(MessageType message_type) const noexcept { return type == static_cast<std::uint8_t>(message_type); }

  friend bool operator==(const Frame&, const Frame&) = default;
};

Bytes encode_header(std::uint8_t type, std::size_t payload_length);
Bytes encode(const Frame& frame);
Bytes encode(MessageType type, const Bytes& payload);

// Validates a header and returns the payload length it announces.
std::size_t decode_header(const std::uint8_t* header);

// Decodes a buffer holding exactly one frame.
Frame decode(const std::uint8_t* data, std::size_t size);
Frame decode(const Bytes& buffer);

// Reads exactly one frame. Throws ConnectionError when the peer closed before
// the first header byte, ProtocolError on malformed or truncated frames.
Frame read_frame(ByteStream& stream);

void write_frame(ByteStream& stream, const Frame& frame);

}  // namespace glonax_agent::protocol
