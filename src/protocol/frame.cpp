#include "protocol/frame.hpp"

#include <algorithm>
#include <string>

#include "protocol/byte_stream.hpp"

namespace glonax_agent::protocol {

bool is_known_message_type(const std::uint8_t code) noexcept {
  switch (static_cast<MessageType>(code)) {
    case MessageType::ERROR:
    case MessageType::ECHO:
    case MessageType::SESSION:
    case MessageType::SHUTDOWN:
    case MessageType::REQUEST:
    case MessageType::INSTANCE:
    case MessageType::STATUS:
    case MessageType::MOTION:
    case MessageType::SIGNAL:
    case MessageType::ACTOR:
    case MessageType::VMS:
    case MessageType::GNSS:
    case MessageType::ENGINE:
    case MessageType::TARGET:
    case MessageType::CONTROL:
    case MessageType::ROTATOR:
      return true;
  }
  return false;
}

bool is_deprecated_message_type(const MessageType type) noexcept {
  return type == MessageType::VMS || type == MessageType::GNSS;
}

const char* message_type_name(const std::uint8_t code) noexcept {
  switch (static_cast<MessageType>(code)) {
    case MessageType::ERROR:
      return "ERROR";
    case MessageType::ECHO:
      return "ECHO";
    case MessageType::SESSION:
      return "SESSION";
    case MessageType::SHUTDOWN:
      return "SHUTDOWN";
    case MessageType::REQUEST:
      return "REQUEST";
    case MessageType::INSTANCE:
      return "INSTANCE";
    case MessageType::STATUS:
      return "STATUS";
    case MessageType::MOTION:
      return "MOTION";
    case MessageType::SIGNAL:
      return "SIGNAL";
    case MessageType::ACTOR:
      return "ACTOR";
    case MessageType::VMS:
      return "VMS";
    case MessageType::GNSS:
      return "GNSS";
    case MessageType::ENGINE:
      return "ENGINE";
    case MessageType::TARGET:
      return "TARGET";
    case MessageType::CONTROL:
      return "CONTROL";
    case MessageType::ROTATOR:
      return "ROTATOR";
  }
  return "UNKNOWN";
}

Bytes encode_header(const std::uint8_t type, const std::size_t payload_length) {
  if (payload_length > kMaxPayloadSize) {
    throw ProtocolError("payload of " + std::to_string(payload_length) + " bytes exceeds frame limit");
  }

  Bytes header;
  header.reserve(kHeaderSize);
  header.insert(header.end(), kFrameMagic.begin(), kFrameMagic.end());
  header.push_back(kProtocolVersion);
  header.push_back(type);
  header.push_back(static_cast<std::uint8_t>((payload_length >> 8U) & 0xFFU));
  header.push_back(static_cast<std::uint8_t>(payload_length & 0xFFU));
  header.push_back(0);
  header.push_back(0);
  header.push_back(0);
  return header;
}

Bytes encode(const Frame& frame) {
  Bytes out = encode_header(frame.type, frame.payload.size());
  out.insert(out.end(), frame.payload.begin(), frame.payload.end());
  return out;
}

Bytes encode(const MessageType type, const Bytes& payload) {
  Bytes out = encode_header(static_cast<std::uint8_t>(type), payload.size());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

std::size_t decode_header(const std::uint8_t* header) {
  if (!std::equal(kFrameMagic.begin(), kFrameMagic.end(), header)) {
    throw ProtocolError("invalid frame magic");
  }
  if (header[3] != kProtocolVersion) {
    throw ProtocolError("unsupported protocol version " + std::to_string(header[3]));
  }
  if (header[7] != 0 || header[8] != 0 || header[9] != 0) {
    throw ProtocolError("invalid header padding");
  }
  return (static_cast<std::size_t>(header[5]) << 8U) | static_cast<std::size_t>(header[6]);
}

Frame decode(const std::uint8_t* data, const std::size_t size) {
  if (size < kHeaderSize) {
    throw ProtocolError("frame shorter than header");
  }

  const std::size_t length = decode_header(data);
  if (size != kHeaderSize + length) {
    throw ProtocolError("frame length mismatch: header announces " + std::to_string(length) + " bytes, buffer holds " +
                        std::to_string(size - kHeaderSize));
  }

  return Frame(data[4], Bytes(data + kHeaderSize, data + size));
}

Frame decode(const Bytes& buffer) { return decode(buffer.data(), buffer.size()); }

Frame read_frame(ByteStream& stream) {
  std::uint8_t header[kHeaderSize];
  const std::size_t got = read_exact(stream, header, kHeaderSize);
  if (got == 0) {
    throw ConnectionError("connection closed by peer");
  }
  if (got < kHeaderSize) {
    throw ProtocolError("truncated frame header");
  }

  const std::size_t length = decode_header(header);
  Frame frame(header[4], Bytes(length));
  if (length > 0 && read_exact(stream, frame.payload.data(), length) != length) {
    throw ProtocolError("truncated frame payload");
  }
  return frame;
}

void write_frame(ByteStream& stream, const Frame& frame) {
  const Bytes bytes = encode(frame);
  stream.write_all(bytes.data(), bytes.size());
}

}  // namespace glonax_agent::protocol
