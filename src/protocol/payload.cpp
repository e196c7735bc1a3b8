#include "protocol/payload.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace glonax_agent::protocol {
namespace {

class ByteWriter {
 public:
  void u8(const std::uint8_t value) { out_.push_back(value); }

  void u16(const std::uint16_t value) {
    out_.push_back(static_cast<std::uint8_t>(value >> 8U));
    out_.push_back(static_cast<std::uint8_t>(value & 0xFFU));
  }

  void i16(const std::int16_t value) { u16(static_cast<std::uint16_t>(value)); }

  void string(const std::string& value) {
    if (value.size() > kMaxPayloadSize) {
      throw ProtocolError("string field exceeds 65535 bytes");
    }
    u16(static_cast<std::uint16_t>(value.size()));
    out_.insert(out_.end(), value.begin(), value.end());
  }

  void raw(const std::uint8_t* data, const std::size_t size) { out_.insert(out_.end(), data, data + size); }

  Bytes take() { return std::move(out_); }

 private:
  Bytes out_{};
};

class ByteReader {
 public:
  ByteReader(const Bytes& data, const char* what) : data_(data), what_(what) {}

  std::uint8_t u8() {
    require(1);
    return data_[offset_++];
  }

  std::uint16_t u16() {
    require(2);
    const auto value = static_cast<std::uint16_t>((data_[offset_] << 8U) | data_[offset_ + 1]);
    offset_ += 2;
    return value;
  }

  std::int16_t i16() { return static_cast<std::int16_t>(u16()); }

  std::string string() {
    const std::size_t length = u16();
    require(length);
    std::string value(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                      data_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
    offset_ += length;
    return value;
  }

  void raw(std::uint8_t* out, const std::size_t size) {
    require(size);
    std::copy(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
              data_.begin() + static_cast<std::ptrdiff_t>(offset_ + size), out);
    offset_ += size;
  }

 private:
  void require(const std::size_t size) const {
    if (data_.size() - offset_ < size) {
      throw ProtocolError(std::string(what_) + " payload is truncated");
    }
  }

  const Bytes& data_;
  const char* what_;
  std::size_t offset_{0};
};

template <typename Fn>
auto checked_code(const char* what, Fn&& convert) {
  try {
    return convert();
  } catch (const std::invalid_argument& ex) {
    throw ProtocolError(std::string(what) + ": " + ex.what());
  }
}

}  // namespace

Bytes to_bytes(const model::Instance& instance) {
  ByteWriter writer;
  writer.raw(instance.id.bytes.data(), instance.id.bytes.size());
  writer.u8(instance.machine_type);
  writer.u8(instance.version[0]);
  writer.u8(instance.version[1]);
  writer.u8(instance.version[2]);
  writer.string(instance.model);
  writer.string(instance.serial_number);
  return writer.take();
}

Bytes to_bytes(const model::Engine& engine) {
  ByteWriter writer;
  writer.u8(engine.driver_demand);
  writer.u8(engine.actual_engine);
  writer.u16(engine.rpm);
  writer.u8(static_cast<std::uint8_t>(engine.state));
  return writer.take();
}

Bytes to_bytes(const model::Motion& motion) {
  ByteWriter writer;
  writer.u8(static_cast<std::uint8_t>(motion.type));
  if (motion.type == model::MotionType::CHANGE) {
    if (motion.change.size() > 0xFF) {
      throw ProtocolError("motion change set holds more than 255 entries");
    }
    writer.u8(static_cast<std::uint8_t>(motion.change.size()));
    for (const auto& change : motion.change) {
      writer.u16(change.actuator);
      writer.i16(change.value);
    }
  } else if (motion.type == model::MotionType::STRAIGHT_DRIVE) {
    writer.i16(motion.straight_drive.value_or(model::StraightDrive{}).value);
  }
  return writer.take();
}

Bytes to_bytes(const model::Control& control) {
  return Bytes{static_cast<std::uint8_t>(control.type), static_cast<std::uint8_t>(control.value ? 1 : 0)};
}

Bytes to_bytes(const model::ModuleStatus& status) {
  ByteWriter writer;
  writer.string(status.name);
  writer.u8(status.state);
  writer.u8(status.error_code);
  return writer.take();
}

model::Instance instance_from_bytes(const Bytes& data) {
  ByteReader reader(data, "instance");
  model::Instance instance{};
  reader.raw(instance.id.bytes.data(), instance.id.bytes.size());
  instance.machine_type = reader.u8();
  instance.version[0] = reader.u8();
  instance.version[1] = reader.u8();
  instance.version[2] = reader.u8();
  instance.model = reader.string();
  instance.serial_number = reader.string();
  return instance;
}

model::Engine engine_from_bytes(const Bytes& data) {
  ByteReader reader(data, "engine");
  model::Engine engine{};
  engine.driver_demand = reader.u8();
  engine.actual_engine = reader.u8();
  engine.rpm = reader.u16();
  const auto state = reader.u8();
  engine.state = checked_code("engine", [state] { return model::engine_state_from_code(state); });
  return engine;
}

model::Motion motion_from_bytes(const Bytes& data) {
  ByteReader reader(data, "motion");
  const auto code = reader.u8();

  model::Motion motion{};
  motion.type = checked_code("motion", [code] { return model::motion_type_from_code(code); });
  if (motion.type == model::MotionType::CHANGE) {
    const std::size_t count = reader.u8();
    motion.change.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      model::ChangeSet change{};
      change.actuator = reader.u16();
      change.value = reader.i16();
      motion.change.push_back(change);
    }
  } else if (motion.type == model::MotionType::STRAIGHT_DRIVE) {
    motion.straight_drive = model::StraightDrive{reader.i16()};
  }
  return motion;
}

model::Control control_from_bytes(const Bytes& data) {
  ByteReader reader(data, "control");
  const auto code = reader.u8();
  model::Control control{};
  control.type = checked_code("control", [code] { return model::control_type_from_code(code); });
  control.value = reader.u8() != 0;
  return control;
}

model::ModuleStatus module_status_from_bytes(const Bytes& data) {
  ByteReader reader(data, "status");
  model::ModuleStatus status{};
  status.name = reader.string();
  status.state = reader.u8();
  status.error_code = reader.u8();
  return status;
}

Bytes session_to_bytes(const std::string& user_agent) {
  ByteWriter writer;
  writer.u8(kProtocolVersion);
  writer.raw(reinterpret_cast<const std::uint8_t*>(user_agent.data()), user_agent.size());
  return writer.take();
}

std::string session_user_agent_from_bytes(const Bytes& data) {
  if (data.empty()) {
    throw ProtocolError("session payload is truncated");
  }
  if (data[0] != kProtocolVersion) {
    throw ProtocolError("session requests unsupported protocol version " + std::to_string(data[0]));
  }
  return std::string(data.begin() + 1, data.end());
}

}  // namespace glonax_agent::protocol
