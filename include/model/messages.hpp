#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "model/uuid.hpp"

namespace glonax_agent::model {

enum class MachineType : std::uint8_t {
  EXCAVATOR = 1,
  WHEEL_LOADER = 2,
  DOZER = 3,
  GRADER = 4,
  HAULER = 5,
  FORESTRY = 6,
};

const char* machine_type_name(std::uint8_t machine_type);

// Machine identity, received once per session during the handshake.
struct Instance {
  Uuid id{};
  std::string model{};
  std::uint8_t machine_type{0};
  std::array<std::uint8_t, 3> version{};
  std::string serial_number{};

  [[nodiscard]] std::string version_string() const;

  friend bool operator==(const Instance&, const Instance&) = default;
};

enum class EngineState : std::uint8_t {
  NOREQUEST = 0x00,
  STARTING = 0x01,
  STOPPING = 0x02,
  REQUEST = 0x10,
};

struct Engine {
  std::uint8_t driver_demand{0};
  std::uint8_t actual_engine{0};
  std::uint16_t rpm{0};
  EngineState state{EngineState::NOREQUEST};

  static Engine request_rpm(std::uint16_t rpm);
  static Engine shutdown();

  [[nodiscard]] bool is_running() const noexcept;

  friend bool operator==(const Engine&, const Engine&) = default;
};

enum class MotionType : std::uint8_t {
  STOP_ALL = 0x00,
  RESUME_ALL = 0x01,
  RESET_ALL = 0x02,
  STRAIGHT_DRIVE = 0x05,
  CHANGE = 0x10,
};

struct StraightDrive {
  std::int16_t value{0};

  friend bool operator==(const StraightDrive&, const StraightDrive&) = default;
};

struct ChangeSet {
  std::uint16_t actuator{0};
  std::int16_t value{0};

  friend bool operator==(const ChangeSet&, const ChangeSet&) = default;
};

struct Motion {
  MotionType type{MotionType::STOP_ALL};
  std::optional<StraightDrive> straight_drive{};
  std::vector<ChangeSet> change{};

  static Motion stop_all();
  static Motion resume_all();
  static Motion reset_all();
  static Motion straight(std::int16_t value);
  static Motion changes(std::vector<ChangeSet> change);

  friend bool operator==(const Motion&, const Motion&) = default;
};

enum class ControlType : std::uint8_t {
  HYDRAULIC_QUICK_DISCONNECT = 0x05,
  HYDRAULIC_LOCK = 0x06,
  HYDRAULIC_BOOST = 0x07,
  HYDRAULIC_BOOM_CONFLUX = 0x08,
  HYDRAULIC_ARM_CONFLUX = 0x09,
  HYDRAULIC_BOOM_FLOAT = 0x0A,
  MACHINE_SHUTDOWN = 0x1B,
  MACHINE_ILLUMINATION = 0x1C,
  MACHINE_HORN = 0x1E,
  MACHINE_STROBE_LIGHT = 0x1F,
  MACHINE_TRAVEL_ALARM = 0x20,
  MACHINE_LIGHTS = 0x2D,
};

struct Control {
  ControlType type{ControlType::MACHINE_HORN};
  bool value{false};

  friend bool operator==(const Control&, const Control&) = default;
};

struct ModuleStatus {
  std::string name{};
  std::uint8_t state{0};
  std::uint8_t error_code{0};

  friend bool operator==(const ModuleStatus&, const ModuleStatus&) = default;
};

// Answer/offer blob relayed through the cloud envelope.
struct SessionDescription {
  std::string type{};
  std::string sdp{};

  friend bool operator==(const SessionDescription&, const SessionDescription&) = default;
};

// Checked conversions from wire codes; throw std::invalid_argument on unknown codes.
EngineState engine_state_from_code(std::uint8_t code);
MotionType motion_type_from_code(std::uint8_t code);
ControlType control_type_from_code(std::uint8_t code);

// Payload of a machine signal. The monostate alternative is "no payload".
using Payload = std::variant<std::monostate, Instance, ModuleStatus, Engine, Motion, Control, SessionDescription>;

struct Signal {
  std::string topic{};
  Payload payload{};

  friend bool operator==(const Signal&, const Signal&) = default;
};

}  // namespace glonax_agent::model
