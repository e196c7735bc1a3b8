#include "model/messages.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace glonax_agent::model {

const char* machine_type_name(const std::uint8_t machine_type) {
  switch (static_cast<MachineType>(machine_type)) {
    case MachineType::EXCAVATOR:
      return "excavator";
    case MachineType::WHEEL_LOADER:
      return "wheel loader";
    case MachineType::DOZER:
      return "dozer";
    case MachineType::GRADER:
      return "grader";
    case MachineType::HAULER:
      return "hauler";
    case MachineType::FORESTRY:
      return "forestry";
  }
  return "unknown";
}

std::string Instance::version_string() const {
  return std::to_string(version[0]) + '.' + std::to_string(version[1]) + '.' + std::to_string(version[2]);
}

Engine Engine::request_rpm(const std::uint16_t rpm) {
  return Engine{.driver_demand = 0, .actual_engine = 0, .rpm = rpm, .state = EngineState::REQUEST};
}

Engine Engine::shutdown() {
  return Engine{.driver_demand = 0, .actual_engine = 0, .rpm = 0, .state = EngineState::NOREQUEST};
}

bool Engine::is_running() const noexcept {
  return state == EngineState::REQUEST && (actual_engine > 0 || rpm > 0);
}

EngineState engine_state_from_code(const std::uint8_t code) {
  switch (code) {
    case 0x00:
    case 0x01:
    case 0x02:
    case 0x10:
      return static_cast<EngineState>(code);
    default:
      throw std::invalid_argument("unknown engine state " + std::to_string(code));
  }
}

MotionType motion_type_from_code(const std::uint8_t code) {
  switch (code) {
    case 0x00:
    case 0x01:
    case 0x02:
    case 0x05:
    case 0x10:
      return static_cast<MotionType>(code);
    default:
      throw std::invalid_argument("unknown motion type " + std::to_string(code));
  }
}

ControlType control_type_from_code(const std::uint8_t code) {
  switch (code) {
    case 0x05:
    case 0x06:
    case 0x07:
    case 0x08:
    case 0x09:
    case 0x0A:
    case 0x1B:
    case 0x1C:
    case 0x1E:
    case 0x1F:
    case 0x20:
    case 0x2D:
      return static_cast<ControlType>(code);
    default:
      throw std::invalid_argument("unknown control type " + std::to_string(code));
  }
}

Motion Motion::stop_all() { return Motion{.type = MotionType::STOP_ALL}; }

Motion Motion::resume_all() { return Motion{.type = MotionType::RESUME_ALL}; }

Motion Motion::reset_all() { return Motion{.type = MotionType::RESET_ALL}; }

Motion Motion::straight(const std::int16_t value) {
  return Motion{.type = MotionType::STRAIGHT_DRIVE, .straight_drive = StraightDrive{value}};
}

Motion Motion::changes(std::vector<ChangeSet> change) {
  return Motion{.type = MotionType::CHANGE, .straight_drive = std::nullopt, .change = std::move(change)};
}

}  // namespace glonax_agent::model
