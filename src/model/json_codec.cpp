#include "model/json_codec.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace glonax_agent::model {
namespace {

template <typename T>
T get_integer(const nlohmann::json& j, const char* key) {
  const auto& value = j.at(key);
  if (!value.is_number_integer()) {
    throw std::invalid_argument(std::string(key) + " must be an integer");
  }

  if constexpr (std::is_signed_v<T>) {
    const auto raw = value.get<std::int64_t>();
    if (raw < std::numeric_limits<T>::min() || raw > std::numeric_limits<T>::max()) {
      throw std::invalid_argument(std::string(key) + " out of range");
    }
    return static_cast<T>(raw);
  } else {
    if (value.is_number_unsigned()) {
      const auto raw = value.get<std::uint64_t>();
      if (raw > std::numeric_limits<T>::max()) {
        throw std::invalid_argument(std::string(key) + " out of range");
      }
      return static_cast<T>(raw);
    }
    const auto raw = value.get<std::int64_t>();
    if (raw < 0 || static_cast<std::uint64_t>(raw) > std::numeric_limits<T>::max()) {
      throw std::invalid_argument(std::string(key) + " out of range");
    }
    return static_cast<T>(raw);
  }
}

}  // namespace

void to_json(nlohmann::json& j, const Uuid& uuid) { j = uuid.to_string(); }

void from_json(const nlohmann::json& j, Uuid& uuid) { uuid = Uuid::parse(j.get<std::string>()); }

void to_json(nlohmann::json& j, const Instance& instance) {
  j = nlohmann::json{{"id", instance.id},
                     {"model", instance.model},
                     {"machine_type", instance.machine_type},
                     {"version", {instance.version[0], instance.version[1], instance.version[2]}},
                     {"serial_number", instance.serial_number}};
}

void from_json(const nlohmann::json& j, Instance& instance) {
  instance.id = j.at("id").get<Uuid>();
  instance.model = j.at("model").get<std::string>();
  instance.machine_type = get_integer<std::uint8_t>(j, "machine_type");

  const auto& version = j.at("version");
  if (!version.is_array() || version.size() != 3) {
    throw std::invalid_argument("version must be an array of three integers");
  }
  for (std::size_t i = 0; i < 3; ++i) {
    const auto part = version[i].get<std::int64_t>();
    if (part < 0 || part > 255) {
      throw std::invalid_argument("version component out of range");
    }
    instance.version[i] = static_cast<std::uint8_t>(part);
  }

  instance.serial_number = j.at("serial_number").get<std::string>();
}

void to_json(nlohmann::json& j, const Engine& engine) {
  j = nlohmann::json{{"driver_demand", engine.driver_demand},
                     {"actual_engine", engine.actual_engine},
                     {"rpm", engine.rpm},
                     {"state", static_cast<std::uint8_t>(engine.state)}};
}

void from_json(const nlohmann::json& j, Engine& engine) {
  engine.driver_demand = get_integer<std::uint8_t>(j, "driver_demand");
  engine.actual_engine = get_integer<std::uint8_t>(j, "actual_engine");
  engine.rpm = get_integer<std::uint16_t>(j, "rpm");
  engine.state = engine_state_from_code(get_integer<std::uint8_t>(j, "state"));
}

void to_json(nlohmann::json& j, const StraightDrive& drive) { j = nlohmann::json{{"value", drive.value}}; }

void from_json(const nlohmann::json& j, StraightDrive& drive) { drive.value = get_integer<std::int16_t>(j, "value"); }

void to_json(nlohmann::json& j, const ChangeSet& change) {
  j = nlohmann::json{{"actuator", change.actuator}, {"value", change.value}};
}

void from_json(const nlohmann::json& j, ChangeSet& change) {
  change.actuator = get_integer<std::uint16_t>(j, "actuator");
  change.value = get_integer<std::int16_t>(j, "value");
}

void to_json(nlohmann::json& j, const Motion& motion) {
  j = nlohmann::json{{"type", static_cast<std::uint8_t>(motion.type)}};
  if (motion.straight_drive.has_value()) {
    j["straight_drive"] = *motion.straight_drive;
  }
  if (motion.type == MotionType::CHANGE) {
    j["change"] = motion.change;
  }
}

void from_json(const nlohmann::json& j, Motion& motion) {
  motion.type = motion_type_from_code(get_integer<std::uint8_t>(j, "type"));
  motion.straight_drive.reset();
  motion.change.clear();

  const auto drive_it = j.find("straight_drive");
  if (drive_it != j.end() && !drive_it->is_null()) {
    motion.straight_drive = drive_it->get<StraightDrive>();
  }

  const auto change_it = j.find("change");
  if (change_it != j.end() && !change_it->is_null()) {
    motion.change = change_it->get<std::vector<ChangeSet>>();
  }

  if (motion.type == MotionType::STRAIGHT_DRIVE && !motion.straight_drive.has_value()) {
    throw std::invalid_argument("straight drive motion requires straight_drive");
  }
}

void to_json(nlohmann::json& j, const Control& control) {
  j = nlohmann::json{{"type", static_cast<std::uint8_t>(control.type)}, {"value", control.value}};
}

void from_json(const nlohmann::json& j, Control& control) {
  control.type = control_type_from_code(get_integer<std::uint8_t>(j, "type"));
  control.value = j.at("value").get<bool>();
}

void to_json(nlohmann::json& j, const ModuleStatus& status) {
  j = nlohmann::json{{"name", status.name}, {"state", status.state}, {"error_code", status.error_code}};
}

void from_json(const nlohmann::json& j, ModuleStatus& status) {
  status.name = j.at("name").get<std::string>();
  status.state = get_integer<std::uint8_t>(j, "state");
  status.error_code = get_integer<std::uint8_t>(j, "error_code");
}

void to_json(nlohmann::json& j, const SessionDescription& description) {
  j = nlohmann::json{{"type", description.type}, {"sdp", description.sdp}};
}

void from_json(const nlohmann::json& j, SessionDescription& description) {
  description.type = j.at("type").get<std::string>();
  description.sdp = j.at("sdp").get<std::string>();
}

void to_json(nlohmann::json& j, const Payload& payload) {
  std::visit(
      [&j](const auto& value) {
        if constexpr (std::is_same_v<std::decay_t<decltype(value)>, std::monostate>) {
          j = nullptr;
        } else {
          j = value;
        }
      },
      payload);
}

std::string to_text(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace glonax_agent::model
