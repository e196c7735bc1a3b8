#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/messages.hpp"

// nlohmann::json ADL hooks for the machine payloads. Decoders throw
// nlohmann::json::exception on missing fields or wrong kinds and
// std::invalid_argument on out-of-range enum codes.
namespace glonax_agent::model {

void to_json(nlohmann::json& j, const Uuid& uuid);
void from_json(const nlohmann::json& j, Uuid& uuid);

void to_json(nlohmann::json& j, const Instance& instance);
void from_json(const nlohmann::json& j, Instance& instance);

void to_json(nlohmann::json& j, const Engine& engine);
void from_json(const nlohmann::json& j, Engine& engine);

void to_json(nlohmann::json& j, const StraightDrive& drive);
void from_json(const nlohmann::json& j, StraightDrive& drive);

void to_json(nlohmann::json& j, const ChangeSet& change);
void from_json(const nlohmann::json& j, ChangeSet& change);

void to_json(nlohmann::json& j, const Motion& motion);
void from_json(const nlohmann::json& j, Motion& motion);

void to_json(nlohmann::json& j, const Control& control);
void from_json(const nlohmann::json& j, Control& control);

void to_json(nlohmann::json& j, const ModuleStatus& status);
void from_json(const nlohmann::json& j, ModuleStatus& status);

void to_json(nlohmann::json& j, const SessionDescription& description);
void from_json(const nlohmann::json& j, SessionDescription& description);

void to_json(nlohmann::json& j, const Payload& payload);

// Compact text for the wire. Machine strings are raw bytes, so invalid
// UTF-8 is replaced with U+FFFD instead of throwing.
std::string to_text(const nlohmann::json& j);

}  // namespace glonax_agent::model
