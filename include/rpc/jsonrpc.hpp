#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace glonax_agent::rpc {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kRuntimeError = -32000;

struct JsonRpcError {
  int code;
  std::string message;
};

// Application error raised by a handler; reported as -32000 with its message.
class RpcRuntimeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Parameters that do not fit the handler; reported as -32602.
class RpcInvalidParams : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const noexcept { return !id.has_value(); }
};

// Id to answer a malformed request with; null when it is missing or unusable.
nlohmann::json request_id(const nlohmann::json& request);

// Validates the request shape. Throws std::invalid_argument.
JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace glonax_agent::rpc
