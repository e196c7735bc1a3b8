#include "rpc/jsonrpc.hpp"

namespace glonax_agent::rpc {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

nlohmann::json request_id(const nlohmann::json& request) {
  if (!request.is_object()) {
    return nullptr;
  }
  const auto it = request.find("id");
  if (it == request.end() || !is_valid_id(*it)) {
    return nullptr;
  }
  return *it;
}

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw std::invalid_argument("Request must be a JSON object");
  }

  const auto jsonrpc_it = request.find("jsonrpc");
  if (jsonrpc_it == request.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw std::invalid_argument("jsonrpc must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw std::invalid_argument("method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::array(), .id = std::nullopt};

  const auto params_it = request.find("params");
  if (params_it != request.end()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw std::invalid_argument("params must be an object or an array");
    }
    parsed.params = *params_it;
  }

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    if (!is_valid_id(*id_it)) {
      throw std::invalid_argument("id must be string, integer, or null");
    }
    parsed.id = *id_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"result", result}, {"id", id}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"error", {{"code", error.code}, {"message", error.message}}},
                        {"id", id}};
}

}  // namespace glonax_agent::rpc
