#include "rpc/dispatcher.hpp"

#include <iostream>

namespace glonax_agent::rpc {

namespace {

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

}  // namespace

Dispatcher::Dispatcher(std::string prefix) : prefix_(std::move(prefix)) {}

void Dispatcher::add_handler(const std::string& name, Handler handler) {
  if (name.empty()) {
    throw std::invalid_argument("method name must not be empty");
  }
  handlers_[name] = std::move(handler);
}

bool Dispatcher::contains(const std::string& method) const { return resolve(method) != nullptr; }

const Dispatcher::Handler* Dispatcher::resolve(const std::string& method) const {
  const std::string name = trim(method);
  if (name.empty()) {
    return nullptr;
  }

  if (const auto it = handlers_.find(name); it != handlers_.end()) {
    return &it->second;
  }
  if (prefix_.empty()) {
    return nullptr;
  }
  if (const auto it = handlers_.find(prefix_ + name); it != handlers_.end()) {
    return &it->second;
  }
  if (name.size() > prefix_.size() && name.compare(0, prefix_.size(), prefix_) == 0) {
    if (const auto it = handlers_.find(name.substr(prefix_.size())); it != handlers_.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

std::optional<nlohmann::json> Dispatcher::invoke(const std::string& raw) const {
  const auto request = nlohmann::json::parse(raw, nullptr, false);
  if (request.is_discarded()) {
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "Parse error"});
  }
  return invoke_json(request);
}

std::optional<nlohmann::json> Dispatcher::invoke_json(const nlohmann::json& request) const {
  if (!request.is_array()) {
    return invoke_one(request);
  }

  if (request.empty()) {
    return make_error_response(nullptr, JsonRpcError{.code = kInvalidRequest, .message = "Invalid Request"});
  }

  nlohmann::json responses = nlohmann::json::array();
  for (const auto& element : request) {
    if (auto response = invoke_one(element)) {
      responses.push_back(std::move(*response));
    }
  }
  if (responses.empty()) {
    return std::nullopt;
  }
  return responses;
}

std::optional<nlohmann::json> Dispatcher::invoke_one(const nlohmann::json& request) const {
  JsonRpcRequest parsed;
  try {
    parsed = parse_request(request);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "[rpc] invalid request: " << ex.what() << '\n';
    return make_error_response(request_id(request),
                               JsonRpcError{.code = kInvalidRequest, .message = "Invalid Request"});
  }

  const nlohmann::json id = parsed.id.value_or(nullptr);
  std::optional<nlohmann::json> response;

  const Handler* handler = resolve(parsed.method);
  if (handler == nullptr) {
    response = make_error_response(id, JsonRpcError{.code = kMethodNotFound, .message = "Method not found"});
  } else {
    try {
      response = make_result_response(id, (*handler)(parsed.params));
    } catch (const RpcInvalidParams& ex) {
      std::cerr << "[rpc] " << parsed.method << ": invalid params: " << ex.what() << '\n';
      response = make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = "Invalid params"});
    } catch (const RpcRuntimeError& ex) {
      response = make_error_response(id, JsonRpcError{.code = kRuntimeError, .message = ex.what()});
    } catch (const std::exception& ex) {
      std::cerr << "[rpc] " << parsed.method << ": internal error: " << ex.what() << '\n';
      response = make_error_response(id, JsonRpcError{.code = kInternalError, .message = "Internal error"});
    }
  }

  if (parsed.is_notification()) {
    return std::nullopt;
  }
  return response;
}

}  // namespace glonax_agent::rpc
