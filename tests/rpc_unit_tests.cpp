#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rpc/dispatcher.hpp"
#include "rpc/jsonrpc.hpp"

using glonax_agent::rpc::Dispatcher;
using glonax_agent::rpc::RpcRuntimeError;
using nlohmann::json;

namespace rpc_tests {

struct Rect {
  int width{0};
  int height{0};
};

void from_json(const json& j, Rect& rect) {
  rect.width = j.at("width").get<int>();
  rect.height = j.at("height").get<int>();
}

}  // namespace rpc_tests

namespace glonax_agent::rpc {
template <>
struct is_record<rpc_tests::Rect> : std::true_type {};
}  // namespace glonax_agent::rpc

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

Dispatcher make_dispatcher() {
  Dispatcher dispatcher;
  dispatcher.add("echo", {"value"}, [](const json& value) { return value; });
  dispatcher.add("rpc_ping", [] { return std::string("pong"); });
  dispatcher.add("sum", {"a", "b"}, [](int a, int b) { return a + b; });
  dispatcher.add("area", [](const rpc_tests::Rect& rect) { return rect.width * rect.height; });
  dispatcher.add("nothing", [] {});
  dispatcher.add("refuse", [](const std::string& why) -> int { throw RpcRuntimeError("refused: " + why); });
  dispatcher.add("explode", []() -> int { throw std::runtime_error("boom"); });
  dispatcher.add("later", [](int value) { return std::async(std::launch::async, [value] { return value * 2; }); });
  return dispatcher;
}

std::optional<json> call(const Dispatcher& dispatcher, const std::string& raw) { return dispatcher.invoke(raw); }

int error_code(const std::optional<json>& response) {
  if (!response.has_value() || !response->contains("error")) {
    return 0;
  }
  return response->at("error").at("code").get<int>();
}

int test_method_prefix_resolution() {
  const Dispatcher dispatcher = make_dispatcher();

  const auto direct = call(dispatcher, R"({"jsonrpc":"2.0","method":"echo","params":["x"],"id":1})");
  const auto prefixed = call(dispatcher, R"({"jsonrpc":"2.0","method":"rpc_echo","params":["x"],"id":2})");
  const auto stripped = call(dispatcher, R"({"jsonrpc":"2.0","method":"ping","id":3})");
  const auto padded = call(dispatcher, R"({"jsonrpc":"2.0","method":"  rpc_ping ","id":4})");

  if (!direct.has_value() || direct->at("result") != "x" || direct->at("id") != 1) {
    return fail("test_method_prefix_resolution", "exact name should resolve");
  }
  if (!prefixed.has_value() || prefixed->at("result") != "x") {
    return fail("test_method_prefix_resolution", "prefixed name should resolve to the bare registration");
  }
  if (!stripped.has_value() || stripped->at("result") != "pong") {
    return fail("test_method_prefix_resolution", "bare name should resolve to the prefixed registration");
  }
  if (!padded.has_value() || padded->at("result") != "pong") {
    return fail("test_method_prefix_resolution", "method names should be trimmed");
  }
  if (!dispatcher.contains("rpc_sum") || dispatcher.contains("rpc_") || dispatcher.contains("bogus")) {
    return fail("test_method_prefix_resolution", "contains should follow the same resolution");
  }

  return 0;
}

int test_error_codes() {
  const Dispatcher dispatcher = make_dispatcher();

  const auto parse_error = call(dispatcher, R"({"jsonrpc":"2.0","method":)");
  if (error_code(parse_error) != -32700 || !parse_error->at("id").is_null()) {
    return fail("test_error_codes", "unparsable text should be -32700 with a null id");
  }

  const auto no_version = call(dispatcher, R"({"method":"echo","params":["x"],"id":7})");
  if (error_code(no_version) != -32600 || no_version->at("id") != 7) {
    return fail("test_error_codes", "missing jsonrpc should be -32600 keeping the id");
  }

  if (glonax_agent::rpc::request_id(json::parse(R"({"id":"a7"})")) != "a7" ||
      !glonax_agent::rpc::request_id(json::parse(R"({"id":[1]})")).is_null() ||
      !glonax_agent::rpc::request_id(json::parse("[7]")).is_null()) {
    return fail("test_error_codes", "malformed requests should answer with a usable id or null");
  }

  const auto scalar_params = call(dispatcher, R"({"jsonrpc":"2.0","method":"echo","params":5,"id":8})");
  if (error_code(scalar_params) != -32600) {
    return fail("test_error_codes", "scalar params should be -32600");
  }

  const auto bad_id = call(dispatcher, R"({"jsonrpc":"2.0","method":"echo","params":["x"],"id":1.5})");
  if (error_code(bad_id) != -32600 || !bad_id->at("id").is_null()) {
    return fail("test_error_codes", "fractional id should be -32600 with a null id");
  }

  const auto unknown = call(dispatcher, R"({"jsonrpc":"2.0","method":"bogus","id":"abc"})");
  if (error_code(unknown) != -32601 || unknown->at("id") != "abc") {
    return fail("test_error_codes", "unknown method should be -32601");
  }

  const auto arity = call(dispatcher, R"({"jsonrpc":"2.0","method":"sum","params":[1],"id":9})");
  if (error_code(arity) != -32602 || arity->at("error").at("message") != "Invalid params") {
    return fail("test_error_codes", "wrong arity should be -32602");
  }

  const auto wrong_type = call(dispatcher, R"({"jsonrpc":"2.0","method":"sum","params":["1",2],"id":10})");
  if (error_code(wrong_type) != -32602) {
    return fail("test_error_codes", "wrong parameter type should be -32602");
  }

  const auto refused = call(dispatcher, R"({"jsonrpc":"2.0","method":"refuse","params":["busy"],"id":11})");
  if (error_code(refused) != -32000 || refused->at("error").at("message") != "refused: busy") {
    return fail("test_error_codes", "application errors should be -32000 with their message");
  }

  const auto exploded = call(dispatcher, R"({"jsonrpc":"2.0","method":"explode","id":12})");
  if (error_code(exploded) != -32603 || exploded->at("error").at("message") != "Internal error") {
    return fail("test_error_codes", "unexpected exceptions should be -32603");
  }

  return 0;
}

int test_notifications_are_silent() {
  const Dispatcher dispatcher = make_dispatcher();

  if (call(dispatcher, R"({"jsonrpc":"2.0","method":"echo","params":["x"]})").has_value()) {
    return fail("test_notifications_are_silent", "successful notification should produce nothing");
  }
  if (call(dispatcher, R"({"jsonrpc":"2.0","method":"bogus"})").has_value()) {
    return fail("test_notifications_are_silent", "unknown method notification should produce nothing");
  }
  if (call(dispatcher, R"({"jsonrpc":"2.0","method":"explode"})").has_value()) {
    return fail("test_notifications_are_silent", "failing notification should produce nothing");
  }

  const auto null_id = call(dispatcher, R"({"jsonrpc":"2.0","method":"nothing","id":null})");
  if (!null_id.has_value() || !null_id->at("result").is_null() || !null_id->at("id").is_null()) {
    return fail("test_notifications_are_silent", "an explicit null id is a request, not a notification");
  }

  return 0;
}

int test_batch_dispatch() {
  const Dispatcher dispatcher = make_dispatcher();

  const auto batch = call(dispatcher, R"([
    {"jsonrpc":"2.0","method":"echo","params":["a"],"id":1},
    {"jsonrpc":"2.0","method":"bogus","params":[],"id":2}
  ])");
  if (!batch.has_value() || !batch->is_array() || batch->size() != 2) {
    return fail("test_batch_dispatch", "batch should answer with two responses");
  }
  if (batch->at(0).at("result") != "a" || batch->at(0).at("id") != 1) {
    return fail("test_batch_dispatch", "first response should carry the echo result");
  }
  if (batch->at(1).at("error").at("code") != -32601 || batch->at(1).at("id") != 2) {
    return fail("test_batch_dispatch", "second response should be method not found");
  }

  const auto empty = call(dispatcher, "[]");
  if (!empty.has_value() || empty->is_array() || error_code(empty) != -32600) {
    return fail("test_batch_dispatch", "empty batch should be a single -32600 response");
  }

  const auto notifications = call(dispatcher, R"([
    {"jsonrpc":"2.0","method":"echo","params":["a"]},
    {"jsonrpc":"2.0","method":"nothing"}
  ])");
  if (notifications.has_value()) {
    return fail("test_batch_dispatch", "all-notification batch should produce nothing");
  }

  const auto mixed = call(dispatcher, R"([1, {"jsonrpc":"2.0","method":"echo","params":["b"]},
    {"jsonrpc":"2.0","method":"rpc_ping","id":5}])");
  if (!mixed.has_value() || mixed->size() != 2 || mixed->at(0).at("error").at("code") != -32600 ||
      mixed->at(1).at("result") != "pong") {
    return fail("test_batch_dispatch", "invalid entries answer individually and notifications are omitted");
  }

  return 0;
}

int test_keyword_and_record_params() {
  const Dispatcher dispatcher = make_dispatcher();

  const auto keyword = call(dispatcher, R"({"jsonrpc":"2.0","method":"sum","params":{"b":2,"a":40},"id":1})");
  if (!keyword.has_value() || keyword->at("result") != 42) {
    return fail("test_keyword_and_record_params", "keyword params should bind by name");
  }

  const auto missing = call(dispatcher, R"({"jsonrpc":"2.0","method":"sum","params":{"a":1},"id":2})");
  if (error_code(missing) != -32602) {
    return fail("test_keyword_and_record_params", "missing keyword should be -32602");
  }

  const auto unknown = call(dispatcher, R"({"jsonrpc":"2.0","method":"sum","params":{"a":1,"b":2,"c":3},"id":3})");
  if (error_code(unknown) != -32602) {
    return fail("test_keyword_and_record_params", "unknown keyword should be -32602");
  }

  const auto record = call(dispatcher, R"({"jsonrpc":"2.0","method":"area","params":{"width":6,"height":7},"id":4})");
  if (!record.has_value() || record->at("result") != 42) {
    return fail("test_keyword_and_record_params", "record params should be built from the whole object");
  }

  const auto record_positional =
      call(dispatcher, R"({"jsonrpc":"2.0","method":"area","params":[{"width":2,"height":3}],"id":5})");
  if (!record_positional.has_value() || record_positional->at("result") != 6) {
    return fail("test_keyword_and_record_params", "record params should also bind positionally");
  }

  const auto unnamed = call(dispatcher, R"({"jsonrpc":"2.0","method":"later","params":{"value":1},"id":6})");
  if (error_code(unnamed) != -32602) {
    return fail("test_keyword_and_record_params", "handlers without names should refuse object params");
  }

  const auto deferred = call(dispatcher, R"({"jsonrpc":"2.0","method":"later","params":[21],"id":7})");
  if (!deferred.has_value() || deferred->at("result") != 42) {
    return fail("test_keyword_and_record_params", "future results should be awaited");
  }

  bool threw = false;
  Dispatcher registry;
  try {
    registry.add("pair", {"only"}, [](int a, int b) { return a + b; });
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw || registry.contains("pair")) {
    return fail("test_keyword_and_record_params", "names that do not match the arity should be refused");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_method_prefix_resolution(); rc != 0) return rc;
  if (int rc = test_error_codes(); rc != 0) return rc;
  if (int rc = test_notifications_are_silent(); rc != 0) return rc;
  if (int rc = test_batch_dispatch(); rc != 0) return rc;
  if (int rc = test_keyword_and_record_params(); rc != 0) return rc;

  std::cout << "[PASS] rpc unit tests\n";
  return 0;
}
