#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "rpc/jsonrpc.hpp"

namespace glonax_agent::rpc {

// Parameter types that are built from the whole params object when they are
// the only parameter of a handler. Specialize next to the record's from_json.
template <typename T>
struct is_record : std::false_type {};

namespace detail {

template <typename T>
struct future_traits {
  static constexpr bool is_future = false;
};

template <typename T>
struct future_traits<std::future<T>> {
  static constexpr bool is_future = true;
  using value_type = T;
};

template <typename F>
struct callable_traits : callable_traits<decltype(&F::operator())> {};

template <typename R, typename... Args>
struct callable_traits<R(Args...)> {
  using result_type = R;
  using args_tuple = std::tuple<std::decay_t<Args>...>;
  static constexpr std::size_t arity = sizeof...(Args);
};

template <typename R, typename... Args>
struct callable_traits<R (*)(Args...)> : callable_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...)> : callable_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const> : callable_traits<R(Args...)> {};

template <typename T>
T convert_param(const nlohmann::json& value, const std::string& where) {
  try {
    return value.get<T>();
  } catch (const nlohmann::json::exception& ex) {
    throw RpcInvalidParams(where + ": " + ex.what());
  } catch (const std::invalid_argument& ex) {
    throw RpcInvalidParams(where + ": " + ex.what());
  }
}

inline const nlohmann::json& keyword_param(const nlohmann::json& params, const std::string& name) {
  const auto it = params.find(name);
  if (it == params.end()) {
    throw RpcInvalidParams("missing parameter '" + name + "'");
  }
  return *it;
}

template <typename Args, std::size_t... I>
Args positional_params(const nlohmann::json& params, std::index_sequence<I...> /*indices*/) {
  if (params.size() != sizeof...(I)) {
    throw RpcInvalidParams("expected " + std::to_string(sizeof...(I)) + " parameters, received " +
                           std::to_string(params.size()));
  }
  return Args{convert_param<std::tuple_element_t<I, Args>>(params[I], "parameter " + std::to_string(I))...};
}

template <typename Args, std::size_t... I>
Args keyword_params(const nlohmann::json& params, const std::vector<std::string>& names,
                    std::index_sequence<I...> /*indices*/) {
  for (const auto& item : params.items()) {
    if (std::find(names.begin(), names.end(), item.key()) == names.end()) {
      throw RpcInvalidParams("unknown parameter '" + item.key() + "'");
    }
  }
  return Args{convert_param<std::tuple_element_t<I, Args>>(keyword_param(params, names[I]), names[I])...};
}

template <typename Args>
Args marshal_params(const nlohmann::json& params, const std::vector<std::string>& names) {
  constexpr std::size_t arity = std::tuple_size_v<Args>;
  using Indices = std::make_index_sequence<arity>;

  if (params.is_array()) {
    return positional_params<Args>(params, Indices{});
  }

  if constexpr (arity == 1) {
    if constexpr (is_record<std::tuple_element_t<0, Args>>::value) {
      return Args{convert_param<std::tuple_element_t<0, Args>>(params, "params")};
    }
  }

  if (names.size() != arity) {
    throw RpcInvalidParams("method does not accept named parameters");
  }
  return keyword_params<Args>(params, names, Indices{});
}

template <typename Fn, typename Args>
nlohmann::json call_handler(Fn& fn, Args&& args) {
  using Result = std::decay_t<typename callable_traits<Fn>::result_type>;

  if constexpr (std::is_void_v<Result>) {
    std::apply(fn, std::forward<Args>(args));
    return nullptr;
  } else if constexpr (future_traits<Result>::is_future) {
    auto pending = std::apply(fn, std::forward<Args>(args));
    if constexpr (std::is_void_v<typename future_traits<Result>::value_type>) {
      pending.get();
      return nullptr;
    } else {
      return nlohmann::json(pending.get());
    }
  } else {
    return nlohmann::json(std::apply(fn, std::forward<Args>(args)));
  }
}

}  // namespace detail

// JSON-RPC 2.0 method registry and dispatcher.
//
// Handlers are plain callables; their parameter list declares the parameter
// shape. Positional params are converted element by element, a single record
// parameter is built from object params, and other object params are matched
// by the names given at registration. A handler may return std::future<T>;
// the dispatcher waits for it.
class Dispatcher {
 public:
  using Handler = std::function<nlohmann::json(const nlohmann::json& params)>;

  explicit Dispatcher(std::string prefix = "rpc_");

  template <typename Fn>
  void add(const std::string& name, Fn fn) {
    add(name, std::vector<std::string>{}, std::move(fn));
  }

  template <typename Fn>
  void add(const std::string& name, std::vector<std::string> param_names, Fn fn) {
    using Traits = detail::callable_traits<Fn>;
    using Args = typename Traits::args_tuple;

    if (!param_names.empty() && param_names.size() != Traits::arity) {
      throw std::invalid_argument("parameter names for '" + name + "' do not match handler arity");
    }

    add_handler(name, [fn = std::move(fn), names = std::move(param_names)](const nlohmann::json& params) mutable {
      return detail::call_handler(fn, detail::marshal_params<Args>(params, names));
    });
  }

  // Registers a raw handler receiving the params value untouched.
  void add_handler(const std::string& name, Handler handler);

  [[nodiscard]] bool contains(const std::string& method) const;
  [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

  // Parses and dispatches raw request text. Returns nullopt when nothing
  // should be sent back (notifications, all-notification batches).
  [[nodiscard]] std::optional<nlohmann::json> invoke(const std::string& raw) const;

  [[nodiscard]] std::optional<nlohmann::json> invoke_json(const nlohmann::json& request) const;

 private:
  [[nodiscard]] std::optional<nlohmann::json> invoke_one(const nlohmann::json& request) const;
  [[nodiscard]] const Handler* resolve(const std::string& method) const;

  std::string prefix_;
  std::unordered_map<std::string, Handler> handlers_{};
};

}  // namespace glonax_agent::rpc
