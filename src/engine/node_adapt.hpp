#pragma once

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace sg::engine::detail {

template <typename T>
struct expected_traits {
  using value_type = T;
  static constexpr bool is_expected = false;
};

template <typename T>
struct expected_traits<Expected<T>> {
  using value_type = T;
  static constexpr bool is_expected = true;
};

template <typename T>
inline constexpr bool is_expected_v = expected_traits<std::remove_cvref_t<T>>::is_expected;

/// Step callable taking the node context: (const State&, NodeContext&) -> R.
template <typename Fn>
concept ContextStepFn = std::invocable<const Fn&, const State&, NodeContext&>;

/// Step callable over the state alone: (const State&) -> R.
template <typename Fn>
concept PlainStepFn = !ContextStepFn<Fn> && std::invocable<const Fn&, const State&>;

template <typename Fn>
concept StepFn = ContextStepFn<Fn> || PlainStepFn<Fn>;

/// Route callable returning several keys (fan-out).
template <typename Fn>
concept FanoutRouteFn = std::invocable<const Fn&, const State&> &&
                        std::convertible_to<std::invoke_result_t<const Fn&, const State&>, std::vector<std::string>>;

/// Route callable returning a single key.
template <typename Fn>
concept SingleRouteFn = !FanoutRouteFn<Fn> && std::invocable<const Fn&, const State&> &&
                        std::constructible_from<std::string, std::invoke_result_t<const Fn&, const State&>>;

template <typename Fn>
concept RouteCallable = FanoutRouteFn<Fn> || SingleRouteFn<Fn>;

template <typename R>
auto to_update(R&& result) -> Expected<Json> {
  if constexpr (is_expected_v<R>) {
    if (!result) {
      return tl::unexpected(std::move(result.error()));
    }
    if constexpr (std::is_void_v<typename expected_traits<std::remove_cvref_t<R>>::value_type>) {
      return Json::object();
    } else {
      return Json(std::move(*result));
    }
  } else {
    return Json(std::forward<R>(result));
  }
}

template <StepFn Fn>
auto make_node_fn(Fn fn) -> NodeFn {
  if constexpr (std::same_as<std::remove_cvref_t<Fn>, NodeFn>) {
    return fn;
  } else if constexpr (ContextStepFn<Fn>) {
    using R = std::invoke_result_t<const Fn&, const State&, NodeContext&>;
    return [fn = std::move(fn)](const State& state, NodeContext& ctx) -> Expected<Json> {
      if constexpr (std::is_void_v<R>) {
        fn(state, ctx);
        return Json::object();
      } else {
        return to_update(fn(state, ctx));
      }
    };
  } else {
    using R = std::invoke_result_t<const Fn&, const State&>;
    return [fn = std::move(fn)](const State& state, NodeContext&) -> Expected<Json> {
      if constexpr (std::is_void_v<R>) {
        fn(state);
        return Json::object();
      } else {
        return to_update(fn(state));
      }
    };
  }
}

template <RouteCallable Fn>
auto make_fanout_fn(Fn fn) -> FanoutFn {
  if constexpr (FanoutRouteFn<Fn>) {
    return [fn = std::move(fn)](const State& state) -> std::vector<std::string> {
      return fn(state);
    };
  } else {
    return [fn = std::move(fn)](const State& state) -> std::vector<std::string> {
      return {std::string(fn(state))};
    };
  }
}

}  // namespace sg::engine::detail
