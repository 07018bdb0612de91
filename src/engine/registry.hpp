#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/error.hpp"
#include "engine/node_adapt.hpp"
#include "engine/types.hpp"

namespace sg::engine {

/// Named step and branch factories for graphs built from JSON definitions.
class StepRegistry {
 public:
  using StepFactory = std::function<Expected<NodeFn>(const Json& params)>;
  using BranchFactory = std::function<Expected<FanoutFn>(const Json& params)>;

  auto register_step_factory(std::string name, StepFactory factory) -> void;
  auto register_branch_factory(std::string name, BranchFactory factory) -> void;

  template <detail::StepFn Fn>
  auto register_step(std::string name, Fn fn) -> void {
    register_step_factory(std::move(name), [node = detail::make_node_fn(std::move(fn))](const Json&) -> Expected<NodeFn> {
      return node;
    });
  }

  /// `factory(params)` returns a step callable, or Expected of one.
  template <typename Factory>
  auto register_step_with_params(std::string name, Factory factory) -> void {
    register_step_factory(std::move(name), [factory = std::move(factory)](const Json& params) -> Expected<NodeFn> {
      using FactoryResult = decltype(factory(params));
      if constexpr (detail::is_expected_v<FactoryResult>) {
        auto fn_result = factory(params);
        if (!fn_result) {
          return tl::unexpected(fn_result.error());
        }
        return detail::make_node_fn(std::move(*fn_result));
      } else {
        return detail::make_node_fn(factory(params));
      }
    });
  }

  template <detail::RouteCallable Fn>
  auto register_branch(std::string name, Fn fn) -> void {
    register_branch_factory(std::move(name),
                            [route = detail::make_fanout_fn(std::move(fn))](const Json&) -> Expected<FanoutFn> {
                              return route;
                            });
  }

  template <typename Factory>
  auto register_branch_with_params(std::string name, Factory factory) -> void {
    register_branch_factory(std::move(name),
                            [factory = std::move(factory)](const Json& params) -> Expected<FanoutFn> {
                              using FactoryResult = decltype(factory(params));
                              if constexpr (detail::is_expected_v<FactoryResult>) {
                                auto fn_result = factory(params);
                                if (!fn_result) {
                                  return tl::unexpected(fn_result.error());
                                }
                                return detail::make_fanout_fn(std::move(*fn_result));
                              } else {
                                return detail::make_fanout_fn(factory(params));
                              }
                            });
  }

  auto find_step(std::string_view name) const -> const StepFactory*;
  auto find_branch(std::string_view name) const -> const BranchFactory*;

  auto step_names() const -> std::vector<std::string>;

 private:
  std::unordered_map<std::string, StepFactory> steps_;
  std::unordered_map<std::string, BranchFactory> branches_;
};

}  // namespace sg::engine
