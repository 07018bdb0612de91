#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/node_adapt.hpp"
#include "engine/plan.hpp"
#include "engine/registry.hpp"
#include "engine/schema.hpp"
#include "runtime/runner.hpp"

namespace sg::engine {

/// Programmatic graph builder. Problems are collected and reported by
/// compile().
class StateGraph {
 public:
  explicit StateGraph(StateSchema schema, std::string name = {});

  template <detail::StepFn Fn>
  auto add_node(std::string name, Fn fn) -> StateGraph& {
    spec_.nodes.push_back(NodeSpec{std::move(name), detail::make_node_fn(std::move(fn))});
    return *this;
  }

  auto add_edge(std::string from, std::string to) -> StateGraph&;

  /// Route by a branch function returning one key (or a list of keys) looked
  /// up in `mapping`.
  template <detail::RouteCallable Fn>
  auto add_conditional_edges(std::string from, Fn route, BranchMap mapping) -> StateGraph& {
    spec_.branches.push_back(BranchSpec{std::move(from), detail::make_fanout_fn(std::move(route)), std::move(mapping)});
    return *this;
  }

  /// Fan-out routing: the branch function returns several keys and every
  /// mapped node runs in the next step.
  template <detail::FanoutRouteFn Fn>
  auto add_conditional_fanout(std::string from, Fn route, BranchMap mapping) -> StateGraph& {
    return add_conditional_edges(std::move(from), std::move(route), std::move(mapping));
  }

  auto set_entry_point(std::string name) -> StateGraph&;
  auto set_finish_point(std::string name) -> StateGraph&;

  /// Record a failure to report at compile time.
  auto defer_error(EngineError error) -> StateGraph&;

  auto spec() const -> const GraphSpec& { return spec_; }

  auto compile(CompileOptions options = {}) const -> Expected<CompiledGraph>;

 private:
  GraphSpec spec_;
  std::optional<EngineError> deferred_error_;
};

/// Resolve a JSON definition's steps and branches against a registry.
auto build_graph(const GraphDef& def, const StepRegistry& registry) -> Expected<StateGraph>;

/// build_graph + compile. The definition's interrupt_before list is added to
/// the options'.
auto compile_graph(const GraphDef& def, const StepRegistry& registry, CompileOptions options = {})
  -> Expected<CompiledGraph>;

}  // namespace sg::engine
