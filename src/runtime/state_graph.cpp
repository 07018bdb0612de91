#include "runtime/state_graph.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

namespace sg::engine {

StateGraph::StateGraph(StateSchema schema, std::string name) {
  spec_.name = std::move(name);
  spec_.schema = std::move(schema);
}

auto StateGraph::add_edge(std::string from, std::string to) -> StateGraph& {
  spec_.edges.push_back(EdgeSpec{std::move(from), std::move(to)});
  return *this;
}

auto StateGraph::set_entry_point(std::string name) -> StateGraph& {
  return add_edge(kStart, std::move(name));
}

auto StateGraph::set_finish_point(std::string name) -> StateGraph& {
  return add_edge(std::move(name), kEnd);
}

auto StateGraph::defer_error(EngineError error) -> StateGraph& {
  if (!deferred_error_) {
    deferred_error_ = std::move(error);
  }
  return *this;
}

auto StateGraph::compile(CompileOptions options) const -> Expected<CompiledGraph> {
  if (deferred_error_) {
    return tl::unexpected(*deferred_error_);
  }
  return compile_graph(spec_, std::move(options));
}

auto build_graph(const GraphDef& def, const StepRegistry& registry) -> Expected<StateGraph> {
  auto schema = StateSchema::from_json(def.state);
  if (!schema) {
    return tl::unexpected(schema.error());
  }
  StateGraph graph(std::move(*schema), def.name);

  for (const auto& node : def.nodes) {
    const auto* factory = registry.find_step(node.step);
    if (!factory) {
      return tl::unexpected(
        make_node_error(ErrorCode::NotFound, node.id, fmt::format("step not registered: {}", node.step)));
    }
    auto fn = (*factory)(node.params);
    if (!fn) {
      auto error = fn.error();
      error.node = node.id;
      return tl::unexpected(std::move(error));
    }
    graph.add_node(node.id, std::move(*fn));
  }
  for (const auto& edge : def.edges) {
    graph.add_edge(edge.from, edge.to);
  }
  for (const auto& branch : def.branches) {
    const auto* factory = registry.find_branch(branch.branch);
    if (!factory) {
      return tl::unexpected(make_node_error(ErrorCode::NotFound, branch.from,
                                            fmt::format("branch not registered: {}", branch.branch)));
    }
    auto route = (*factory)(branch.params);
    if (!route) {
      return tl::unexpected(route.error());
    }
    BranchMap mapping(branch.mapping.begin(), branch.mapping.end());
    graph.add_conditional_edges(branch.from, std::move(*route), std::move(mapping));
  }
  return graph;
}

auto compile_graph(const GraphDef& def, const StepRegistry& registry, CompileOptions options)
  -> Expected<CompiledGraph> {
  auto graph = build_graph(def, registry);
  if (!graph) {
    return tl::unexpected(graph.error());
  }
  for (const auto& name : def.interrupt_before) {
    if (std::find(options.interrupt_before.begin(), options.interrupt_before.end(), name) ==
        options.interrupt_before.end()) {
      options.interrupt_before.push_back(name);
    }
  }
  return graph->compile(std::move(options));
}

}  // namespace sg::engine
