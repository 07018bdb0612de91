#include "engine/plan.hpp"

#include <exception>
#include <queue>
#include <unordered_set>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace sg::engine {
namespace {

auto integrity_error(std::string message) -> EngineError {
  return make_error(ErrorCode::GraphIntegrityError, std::move(message));
}

auto valid_keys(const CompiledBranch& branch) -> std::string {
  std::string out;
  for (const auto& [key, _] : branch.targets) {
    if (!out.empty()) {
      out += ", ";
    }
    out += key;
  }
  return out;
}

/// Evaluate one source's edges and branches, marking the chosen targets.
auto route_from(const GraphPlan& plan, const CompiledNode& source, const State& state,
                std::vector<char>& selected, bool& reached_end) -> Expected<void> {
  for (int target : source.targets) {
    if (target == kEndIndex) {
      reached_end = true;
    } else {
      selected[static_cast<std::size_t>(target)] = 1;
    }
  }
  for (int branch_index : source.branches) {
    const auto& branch = plan.branches[static_cast<std::size_t>(branch_index)];
    std::vector<std::string> keys;
    try {
      keys = branch.route(state);
    } catch (const std::exception& ex) {
      return tl::unexpected(make_node_error(ErrorCode::RoutingError, source.name,
                                            fmt::format("branch function threw: {}", ex.what())));
    }
    for (const auto& key : keys) {
      auto it = branch.targets.find(key);
      if (it == branch.targets.end()) {
        return tl::unexpected(make_node_error(
          ErrorCode::RoutingError, source.name,
          fmt::format("branch returned unknown key '{}' (valid: {})", key, valid_keys(branch))));
      }
      if (it->second == kEndIndex) {
        reached_end = true;
      } else {
        selected[static_cast<std::size_t>(it->second)] = 1;
      }
    }
  }
  return {};
}

auto collect(const std::vector<char>& selected) -> std::vector<int> {
  std::vector<int> next;
  for (std::size_t i = 0; i < selected.size(); ++i) {
    if (selected[i]) {
      next.push_back(static_cast<int>(i));
    }
  }
  return next;
}

struct PlanBuilder {
  GraphSpec& spec;
  const PlanOptions& options;
  GraphPlan plan;

  auto resolve_target(std::string_view name, std::string_view context) -> Expected<int> {
    if (name == std::string_view(kEnd)) {
      return kEndIndex;
    }
    if (name == std::string_view(kStart)) {
      return tl::unexpected(integrity_error(fmt::format("{}: {} cannot be an edge target", context, kStart)));
    }
    int index = plan.find(name);
    if (index < 0) {
      return tl::unexpected(integrity_error(fmt::format("{}: unknown node '{}'", context, name)));
    }
    return index;
  }

  auto resolve_source(std::string_view name, std::string_view context) -> Expected<CompiledNode*> {
    if (name == std::string_view(kStart)) {
      return &plan.start;
    }
    if (name == std::string_view(kEnd)) {
      return tl::unexpected(integrity_error(fmt::format("{}: {} cannot have outgoing edges", context, kEnd)));
    }
    int index = plan.find(name);
    if (index < 0) {
      return tl::unexpected(integrity_error(fmt::format("{}: unknown node '{}'", context, name)));
    }
    return &plan.nodes[static_cast<std::size_t>(index)];
  }

  auto build_nodes() -> Expected<void> {
    if (auto schema = spec.schema.validate(); !schema) {
      return tl::unexpected(schema.error());
    }
    if (spec.nodes.empty()) {
      return tl::unexpected(integrity_error("graph has no nodes"));
    }
    plan.name = spec.name;
    plan.start.name = kStart;
    plan.start.id = intern_name(kStart);
    plan.nodes.reserve(spec.nodes.size());
    for (auto& node_spec : spec.nodes) {
      if (node_spec.name.empty()) {
        return tl::unexpected(integrity_error("node name is empty"));
      }
      if (is_reserved_name(node_spec.name)) {
        return tl::unexpected(integrity_error(fmt::format("node name is reserved: {}", node_spec.name)));
      }
      if (!node_spec.fn) {
        return tl::unexpected(integrity_error(fmt::format("node has no step function: {}", node_spec.name)));
      }
      auto id = intern_name(node_spec.name);
      if (auto it = plan.index.find(id); it != plan.index.end()) {
        const auto& other = plan.nodes[static_cast<std::size_t>(it->second)].name;
        if (other == node_spec.name) {
          return tl::unexpected(integrity_error(fmt::format("duplicate node name: {}", node_spec.name)));
        }
        return tl::unexpected(
          integrity_error(fmt::format("node names '{}' and '{}' intern to the same id", other, node_spec.name)));
      }
      CompiledNode node;
      node.name = std::move(node_spec.name);
      node.id = id;
      node.fn = std::move(node_spec.fn);
      plan.index.emplace(id, static_cast<int>(plan.nodes.size()));
      plan.nodes.push_back(std::move(node));
    }
    plan.schema = std::move(spec.schema);
    return {};
  }

  auto bind_edges() -> Expected<void> {
    for (const auto& edge : spec.edges) {
      auto context = fmt::format("edge {} -> {}", edge.from, edge.to);
      auto source = resolve_source(edge.from, context);
      if (!source) {
        return tl::unexpected(source.error());
      }
      auto target = resolve_target(edge.to, context);
      if (!target) {
        return tl::unexpected(target.error());
      }
      auto& targets = (*source)->targets;
      bool duplicate = false;
      for (int existing : targets) {
        duplicate = duplicate || existing == *target;
      }
      if (!duplicate) {
        targets.push_back(*target);
      }
    }
    return {};
  }

  auto bind_branches() -> Expected<void> {
    for (auto& branch_spec : spec.branches) {
      auto context = fmt::format("conditional edges from {}", branch_spec.from);
      if (!branch_spec.route) {
        return tl::unexpected(integrity_error(fmt::format("{}: branch function is empty", context)));
      }
      if (branch_spec.mapping.empty()) {
        return tl::unexpected(integrity_error(fmt::format("{}: branch mapping is empty", context)));
      }
      auto source = resolve_source(branch_spec.from, context);
      if (!source) {
        return tl::unexpected(source.error());
      }
      CompiledBranch branch;
      branch.from = branch_spec.from;
      branch.route = std::move(branch_spec.route);
      for (const auto& [key, target_name] : branch_spec.mapping) {
        auto target = resolve_target(target_name, context);
        if (!target) {
          return tl::unexpected(target.error());
        }
        branch.targets.emplace(key, *target);
      }
      (*source)->branches.push_back(static_cast<int>(plan.branches.size()));
      plan.branches.push_back(std::move(branch));
    }
    return {};
  }

  auto mark_interrupts() -> Expected<void> {
    for (const auto& name : options.interrupt_before) {
      int index = plan.find(name);
      if (index < 0) {
        return tl::unexpected(integrity_error(fmt::format("interrupt_before names unknown node: {}", name)));
      }
      plan.nodes[static_cast<std::size_t>(index)].interrupt_before = true;
    }
    return {};
  }

  /// Every successor a source may route to, ignoring branch conditions.
  auto successors(const CompiledNode& node) const -> std::vector<int> {
    std::vector<int> out = node.targets;
    for (int branch_index : node.branches) {
      for (const auto& [_, target] : plan.branches[static_cast<std::size_t>(branch_index)].targets) {
        out.push_back(target);
      }
    }
    return out;
  }

  auto check_reachability() -> Expected<void> {
    const std::size_t count = plan.nodes.size();
    if (plan.start.targets.empty() && plan.start.branches.empty()) {
      return tl::unexpected(integrity_error(fmt::format("graph has no entry edge from {}", kStart)));
    }

    std::vector<std::vector<int>> forward(count);
    std::vector<std::vector<int>> reverse(count);
    std::vector<char> reaches_end(count, 0);
    for (std::size_t i = 0; i < count; ++i) {
      forward[i] = successors(plan.nodes[i]);
      for (int target : forward[i]) {
        if (target == kEndIndex) {
          reaches_end[i] = 1;
        } else {
          reverse[static_cast<std::size_t>(target)].push_back(static_cast<int>(i));
        }
      }
    }

    std::vector<char> reachable(count, 0);
    std::queue<int> ready;
    bool start_reaches_end = false;
    for (int target : successors(plan.start)) {
      if (target == kEndIndex) {
        start_reaches_end = true;
      } else if (!reachable[static_cast<std::size_t>(target)]) {
        reachable[static_cast<std::size_t>(target)] = 1;
        ready.push(target);
      }
    }
    while (!ready.empty()) {
      int node = ready.front();
      ready.pop();
      for (int next : forward[static_cast<std::size_t>(node)]) {
        if (next != kEndIndex && !reachable[static_cast<std::size_t>(next)]) {
          reachable[static_cast<std::size_t>(next)] = 1;
          ready.push(next);
        }
      }
    }

    std::vector<char> to_end(count, 0);
    for (std::size_t i = 0; i < count; ++i) {
      if (reaches_end[i]) {
        to_end[i] = 1;
        ready.push(static_cast<int>(i));
      }
    }
    while (!ready.empty()) {
      int node = ready.front();
      ready.pop();
      for (int prev : reverse[static_cast<std::size_t>(node)]) {
        if (!to_end[static_cast<std::size_t>(prev)]) {
          to_end[static_cast<std::size_t>(prev)] = 1;
          ready.push(prev);
        }
      }
    }

    bool any_reachable_end = start_reaches_end;
    for (std::size_t i = 0; i < count; ++i) {
      const auto& node = plan.nodes[i];
      if (!reachable[i]) {
        return tl::unexpected(integrity_error(fmt::format("node '{}' is unreachable from {}", node.name, kStart)));
      }
      if (forward[i].empty()) {
        return tl::unexpected(integrity_error(fmt::format("node '{}' has no outgoing edge", node.name)));
      }
      if (!to_end[i]) {
        return tl::unexpected(integrity_error(fmt::format("no path from node '{}' to {}", node.name, kEnd)));
      }
      any_reachable_end = any_reachable_end || to_end[i];
    }
    if (!any_reachable_end) {
      return tl::unexpected(integrity_error(fmt::format("no path from {} to {}", kStart, kEnd)));
    }
    return {};
  }
};

}  // namespace

auto GraphPlan::find(std::string_view name) const -> int {
  auto it = index.find(intern_name(name));
  if (it == index.end()) {
    return -1;
  }
  if (nodes[static_cast<std::size_t>(it->second)].name != name) {
    return -1;
  }
  return it->second;
}

auto GraphPlan::lookup(const std::vector<std::string>& names) const -> Expected<std::vector<int>> {
  std::vector<int> out;
  out.reserve(names.size());
  for (const auto& name : names) {
    int node = find(name);
    if (node < 0) {
      return tl::unexpected(make_error(ErrorCode::CheckpointError,
                                       fmt::format("checkpoint references unknown node: {}", name)));
    }
    out.push_back(node);
  }
  return out;
}

auto GraphPlan::names(std::span<const int> selected) const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(selected.size());
  for (int node : selected) {
    out.push_back(nodes[static_cast<std::size_t>(node)].name);
  }
  return out;
}

auto GraphPlan::resolve_entry(const State& state) const -> Expected<std::vector<int>> {
  std::vector<char> selected(nodes.size(), 0);
  bool reached_end = false;
  if (auto routed = route_from(*this, start, state, selected, reached_end); !routed) {
    return tl::unexpected(routed.error());
  }
  return collect(selected);
}

auto GraphPlan::resolve_next(std::span<const int> ran, const State& state) const -> Expected<std::vector<int>> {
  std::vector<char> selected(nodes.size(), 0);
  bool reached_end = false;
  for (int node : ran) {
    if (auto routed = route_from(*this, nodes[static_cast<std::size_t>(node)], state, selected, reached_end);
        !routed) {
      return tl::unexpected(routed.error());
    }
  }
  return collect(selected);
}

auto GraphPlan::any_interrupt(std::span<const int> selected) const -> bool {
  for (int node : selected) {
    if (nodes[static_cast<std::size_t>(node)].interrupt_before) {
      return true;
    }
  }
  return false;
}

auto compile_plan(GraphSpec spec, const PlanOptions& options) -> Expected<GraphPlan> {
  PlanBuilder builder{spec, options, {}};
  if (auto result = builder.build_nodes(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.bind_edges(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.bind_branches(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.mark_interrupts(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.check_reachability(); !result) {
    return tl::unexpected(result.error());
  }
  return std::move(builder.plan);
}

}  // namespace sg::engine
