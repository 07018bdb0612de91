#pragma once

#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/schema.hpp"
#include "engine/types.hpp"

namespace sg::engine {

/// Branch key -> target node name (a node, or kEnd).
using BranchMap = std::map<std::string, std::string>;

struct NodeSpec {
  std::string name;
  NodeFn fn;
};

struct EdgeSpec {
  std::string from;
  std::string to;
};

struct BranchSpec {
  std::string from;
  FanoutFn route;
  BranchMap mapping;
};

/// Uncompiled graph: what the builders collect before compile time.
struct GraphSpec {
  std::string name;
  StateSchema schema;
  std::vector<NodeSpec> nodes;
  std::vector<EdgeSpec> edges;
  std::vector<BranchSpec> branches;
};

struct PlanOptions {
  std::vector<std::string> interrupt_before;
};

/// Target index standing for the virtual terminal.
inline constexpr int kEndIndex = -1;

struct CompiledBranch {
  std::string from;
  FanoutFn route;
  /// Branch key -> node index or kEndIndex.
  std::map<std::string, int> targets;
};

struct CompiledNode {
  std::string name;
  NodeId id = 0;
  NodeFn fn;
  /// Unconditional successors (node index or kEndIndex), edge order.
  std::vector<int> targets;
  /// Indices into GraphPlan::branches.
  std::vector<int> branches;
  bool interrupt_before = false;
};

/// Fixed adjacency structure produced by compile_plan.
struct GraphPlan {
  std::string name;
  StateSchema schema;
  std::vector<CompiledNode> nodes;
  std::vector<CompiledBranch> branches;
  /// Outgoing edges of the virtual entry.
  CompiledNode start;
  std::unordered_map<NodeId, int> index;

  /// Node index for a name, or -1.
  auto find(std::string_view name) const -> int;

  /// Resolve names from a checkpoint back to node indices.
  auto lookup(const std::vector<std::string>& names) const -> Expected<std::vector<int>>;
  auto names(std::span<const int> nodes) const -> std::vector<std::string>;

  auto resolve_entry(const State& state) const -> Expected<std::vector<int>>;

  /// Next node set after `ran` executed. Nodes come back in declaration order
  /// without duplicates. An empty result means the run reached the terminal.
  auto resolve_next(std::span<const int> ran, const State& state) const -> Expected<std::vector<int>>;

  auto any_interrupt(std::span<const int> nodes) const -> bool;
};

/// Validate topology and lay it out for execution. All integrity failures
/// come back as GraphIntegrityError.
auto compile_plan(GraphSpec spec, const PlanOptions& options = {}) -> Expected<GraphPlan>;

}  // namespace sg::engine
