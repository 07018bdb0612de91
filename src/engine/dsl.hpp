#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace sg::engine {

struct NodeDef {
  std::string id;
  /// Registered step name.
  std::string step;
  Json params;
};

struct EdgeDef {
  std::string from;
  std::string to;
};

struct BranchDef {
  std::string from;
  /// Registered branch name.
  std::string branch;
  Json params;
  std::map<std::string, std::string> mapping;
};

/// Declarative graph definition, resolved against a StepRegistry by
/// build_graph.
struct GraphDef {
  int version = 1;
  std::string name;
  /// State schema in StateSchema::from_json form.
  Json state;
  std::vector<NodeDef> nodes;
  std::vector<EdgeDef> edges;
  std::vector<BranchDef> branches;
  std::vector<std::string> interrupt_before;
};

auto parse_graph_json(const Json& json) -> Expected<GraphDef>;
auto parse_graph_text(std::string_view text) -> Expected<GraphDef>;
auto parse_graph_file(std::string_view path) -> Expected<GraphDef>;

}  // namespace sg::engine
