#include "engine/dsl.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>

#include <spdlog/fmt/fmt.h>

namespace sg::engine {
namespace {

auto dsl_error(std::string message) -> EngineError {
  return make_error(ErrorCode::InvalidInput, std::move(message));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(dsl_error(fmt::format("{}: missing or invalid field '{}'", context, field)));
  }
  return it->get<std::string>();
}

auto get_params(const Json& obj) -> Json {
  if (auto it = obj.find("params"); it != obj.end()) {
    return *it;
  }
  return Json::object();
}

auto parse_string_list(const Json& json, std::string_view context) -> Expected<std::vector<std::string>> {
  if (!json.is_array()) {
    return tl::unexpected(dsl_error(fmt::format("{} must be an array", context)));
  }
  std::vector<std::string> out;
  for (const auto& item : json) {
    if (!item.is_string()) {
      return tl::unexpected(dsl_error(fmt::format("{} entries must be strings", context)));
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

auto parse_nodes(const Json& json, GraphDef& graph) -> Expected<void> {
  auto nodes_it = json.find("nodes");
  if (nodes_it == json.end() || !nodes_it->is_array()) {
    return tl::unexpected(dsl_error("nodes must be an array"));
  }
  std::unordered_set<std::string> node_ids;
  for (const auto& node_json : *nodes_it) {
    if (!node_json.is_object()) {
      return tl::unexpected(dsl_error("node entry must be an object"));
    }
    auto id = get_string_field(node_json, "id", "node");
    if (!id) {
      return tl::unexpected(id.error());
    }
    if (!node_ids.insert(*id).second) {
      return tl::unexpected(dsl_error("duplicate node id: " + *id));
    }
    auto step = get_string_field(node_json, "step", "node " + *id);
    if (!step) {
      return tl::unexpected(step.error());
    }
    NodeDef node;
    node.id = std::move(*id);
    node.step = std::move(*step);
    node.params = get_params(node_json);
    graph.nodes.push_back(std::move(node));
  }
  return {};
}

auto parse_edges(const Json& json, GraphDef& graph) -> Expected<void> {
  if (auto it = json.find("entry"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(dsl_error("entry must be a string"));
    }
    graph.edges.push_back(EdgeDef{kStart, it->get<std::string>()});
  }
  auto edges_it = json.find("edges");
  if (edges_it != json.end()) {
    if (!edges_it->is_array()) {
      return tl::unexpected(dsl_error("edges must be an array"));
    }
    for (const auto& edge_json : *edges_it) {
      if (!edge_json.is_object()) {
        return tl::unexpected(dsl_error("edge entry must be an object"));
      }
      auto from = get_string_field(edge_json, "from", "edge");
      if (!from) {
        return tl::unexpected(from.error());
      }
      auto to = get_string_field(edge_json, "to", "edge");
      if (!to) {
        return tl::unexpected(to.error());
      }
      graph.edges.push_back(EdgeDef{std::move(*from), std::move(*to)});
    }
  }
  if (auto it = json.find("finish"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(dsl_error("finish must be a string"));
    }
    graph.edges.push_back(EdgeDef{it->get<std::string>(), kEnd});
  }
  return {};
}

auto parse_branches(const Json& json, GraphDef& graph) -> Expected<void> {
  auto branches_it = json.find("branches");
  if (branches_it == json.end()) {
    return {};
  }
  if (!branches_it->is_array()) {
    return tl::unexpected(dsl_error("branches must be an array"));
  }
  for (const auto& branch_json : *branches_it) {
    if (!branch_json.is_object()) {
      return tl::unexpected(dsl_error("branch entry must be an object"));
    }
    auto from = get_string_field(branch_json, "from", "branch");
    if (!from) {
      return tl::unexpected(from.error());
    }
    auto name = get_string_field(branch_json, "branch", "branch from " + *from);
    if (!name) {
      return tl::unexpected(name.error());
    }
    BranchDef branch;
    branch.from = std::move(*from);
    branch.branch = std::move(*name);
    branch.params = get_params(branch_json);
    auto mapping_it = branch_json.find("mapping");
    if (mapping_it == branch_json.end()) {
      return tl::unexpected(dsl_error(fmt::format("branch from {}: missing mapping", branch.from)));
    }
    if (mapping_it->is_array()) {
      auto targets = parse_string_list(*mapping_it, "branch mapping");
      if (!targets) {
        return tl::unexpected(targets.error());
      }
      for (auto& target : *targets) {
        branch.mapping.emplace(target, target);
      }
    } else if (mapping_it->is_object()) {
      for (const auto& [key, target] : mapping_it->items()) {
        if (!target.is_string()) {
          return tl::unexpected(
            dsl_error(fmt::format("branch from {}: mapping for '{}' must be a node name", branch.from, key)));
        }
        branch.mapping.emplace(key, target.get<std::string>());
      }
    } else {
      return tl::unexpected(
        dsl_error(fmt::format("branch from {}: mapping must be an object or array", branch.from)));
    }
    graph.branches.push_back(std::move(branch));
  }
  return {};
}

}  // namespace

auto parse_graph_json(const Json& json) -> Expected<GraphDef> {
  if (!json.is_object()) {
    return tl::unexpected(dsl_error("graph json must be an object"));
  }

  GraphDef graph;
  if (auto it = json.find("version"); it != json.end()) {
    if (!it->is_number_integer()) {
      return tl::unexpected(dsl_error("version must be an integer"));
    }
    graph.version = it->get<int>();
  }
  if (auto it = json.find("name"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(dsl_error("name must be a string"));
    }
    graph.name = it->get<std::string>();
  }
  auto state_it = json.find("state");
  if (state_it == json.end() || !state_it->is_object()) {
    return tl::unexpected(dsl_error("state must be an object"));
  }
  graph.state = *state_it;

  if (auto result = parse_nodes(json, graph); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = parse_edges(json, graph); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = parse_branches(json, graph); !result) {
    return tl::unexpected(result.error());
  }
  if (auto it = json.find("interrupt_before"); it != json.end()) {
    auto names = parse_string_list(*it, "interrupt_before");
    if (!names) {
      return tl::unexpected(names.error());
    }
    graph.interrupt_before = std::move(*names);
  }
  return graph;
}

auto parse_graph_text(std::string_view text) -> Expected<GraphDef> {
  auto json = Json::parse(std::string(text), nullptr, false);
  if (json.is_discarded()) {
    return tl::unexpected(dsl_error("graph definition is not valid json"));
  }
  return parse_graph_json(json);
}

auto parse_graph_file(std::string_view path) -> Expected<GraphDef> {
  std::ifstream file{std::string(path)};
  if (!file) {
    return tl::unexpected(dsl_error(fmt::format("failed to open graph file: {}", path)));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse_graph_text(buffer.str());
}

}  // namespace sg::engine
