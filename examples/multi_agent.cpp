#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"
#include "engine/dsl.hpp"
#include "engine/registry.hpp"
#include "runtime/state_graph.hpp"

namespace {

using sg::engine::Json;
using sg::engine::State;

auto contains_any(const std::string& text, const std::vector<std::string>& words) -> bool {
  for (const auto& word : words) {
    if (text.find(word) != std::string::npos) {
      return true;
    }
  }
  return false;
}

auto route_to_agent(const State& state) -> std::string {
  auto query = state.at("query").get<std::string>();
  for (auto& c : query) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (contains_any(query, {"code", "function", "api", "implement", "debug"})) {
    return "coder";
  }
  if (contains_any(query, {"write", "article", "blog", "content", "story"})) {
    return "writer";
  }
  return "researcher";
}

auto register_agents(sg::engine::StepRegistry& registry) -> void {
  registry.register_step_with_params("specialist", [](const Json& params) {
    auto label = params.value("label", std::string("RESULT"));
    auto role = params.value("role", std::string("agent"));
    return [label, role](const State& state) -> Json {
      auto query = state.at("query").get<std::string>();
      std::cout << fmt::format("[{}] Processing: {}...\n", role, query.substr(0, 50));
      return Json{{"agent_type", role}, {"result", fmt::format("{}: handled '{}'", label, query)}};
    };
  });
  registry.register_branch("route_to_agent", &route_to_agent);
}

constexpr const char* kDefinition = R"JSON(
{
  "version": 1,
  "name": "multi_agent",
  "state": {
    "query": { "reducer": "replace", "required": true },
    "agent_type": { "reducer": "replace", "default": "" },
    "result": { "reducer": "replace", "default": "" }
  },
  "nodes": [
    { "id": "researcher", "step": "specialist", "params": { "role": "researcher", "label": "RESEARCH" } },
    { "id": "coder", "step": "specialist", "params": { "role": "coder", "label": "CODE" } },
    { "id": "writer", "step": "specialist", "params": { "role": "writer", "label": "CONTENT" } }
  ],
  "branches": [
    { "from": "__start__", "branch": "route_to_agent", "mapping": ["researcher", "coder", "writer"] }
  ],
  "edges": [
    { "from": "researcher", "to": "__end__" },
    { "from": "coder", "to": "__end__" },
    { "from": "writer", "to": "__end__" }
  ]
}
)JSON";

}  // namespace

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sg::log::init();

  auto def = sg::engine::parse_graph_text(kDefinition);
  if (!def) {
    std::cerr << "Parse error: " << def.error().describe() << "\n";
    sg::log::shutdown();
    return 1;
  }

  sg::engine::StepRegistry registry;
  register_agents(registry);
  auto app = sg::engine::compile_graph(*def, registry);
  if (!app) {
    std::cerr << "Compile error: " << app.error().describe() << "\n";
    sg::log::shutdown();
    return 1;
  }

  const std::vector<std::string> queries = {
    "Implement a binary search algorithm in Python",
    "Write a blog post about the future of AI",
    "Research the latest developments in quantum computing",
  };

  for (const auto& query : queries) {
    std::cout << fmt::format("\n{:=<60}\nQuery: {}\n{:=<60}\n", "", query, "");
    auto result = app->invoke(Json{{"query", query}}, sg::engine::ThreadConfig{});
    if (!result) {
      std::cerr << "Run error: " << result.error().describe() << "\n";
      continue;
    }
    std::cout << fmt::format("\nAgent Type: {}\n", result->at("agent_type").get<std::string>());
    std::cout << fmt::format("Result Preview: {}\n", result->at("result").get<std::string>().substr(0, 200));
  }

  sg::log::shutdown();
  return 0;
}
