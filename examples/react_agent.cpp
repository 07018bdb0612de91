#include <iostream>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"
#include "engine/schema.hpp"
#include "kernel/messages.hpp"
#include "kernel/sample_tools.hpp"
#include "kernel/tool_node.hpp"
#include "runtime/state_graph.hpp"

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sg::log::init();

  using sg::engine::kEnd;

  sg::engine::StateSchema schema;
  schema.field("messages", sg::engine::ReducerKind::Append);

  sg::engine::StateGraph graph(std::move(schema), "react_agent");
  graph.add_node("agent", sg::kernel::make_scripted_agent())
    .add_node("tools", sg::kernel::make_tool_node(sg::kernel::make_sample_tools()))
    .set_entry_point("agent")
    .add_conditional_edges("agent", &sg::kernel::tools_condition, {{"tools", "tools"}, {kEnd, kEnd}})
    .add_edge("tools", "agent");

  auto app = graph.compile();
  if (!app) {
    std::cerr << "Compile error: " << app.error().describe() << "\n";
    sg::log::shutdown();
    return 1;
  }

  const std::vector<std::string> queries = {
    "What is the weather?",
    "What is 25 * 4 + 10?",
    "Tell me about LangGraph",
  };

  int exit_code = 0;
  for (const auto& query : queries) {
    std::cout << fmt::format("\n=== Query: {} ===\n", query);
    auto result = app->invoke(sg::engine::Json{{"messages", sg::engine::Json::array({sg::kernel::user_message(query)})}},
                              sg::engine::ThreadConfig{});
    if (!result) {
      std::cerr << "Run error: " << result.error().describe() << "\n";
      exit_code = 1;
      continue;
    }
    for (const auto& message : result->at("messages")) {
      std::cout << fmt::format("  [{}] {}\n", sg::kernel::message_role(message), sg::kernel::message_text(message));
    }
    std::cout << fmt::format("Response: {}\n", sg::kernel::message_text(result->at("messages").back()));
  }

  sg::log::shutdown();
  return exit_code;
}
