#include <iostream>
#include <memory>
#include <string>

#include <gflags/gflags.h>
#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"
#include "engine/checkpoint.hpp"
#include "engine/schema.hpp"
#include "kernel/messages.hpp"
#include "kernel/sample_tools.hpp"
#include "kernel/tool_node.hpp"
#include "runtime/state_graph.hpp"

DEFINE_bool(approve, true, "Approve the pending tool calls (false rejects them)");

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sg::log::init();

  using sg::engine::Json;
  using sg::engine::kEnd;

  sg::engine::StateSchema schema;
  schema.field("messages", sg::engine::ReducerKind::Append);

  sg::engine::StateGraph graph(std::move(schema), "human_approval");
  graph.add_node("agent", sg::kernel::make_scripted_agent())
    .add_node("tools", sg::kernel::make_tool_node(sg::kernel::make_sample_tools()))
    .set_entry_point("agent")
    .add_conditional_edges("agent", &sg::kernel::tools_condition, {{"tools", "tools"}, {kEnd, kEnd}})
    .add_edge("tools", "agent");

  sg::engine::CompileOptions options;
  options.checkpointer = std::make_shared<sg::engine::InMemoryCheckpointer>();
  options.interrupt_before = {"tools"};
  auto app = graph.compile(std::move(options));
  if (!app) {
    std::cerr << "Compile error: " << app.error().describe() << "\n";
    sg::log::shutdown();
    return 1;
  }

  const sg::engine::ThreadConfig config{"approval-thread"};
  auto fail = [](const sg::engine::EngineError& error) {
    std::cerr << "Run error: " << error.describe() << "\n";
    sg::log::shutdown();
    return 1;
  };

  std::cout << "=== Step 1: Initial Request ===\n";
  auto result = app->invoke(
    Json{{"messages", Json::array({sg::kernel::user_message("Send an email to alice@example.com about meeting")})}},
    config);
  if (!result) {
    return fail(result.error());
  }

  auto snapshot = app->get_state(config);
  if (!snapshot) {
    return fail(snapshot.error());
  }
  std::cout << fmt::format("Next: {}\n", Json(snapshot->next).dump());
  const auto& last = result->at("messages").back();
  std::cout << fmt::format("Pending tool calls: {}\n", last.at("tool_calls").size());

  std::cout << "\n=== Step 2: Human Review ===\n";
  for (const auto& call : last.at("tool_calls")) {
    std::cout << fmt::format("Tool: {}\nArguments: {}\n", call.at("name").get<std::string>(), call.at("args").dump());
  }

  if (FLAGS_approve) {
    std::cout << "\n=== Step 3: Resuming with Approval ===\n";
    auto resumed = app->invoke(std::nullopt, config);
    if (!resumed) {
      return fail(resumed.error());
    }
    std::cout << fmt::format("Final result: {}\n", sg::kernel::message_text(resumed->at("messages").back()));
  } else {
    std::cout << "\n=== Request Rejected ===\n";
    auto updated = app->update_state(
      config, Json{{"messages", Json::array({sg::kernel::assistant_message("Request rejected by reviewer.")})}});
    if (!updated) {
      return fail(updated.error());
    }
    std::cout << fmt::format("Workflow stopped; next remains {}\n", Json(updated->next).dump());
  }

  sg::log::shutdown();
  return 0;
}
