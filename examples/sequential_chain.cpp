#include <cctype>
#include <iostream>
#include <mutex>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "engine/schema.hpp"
#include "engine/trace.hpp"
#include "runtime/state_graph.hpp"

namespace {

using sg::engine::Json;
using sg::engine::State;

struct StdoutTraceSink {
  std::mutex mutex;

  void on_run_start(const sg::engine::trace::RunStart& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << fmt::format("[trace] run_start trace_id={} graph={}\n", event.trace_id, event.graph_name);
  }

  void on_run_end(const sg::engine::trace::RunEnd& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << fmt::format("[trace] run_end trace_id={} steps={} status={} duration_ns={}\n", event.trace_id,
                             event.steps, static_cast<int>(event.status), event.duration);
  }

  void on_node_end(const sg::engine::trace::NodeEnd& event) {
    std::lock_guard<std::mutex> lock(mutex);
    std::cout << fmt::format("[trace] node_end node={} step={} status={} duration_ns={}\n", event.node_id,
                             event.step, static_cast<int>(event.status), event.duration);
  }
};

auto process_input(const State& state) -> Json {
  auto input = state.at("input").get<std::string>();
  std::string upper;
  for (char c : input) {
    upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  auto processed = fmt::format("Processed: {}", upper);
  std::cout << fmt::format("Step 1: {} -> {}\n", input, processed);
  return Json{{"processed", processed}};
}

auto generate_output(const State& state) -> Json {
  auto output = fmt::format("Final: {} + extra transformation", state.at("processed").get<std::string>());
  std::cout << fmt::format("Step 2: {}\n", output);
  return Json{{"output", output}};
}

}  // namespace

int main() {
  sg::engine::StateSchema schema;
  schema.field("input").field_with_default("processed", sg::engine::ReducerKind::Replace, "")
    .field_with_default("output", sg::engine::ReducerKind::Replace, "");

  sg::engine::StateGraph graph(std::move(schema), "sequential_chain");
  graph.add_node("process", &process_input)
    .add_node("generate", &generate_output)
    .add_edge(sg::engine::kStart, "process")
    .add_edge("process", "generate")
    .add_edge("generate", sg::engine::kEnd);

  auto app = graph.compile();
  if (!app) {
    std::cerr << "Compile error: " << app.error().describe() << "\n";
    return 1;
  }

  StdoutTraceSink sink;
  sg::engine::RunContext ctx;
  ctx.trace.sink = sg::engine::trace::make_sink(sink);
  ctx.trace.flags = sg::engine::trace::kAllFlags;

  auto result = app->invoke(Json{{"input", "Hello sg-engine!"}}, sg::engine::ThreadConfig{}, ctx);
  if (!result) {
    std::cerr << "Run error: " << result.error().describe() << "\n";
    return 1;
  }

  std::cout << "\n=== Result ===\n" << result->dump(2) << "\n";
  return 0;
}
