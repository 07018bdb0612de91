#include <gtest/gtest.h>

#include <fstream>

#include "engine/dsl.hpp"
#include "engine/registry.hpp"
#include "test_support.hpp"

namespace {

using sg::engine::ErrorCode;
using sg::engine::Json;
using sg::engine::StepRegistry;
using sg::engine::ThreadConfig;

constexpr char kPipeline[] = R"({
  "version": 1,
  "name": "shout",
  "state": {"input": "replace", "output": "replace", "mode": {"default": "loud"}},
  "nodes": [
    {"id": "upper", "step": "transform", "params": {"from": "input", "to": "output", "upper": true}},
    {"id": "wrap", "step": "transform", "params": {"from": "output", "to": "output", "prefix": "<", "suffix": ">"}},
    {"id": "quiet", "step": "set_field", "params": {"field": "output", "value": "..."}}
  ],
  "entry": "upper",
  "edges": [{"from": "upper", "to": "wrap"}],
  "branches": [
    {"from": "wrap", "branch": "field_value", "params": {"field": "mode", "default": "loud"},
     "mapping": {"loud": "__end__", "quiet": "quiet"}}
  ],
  "finish": "quiet"
})";

auto sample_registry() -> StepRegistry {
  StepRegistry registry;
  sg::kernel::register_sample_steps(registry, sg::kernel::make_sample_tools());
  return registry;
}

}  // namespace

TEST(GraphDsl, ParsesDefinition) {
  auto def = sg::engine::parse_graph_text(kPipeline);
  ASSERT_TRUE(def) << def.error().describe();
  EXPECT_EQ(def->version, 1);
  EXPECT_EQ(def->name, "shout");
  ASSERT_EQ(def->nodes.size(), 3u);
  EXPECT_EQ(def->nodes[0].id, "upper");
  EXPECT_EQ(def->nodes[0].step, "transform");
  EXPECT_EQ(def->nodes[0].params["upper"], true);
  ASSERT_EQ(def->edges.size(), 3u);
  EXPECT_EQ(def->edges.front().from, sg::engine::kStart);
  EXPECT_EQ(def->edges.back().to, sg::engine::kEnd);
  ASSERT_EQ(def->branches.size(), 1u);
  EXPECT_EQ(def->branches[0].mapping.at("quiet"), "quiet");
}

TEST(GraphDsl, RejectsMalformedDefinitions) {
  auto not_json = sg::engine::parse_graph_text("{nodes: ");
  ASSERT_FALSE(not_json);
  EXPECT_EQ(not_json.error().code, ErrorCode::InvalidInput);

  EXPECT_FALSE(sg::engine::parse_graph_json(Json{{"nodes", Json::array()}}));
  EXPECT_FALSE(sg::engine::parse_graph_json(Json{{"state", Json::object()}}));

  auto duplicate = sg::engine::parse_graph_text(R"({
    "state": {"x": "replace"},
    "nodes": [{"id": "a", "step": "s"}, {"id": "a", "step": "s"}]
  })");
  ASSERT_FALSE(duplicate);
  EXPECT_NE(duplicate.error().message.find("duplicate"), std::string::npos);

  auto bad_mapping = sg::engine::parse_graph_text(R"({
    "state": {"x": "replace"},
    "nodes": [{"id": "a", "step": "s"}],
    "branches": [{"from": "a", "branch": "b", "mapping": 7}]
  })");
  ASSERT_FALSE(bad_mapping);
  EXPECT_EQ(bad_mapping.error().code, ErrorCode::InvalidInput);

  auto bad_interrupts = sg::engine::parse_graph_text(R"({
    "state": {"x": "replace"},
    "nodes": [{"id": "a", "step": "s"}],
    "interrupt_before": "a"
  })");
  EXPECT_FALSE(bad_interrupts);
}

TEST(GraphDsl, CompiledDefinitionRunsRegisteredSteps) {
  auto def = sg::engine::parse_graph_text(kPipeline);
  ASSERT_TRUE(def);
  auto app = sg::engine::compile_graph(*def, sample_registry());
  ASSERT_TRUE(app) << app.error().describe();
  EXPECT_EQ(app->name(), "shout");

  auto loud = app->invoke(Json{{"input", "hey"}}, ThreadConfig{"1"});
  ASSERT_TRUE(loud) << loud.error().describe();
  EXPECT_EQ((*loud)["output"], "<HEY>");

  auto quiet = app->invoke(Json{{"input", "hey"}, {"mode", "quiet"}}, ThreadConfig{"2"});
  ASSERT_TRUE(quiet);
  EXPECT_EQ((*quiet)["output"], "...");
}

TEST(GraphDsl, UnknownStepOrBranchIsNotFound) {
  StepRegistry registry = sample_registry();
  auto def = sg::engine::parse_graph_text(R"({
    "state": {"x": "replace"},
    "nodes": [{"id": "a", "step": "does_not_exist"}],
    "entry": "a",
    "finish": "a"
  })");
  ASSERT_TRUE(def);
  auto graph = sg::engine::build_graph(*def, registry);
  ASSERT_FALSE(graph);
  EXPECT_EQ(graph.error().code, ErrorCode::NotFound);
  EXPECT_EQ(graph.error().node, "a");

  def->nodes[0].step = "set_field";
  def->nodes[0].params = Json{{"field", "x"}, {"value", 1}};
  def->branches.push_back(sg::engine::BranchDef{"a", "nope", Json::object(), {{"k", "a"}}});
  auto branch = sg::engine::build_graph(*def, registry);
  ASSERT_FALSE(branch);
  EXPECT_EQ(branch.error().code, ErrorCode::NotFound);
}

TEST(GraphDsl, StepFactoryErrorsCarryTheNode) {
  auto def = sg::engine::parse_graph_text(R"({
    "state": {"x": "replace"},
    "nodes": [{"id": "setter", "step": "set_field", "params": {}}],
    "entry": "setter",
    "finish": "setter"
  })");
  ASSERT_TRUE(def);
  auto graph = sg::engine::build_graph(*def, sample_registry());
  ASSERT_FALSE(graph);
  EXPECT_EQ(graph.error().code, ErrorCode::InvalidInput);
  EXPECT_EQ(graph.error().node, "setter");
}

TEST(GraphDsl, DefinitionInterruptsRequireCheckpointer) {
  constexpr char kAgent[] = R"({
    "name": "agent",
    "state": {"messages": "append"},
    "nodes": [{"id": "agent", "step": "scripted_agent"}, {"id": "tools", "step": "tools"}],
    "entry": "agent",
    "edges": [{"from": "tools", "to": "agent"}],
    "branches": [{"from": "agent", "branch": "tools_condition", "mapping": {"tools": "tools", "__end__": "__end__"}}],
    "interrupt_before": ["tools"]
  })";
  auto def = sg::engine::parse_graph_text(kAgent);
  ASSERT_TRUE(def) << def.error().describe();

  auto bare = sg::engine::compile_graph(*def, sample_registry());
  ASSERT_FALSE(bare);
  EXPECT_EQ(bare.error().code, ErrorCode::GraphIntegrityError);

  auto app = sg::engine::compile_graph(*def, sample_registry(), sg::test::memory_options());
  ASSERT_TRUE(app) << app.error().describe();
  EXPECT_EQ(app->interrupt_before(), (std::vector<std::string>{"tools"}));

  sg::engine::RunContext ctx;
  auto paused = app->run(sg::test::user_input("What is 2 + 2?"), ThreadConfig{"dsl"}, ctx);
  ASSERT_TRUE(paused) << paused.error().describe();
  EXPECT_EQ(paused->status, sg::engine::RunStatus::Paused);

  auto done = app->invoke(std::nullopt, ThreadConfig{"dsl"});
  ASSERT_TRUE(done);
  EXPECT_EQ((*done)["messages"].back()["content"], "The result of 2 + 2 is 4");
}

TEST(GraphDsl, LoadsDefinitionFromFile) {
  sg::test::TempDir dir;
  auto path = dir.path() / "graph.json";
  {
    std::ofstream out(path);
    out << kPipeline;
  }
  auto def = sg::engine::parse_graph_file(path.string());
  ASSERT_TRUE(def) << def.error().describe();
  EXPECT_EQ(def->nodes.size(), 3u);

  auto missing = sg::engine::parse_graph_file((dir.path() / "absent.json").string());
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ErrorCode::InvalidInput);
}
