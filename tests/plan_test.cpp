#include <gtest/gtest.h>

#include "test_support.hpp"

namespace {

using sg::engine::BranchMap;
using sg::engine::CompileOptions;
using sg::engine::ErrorCode;
using sg::engine::Json;
using sg::engine::kEnd;
using sg::engine::kStart;
using sg::engine::State;
using sg::engine::StateGraph;
using sg::engine::ThreadConfig;
using sg::test::log_schema;
using sg::test::log_step;

auto expect_integrity_error(const StateGraph& graph, CompileOptions options = {}) -> std::string {
  auto compiled = graph.compile(std::move(options));
  EXPECT_FALSE(compiled.has_value());
  if (compiled) {
    return {};
  }
  EXPECT_EQ(compiled.error().code, ErrorCode::GraphIntegrityError) << compiled.error().describe();
  return compiled.error().message;
}

}  // namespace

TEST(GraphPlan, LinearGraphCompiles) {
  StateGraph graph(log_schema(), "linear");
  graph.add_node("a", log_step("a")).add_node("b", log_step("b")).set_entry_point("a").add_edge("a", "b")
    .set_finish_point("b");

  auto compiled = graph.compile();
  ASSERT_TRUE(compiled) << compiled.error().describe();
  EXPECT_EQ(compiled->name(), "linear");
  EXPECT_EQ(compiled->node_names(), (std::vector<std::string>{"a", "b"}));
  EXPECT_TRUE(compiled->interrupt_before().empty());
}

TEST(GraphPlan, DefaultNameIsGraph) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).set_entry_point("a").set_finish_point("a");
  auto compiled = graph.compile();
  ASSERT_TRUE(compiled);
  EXPECT_EQ(compiled->name(), "graph");
}

TEST(GraphPlan, NodeWithoutOutgoingEdgeIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).add_node("b", log_step("b")).set_entry_point("a").add_edge("a", "b");
  auto message = expect_integrity_error(graph);
  EXPECT_NE(message.find("'b' has no outgoing edge"), std::string::npos);
}

TEST(GraphPlan, UnreachableNodeIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).add_node("orphan", log_step("o")).set_entry_point("a").set_finish_point("a")
    .set_finish_point("orphan");
  auto message = expect_integrity_error(graph);
  EXPECT_NE(message.find("orphan"), std::string::npos);
}

TEST(GraphPlan, UnknownEdgeTargetIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).set_entry_point("a").add_edge("a", "missing");
  auto message = expect_integrity_error(graph);
  EXPECT_NE(message.find("missing"), std::string::npos);
}

TEST(GraphPlan, UnknownBranchTargetIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a"))
    .set_entry_point("a")
    .add_conditional_edges("a", [](const State&) { return std::string("x"); }, BranchMap{{"x", "ghost"}});
  expect_integrity_error(graph);
}

TEST(GraphPlan, ReservedNamesAreRejected) {
  StateGraph start_node(log_schema());
  start_node.add_node(kStart, log_step("a")).set_entry_point(kStart);
  expect_integrity_error(start_node);

  StateGraph into_start(log_schema());
  into_start.add_node("a", log_step("a")).set_entry_point("a").add_edge("a", kStart);
  expect_integrity_error(into_start);

  StateGraph out_of_end(log_schema());
  out_of_end.add_node("a", log_step("a")).set_entry_point("a").set_finish_point("a").add_edge(kEnd, "a");
  expect_integrity_error(out_of_end);
}

TEST(GraphPlan, DuplicateNodeIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).add_node("a", log_step("again")).set_entry_point("a").set_finish_point("a");
  auto message = expect_integrity_error(graph);
  EXPECT_NE(message.find("duplicate"), std::string::npos);
}

TEST(GraphPlan, MissingEntryIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).set_finish_point("a");
  expect_integrity_error(graph);
}

TEST(GraphPlan, CycleWithoutExitIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).add_node("b", log_step("b")).set_entry_point("a").add_edge("a", "b")
    .add_edge("b", "a");
  auto message = expect_integrity_error(graph);
  EXPECT_NE(message.find(kEnd), std::string::npos);
}

TEST(GraphPlan, InvalidSchemaFailsCompile) {
  sg::engine::StateSchema schema;
  schema.field("x").field("x");
  StateGraph graph(std::move(schema));
  graph.add_node("a", log_step("a")).set_entry_point("a").set_finish_point("a");
  auto compiled = graph.compile();
  ASSERT_FALSE(compiled);
  EXPECT_EQ(compiled.error().code, ErrorCode::SchemaError);
}

TEST(GraphPlan, InterruptOnUnknownNodeIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).set_entry_point("a").set_finish_point("a");
  expect_integrity_error(graph, sg::test::memory_options({"nope"}));
}

TEST(GraphPlan, InterruptWithoutCheckpointerIsRejected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).set_entry_point("a").set_finish_point("a");
  CompileOptions options;
  options.interrupt_before = {"a"};
  expect_integrity_error(graph, options);
}

TEST(GraphPlan, NonPositiveRecursionLimitIsInvalid) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).set_entry_point("a").set_finish_point("a");
  CompileOptions options;
  options.recursion_limit = 0;
  auto compiled = graph.compile(options);
  ASSERT_FALSE(compiled);
  EXPECT_EQ(compiled.error().code, ErrorCode::InvalidInput);
}

TEST(GraphPlan, EntryFanOutFollowsDeclarationOrder) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a"))
    .add_node("b", log_step("b"))
    .add_node("c", log_step("c"))
    .add_edge(kStart, "c")
    .add_edge(kStart, "a")
    .add_edge(kStart, "b")
    .add_edge(kStart, "a")
    .set_finish_point("a")
    .set_finish_point("b")
    .set_finish_point("c");

  auto plan = sg::engine::compile_plan(graph.spec());
  ASSERT_TRUE(plan) << plan.error().describe();
  auto entry = plan->resolve_entry(Json::object());
  ASSERT_TRUE(entry);
  EXPECT_EQ(plan->names(*entry), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(GraphPlan, TerminalIsDroppedWhenOtherNodesAreSelected) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a"))
    .add_node("b", log_step("b"))
    .set_entry_point("a")
    .add_conditional_fanout("a",
                            [](const State&) {
                              return std::vector<std::string>{"done", "more"};
                            },
                            BranchMap{{"done", kEnd}, {"more", "b"}})
    .set_finish_point("b");

  auto plan = sg::engine::compile_plan(graph.spec());
  ASSERT_TRUE(plan) << plan.error().describe();
  std::vector<int> ran{plan->find("a")};
  auto next = plan->resolve_next(ran, Json::object());
  ASSERT_TRUE(next);
  EXPECT_EQ(plan->names(*next), (std::vector<std::string>{"b"}));

  std::vector<int> last{plan->find("b")};
  auto done = plan->resolve_next(last, Json::object());
  ASSERT_TRUE(done);
  EXPECT_TRUE(done->empty());
}

TEST(GraphPlan, LookupOfUnknownNodeIsCheckpointError) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a")).set_entry_point("a").set_finish_point("a");
  auto plan = sg::engine::compile_plan(graph.spec());
  ASSERT_TRUE(plan);
  auto found = plan->lookup({"a"});
  ASSERT_TRUE(found);
  EXPECT_EQ(found->size(), 1u);
  auto missing = plan->lookup({"a", "zzz"});
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ErrorCode::CheckpointError);
}

class ConditionalRouting : public ::testing::Test {
 protected:
  void SetUp() override {
    coder_calls = std::make_shared<std::atomic<int>>(0);
    writer_calls = std::make_shared<std::atomic<int>>(0);
    StateGraph graph(log_schema(), "router");
    graph.add_node("supervisor", log_step("supervisor"))
      .add_node("coder", log_step("coder", coder_calls))
      .add_node("writer", log_step("writer", writer_calls))
      .set_entry_point("supervisor")
      .add_conditional_edges("supervisor",
                             [](const State& state) { return state.value("route", std::string()); },
                             BranchMap{{"coder", "coder"}, {"writer", "writer"}, {"finish", kEnd}})
      .set_finish_point("coder")
      .set_finish_point("writer");
    auto compiled = graph.compile();
    ASSERT_TRUE(compiled) << compiled.error().describe();
    app.emplace(std::move(*compiled));
  }

  std::shared_ptr<std::atomic<int>> coder_calls;
  std::shared_ptr<std::atomic<int>> writer_calls;
  std::optional<sg::engine::CompiledGraph> app;
};

TEST_F(ConditionalRouting, KnownKeyRunsMappedNode) {
  auto state = app->invoke(Json{{"route", "coder"}}, ThreadConfig{"t"});
  ASSERT_TRUE(state) << state.error().describe();
  EXPECT_EQ((*state)["log"], Json::array({"supervisor", "coder"}));
  EXPECT_EQ(coder_calls->load(), 1);
  EXPECT_EQ(writer_calls->load(), 0);
}

TEST_F(ConditionalRouting, TerminalKeyEndsRun) {
  auto state = app->invoke(Json{{"route", "finish"}}, ThreadConfig{"t"});
  ASSERT_TRUE(state);
  EXPECT_EQ((*state)["log"], Json::array({"supervisor"}));
}

TEST_F(ConditionalRouting, UnknownKeyIsRoutingErrorAndRunsNothing) {
  auto state = app->invoke(Json{{"route", "unknown"}}, ThreadConfig{"t"});
  ASSERT_FALSE(state);
  EXPECT_EQ(state.error().code, ErrorCode::RoutingError);
  EXPECT_EQ(state.error().node, "supervisor");
  EXPECT_NE(state.error().message.find("coder, finish, writer"), std::string::npos);
  EXPECT_EQ(coder_calls->load(), 0);
  EXPECT_EQ(writer_calls->load(), 0);
}

TEST(GraphPlan, ThrowingBranchIsRoutingError) {
  StateGraph graph(log_schema());
  graph.add_node("a", log_step("a"))
    .set_entry_point("a")
    .add_conditional_edges("a",
                           [](const State&) -> std::string {
                             throw std::runtime_error("no route");
                           },
                           BranchMap{{"end", kEnd}});
  auto app = graph.compile();
  ASSERT_TRUE(app);
  auto state = app->invoke(Json::object(), ThreadConfig{"t"});
  ASSERT_FALSE(state);
  EXPECT_EQ(state.error().code, ErrorCode::RoutingError);
  EXPECT_NE(state.error().message.find("no route"), std::string::npos);
}
