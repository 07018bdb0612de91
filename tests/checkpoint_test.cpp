#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

#include "runtime/file_checkpointer.hpp"
#include "test_support.hpp"

namespace {

using sg::engine::Checkpoint;
using sg::engine::Checkpointer;
using sg::engine::ErrorCode;
using sg::engine::FileCheckpointer;
using sg::engine::InMemoryCheckpointer;
using sg::engine::Json;
using sg::engine::ThreadConfig;

auto sample_checkpoint(const std::string& thread_id, int step) -> Checkpoint {
  Checkpoint checkpoint;
  checkpoint.thread_id = thread_id;
  checkpoint.graph = "agent";
  checkpoint.state = Json{{"messages", Json::array({sg::kernel::user_message("hello")})}};
  checkpoint.pending = {"tools"};
  checkpoint.interrupted = true;
  checkpoint.step = step;
  checkpoint.updated_at_ms = sg::engine::now_ms();
  return checkpoint;
}

auto expect_same(const Checkpoint& actual, const Checkpoint& expected) -> void {
  EXPECT_EQ(actual.thread_id, expected.thread_id);
  EXPECT_EQ(actual.graph, expected.graph);
  EXPECT_EQ(actual.state, expected.state);
  EXPECT_EQ(actual.pending, expected.pending);
  EXPECT_EQ(actual.interrupted, expected.interrupted);
  EXPECT_EQ(actual.step, expected.step);
  EXPECT_EQ(actual.updated_at_ms, expected.updated_at_ms);
}

/// Behaviour every checkpointer must share.
auto exercise_store(Checkpointer& store) -> void {
  auto empty = store.load("t1");
  ASSERT_TRUE(empty);
  EXPECT_FALSE(empty->has_value());

  auto first = sample_checkpoint("t1", 0);
  ASSERT_TRUE(store.save("t1", first));
  auto latest = sample_checkpoint("t1", 3);
  latest.pending.clear();
  latest.interrupted = false;
  ASSERT_TRUE(store.save("t1", latest));
  ASSERT_TRUE(store.save("t2", sample_checkpoint("t2", 1)));

  auto loaded = store.load("t1");
  ASSERT_TRUE(loaded);
  ASSERT_TRUE(loaded->has_value());
  expect_same(**loaded, latest);

  auto threads = store.list_threads();
  ASSERT_TRUE(threads);
  std::sort(threads->begin(), threads->end());
  EXPECT_EQ(*threads, (std::vector<std::string>{"t1", "t2"}));

  auto removed = store.remove("t1");
  ASSERT_TRUE(removed);
  EXPECT_TRUE(*removed);
  auto removed_again = store.remove("t1");
  ASSERT_TRUE(removed_again);
  EXPECT_FALSE(*removed_again);

  auto gone = store.load("t1");
  ASSERT_TRUE(gone);
  EXPECT_FALSE(gone->has_value());
}

}  // namespace

TEST(Checkpoint, JsonRejectsMalformedRecords) {
  auto good = sg::engine::checkpoint_to_json(sample_checkpoint("t", 2));
  auto parsed = sg::engine::checkpoint_from_json(good);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->pending, (std::vector<std::string>{"tools"}));

  auto no_state = good;
  no_state.erase("state");
  auto missing = sg::engine::checkpoint_from_json(no_state);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ErrorCode::CheckpointError);

  auto bad_pending = good;
  bad_pending["pending"] = Json::array({1, 2});
  EXPECT_FALSE(sg::engine::checkpoint_from_json(bad_pending));

  EXPECT_FALSE(sg::engine::checkpoint_from_json(Json::array()));
}

TEST(InMemoryCheckpointer, StoresLatestCheckpointPerThread) {
  InMemoryCheckpointer store;
  exercise_store(store);
}

TEST(FileCheckpointer, StoresLatestCheckpointPerThread) {
  sg::test::TempDir dir;
  auto store = FileCheckpointer::create(dir.path() / "threads");
  ASSERT_TRUE(store) << store.error().describe();
  exercise_store(**store);
}

TEST(FileCheckpointer, ThreadIdsAreEncodedIntoSafeFileNames) {
  const std::string thread_id = "user/42: a.b%";
  auto stem = FileCheckpointer::encode_thread_id(thread_id);
  EXPECT_EQ(stem.find('/'), std::string::npos);
  EXPECT_EQ(stem.find(' '), std::string::npos);
  EXPECT_EQ(stem.find('.'), std::string::npos);
  EXPECT_EQ(FileCheckpointer::decode_thread_id(stem), thread_id);
  EXPECT_EQ(FileCheckpointer::encode_thread_id("plain_id-1"), "plain_id-1");
  EXPECT_FALSE(FileCheckpointer::decode_thread_id("bad%4").has_value());
  EXPECT_FALSE(FileCheckpointer::decode_thread_id("bad%zz").has_value());

  sg::test::TempDir dir;
  auto store = FileCheckpointer::create(dir.path());
  ASSERT_TRUE(store);
  ASSERT_TRUE((*store)->save(thread_id, sample_checkpoint(thread_id, 0)));
  auto threads = (*store)->list_threads();
  ASSERT_TRUE(threads);
  EXPECT_EQ(*threads, (std::vector<std::string>{thread_id}));
}

TEST(FileCheckpointer, SurvivesReopening) {
  sg::test::TempDir dir;
  auto saved = sample_checkpoint("durable", 5);
  {
    auto store = FileCheckpointer::create(dir.path());
    ASSERT_TRUE(store);
    ASSERT_TRUE((*store)->save("durable", saved));
  }
  auto reopened = FileCheckpointer::create(dir.path());
  ASSERT_TRUE(reopened);
  auto loaded = (*reopened)->load("durable");
  ASSERT_TRUE(loaded);
  ASSERT_TRUE(loaded->has_value());
  expect_same(**loaded, saved);
}

TEST(FileCheckpointer, CorruptFileIsCheckpointError) {
  sg::test::TempDir dir;
  auto store = FileCheckpointer::create(dir.path());
  ASSERT_TRUE(store);
  ASSERT_TRUE((*store)->save("broken", sample_checkpoint("broken", 0)));

  for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
    std::ofstream out(entry.path(), std::ios::trunc);
    out << "{ not json";
  }
  auto loaded = (*store)->load("broken");
  ASSERT_FALSE(loaded);
  EXPECT_EQ(loaded.error().code, ErrorCode::CheckpointError);
}

TEST(FileCheckpointer, UnencodableStateIsCheckpointError) {
  sg::test::TempDir dir;
  auto store = FileCheckpointer::create(dir.path());
  ASSERT_TRUE(store);

  auto raw = sample_checkpoint("raw", 0);
  raw.state["route"] = std::string("\xff\xfe bytes");
  auto saved = (*store)->save("raw", raw);
  ASSERT_FALSE(saved);
  EXPECT_EQ(saved.error().code, ErrorCode::CheckpointError);
  auto threads = (*store)->list_threads();
  ASSERT_TRUE(threads);
  EXPECT_TRUE(threads->empty());

  sg::engine::StateGraph graph(sg::test::log_schema(), "bytes");
  graph
    .add_node("decode",
              [](const sg::engine::State&) -> Json { return Json{{"route", std::string("\xff\xfe bytes")}}; })
    .set_entry_point("decode")
    .set_finish_point("decode");
  sg::engine::CompileOptions options;
  options.checkpointer = *store;
  auto app = graph.compile(options);
  ASSERT_TRUE(app) << app.error().describe();

  ThreadConfig config{"bytes"};
  auto result = app->invoke(Json::object(), config);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, ErrorCode::CheckpointError);
  EXPECT_TRUE(result.error().state["route"].is_null());

  auto snapshot = app->get_state(config);
  ASSERT_TRUE(snapshot) << snapshot.error().describe();
  EXPECT_EQ(snapshot->step, -1);
  EXPECT_EQ(snapshot->next, (std::vector<std::string>{"decode"}));
  EXPECT_EQ(result.error().state, snapshot->values);
}

TEST(FileCheckpointer, InterruptedRunResumesInANewProcessImage) {
  sg::test::TempDir dir;
  ThreadConfig config{"approval/1"};
  auto tool_calls = std::make_shared<std::atomic<int>>(0);
  {
    auto store = FileCheckpointer::create(dir.path());
    ASSERT_TRUE(store);
    sg::engine::CompileOptions options;
    options.checkpointer = *store;
    options.interrupt_before = {"tools"};
    auto app = sg::test::agent_graph(tool_calls).compile(options);
    ASSERT_TRUE(app) << app.error().describe();
    auto paused = app->invoke(sg::test::user_input("Search for the weather today"), config);
    ASSERT_TRUE(paused) << paused.error().describe();
    EXPECT_EQ(tool_calls->load(), 0);
  }

  auto store = FileCheckpointer::create(dir.path());
  ASSERT_TRUE(store);
  sg::engine::CompileOptions options;
  options.checkpointer = *store;
  options.interrupt_before = {"tools"};
  auto app = sg::test::agent_graph(tool_calls).compile(options);
  ASSERT_TRUE(app);

  auto snapshot = app->get_state(config);
  ASSERT_TRUE(snapshot) << snapshot.error().describe();
  EXPECT_TRUE(snapshot->interrupted);
  EXPECT_EQ(snapshot->next, (std::vector<std::string>{"tools"}));

  auto resumed = app->invoke(std::nullopt, config);
  ASSERT_TRUE(resumed) << resumed.error().describe();
  EXPECT_EQ(tool_calls->load(), 1);
  EXPECT_EQ((*resumed)["messages"].back()["content"], "The weather is sunny with a high of 75°F.");
}

TEST(Checkpointer, ThreadLeaseReleasesOnDestruction) {
  InMemoryCheckpointer store;
  {
    auto lease = store.lock_thread("t");
    EXPECT_TRUE(lease.held());
    auto moved = std::move(lease);
    EXPECT_FALSE(lease.held());
    EXPECT_TRUE(moved.held());
  }
  auto again = store.lock_thread("t");
  EXPECT_TRUE(again.held());
}
