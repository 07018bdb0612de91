#include <gtest/gtest.h>

#include "test_support.hpp"

namespace {

using sg::engine::ErrorCode;
using sg::engine::Expected;
using sg::engine::FieldSpec;
using sg::engine::Json;
using sg::engine::ReducerKind;
using sg::engine::StateSchema;

auto sum_reducer(const Json& current, const Json& update) -> Expected<Json> {
  return Json(current.get<int>() + update.get<int>());
}

}  // namespace

TEST(StateSchema, AppendConcatenatesInOrder) {
  StateSchema schema;
  schema.field("messages", ReducerKind::Append);
  ASSERT_TRUE(schema.validate());

  auto merged = schema.merge(Json{{"messages", Json::array({"a"})}}, Json{{"messages", Json::array({"b", "c"})}});
  ASSERT_TRUE(merged) << merged.error().describe();
  EXPECT_EQ((*merged)["messages"], Json::array({"a", "b", "c"}));
}

TEST(StateSchema, ReplaceOverwrites) {
  StateSchema schema;
  schema.field("answer").field("log", ReducerKind::Append);

  auto merged = schema.merge(Json{{"answer", "old"}, {"log", Json::array()}}, Json{{"answer", "new"}});
  ASSERT_TRUE(merged);
  EXPECT_EQ((*merged)["answer"], "new");
  EXPECT_EQ((*merged)["log"], Json::array());
}

TEST(StateSchema, UnknownFieldIsSchemaErrorNamingDeclaredFields) {
  StateSchema schema;
  schema.field("messages", ReducerKind::Append).field("answer");

  auto merged = schema.merge(Json{{"messages", Json::array()}}, Json{{"bogus", 1}});
  ASSERT_FALSE(merged);
  EXPECT_EQ(merged.error().code, ErrorCode::SchemaError);
  EXPECT_NE(merged.error().message.find("bogus"), std::string::npos);
  EXPECT_NE(merged.error().message.find("messages, answer"), std::string::npos);
}

TEST(StateSchema, AppendRejectsNonSequenceUpdate) {
  StateSchema schema;
  schema.field("messages", ReducerKind::Append);

  auto merged = schema.merge(Json{{"messages", Json::array()}}, Json{{"messages", "hello"}});
  ASSERT_FALSE(merged);
  EXPECT_EQ(merged.error().code, ErrorCode::TypeError);
}

TEST(StateSchema, NullUpdateIsNoOpAndNonObjectFails) {
  StateSchema schema;
  schema.field("answer");
  Json state{{"answer", 1}};

  auto same = schema.merge(state, nullptr);
  ASSERT_TRUE(same);
  EXPECT_EQ(*same, state);

  auto bad = schema.merge(state, Json::array({1}));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ErrorCode::SchemaError);
}

TEST(StateSchema, InitialStateFillsDefaults) {
  StateSchema schema;
  schema.field("messages", ReducerKind::Append)
    .field("answer")
    .field_with_default("mode", ReducerKind::Replace, "chat");

  auto state = schema.initial_state(Json{{"messages", Json::array({"hi"})}});
  ASSERT_TRUE(state) << state.error().describe();
  EXPECT_EQ((*state)["messages"], Json::array({"hi"}));
  EXPECT_TRUE((*state)["answer"].is_null());
  EXPECT_EQ((*state)["mode"], "chat");
}

TEST(StateSchema, RequiredFieldMustBePresent) {
  StateSchema schema;
  FieldSpec spec;
  spec.name = "query";
  spec.required = true;
  ASSERT_TRUE(schema.add_field(spec));

  auto missing = schema.initial_state(Json::object());
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ErrorCode::SchemaError);

  auto present = schema.initial_state(Json{{"query", "weather"}});
  ASSERT_TRUE(present);
  EXPECT_EQ((*present)["query"], "weather");
}

TEST(StateSchema, InitialInputMustBeObject) {
  StateSchema schema;
  schema.field("answer");
  auto state = schema.initial_state(Json("text"));
  ASSERT_FALSE(state);
  EXPECT_EQ(state.error().code, ErrorCode::InvalidInput);
}

TEST(StateSchema, CustomReducer) {
  StateSchema schema;
  schema.field("total", &sum_reducer);
  ASSERT_EQ(schema.reducer_of("total"), ReducerKind::Custom);

  auto merged = schema.merge(Json{{"total", 3}}, Json{{"total", 4}});
  ASSERT_TRUE(merged);
  EXPECT_EQ((*merged)["total"], 7);
}

TEST(StateSchema, ThrowingReducerBecomesSchemaError) {
  StateSchema schema;
  schema.field("total", [](const Json&, const Json&) -> Expected<Json> {
    throw std::runtime_error("boom");
  });

  auto merged = schema.merge(Json{{"total", 0}}, Json{{"total", 1}});
  ASSERT_FALSE(merged);
  EXPECT_EQ(merged.error().code, ErrorCode::SchemaError);
  EXPECT_NE(merged.error().message.find("boom"), std::string::npos);
}

TEST(StateSchema, DuplicateFieldReportedByValidate) {
  StateSchema schema;
  schema.field("answer").field("answer", ReducerKind::Append);
  auto valid = schema.validate();
  ASSERT_FALSE(valid);
  EXPECT_EQ(valid.error().code, ErrorCode::SchemaError);
  EXPECT_EQ(schema.size(), 1u);
}

TEST(StateSchema, EmptySchemaIsInvalid) {
  StateSchema schema;
  EXPECT_FALSE(schema.validate());
}

TEST(StateSchema, FromJsonAcceptsShorthandAndObjects) {
  auto schema = StateSchema::from_json(Json::parse(R"({
    "messages": "append",
    "mode": {"reducer": "replace", "default": "chat"},
    "query": {"required": true}
  })"));
  ASSERT_TRUE(schema) << schema.error().describe();
  EXPECT_EQ(schema->reducer_of("messages"), ReducerKind::Append);
  EXPECT_EQ(schema->reducer_of("mode"), ReducerKind::Replace);
  EXPECT_FALSE(schema->reducer_of("missing").has_value());

  auto state = schema->initial_state(Json{{"query", "q"}});
  ASSERT_TRUE(state);
  EXPECT_EQ((*state)["mode"], "chat");
  EXPECT_EQ((*state)["messages"], Json::array());
}

TEST(StateSchema, FromJsonRejectsUnknownReducer) {
  auto schema = StateSchema::from_json(Json{{"messages", "concat"}});
  ASSERT_FALSE(schema);
  EXPECT_EQ(schema.error().code, ErrorCode::SchemaError);
}

TEST(StateSchema, AppendDefaultMustBeSequence) {
  auto schema = StateSchema::from_json(Json{{"log", {{"reducer", "append"}, {"default", 5}}}});
  ASSERT_FALSE(schema);
  EXPECT_EQ(schema.error().code, ErrorCode::TypeError);
}
