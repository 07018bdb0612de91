#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace sg::engine {

enum class ReducerKind {
  Replace,
  Append,
  Custom,
};

auto to_string(ReducerKind kind) -> std::string_view;
auto parse_reducer_kind(std::string_view name) -> Expected<ReducerKind>;

/// Combines the stored value of a field with a value returned by a node.
using ReducerFn = std::function<Expected<Json>(const Json& current, const Json& update)>;

struct FieldSpec {
  std::string name;
  ReducerKind reducer = ReducerKind::Replace;
  /// Used when reducer == Custom.
  ReducerFn custom;
  /// Value the field takes when the initial input omits it. Append fields
  /// default to an empty array when unset.
  std::optional<Json> default_value;
  /// Initial input must carry the field.
  bool required = false;
};

/// Shape of the shared state and the merge policy of each field.
class StateSchema {
 public:
  StateSchema() = default;

  auto add_field(FieldSpec spec) -> Expected<void>;

  /// Chaining form of add_field. The first failure is kept and reported by
  /// validate(), which compile() calls.
  auto field(std::string name, ReducerKind reducer = ReducerKind::Replace) -> StateSchema&;
  auto field(std::string name, ReducerFn reducer) -> StateSchema&;
  auto field_with_default(std::string name, ReducerKind reducer, Json default_value) -> StateSchema&;

  auto validate() const -> Expected<void>;

  auto has_field(std::string_view name) const -> bool;
  auto find(std::string_view name) const -> const FieldSpec*;
  auto reducer_of(std::string_view name) const -> std::optional<ReducerKind>;
  /// Field names in declaration order.
  auto field_names() const -> std::vector<std::string>;
  auto size() const -> std::size_t { return fields_.size(); }

  /// Apply a partial update on top of a copy of current.
  auto merge(const State& current, const Json& update) const -> Expected<State>;
  /// Apply a partial update in place. On failure target may hold a prefix of
  /// the update; callers that need atomicity merge into a copy.
  auto merge_into(State& target, const Json& update) const -> Expected<void>;

  /// Check an update's keys and shape without merging.
  auto validate_update(const Json& update) const -> Expected<void>;

  /// Build a complete state from a caller input, filling defaults.
  auto initial_state(const Json& input) const -> Expected<State>;

  /// Parse `{"field": {"reducer": "append", "default": [], "required": true}}`
  /// or the shorthand `{"field": "append"}`.
  static auto from_json(const Json& json) -> Expected<StateSchema>;

 private:
  auto default_of(const FieldSpec& spec) const -> Json;
  auto remember(Expected<void> result) -> void;

  std::vector<FieldSpec> fields_;
  std::unordered_map<std::string, std::size_t> index_;
  std::optional<EngineError> deferred_error_;
};

}  // namespace sg::engine
