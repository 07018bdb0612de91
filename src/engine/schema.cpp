#include "engine/schema.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>

namespace sg::engine {
namespace {

auto join_names(const std::vector<std::string>& names) -> std::string {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

auto apply_append(std::string_view field, const Json& current, const Json& update) -> Expected<Json> {
  if (!current.is_array()) {
    return tl::unexpected(make_error(
      ErrorCode::TypeError, fmt::format("append field '{}' holds a non-sequence value", field)));
  }
  if (!update.is_array()) {
    return tl::unexpected(make_error(
      ErrorCode::TypeError, fmt::format("append field '{}' expects a sequence update, got {}", field,
                                        update.type_name())));
  }
  Json merged = current;
  for (const auto& item : update) {
    merged.push_back(item);
  }
  return merged;
}

}  // namespace

auto to_string(ReducerKind kind) -> std::string_view {
  switch (kind) {
    case ReducerKind::Replace:
      return "replace";
    case ReducerKind::Append:
      return "append";
    case ReducerKind::Custom:
      return "custom";
  }
  return "replace";
}

auto parse_reducer_kind(std::string_view name) -> Expected<ReducerKind> {
  if (name == "replace") {
    return ReducerKind::Replace;
  }
  if (name == "append") {
    return ReducerKind::Append;
  }
  return tl::unexpected(make_error(ErrorCode::SchemaError, fmt::format("unknown reducer: {}", name)));
}

auto StateSchema::add_field(FieldSpec spec) -> Expected<void> {
  if (spec.name.empty()) {
    return tl::unexpected(make_error(ErrorCode::SchemaError, "state field name is empty"));
  }
  if (index_.contains(spec.name)) {
    return tl::unexpected(
      make_error(ErrorCode::SchemaError, fmt::format("duplicate state field: {}", spec.name)));
  }
  if (spec.reducer == ReducerKind::Custom && !spec.custom) {
    return tl::unexpected(
      make_error(ErrorCode::SchemaError, fmt::format("custom reducer missing for field: {}", spec.name)));
  }
  if (spec.reducer == ReducerKind::Append && spec.default_value && !spec.default_value->is_array()) {
    return tl::unexpected(make_error(
      ErrorCode::TypeError, fmt::format("append field '{}' needs a sequence default", spec.name)));
  }
  index_.emplace(spec.name, fields_.size());
  fields_.push_back(std::move(spec));
  return {};
}

auto StateSchema::field(std::string name, ReducerKind reducer) -> StateSchema& {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.reducer = reducer;
  remember(add_field(std::move(spec)));
  return *this;
}

auto StateSchema::field(std::string name, ReducerFn reducer) -> StateSchema& {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.reducer = ReducerKind::Custom;
  spec.custom = std::move(reducer);
  remember(add_field(std::move(spec)));
  return *this;
}

auto StateSchema::field_with_default(std::string name, ReducerKind reducer, Json default_value) -> StateSchema& {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.reducer = reducer;
  spec.default_value = std::move(default_value);
  remember(add_field(std::move(spec)));
  return *this;
}

auto StateSchema::remember(Expected<void> result) -> void {
  if (!result && !deferred_error_) {
    deferred_error_ = std::move(result.error());
  }
}

auto StateSchema::validate() const -> Expected<void> {
  if (deferred_error_) {
    return tl::unexpected(*deferred_error_);
  }
  if (fields_.empty()) {
    return tl::unexpected(make_error(ErrorCode::SchemaError, "state schema declares no fields"));
  }
  return {};
}

auto StateSchema::has_field(std::string_view name) const -> bool {
  return find(name) != nullptr;
}

auto StateSchema::find(std::string_view name) const -> const FieldSpec* {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) {
    return nullptr;
  }
  return &fields_[it->second];
}

auto StateSchema::reducer_of(std::string_view name) const -> std::optional<ReducerKind> {
  const auto* spec = find(name);
  if (!spec) {
    return std::nullopt;
  }
  return spec->reducer;
}

auto StateSchema::field_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(fields_.size());
  for (const auto& spec : fields_) {
    names.push_back(spec.name);
  }
  return names;
}

auto StateSchema::default_of(const FieldSpec& spec) const -> Json {
  if (spec.default_value) {
    return *spec.default_value;
  }
  if (spec.reducer == ReducerKind::Append) {
    return Json::array();
  }
  return nullptr;
}

auto StateSchema::validate_update(const Json& update) const -> Expected<void> {
  if (update.is_null()) {
    return {};
  }
  if (!update.is_object()) {
    return tl::unexpected(make_error(
      ErrorCode::SchemaError, fmt::format("state update must be an object, got {}", update.type_name())));
  }
  for (const auto& [key, value] : update.items()) {
    if (!index_.contains(key)) {
      return tl::unexpected(make_error(
        ErrorCode::SchemaError,
        fmt::format("unknown state field '{}' (declared: {})", key, join_names(field_names()))));
    }
  }
  return {};
}

auto StateSchema::merge_into(State& target, const Json& update) const -> Expected<void> {
  if (auto valid = validate_update(update); !valid) {
    return tl::unexpected(valid.error());
  }
  if (update.is_null()) {
    return {};
  }
  for (const auto& [key, value] : update.items()) {
    const auto& spec = fields_[index_.find(key)->second];
    if (!target.contains(key)) {
      target[key] = default_of(spec);
    }
    auto& slot = target[key];
    switch (spec.reducer) {
      case ReducerKind::Replace:
        slot = value;
        break;
      case ReducerKind::Append: {
        auto merged = apply_append(key, slot, value);
        if (!merged) {
          return tl::unexpected(merged.error());
        }
        slot = std::move(*merged);
        break;
      }
      case ReducerKind::Custom: {
        Expected<Json> merged = tl::unexpected(make_error(ErrorCode::SchemaError, "reducer not run"));
        try {
          merged = spec.custom(slot, value);
        } catch (const std::exception& ex) {
          return tl::unexpected(make_error(
            ErrorCode::SchemaError, fmt::format("reducer for field '{}' threw: {}", key, ex.what())));
        }
        if (!merged) {
          return tl::unexpected(merged.error());
        }
        slot = std::move(*merged);
        break;
      }
    }
  }
  return {};
}

auto StateSchema::merge(const State& current, const Json& update) const -> Expected<State> {
  State next = current;
  if (auto result = merge_into(next, update); !result) {
    return tl::unexpected(result.error());
  }
  return next;
}

auto StateSchema::initial_state(const Json& input) const -> Expected<State> {
  if (!input.is_object()) {
    return tl::unexpected(make_error(
      ErrorCode::InvalidInput, fmt::format("initial input must be an object, got {}", input.type_name())));
  }
  State state = Json::object();
  for (const auto& spec : fields_) {
    if (spec.required && !input.contains(spec.name)) {
      return tl::unexpected(
        make_error(ErrorCode::SchemaError, fmt::format("initial input is missing field: {}", spec.name)));
    }
    state[spec.name] = default_of(spec);
  }
  if (auto result = merge_into(state, input); !result) {
    return tl::unexpected(result.error());
  }
  return state;
}

auto StateSchema::from_json(const Json& json) -> Expected<StateSchema> {
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::SchemaError, "state schema must be an object"));
  }
  StateSchema schema;
  for (const auto& [name, field_json] : json.items()) {
    FieldSpec spec;
    spec.name = name;
    if (field_json.is_string()) {
      auto kind = parse_reducer_kind(field_json.get<std::string>());
      if (!kind) {
        return tl::unexpected(kind.error());
      }
      spec.reducer = *kind;
    } else if (field_json.is_object()) {
      if (auto it = field_json.find("reducer"); it != field_json.end()) {
        if (!it->is_string()) {
          return tl::unexpected(
            make_error(ErrorCode::SchemaError, fmt::format("reducer of field '{}' must be a string", name)));
        }
        auto kind = parse_reducer_kind(it->get<std::string>());
        if (!kind) {
          return tl::unexpected(kind.error());
        }
        spec.reducer = *kind;
      }
      if (auto it = field_json.find("default"); it != field_json.end()) {
        spec.default_value = *it;
      }
      if (auto it = field_json.find("required"); it != field_json.end()) {
        if (!it->is_boolean()) {
          return tl::unexpected(
            make_error(ErrorCode::SchemaError, fmt::format("required of field '{}' must be a bool", name)));
        }
        spec.required = it->get<bool>();
      }
    } else {
      return tl::unexpected(
        make_error(ErrorCode::SchemaError, fmt::format("field '{}' must be an object or reducer name", name)));
    }
    if (auto added = schema.add_field(std::move(spec)); !added) {
      return tl::unexpected(added.error());
    }
  }
  return schema;
}

}  // namespace sg::engine
