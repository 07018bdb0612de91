#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace sg::engine {

enum class ErrorCode {
  SchemaError,
  TypeError,
  RoutingError,
  GraphIntegrityError,
  NodeExecutionError,
  CheckpointError,
  RecursionLimit,
  Cancelled,
  InvalidInput,
  NotFound,
};

auto to_string(ErrorCode code) -> std::string_view;

struct EngineError {
  ErrorCode code = ErrorCode::InvalidInput;
  std::string message;
  /// Node that failed, empty when the failure is not tied to a node.
  std::string node;
  /// State as of the last successful checkpoint (null when unknown).
  nlohmann::json state;

  auto describe() const -> std::string;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(ErrorCode code, std::string message) -> EngineError {
  return EngineError{code, std::move(message), {}, nullptr};
}

inline auto make_node_error(ErrorCode code, std::string node, std::string message) -> EngineError {
  return EngineError{code, std::move(message), std::move(node), nullptr};
}

}  // namespace sg::engine
