#include "engine/error.hpp"

#include <spdlog/fmt/fmt.h>

namespace sg::engine {

auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::SchemaError:
      return "SchemaError";
    case ErrorCode::TypeError:
      return "TypeError";
    case ErrorCode::RoutingError:
      return "RoutingError";
    case ErrorCode::GraphIntegrityError:
      return "GraphIntegrityError";
    case ErrorCode::NodeExecutionError:
      return "NodeExecutionError";
    case ErrorCode::CheckpointError:
      return "CheckpointError";
    case ErrorCode::RecursionLimit:
      return "RecursionLimit";
    case ErrorCode::Cancelled:
      return "Cancelled";
    case ErrorCode::InvalidInput:
      return "InvalidInput";
    case ErrorCode::NotFound:
      return "NotFound";
  }
  return "Unknown";
}

auto EngineError::describe() const -> std::string {
  if (node.empty()) {
    return fmt::format("{}: {}", to_string(code), message);
  }
  return fmt::format("{} in node '{}': {}", to_string(code), node, message);
}

}  // namespace sg::engine
