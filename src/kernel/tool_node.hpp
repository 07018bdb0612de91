#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"
#include "kernel/messages.hpp"

namespace sg::kernel {

/// Tool handler: arguments object in, result out. A string result becomes the
/// tool message content verbatim; other values are serialized.
using ToolFn = std::function<sg::engine::Expected<Json>(const Json& args)>;

struct ToolSpec {
  std::string name;
  std::string description;
  ToolFn fn;
};

class ToolRegistry {
 public:
  auto add(std::string name, std::string description, ToolFn fn) -> void;
  auto find(std::string_view name) const -> const ToolSpec*;
  /// Registered names, sorted.
  auto names() const -> std::vector<std::string>;

 private:
  std::unordered_map<std::string, ToolSpec> tools_;
};

struct ToolNodeOptions {
  std::string messages_field{kMessagesField};
};

/// Step that executes the tool calls carried by the last message and appends
/// one tool message per call, in call order. Failing calls produce a message
/// with status "error" instead of failing the step.
auto make_tool_node(std::shared_ptr<const ToolRegistry> tools, ToolNodeOptions options = {}) -> sg::engine::NodeFn;

/// Execute one call object ({"id","name","args"}) and build its tool message.
auto run_tool_call(const ToolRegistry& tools, const Json& call) -> Json;

}  // namespace sg::kernel
