#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "engine/error.hpp"
#include "engine/registry.hpp"
#include "kernel/tool_node.hpp"

namespace sg::kernel {

/// search_engine, calculator, send_email and execute_command. All simulated.
auto register_sample_tools(ToolRegistry& registry) -> void;

auto make_sample_tools() -> std::shared_ptr<const ToolRegistry>;

/// Arithmetic over + - * / and parentheses.
auto evaluate_expression(std::string_view expression) -> sg::engine::Expected<double>;

/// Deterministic stand-in for a tool-calling model. On a user message it
/// requests the sample tool matching the request (or answers directly); after
/// tool results it answers with their contents.
auto make_scripted_agent(std::string messages_field = std::string(kMessagesField)) -> sg::engine::NodeFn;

/// Steps and branches for JSON graph definitions:
///   scripted_agent, tools, set_field {field, value}, transform {from, to, prefix, upper}
///   branch tools_condition, branch field_value {field, default}
auto register_sample_steps(sg::engine::StepRegistry& registry, std::shared_ptr<const ToolRegistry> tools) -> void;

}  // namespace sg::kernel
