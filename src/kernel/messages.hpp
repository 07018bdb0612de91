#pragma once

#include <string>
#include <string_view>

#include "engine/types.hpp"

namespace sg::kernel {

using sg::engine::Json;
using sg::engine::State;

inline constexpr std::string_view kMessagesField = "messages";
inline constexpr std::string_view kToolsNode = "tools";

auto user_message(std::string content) -> Json;
auto assistant_message(std::string content, Json tool_calls = Json::array()) -> Json;
auto tool_message(std::string tool_call_id, std::string name, std::string content, bool ok = true) -> Json;
auto tool_call(std::string id, std::string name, Json args) -> Json;

/// Last entry of a message list field, or nullptr when absent or empty.
auto last_message(const State& state, std::string_view field = kMessagesField) -> const Json*;

auto has_tool_calls(const Json& message) -> bool;

auto last_message_has_tool_calls(const State& state, std::string_view field = kMessagesField) -> bool;

/// Branch function for agent loops: "tools" when the last message requests
/// tool calls, the terminal otherwise.
auto tools_condition(const State& state) -> std::string;

auto message_role(const Json& message) -> std::string;
auto message_text(const Json& message) -> std::string;

}  // namespace sg::kernel
