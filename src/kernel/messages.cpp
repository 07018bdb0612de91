#include "kernel/messages.hpp"

#include <utility>

namespace sg::kernel {

auto user_message(std::string content) -> Json {
  return Json{{"role", "user"}, {"content", std::move(content)}};
}

auto assistant_message(std::string content, Json tool_calls) -> Json {
  Json message{{"role", "assistant"}, {"content", std::move(content)}};
  if (tool_calls.is_array() && !tool_calls.empty()) {
    message["tool_calls"] = std::move(tool_calls);
  }
  return message;
}

auto tool_message(std::string tool_call_id, std::string name, std::string content, bool ok) -> Json {
  return Json{
    {"role", "tool"},
    {"tool_call_id", std::move(tool_call_id)},
    {"name", std::move(name)},
    {"content", std::move(content)},
    {"status", ok ? "success" : "error"},
  };
}

auto tool_call(std::string id, std::string name, Json args) -> Json {
  return Json{{"id", std::move(id)}, {"name", std::move(name)}, {"args", std::move(args)}};
}

auto last_message(const State& state, std::string_view field) -> const Json* {
  if (!state.is_object()) {
    return nullptr;
  }
  auto it = state.find(std::string(field));
  if (it == state.end() || !it->is_array() || it->empty()) {
    return nullptr;
  }
  return &it->back();
}

auto has_tool_calls(const Json& message) -> bool {
  if (!message.is_object()) {
    return false;
  }
  auto it = message.find("tool_calls");
  return it != message.end() && it->is_array() && !it->empty();
}

auto last_message_has_tool_calls(const State& state, std::string_view field) -> bool {
  const auto* message = last_message(state, field);
  return message && has_tool_calls(*message);
}

auto tools_condition(const State& state) -> std::string {
  if (last_message_has_tool_calls(state)) {
    return std::string(kToolsNode);
  }
  return sg::engine::kEnd;
}

auto message_role(const Json& message) -> std::string {
  if (message.is_object()) {
    if (auto it = message.find("role"); it != message.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return "unknown";
}

auto message_text(const Json& message) -> std::string {
  if (message.is_string()) {
    return message.get<std::string>();
  }
  if (message.is_object()) {
    if (auto it = message.find("content"); it != message.end()) {
      return it->is_string() ? it->get<std::string>() : it->dump();
    }
  }
  return message.dump();
}

}  // namespace sg::kernel
