#include "kernel/tool_node.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"

namespace sg::kernel {
namespace {

auto string_field(const Json& obj, const char* key) -> std::string {
  if (auto it = obj.find(key); it != obj.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

}  // namespace

auto ToolRegistry::add(std::string name, std::string description, ToolFn fn) -> void {
  auto key = name;
  tools_[std::move(key)] = ToolSpec{std::move(name), std::move(description), std::move(fn)};
}

auto ToolRegistry::find(std::string_view name) const -> const ToolSpec* {
  auto it = tools_.find(std::string(name));
  if (it == tools_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto ToolRegistry::names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto& [name, _] : tools_) {
    out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

auto run_tool_call(const ToolRegistry& tools, const Json& call) -> Json {
  if (!call.is_object()) {
    return tool_message({}, {}, "malformed tool call", false);
  }
  auto id = string_field(call, "id");
  auto name = string_field(call, "name");
  if (name.empty()) {
    return tool_message(std::move(id), {}, "tool call has no name", false);
  }
  const auto* spec = tools.find(name);
  if (!spec || !spec->fn) {
    return tool_message(std::move(id), name, fmt::format("unknown tool: {}", name), false);
  }
  Json args = Json::object();
  if (auto it = call.find("args"); it != call.end()) {
    args = *it;
  }

  try {
    auto result = spec->fn(args);
    if (!result) {
      return tool_message(std::move(id), name, fmt::format("Error: {}", result.error().message), false);
    }
    auto content = result->is_string() ? result->get<std::string>() : result->dump();
    return tool_message(std::move(id), name, std::move(content));
  } catch (const std::exception& ex) {
    return tool_message(std::move(id), name, fmt::format("Error: {}", ex.what()), false);
  } catch (...) {
    return tool_message(std::move(id), name, "Error: unknown exception", false);
  }
}

auto make_tool_node(std::shared_ptr<const ToolRegistry> tools, ToolNodeOptions options) -> sg::engine::NodeFn {
  return [tools = std::move(tools), options = std::move(options)](
           const State& state, sg::engine::NodeContext& ctx) -> sg::engine::Expected<Json> {
    if (!tools) {
      return tl::unexpected(
        sg::engine::make_error(sg::engine::ErrorCode::NodeExecutionError, "tool node has no tool registry"));
    }
    const auto* message = last_message(state, options.messages_field);
    if (!message || !has_tool_calls(*message)) {
      return tl::unexpected(sg::engine::make_error(
        sg::engine::ErrorCode::NodeExecutionError,
        fmt::format("last entry of '{}' carries no tool calls", options.messages_field)));
    }
    const auto& calls = message->at("tool_calls");
    std::vector<Json> results(calls.size());
    ctx.parallel_for(calls.size(), [&](std::size_t i) {
      results[i] = run_tool_call(*tools, calls[i]);
    });

    Json out = Json::array();
    std::size_t failed = 0;
    for (auto& result : results) {
      if (result.value("status", "") == "error") {
        failed += 1;
      }
      out.push_back(std::move(result));
    }
    if (failed > 0) {
      sg::log::warn("tool node {}: {} of {} calls failed", ctx.node(), failed, calls.size());
    }
    return Json{{options.messages_field, std::move(out)}};
  };
}

}  // namespace sg::kernel
