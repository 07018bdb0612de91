#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"
#include "engine/schema.hpp"
#include "kernel/messages.hpp"
#include "runtime/options.hpp"
#include "runtime/state_graph.hpp"

namespace {

using sg::engine::Json;
using sg::engine::State;

auto to_lower(std::string text) -> std::string {
  for (auto& c : text) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return text;
}

/// Find "<marker> X" in earlier user messages and return X.
auto recall(const Json& history, std::string_view marker) -> std::string {
  for (const auto& message : history) {
    if (sg::kernel::message_role(message) != "user") {
      continue;
    }
    auto text = sg::kernel::message_text(message);
    auto pos = to_lower(text).find(marker);
    if (pos == std::string::npos) {
      continue;
    }
    auto rest = text.substr(pos + marker.size());
    while (!rest.empty() && (rest.back() == '!' || rest.back() == '.' || rest.back() == ' ')) {
      rest.pop_back();
    }
    return rest;
  }
  return {};
}

/// Rule-based chatbot that answers from the conversation history.
auto chatbot(const State& state) -> Json {
  const auto& history = state.at("messages");
  auto question = to_lower(sg::kernel::message_text(history.back()));
  std::string reply;
  if (question.find("my name is") != std::string::npos) {
    reply = fmt::format("Nice to meet you, {}!", recall(history, "my name is "));
  } else if (question.find("what's my name") != std::string::npos) {
    auto name = recall(history, "my name is ");
    reply = name.empty() ? "You have not told me your name." : fmt::format("Your name is {}.", name);
  } else if (question.find("what did i say i'm learning") != std::string::npos) {
    auto topic = recall(history, "i'm learning about ");
    reply = topic.empty() ? "You have not said." : fmt::format("You said you're learning about {}.", topic);
  } else {
    reply = "Noted.";
  }
  return Json{{"messages", Json::array({sg::kernel::assistant_message(reply)})}};
}

}  // namespace

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sg::log::init();

  auto options = sg::engine::compile_options_from_flags();
  if (!options) {
    std::cerr << "Config error: " << options.error().describe() << "\n";
    sg::log::shutdown();
    return 1;
  }

  sg::engine::StateSchema schema;
  schema.field("messages", sg::engine::ReducerKind::Append);

  sg::engine::StateGraph graph(std::move(schema), "memory_chat");
  graph.add_node("chatbot", &chatbot).set_entry_point("chatbot").set_finish_point("chatbot");

  auto app = graph.compile(std::move(*options));
  if (!app) {
    std::cerr << "Compile error: " << app.error().describe() << "\n";
    sg::log::shutdown();
    return 1;
  }

  const sg::engine::ThreadConfig config{"conversation-1"};
  const std::vector<std::string> conversation = {
    "Hi, my name is Alice!",
    "What's my name?",
    "I'm learning about LangGraph.",
    "What did I say I'm learning?",
  };

  for (const auto& user_message : conversation) {
    std::cout << fmt::format("\n=== User: {} ===\n", user_message);
    auto result = app->invoke(Json{{"messages", Json::array({sg::kernel::user_message(user_message)})}}, config);
    if (!result) {
      std::cerr << "Run error: " << result.error().describe() << "\n";
      sg::log::shutdown();
      return 1;
    }
    std::cout << fmt::format("Assistant: {}\n", sg::kernel::message_text(result->at("messages").back()));
  }

  std::cout << "\n=== Conversation History ===\n";
  auto snapshot = app->get_state(config);
  if (!snapshot) {
    std::cerr << "State error: " << snapshot.error().describe() << "\n";
    sg::log::shutdown();
    return 1;
  }
  int index = 1;
  for (const auto& message : snapshot->values.at("messages")) {
    std::cout << fmt::format("{}. [{}] {}\n", index++, sg::kernel::message_role(message),
                             sg::kernel::message_text(message));
  }

  sg::log::shutdown();
  return 0;
}
