#include "kernel/sample_tools.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace sg::kernel {
namespace {

using sg::engine::ErrorCode;
using sg::engine::Expected;
using sg::engine::make_error;

auto to_lower(std::string_view text) -> std::string {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto to_upper(std::string_view text) -> std::string {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

auto trim(std::string_view text) -> std::string {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(begin, end - begin + 1));
}

auto get_string_param(const Json& params, const char* key, std::string fallback) -> std::string {
  if (!params.is_object()) {
    return fallback;
  }
  auto it = params.find(key);
  if (it != params.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return fallback;
}

auto get_bool_param(const Json& params, const char* key, bool fallback) -> bool {
  if (!params.is_object()) {
    return fallback;
  }
  auto it = params.find(key);
  if (it != params.end() && it->is_boolean()) {
    return it->get<bool>();
  }
  return fallback;
}

auto require_string_arg(const Json& args, const char* key) -> Expected<std::string> {
  if (args.is_object()) {
    if (auto it = args.find(key); it != args.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return tl::unexpected(make_error(ErrorCode::InvalidInput, fmt::format("missing string argument '{}'", key)));
}

class ExpressionParser {
 public:
  explicit ExpressionParser(std::string_view text) : text_(text) {}

  auto parse() -> Expected<double> {
    auto value = expr();
    if (!value) {
      return value;
    }
    skip_space();
    if (pos_ != text_.size()) {
      return fail(fmt::format("unexpected '{}' at position {}", text_[pos_], pos_));
    }
    return value;
  }

 private:
  auto fail(std::string message) const -> Expected<double> {
    return tl::unexpected(make_error(ErrorCode::InvalidInput, std::move(message)));
  }

  auto skip_space() -> void {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  auto peek() -> char {
    skip_space();
    return pos_ < text_.size() ? text_[pos_] : '\0';
  }

  auto expr() -> Expected<double> {
    auto lhs = term();
    if (!lhs) {
      return lhs;
    }
    double value = *lhs;
    for (char op = peek(); op == '+' || op == '-'; op = peek()) {
      ++pos_;
      auto rhs = term();
      if (!rhs) {
        return rhs;
      }
      value = op == '+' ? value + *rhs : value - *rhs;
    }
    return value;
  }

  auto term() -> Expected<double> {
    auto lhs = factor();
    if (!lhs) {
      return lhs;
    }
    double value = *lhs;
    for (char op = peek(); op == '*' || op == '/'; op = peek()) {
      ++pos_;
      auto rhs = factor();
      if (!rhs) {
        return rhs;
      }
      if (op == '/') {
        if (*rhs == 0.0) {
          return fail("division by zero");
        }
        value /= *rhs;
      } else {
        value *= *rhs;
      }
    }
    return value;
  }

  auto factor() -> Expected<double> {
    char c = peek();
    if (c == '-' || c == '+') {
      ++pos_;
      auto inner = factor();
      if (!inner) {
        return inner;
      }
      return c == '-' ? -*inner : *inner;
    }
    if (c == '(') {
      ++pos_;
      auto inner = expr();
      if (!inner) {
        return inner;
      }
      if (peek() != ')') {
        return fail("missing ')'");
      }
      ++pos_;
      return inner;
    }
    return number();
  }

  auto number() -> Expected<double> {
    skip_space();
    std::size_t start = pos_;
    bool seen_dot = false;
    while (pos_ < text_.size()) {
      char c = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(c))) {
        ++pos_;
      } else if (c == '.' && !seen_dot) {
        seen_dot = true;
        ++pos_;
      } else {
        break;
      }
    }
    if (start == pos_ || (pos_ - start == 1 && seen_dot)) {
      if (start >= text_.size()) {
        return fail("unexpected end of expression");
      }
      return fail(fmt::format("expected a number at position {}", start));
    }
    std::string digits(text_.substr(start, pos_ - start));
    return std::strtod(digits.c_str(), nullptr);
  }

  std::string_view text_;
  std::size_t pos_ = 0;
};

auto format_number(double value) -> std::string {
  if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
    return fmt::format("{}", static_cast<long long>(value));
  }
  return fmt::format("{}", value);
}

auto search_engine(const Json& args) -> Expected<Json> {
  auto query = require_string_arg(args, "query");
  if (!query) {
    return tl::unexpected(query.error());
  }
  static const std::array<std::pair<std::string_view, std::string_view>, 3> kDatabase{{
    {"weather", "The weather is sunny with a high of 75°F."},
    {"python", "Python is a high-level programming language."},
    {"langgraph", "LangGraph is a framework for building stateful agents."},
  }};
  auto lower = to_lower(*query);
  for (const auto& [key, value] : kDatabase) {
    if (lower.find(key) != std::string::npos) {
      return Json(std::string(value));
    }
  }
  return Json(fmt::format("No results found for: {}", *query));
}

auto calculator(const Json& args) -> Expected<Json> {
  auto expression = require_string_arg(args, "expression");
  if (!expression) {
    return tl::unexpected(expression.error());
  }
  auto value = evaluate_expression(*expression);
  if (!value) {
    return tl::unexpected(value.error());
  }
  return Json(fmt::format("The result of {} is {}", trim(*expression), format_number(*value)));
}

auto send_email(const Json& args) -> Expected<Json> {
  auto to = require_string_arg(args, "to");
  if (!to) {
    return tl::unexpected(to.error());
  }
  auto subject = require_string_arg(args, "subject");
  if (!subject) {
    return tl::unexpected(subject.error());
  }
  return Json(fmt::format("Email sent to {} with subject '{}'", *to, *subject));
}

auto execute_command(const Json& args) -> Expected<Json> {
  auto command = require_string_arg(args, "command");
  if (!command) {
    return tl::unexpected(command.error());
  }
  return Json(fmt::format("Executed command: {}", *command));
}

/// First run of arithmetic characters holding both a digit and an operator.
auto extract_expression(std::string_view text) -> std::string {
  constexpr std::string_view kAllowed = "0123456789.+-*/() ";
  std::size_t i = 0;
  while (i < text.size()) {
    if (kAllowed.find(text[i]) == std::string_view::npos) {
      ++i;
      continue;
    }
    std::size_t start = i;
    while (i < text.size() && kAllowed.find(text[i]) != std::string_view::npos) {
      ++i;
    }
    auto run = text.substr(start, i - start);
    bool digit = run.find_first_of("0123456789") != std::string_view::npos;
    bool op = run.find_first_of("+-*/") != std::string_view::npos;
    if (digit && op) {
      return trim(run);
    }
  }
  return {};
}

auto extract_address(std::string_view text) -> std::string {
  std::size_t i = 0;
  while (i < text.size()) {
    auto end = text.find(' ', i);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto token = text.substr(i, end - i);
    if (token.find('@') != std::string_view::npos) {
      while (!token.empty() && std::ispunct(static_cast<unsigned char>(token.back()))) {
        token.remove_suffix(1);
      }
      return std::string(token);
    }
    i = end + 1;
  }
  return {};
}

auto command_after(std::string_view text, std::string_view lower, std::string_view verb) -> std::string {
  auto pos = lower.find(verb);
  if (pos == std::string_view::npos) {
    return {};
  }
  return trim(text.substr(pos + verb.size()));
}

auto plan_tool_calls(std::string_view text, int step) -> Json {
  auto lower = to_lower(text);
  auto id = [step](int index) { return fmt::format("call_{}_{}", step, index); };
  Json calls = Json::array();

  if (lower.find("email") != std::string::npos) {
    auto to = extract_address(text);
    auto subject = lower.find("meeting") != std::string::npos ? std::string("Meeting") : std::string("Message");
    calls.push_back(tool_call(id(0), "send_email",
                              Json{{"to", to.empty() ? "unknown@example.com" : to},
                                   {"subject", subject},
                                   {"body", std::string(text)}}));
    return calls;
  }
  for (std::string_view verb : {std::string_view("execute "), std::string_view("run ")}) {
    auto command = command_after(text, lower, verb);
    if (!command.empty()) {
      calls.push_back(tool_call(id(0), "execute_command", Json{{"command", command}}));
      return calls;
    }
  }
  if (auto expression = extract_expression(text); !expression.empty()) {
    calls.push_back(tool_call(id(static_cast<int>(calls.size())), "calculator", Json{{"expression", expression}}));
  }
  for (std::string_view topic : {"weather", "python", "langgraph", "search", "tell me about"}) {
    if (lower.find(topic) != std::string::npos) {
      calls.push_back(tool_call(id(static_cast<int>(calls.size())), "search_engine", Json{{"query", std::string(text)}}));
      break;
    }
  }
  return calls;
}

}  // namespace

auto evaluate_expression(std::string_view expression) -> Expected<double> {
  if (trim(expression).empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidInput, "empty expression"));
  }
  return ExpressionParser(expression).parse();
}

auto register_sample_tools(ToolRegistry& registry) -> void {
  registry.add("search_engine", "Search for information about a query.", &search_engine);
  registry.add("calculator", "Evaluate a mathematical expression.", &calculator);
  registry.add("send_email", "Send an email to a recipient.", &send_email);
  registry.add("execute_command", "Execute a system command (simulated).", &execute_command);
}

auto make_sample_tools() -> std::shared_ptr<const ToolRegistry> {
  auto registry = std::make_shared<ToolRegistry>();
  register_sample_tools(*registry);
  return registry;
}

auto make_scripted_agent(std::string messages_field) -> sg::engine::NodeFn {
  return [field = std::move(messages_field)](const State& state,
                                             sg::engine::NodeContext& ctx) -> Expected<Json> {
    const Json* last = last_message(state, field);
    if (!last) {
      return tl::unexpected(make_error(ErrorCode::NodeExecutionError, fmt::format("'{}' is empty", field)));
    }

    if (message_role(*last) == "tool") {
      const auto& history = state.at(field);
      std::vector<std::string> results;
      for (auto it = history.rbegin(); it != history.rend() && message_role(*it) == "tool"; ++it) {
        results.push_back(message_text(*it));
      }
      std::reverse(results.begin(), results.end());
      std::string answer;
      for (const auto& result : results) {
        if (!answer.empty()) {
          answer += "\n";
        }
        answer += result;
      }
      return Json{{field, Json::array({assistant_message(std::move(answer))})}};
    }

    auto text = message_text(*last);
    auto calls = plan_tool_calls(text, ctx.step());
    if (calls.empty()) {
      return Json{{field, Json::array({assistant_message(fmt::format("You said: {}", text))})}};
    }
    return Json{{field, Json::array({assistant_message("", std::move(calls))})}};
  };
}

auto register_sample_steps(sg::engine::StepRegistry& registry, std::shared_ptr<const ToolRegistry> tools) -> void {
  registry.register_step_with_params("scripted_agent", [](const Json& params) {
    return make_scripted_agent(get_string_param(params, "messages_field", std::string(kMessagesField)));
  });

  registry.register_step_with_params("tools", [tools](const Json& params) {
    ToolNodeOptions options;
    options.messages_field = get_string_param(params, "messages_field", std::string(kMessagesField));
    return make_tool_node(tools, std::move(options));
  });

  registry.register_step_with_params("set_field", [](const Json& params) -> Expected<sg::engine::NodeFn> {
    auto field = get_string_param(params, "field", {});
    if (field.empty()) {
      return tl::unexpected(make_error(ErrorCode::InvalidInput, "set_field requires a 'field' param"));
    }
    Json value = params.contains("value") ? params.at("value") : Json(nullptr);
    return sg::engine::NodeFn([field, value](const State&, sg::engine::NodeContext&) -> Expected<Json> {
      return Json{{field, value}};
    });
  });

  registry.register_step_with_params("transform", [](const Json& params) -> Expected<sg::engine::NodeFn> {
    auto from = get_string_param(params, "from", {});
    auto to = get_string_param(params, "to", {});
    if (from.empty() || to.empty()) {
      return tl::unexpected(make_error(ErrorCode::InvalidInput, "transform requires 'from' and 'to' params"));
    }
    auto prefix = get_string_param(params, "prefix", {});
    auto suffix = get_string_param(params, "suffix", {});
    bool upper = get_bool_param(params, "upper", false);
    return sg::engine::NodeFn(
      [from, to, prefix, suffix, upper](const State& state, sg::engine::NodeContext&) -> Expected<Json> {
        auto it = state.find(from);
        if (it == state.end() || !it->is_string()) {
          return tl::unexpected(
            make_error(ErrorCode::TypeError, fmt::format("transform input '{}' is not a string", from)));
        }
        auto text = it->get<std::string>();
        return Json{{to, prefix + (upper ? to_upper(text) : text) + suffix}};
      });
  });

  registry.register_branch("tools_condition", &tools_condition);

  registry.register_branch_with_params("field_value", [](const Json& params) -> Expected<sg::engine::FanoutFn> {
    auto field = get_string_param(params, "field", {});
    if (field.empty()) {
      return tl::unexpected(make_error(ErrorCode::InvalidInput, "field_value requires a 'field' param"));
    }
    auto fallback = get_string_param(params, "default", {});
    return sg::engine::FanoutFn([field, fallback](const State& state) -> std::vector<std::string> {
      auto it = state.find(field);
      if (it == state.end() || !it->is_string() || it->get<std::string>().empty()) {
        return {fallback};
      }
      return {it->get<std::string>()};
    });
  });
}

}  // namespace sg::kernel
