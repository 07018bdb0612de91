#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <entt/core/hashed_string.hpp>
#include <nlohmann/json.hpp>

#include "engine/error.hpp"
#include "engine/trace.hpp"

namespace sg::engine {

using Json = nlohmann::json;

/// Full graph state: a JSON object keyed by schema field name.
using State = Json;

/// Virtual entry node. Never executed.
inline constexpr char kStart[] = "__start__";
/// Virtual terminal node. Reaching it completes the run.
inline constexpr char kEnd[] = "__end__";

inline auto is_reserved_name(std::string_view name) -> bool {
  return name == std::string_view(kStart) || name == std::string_view(kEnd);
}

/// Interned node name.
using NodeId = entt::hashed_string::hash_type;

inline auto intern_name(std::string_view name) -> NodeId {
  return entt::hashed_string::value(name.data(), name.size());
}

struct ThreadConfig {
  std::string thread_id;
};

/// Per-invocation controls supplied by the caller.
struct RunContext {
  std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
  std::atomic<bool> cancelled{false};
  trace::TraceContext trace;

  auto cancel() -> void { cancelled.store(true, std::memory_order_release); }

  auto is_cancelled() const -> bool {
    return cancelled.load(std::memory_order_acquire);
  }

  auto deadline_exceeded() const -> bool {
    return std::chrono::steady_clock::now() > deadline;
  }

  auto should_stop() const -> bool {
    return is_cancelled() || deadline_exceeded();
  }
};

/// View handed to a node while it runs.
class NodeContext {
 public:
  using ParallelFn = void (*)(const void*, std::size_t, const std::function<void(std::size_t)>&);

  NodeContext() = default;
  NodeContext(std::string_view node, std::string_view thread_id, int step, const RunContext* run,
              const void* pool = nullptr, ParallelFn parallel = nullptr)
      : node_(node), thread_id_(thread_id), step_(step), run_(run), pool_(pool), parallel_(parallel) {}

  auto node() const -> std::string_view { return node_; }
  auto thread_id() const -> std::string_view { return thread_id_; }
  auto step() const -> int { return step_; }

  auto should_stop() const -> bool { return run_ && run_->should_stop(); }

  /// Run body(0..count-1) on the engine worker pool and wait for all of them.
  /// Falls back to the calling thread when no pool is attached.
  auto parallel_for(std::size_t count, const std::function<void(std::size_t)>& body) const -> void {
    if (parallel_ && count > 1) {
      parallel_(pool_, count, body);
      return;
    }
    for (std::size_t i = 0; i < count; ++i) {
      body(i);
    }
  }

 private:
  std::string_view node_;
  std::string_view thread_id_;
  int step_ = 0;
  const RunContext* run_ = nullptr;
  const void* pool_ = nullptr;
  ParallelFn parallel_ = nullptr;
};

/// Step function: reads the state, returns a partial update (a JSON object).
using NodeFn = std::function<Expected<Json>(const State&, NodeContext&)>;

/// Conditional routing: returns one branch key.
using RouteFn = std::function<std::string(const State&)>;

/// Conditional fan-out routing: returns zero or more branch keys.
using FanoutFn = std::function<std::vector<std::string>(const State&)>;

}  // namespace sg::engine
