#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/checkpoint.hpp"
#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/types.hpp"
#include "runtime/executor.hpp"

namespace sg::engine {

inline constexpr int kDefaultRecursionLimit = 25;

struct CompileOptions {
  /// Graph name recorded in checkpoints and traces (defaults to the builder's).
  std::string name;
  /// Thread storage. Without one every invoke is a fresh, unpersisted run.
  std::shared_ptr<Checkpointer> checkpointer;
  /// Pause before these nodes run. Requires a checkpointer.
  std::vector<std::string> interrupt_before;
  /// Maximum steps per invocation.
  int recursion_limit = kDefaultRecursionLimit;
  ExecutorConfig executor;
  /// Reuse an existing worker pool instead of creating one from `executor`.
  std::shared_ptr<Executor> shared_executor;
};

enum class RunStatus {
  Idle,
  Running,
  Paused,
  Completed,
  Failed,
};

auto to_string(RunStatus status) -> std::string_view;

/// Read-only view of a thread's checkpoint.
struct StateSnapshot {
  State values;
  std::vector<std::string> next;
  bool interrupted = false;
  int step = -1;

  auto operator==(const StateSnapshot& other) const -> bool {
    return values == other.values && next == other.next && interrupted == other.interrupted &&
           step == other.step;
  }
};

struct RunResult {
  State state;
  RunStatus status = RunStatus::Idle;
  /// Pending nodes when paused.
  std::vector<std::string> next;
  /// Steps executed by this invocation.
  int steps = 0;
};

class CompiledGraph;

/// Validate and lay out a graph. Fails with GraphIntegrityError on a bad
/// topology, or when interrupts are requested without a checkpointer.
auto compile_graph(GraphSpec spec, CompileOptions options = {}) -> Expected<CompiledGraph>;

/// Immutable executable graph. Safe to invoke from several threads; calls on
/// the same thread id are serialized by the checkpointer's advisory lock.
class CompiledGraph {
 public:
  /// Run until completion or an interrupt boundary and return the state.
  /// `input` starts or amends a thread; std::nullopt resumes it.
  auto invoke(std::optional<Json> input, const ThreadConfig& config) const -> Expected<State>;
  auto invoke(std::optional<Json> input, const ThreadConfig& config, RunContext& ctx) const -> Expected<State>;

  /// Like invoke, but also reports whether the run paused or completed.
  auto run(std::optional<Json> input, const ThreadConfig& config, RunContext& ctx) const -> Expected<RunResult>;

  auto get_state(const ThreadConfig& config) const -> Expected<StateSnapshot>;

  /// Merge values into a stored thread without running any node.
  auto update_state(const ThreadConfig& config, const Json& values) const -> Expected<StateSnapshot>;

  auto name() const -> const std::string& { return plan_->name; }
  auto node_names() const -> std::vector<std::string>;
  auto interrupt_before() const -> std::vector<std::string>;
  auto plan() const -> const GraphPlan& { return *plan_; }
  auto checkpointer() const -> const std::shared_ptr<Checkpointer>& { return checkpointer_; }

 private:
  friend auto compile_graph(GraphSpec spec, CompileOptions options) -> Expected<CompiledGraph>;

  CompiledGraph(std::shared_ptr<const GraphPlan> plan, std::shared_ptr<Checkpointer> checkpointer,
                std::shared_ptr<Executor> executor, int recursion_limit);

  auto drive(Checkpointer& store, std::optional<Json> input, const ThreadConfig& config, RunContext& ctx) const
    -> Expected<RunResult>;

  std::shared_ptr<const GraphPlan> plan_;
  std::shared_ptr<Checkpointer> checkpointer_;
  std::shared_ptr<Executor> executor_;
  int recursion_limit_ = kDefaultRecursionLimit;
};

}  // namespace sg::engine
