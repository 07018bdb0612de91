#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/types.hpp"

namespace sg::engine {

struct ExecutorConfig {
  /// Worker threads for fan-out steps; <= 0 uses hardware concurrency.
  int worker_threads = 0;
};

/// Runs the node set of one step. A single node runs on the calling thread;
/// several run on the worker pool and join at a barrier before returning.
class Executor {
 public:
  explicit Executor(ExecutorConfig config = {});
  ~Executor();

  Executor(const Executor&) = default;
  Executor(Executor&&) noexcept = default;
  auto operator=(const Executor&) -> Executor& = default;
  auto operator=(Executor&&) noexcept -> Executor& = default;

  /// Execute `nodes` against a read-only state. Updates come back in the same
  /// order as `nodes`. The first failure in that order is returned after every
  /// node finished.
  auto run_nodes(const GraphPlan& plan, std::span<const int> nodes, const State& state,
                 std::string_view thread_id, int step, RunContext& ctx) const -> Expected<std::vector<Json>>;

  /// Run body(0..count-1) on the pool and wait. Exceptions are rethrown on the
  /// caller after all indices completed (the first by index wins). Calls made
  /// from a pool worker run inline.
  auto parallel_for(std::size_t count, const std::function<void(std::size_t)>& body) const -> void;

  auto worker_count() const -> int;

 private:
  struct Pools;
  std::shared_ptr<Pools> pools_;
};

}  // namespace sg::engine
