#include "runtime/executor.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexec/execution.hpp>

namespace sg::engine {
namespace {

thread_local bool t_on_worker = false;

/// Shared by the tasks of one parallel_for; outlives the waiting caller's
/// stack frame until the last task has signalled.
struct Barrier {
  explicit Barrier(std::size_t count) : remaining(static_cast<int>(count)), errors(count) {}

  std::atomic<int> remaining;
  std::vector<std::exception_ptr> errors;

  auto arrive() -> void {
    if (remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      remaining.notify_one();
    }
  }

  auto wait() -> void {
    int count = remaining.load(std::memory_order_acquire);
    while (count != 0) {
      remaining.wait(count, std::memory_order_relaxed);
      count = remaining.load(std::memory_order_acquire);
    }
  }

  auto rethrow_first() -> void {
    for (auto& error : errors) {
      if (error) {
        std::rethrow_exception(error);
      }
    }
  }
};

auto parallel_trampoline(const void* self, std::size_t count, const std::function<void(std::size_t)>& body) -> void {
  static_cast<const Executor*>(self)->parallel_for(count, body);
}

auto execute_node(const Executor& executor, const GraphPlan& plan, int node_index, const State& state,
                  std::string_view thread_id, int step, RunContext& ctx) -> Expected<Json> {
  const auto& node = plan.nodes[static_cast<std::size_t>(node_index)];
  auto& trace_ctx = ctx.trace;

  trace::SpanId span_id = 0;
  trace::Tick start_ts = 0;
  if (trace_ctx.enabled(trace::TraceFlag::NodeSpan)) {
    span_id = trace_ctx.new_span();
    start_ts = trace_ctx.now();
    trace::emit(trace_ctx.sink, trace::NodeStart{trace_ctx.trace_id, span_id, trace_ctx.run_span, node.name,
                                                 node_index, step, start_ts});
  }

  auto finish_trace = [&](trace::SpanStatus status, std::string_view message) {
    if (trace_ctx.enabled(trace::TraceFlag::NodeSpan)) {
      trace::Tick end_ts = trace_ctx.now();
      trace::Tick duration = 0;
      if (start_ts != 0 && end_ts >= start_ts) {
        duration = end_ts - start_ts;
      }
      trace::emit(trace_ctx.sink,
                  trace::NodeEnd{trace_ctx.trace_id, span_id, node.name, node_index, step, end_ts, duration, status});
    }
    if (!message.empty() && trace_ctx.enabled(trace::TraceFlag::ErrorDetail)) {
      trace::emit(trace_ctx.sink, trace::NodeError{trace_ctx.trace_id, span_id, node.name, node_index, message});
    }
  };

  auto fail = [&](std::string message) -> Expected<Json> {
    finish_trace(trace::SpanStatus::Error, message);
    return tl::unexpected(make_node_error(ErrorCode::NodeExecutionError, node.name, std::move(message)));
  };

  if (ctx.should_stop()) {
    finish_trace(trace::SpanStatus::Cancelled, {});
    return tl::unexpected(make_node_error(ErrorCode::Cancelled, node.name,
                                          ctx.is_cancelled() ? "run cancelled" : "deadline exceeded"));
  }

  NodeContext node_ctx(node.name, thread_id, step, &ctx, &executor, &parallel_trampoline);
  try {
    auto result = node.fn(state, node_ctx);
    if (!result) {
      return fail(result.error().message);
    }
    finish_trace(trace::SpanStatus::Ok, {});
    return std::move(*result);
  } catch (const std::exception& ex) {
    return fail(ex.what());
  } catch (...) {
    return fail("unknown exception");
  }
}

}  // namespace

struct Executor::Pools {
  explicit Pools(int threads) : worker_pool(static_cast<std::size_t>(threads)), threads(threads) {}
  exec::static_thread_pool worker_pool;
  int threads = 0;
};

Executor::Executor(ExecutorConfig config) {
  int threads = config.worker_threads;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) {
      threads = 4;
    }
  }
  pools_ = std::make_shared<Pools>(threads);
}

Executor::~Executor() = default;

auto Executor::worker_count() const -> int {
  return pools_->threads;
}

auto Executor::parallel_for(std::size_t count, const std::function<void(std::size_t)>& body) const -> void {
  if (count == 0) {
    return;
  }
  if (count == 1 || t_on_worker) {
    for (std::size_t i = 0; i < count; ++i) {
      body(i);
    }
    return;
  }

  auto barrier = std::make_shared<Barrier>(count);
  auto scheduler = pools_->worker_pool.get_scheduler();
  for (std::size_t i = 0; i < count; ++i) {
    auto task = stdexec::schedule(scheduler) | stdexec::then([barrier, &body, i]() {
                  t_on_worker = true;
                  try {
                    body(i);
                  } catch (...) {
                    barrier->errors[i] = std::current_exception();
                  }
                  barrier->arrive();
                });
    stdexec::start_detached(std::move(task));
  }
  barrier->wait();
  barrier->rethrow_first();
}

auto Executor::run_nodes(const GraphPlan& plan, std::span<const int> nodes, const State& state,
                         std::string_view thread_id, int step, RunContext& ctx) const
  -> Expected<std::vector<Json>> {
  std::vector<Expected<Json>> results(nodes.size(), Expected<Json>(Json::object()));
  parallel_for(nodes.size(), [&](std::size_t i) {
    results[i] = execute_node(*this, plan, nodes[i], state, thread_id, step, ctx);
  });

  std::vector<Json> updates;
  updates.reserve(nodes.size());
  for (auto& result : results) {
    if (!result) {
      return tl::unexpected(std::move(result.error()));
    }
    updates.push_back(std::move(*result));
  }
  return updates;
}

}  // namespace sg::engine
