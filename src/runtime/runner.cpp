#include "runtime/runner.hpp"

#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"

namespace sg::engine {
namespace {

constexpr std::string_view kDefaultGraphName = "graph";

auto join(const std::vector<std::string>& names) -> std::string {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ",";
    }
    out += name;
  }
  return out;
}

auto snapshot_of(const Checkpoint& checkpoint) -> StateSnapshot {
  return StateSnapshot{checkpoint.state, checkpoint.pending, checkpoint.interrupted, checkpoint.step};
}

auto span_status(const Expected<RunResult>& outcome) -> trace::SpanStatus {
  if (!outcome) {
    return outcome.error().code == ErrorCode::Cancelled ? trace::SpanStatus::Cancelled : trace::SpanStatus::Error;
  }
  return outcome->status == RunStatus::Paused ? trace::SpanStatus::Paused : trace::SpanStatus::Ok;
}

}  // namespace

auto to_string(RunStatus status) -> std::string_view {
  switch (status) {
    case RunStatus::Idle:
      return "idle";
    case RunStatus::Running:
      return "running";
    case RunStatus::Paused:
      return "paused";
    case RunStatus::Completed:
      return "completed";
    case RunStatus::Failed:
      return "failed";
  }
  return "idle";
}

CompiledGraph::CompiledGraph(std::shared_ptr<const GraphPlan> plan, std::shared_ptr<Checkpointer> checkpointer,
                             std::shared_ptr<Executor> executor, int recursion_limit)
    : plan_(std::move(plan)),
      checkpointer_(std::move(checkpointer)),
      executor_(std::move(executor)),
      recursion_limit_(recursion_limit) {}

auto compile_graph(GraphSpec spec, CompileOptions options) -> Expected<CompiledGraph> {
  if (!options.interrupt_before.empty() && !options.checkpointer) {
    return tl::unexpected(
      make_error(ErrorCode::GraphIntegrityError, "interrupt_before requires a checkpointer"));
  }
  if (options.recursion_limit <= 0) {
    return tl::unexpected(make_error(ErrorCode::InvalidInput,
                                     fmt::format("recursion_limit must be positive, got {}", options.recursion_limit)));
  }
  if (!options.name.empty()) {
    spec.name = options.name;
  } else if (spec.name.empty()) {
    spec.name = std::string(kDefaultGraphName);
  }

  PlanOptions plan_options;
  plan_options.interrupt_before = options.interrupt_before;
  auto plan = compile_plan(std::move(spec), plan_options);
  if (!plan) {
    sg::log::error("graph compile failed: {}", plan.error().describe());
    return tl::unexpected(plan.error());
  }

  auto executor = options.shared_executor;
  if (!executor) {
    executor = std::make_shared<Executor>(options.executor);
  }
  sg::log::debug("graph compiled: name={} nodes={} interrupts={}", plan->name, plan->nodes.size(),
                 options.interrupt_before.size());
  return CompiledGraph(std::make_shared<const GraphPlan>(std::move(*plan)), std::move(options.checkpointer),
                       std::move(executor), options.recursion_limit);
}

auto CompiledGraph::node_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(plan_->nodes.size());
  for (const auto& node : plan_->nodes) {
    names.push_back(node.name);
  }
  return names;
}

auto CompiledGraph::interrupt_before() const -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& node : plan_->nodes) {
    if (node.interrupt_before) {
      names.push_back(node.name);
    }
  }
  return names;
}

auto CompiledGraph::invoke(std::optional<Json> input, const ThreadConfig& config) const -> Expected<State> {
  RunContext ctx;
  return invoke(std::move(input), config, ctx);
}

auto CompiledGraph::invoke(std::optional<Json> input, const ThreadConfig& config, RunContext& ctx) const
  -> Expected<State> {
  auto result = run(std::move(input), config, ctx);
  if (!result) {
    return tl::unexpected(std::move(result.error()));
  }
  return std::move(result->state);
}

auto CompiledGraph::run(std::optional<Json> input, const ThreadConfig& config, RunContext& ctx) const
  -> Expected<RunResult> {
  if (checkpointer_ && config.thread_id.empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidInput, "thread_id is required with a checkpointer"));
  }

  std::shared_ptr<Checkpointer> store = checkpointer_;
  if (!store) {
    store = std::make_shared<InMemoryCheckpointer>();
  }
  auto lease = store->lock_thread(config.thread_id);

  auto& trace_ctx = ctx.trace;
  trace::Tick run_start = 0;
  if (trace_ctx.enabled()) {
    if (trace_ctx.trace_id == 0) {
      trace_ctx.trace_id = trace_ctx.new_span();
    }
    trace_ctx.run_span = trace_ctx.new_span();
    if (trace_ctx.enabled(trace::TraceFlag::RunSpan)) {
      run_start = trace_ctx.now();
      trace::emit(trace_ctx.sink,
                  trace::RunStart{trace_ctx.trace_id, trace_ctx.run_span, plan_->name, config.thread_id, run_start});
    }
  }

  auto outcome = drive(*store, std::move(input), config, ctx);

  if (trace_ctx.enabled(trace::TraceFlag::RunSpan)) {
    trace::Tick end_ts = trace_ctx.now();
    trace::Tick duration = 0;
    if (run_start != 0 && end_ts >= run_start) {
      duration = end_ts - run_start;
    }
    trace::emit(trace_ctx.sink, trace::RunEnd{trace_ctx.trace_id, trace_ctx.run_span, config.thread_id,
                                              outcome ? outcome->steps : 0, end_ts, duration, span_status(outcome)});
  }

  if (!outcome) {
    sg::log::error("run failed: graph={} thread={} {}", plan_->name, config.thread_id, outcome.error().describe());
  } else if (outcome->status == RunStatus::Paused) {
    sg::log::info("run paused: graph={} thread={} steps={} next={}", plan_->name, config.thread_id, outcome->steps,
                  join(outcome->next));
  } else {
    sg::log::info("run completed: graph={} thread={} steps={}", plan_->name, config.thread_id, outcome->steps);
  }
  return outcome;
}

auto CompiledGraph::drive(Checkpointer& store, std::optional<Json> input, const ThreadConfig& config,
                          RunContext& ctx) const -> Expected<RunResult> {
  const auto& plan = *plan_;
  const auto& thread_id = config.thread_id;

  // Last record the store accepted. Only a successful save replaces it.
  Checkpoint checkpoint;
  auto fail = [&checkpoint](EngineError error) -> Expected<RunResult> {
    if (error.state.is_null()) {
      error.state = checkpoint.state;
    }
    return tl::unexpected(std::move(error));
  };
  auto commit = [&](Checkpoint record) -> Expected<void> {
    record.updated_at_ms = now_ms();
    if (auto saved = store.save(thread_id, record); !saved) {
      return saved;
    }
    checkpoint = std::move(record);
    return {};
  };

  auto loaded = store.load(thread_id);
  if (!loaded) {
    return tl::unexpected(std::move(loaded.error()));
  }

  std::vector<int> current;
  bool resuming = false;
  Checkpoint staged;
  if (!loaded->has_value()) {
    if (!input) {
      return tl::unexpected(make_error(ErrorCode::InvalidInput,
                                       fmt::format("thread '{}' has no checkpoint to resume", thread_id)));
    }
    auto state = plan.schema.initial_state(*input);
    if (!state) {
      return tl::unexpected(std::move(state.error()));
    }
    auto entry = plan.resolve_entry(*state);
    if (!entry) {
      return tl::unexpected(std::move(entry.error()));
    }
    staged.thread_id = thread_id;
    staged.graph = plan.name;
    staged.state = std::move(*state);
    staged.step = -1;
    current = std::move(*entry);
  } else {
    checkpoint = std::move(**loaded);
    if (!checkpoint.graph.empty() && checkpoint.graph != plan.name) {
      return tl::unexpected(make_error(
        ErrorCode::CheckpointError,
        fmt::format("thread '{}' belongs to graph '{}', not '{}'", thread_id, checkpoint.graph, plan.name)));
    }
    auto pending = plan.lookup(checkpoint.pending);
    if (!pending) {
      return fail(std::move(pending.error()));
    }
    if (!input) {
      if (pending->empty()) {
        return RunResult{checkpoint.state, RunStatus::Completed, {}, 0};
      }
      current = std::move(*pending);
      resuming = checkpoint.interrupted;
    } else {
      auto merged = plan.schema.merge(checkpoint.state, *input);
      if (!merged) {
        return fail(std::move(merged.error()));
      }
      if (!pending->empty()) {
        current = std::move(*pending);
        resuming = checkpoint.interrupted;
      } else {
        auto entry = plan.resolve_entry(*merged);
        if (!entry) {
          return fail(std::move(entry.error()));
        }
        current = std::move(*entry);
      }
      staged.thread_id = checkpoint.thread_id;
      staged.state = std::move(*merged);
      staged.step = checkpoint.step;
    }
  }

  if (input) {
    staged.graph = plan.name;
    staged.pending = plan.names(current);
    // An input that carries a thread past its boundary is the approval; a
    // failed step after it retries without pausing again.
    staged.interrupted = resuming;
    if (auto saved = commit(std::move(staged)); !saved) {
      return fail(std::move(saved.error()));
    }
  }

  int steps = 0;
  while (!current.empty()) {
    if (ctx.should_stop()) {
      return fail(make_error(ErrorCode::Cancelled, ctx.is_cancelled() ? "run cancelled" : "deadline exceeded"));
    }

    if (!resuming && plan.any_interrupt(current)) {
      Checkpoint paused = checkpoint;
      paused.pending = plan.names(current);
      paused.interrupted = true;
      if (auto saved = commit(std::move(paused)); !saved) {
        return fail(std::move(saved.error()));
      }
      if (ctx.trace.enabled(trace::TraceFlag::Interrupts)) {
        trace::emit(ctx.trace.sink,
                    trace::Interrupt{ctx.trace.trace_id, thread_id, checkpoint.pending, checkpoint.step + 1});
      }
      return RunResult{checkpoint.state, RunStatus::Paused, checkpoint.pending, steps};
    }
    resuming = false;

    if (steps >= recursion_limit_) {
      return fail(make_error(ErrorCode::RecursionLimit,
                             fmt::format("recursion limit of {} steps reached without completing", recursion_limit_)));
    }

    const int step = checkpoint.step + 1;
    sg::log::debug("step start: graph={} thread={} step={} nodes={}", plan.name, thread_id, step,
                   join(plan.names(current)));

    auto updates = executor_->run_nodes(plan, current, checkpoint.state, thread_id, step, ctx);
    if (!updates) {
      return fail(std::move(updates.error()));
    }
    if (ctx.should_stop()) {
      return fail(make_error(ErrorCode::Cancelled, ctx.is_cancelled() ? "run cancelled" : "deadline exceeded"));
    }

    State next_state = checkpoint.state;
    for (std::size_t i = 0; i < updates->size(); ++i) {
      if (auto merged = plan.schema.merge_into(next_state, (*updates)[i]); !merged) {
        auto error = std::move(merged.error());
        error.node = plan.nodes[static_cast<std::size_t>(current[i])].name;
        return fail(std::move(error));
      }
    }

    auto next = plan.resolve_next(current, next_state);
    if (!next) {
      return fail(std::move(next.error()));
    }

    Checkpoint record;
    record.thread_id = checkpoint.thread_id.empty() ? thread_id : checkpoint.thread_id;
    record.graph = plan.name;
    record.state = std::move(next_state);
    record.step = step;
    record.pending = plan.names(*next);
    if (auto saved = commit(std::move(record)); !saved) {
      return fail(std::move(saved.error()));
    }
    ++steps;
    current = std::move(*next);
  }

  return RunResult{checkpoint.state, RunStatus::Completed, {}, steps};
}

auto CompiledGraph::get_state(const ThreadConfig& config) const -> Expected<StateSnapshot> {
  if (!checkpointer_) {
    return tl::unexpected(make_error(ErrorCode::NotFound, "graph was compiled without a checkpointer"));
  }
  auto loaded = checkpointer_->load(config.thread_id);
  if (!loaded) {
    return tl::unexpected(std::move(loaded.error()));
  }
  if (!loaded->has_value()) {
    return tl::unexpected(
      make_error(ErrorCode::NotFound, fmt::format("no checkpoint for thread '{}'", config.thread_id)));
  }
  return snapshot_of(**loaded);
}

auto CompiledGraph::update_state(const ThreadConfig& config, const Json& values) const -> Expected<StateSnapshot> {
  if (!checkpointer_) {
    return tl::unexpected(make_error(ErrorCode::NotFound, "graph was compiled without a checkpointer"));
  }
  auto lease = checkpointer_->lock_thread(config.thread_id);
  auto loaded = checkpointer_->load(config.thread_id);
  if (!loaded) {
    return tl::unexpected(std::move(loaded.error()));
  }
  if (!loaded->has_value()) {
    return tl::unexpected(
      make_error(ErrorCode::NotFound, fmt::format("no checkpoint for thread '{}'", config.thread_id)));
  }
  auto checkpoint = std::move(**loaded);
  auto merged = plan_->schema.merge(checkpoint.state, values);
  if (!merged) {
    return tl::unexpected(std::move(merged.error()));
  }
  checkpoint.state = std::move(*merged);
  checkpoint.updated_at_ms = now_ms();
  if (auto saved = checkpointer_->save(config.thread_id, checkpoint); !saved) {
    return tl::unexpected(std::move(saved.error()));
  }
  sg::log::info("state_updated", {{"graph", plan_->name},
                                   {"thread", config.thread_id},
                                   {"fields", std::to_string(values.size())},
                                   {"step", std::to_string(checkpoint.step)}});
  return snapshot_of(checkpoint);
}

}  // namespace sg::engine
