#pragma once

#include "engine/error.hpp"
#include "runtime/runner.hpp"

namespace sg::engine {

/// CompileOptions from --worker_threads, --recursion_limit and
/// --checkpoint_dir. A file checkpointer is attached when the directory flag
/// is set, an in-memory one otherwise.
auto compile_options_from_flags() -> Expected<CompileOptions>;

}  // namespace sg::engine
