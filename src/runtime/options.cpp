#include "runtime/options.hpp"

#include <memory>
#include <string>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "engine/checkpoint.hpp"
#include "runtime/file_checkpointer.hpp"

DECLARE_int32(worker_threads);
DECLARE_int32(recursion_limit);
DECLARE_string(checkpoint_dir);

namespace sg::engine {

auto compile_options_from_flags() -> Expected<CompileOptions> {
  CompileOptions options;
  options.executor.worker_threads = FLAGS_worker_threads;
  options.recursion_limit = FLAGS_recursion_limit;

  const std::string dir = FLAGS_checkpoint_dir;
  if (dir.empty()) {
    options.checkpointer = std::make_shared<InMemoryCheckpointer>();
    return options;
  }
  auto checkpointer = FileCheckpointer::create(dir);
  if (!checkpointer) {
    return tl::unexpected(checkpointer.error());
  }
  sg::log::info("using file checkpoints under {}", dir);
  options.checkpointer = std::move(*checkpointer);
  return options;
}

}  // namespace sg::engine
