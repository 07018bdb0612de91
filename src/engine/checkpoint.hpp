#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace sg::engine {

/// Durable record of one thread: the full state plus its continuation.
struct Checkpoint {
  std::string thread_id;
  std::string graph;
  State state;
  /// Nodes to run next. Empty once the run completed.
  std::vector<std::string> pending;
  /// Paused in front of an interrupt boundary.
  bool interrupted = false;
  /// Last completed step; -1 before any node ran.
  int step = -1;
  std::int64_t updated_at_ms = 0;
};

auto checkpoint_to_json(const Checkpoint& checkpoint) -> Json;
auto checkpoint_from_json(const Json& json) -> Expected<Checkpoint>;

/// Storage for checkpoints keyed by thread id.
///
/// Implementations must make a returned save visible to every later load in
/// the same process and keep last-write-wins semantics. The base class also
/// owns the advisory lock table that serializes same-thread invocations.
class Checkpointer {
 public:
  class ThreadLease;

  Checkpointer() = default;
  virtual ~Checkpointer() = default;

  Checkpointer(const Checkpointer&) = delete;
  auto operator=(const Checkpointer&) -> Checkpointer& = delete;

  virtual auto save(std::string_view thread_id, const Checkpoint& checkpoint) -> Expected<void> = 0;
  virtual auto load(std::string_view thread_id) const -> Expected<std::optional<Checkpoint>> = 0;
  /// Returns false when nothing was stored for the thread.
  virtual auto remove(std::string_view thread_id) -> Expected<bool> = 0;
  virtual auto list_threads() const -> Expected<std::vector<std::string>> = 0;

  /// Block until the thread's advisory lock is held. Released with the lease.
  auto lock_thread(std::string_view thread_id) -> ThreadLease;

 private:
  struct LockEntry {
    std::mutex mutex;
    int users = 0;
  };

  auto release(const std::string& thread_id, const std::shared_ptr<LockEntry>& entry) -> void;

  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<LockEntry>> locks_;
};

class Checkpointer::ThreadLease {
 public:
  ThreadLease() = default;
  ~ThreadLease();

  ThreadLease(ThreadLease&& other) noexcept;
  auto operator=(ThreadLease&& other) noexcept -> ThreadLease&;
  ThreadLease(const ThreadLease&) = delete;
  auto operator=(const ThreadLease&) -> ThreadLease& = delete;

  auto held() const -> bool { return owner_ != nullptr; }

 private:
  friend class Checkpointer;

  ThreadLease(Checkpointer* owner, std::string thread_id, std::shared_ptr<LockEntry> entry)
      : owner_(owner), thread_id_(std::move(thread_id)), entry_(std::move(entry)) {}

  auto reset() -> void;

  Checkpointer* owner_ = nullptr;
  std::string thread_id_;
  std::shared_ptr<LockEntry> entry_;
};

class InMemoryCheckpointer final : public Checkpointer {
 public:
  auto save(std::string_view thread_id, const Checkpoint& checkpoint) -> Expected<void> override;
  auto load(std::string_view thread_id) const -> Expected<std::optional<Checkpoint>> override;
  auto remove(std::string_view thread_id) -> Expected<bool> override;
  auto list_threads() const -> Expected<std::vector<std::string>> override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Checkpoint> records_;
};

auto now_ms() -> std::int64_t;

}  // namespace sg::engine
