#include "engine/checkpoint.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace sg::engine {

auto now_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

auto checkpoint_to_json(const Checkpoint& checkpoint) -> Json {
  return Json{
    {"thread_id", checkpoint.thread_id},
    {"graph", checkpoint.graph},
    {"state", checkpoint.state},
    {"pending", checkpoint.pending},
    {"interrupted", checkpoint.interrupted},
    {"step", checkpoint.step},
    {"updated_at_ms", checkpoint.updated_at_ms},
  };
}

auto checkpoint_from_json(const Json& json) -> Expected<Checkpoint> {
  auto fail = [](std::string_view what) {
    return tl::unexpected(make_error(ErrorCode::CheckpointError, fmt::format("malformed checkpoint: {}", what)));
  };
  if (!json.is_object()) {
    return fail("not an object");
  }
  Checkpoint checkpoint;
  auto thread_it = json.find("thread_id");
  if (thread_it == json.end() || !thread_it->is_string()) {
    return fail("thread_id");
  }
  checkpoint.thread_id = thread_it->get<std::string>();
  if (auto it = json.find("graph"); it != json.end()) {
    if (!it->is_string()) {
      return fail("graph");
    }
    checkpoint.graph = it->get<std::string>();
  }
  auto state_it = json.find("state");
  if (state_it == json.end() || !state_it->is_object()) {
    return fail("state");
  }
  checkpoint.state = *state_it;
  auto pending_it = json.find("pending");
  if (pending_it == json.end() || !pending_it->is_array()) {
    return fail("pending");
  }
  for (const auto& name : *pending_it) {
    if (!name.is_string()) {
      return fail("pending entry");
    }
    checkpoint.pending.push_back(name.get<std::string>());
  }
  if (auto it = json.find("interrupted"); it != json.end()) {
    if (!it->is_boolean()) {
      return fail("interrupted");
    }
    checkpoint.interrupted = it->get<bool>();
  }
  if (auto it = json.find("step"); it != json.end()) {
    if (!it->is_number_integer()) {
      return fail("step");
    }
    checkpoint.step = it->get<int>();
  }
  if (auto it = json.find("updated_at_ms"); it != json.end() && it->is_number_integer()) {
    checkpoint.updated_at_ms = it->get<std::int64_t>();
  }
  return checkpoint;
}

auto Checkpointer::lock_thread(std::string_view thread_id) -> ThreadLease {
  std::shared_ptr<LockEntry> entry;
  std::string key(thread_id);
  {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = locks_[key];
    if (!slot) {
      slot = std::make_shared<LockEntry>();
    }
    slot->users += 1;
    entry = slot;
  }
  entry->mutex.lock();
  return ThreadLease(this, std::move(key), std::move(entry));
}

auto Checkpointer::release(const std::string& thread_id, const std::shared_ptr<LockEntry>& entry) -> void {
  entry->mutex.unlock();
  std::lock_guard<std::mutex> lock(locks_mutex_);
  entry->users -= 1;
  if (entry->users == 0) {
    auto it = locks_.find(thread_id);
    if (it != locks_.end() && it->second == entry) {
      locks_.erase(it);
    }
  }
}

Checkpointer::ThreadLease::~ThreadLease() {
  reset();
}

Checkpointer::ThreadLease::ThreadLease(ThreadLease&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      thread_id_(std::move(other.thread_id_)),
      entry_(std::move(other.entry_)) {}

auto Checkpointer::ThreadLease::operator=(ThreadLease&& other) noexcept -> ThreadLease& {
  if (this != &other) {
    reset();
    owner_ = std::exchange(other.owner_, nullptr);
    thread_id_ = std::move(other.thread_id_);
    entry_ = std::move(other.entry_);
  }
  return *this;
}

auto Checkpointer::ThreadLease::reset() -> void {
  if (owner_ && entry_) {
    owner_->release(thread_id_, entry_);
  }
  owner_ = nullptr;
  entry_.reset();
}

auto InMemoryCheckpointer::save(std::string_view thread_id, const Checkpoint& checkpoint) -> Expected<void> {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  records_.insert_or_assign(std::string(thread_id), checkpoint);
  return {};
}

auto InMemoryCheckpointer::load(std::string_view thread_id) const -> Expected<std::optional<Checkpoint>> {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = records_.find(std::string(thread_id));
  if (it == records_.end()) {
    return std::optional<Checkpoint>{};
  }
  return std::optional<Checkpoint>{it->second};
}

auto InMemoryCheckpointer::remove(std::string_view thread_id) -> Expected<bool> {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return records_.erase(std::string(thread_id)) > 0;
}

auto InMemoryCheckpointer::list_threads() const -> Expected<std::vector<std::string>> {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> threads;
  threads.reserve(records_.size());
  for (const auto& [thread_id, _] : records_) {
    threads.push_back(thread_id);
  }
  std::sort(threads.begin(), threads.end());
  return threads;
}

}  // namespace sg::engine
