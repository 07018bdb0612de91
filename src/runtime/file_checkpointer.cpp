#include "runtime/file_checkpointer.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"

namespace sg::engine {
namespace {

constexpr std::string_view kExtension = ".json";
constexpr std::string_view kTempSuffix = ".tmp";

auto checkpoint_error(std::string message) -> EngineError {
  return make_error(ErrorCode::CheckpointError, std::move(message));
}

auto is_plain(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

auto hex_value(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

}  // namespace

auto FileCheckpointer::create(std::filesystem::path dir) -> Expected<std::shared_ptr<FileCheckpointer>> {
  if (dir.empty()) {
    return tl::unexpected(checkpoint_error("checkpoint directory is empty"));
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return tl::unexpected(
      checkpoint_error(fmt::format("cannot create checkpoint directory {}: {}", dir.string(), ec.message())));
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    return tl::unexpected(checkpoint_error(fmt::format("not a directory: {}", dir.string())));
  }
  return std::make_shared<FileCheckpointer>(Private{}, std::move(dir));
}

auto FileCheckpointer::encode_thread_id(std::string_view thread_id) -> std::string {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(thread_id.size());
  for (char c : thread_id) {
    if (is_plain(c)) {
      out.push_back(c);
    } else {
      auto byte = static_cast<unsigned char>(c);
      out.push_back('%');
      out.push_back(kHex[byte >> 4]);
      out.push_back(kHex[byte & 0x0F]);
    }
  }
  return out;
}

auto FileCheckpointer::decode_thread_id(std::string_view stem) -> std::optional<std::string> {
  std::string out;
  out.reserve(stem.size());
  for (std::size_t i = 0; i < stem.size(); ++i) {
    if (stem[i] != '%') {
      out.push_back(stem[i]);
      continue;
    }
    if (i + 2 >= stem.size()) {
      return std::nullopt;
    }
    int hi = hex_value(stem[i + 1]);
    int lo = hex_value(stem[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

auto FileCheckpointer::path_for(std::string_view thread_id) const -> std::filesystem::path {
  return dir_ / (encode_thread_id(thread_id) + std::string(kExtension));
}

auto FileCheckpointer::save(std::string_view thread_id, const Checkpoint& checkpoint) -> Expected<void> {
  const auto target = path_for(thread_id);
  auto temp = target;
  temp += std::string(kTempSuffix);
  std::string payload;
  try {
    payload = checkpoint_to_json(checkpoint).dump();
  } catch (const Json::exception& ex) {
    return tl::unexpected(
      checkpoint_error(fmt::format("cannot serialize checkpoint for thread {}: {}", thread_id, ex.what())));
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
      return tl::unexpected(checkpoint_error(fmt::format("cannot open {} for writing", temp.string())));
    }
    file << payload;
    file.flush();
    if (!file) {
      return tl::unexpected(checkpoint_error(fmt::format("write failed: {}", temp.string())));
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    std::error_code cleanup;
    std::filesystem::remove(temp, cleanup);
    return tl::unexpected(
      checkpoint_error(fmt::format("cannot move checkpoint into place {}: {}", target.string(), ec.message())));
  }
  sg::log::debug("checkpoint saved: thread={} step={} pending={}", thread_id, checkpoint.step,
                 checkpoint.pending.size());
  return {};
}

auto FileCheckpointer::load(std::string_view thread_id) const -> Expected<std::optional<Checkpoint>> {
  const auto path = path_for(thread_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      return tl::unexpected(checkpoint_error(fmt::format("cannot stat {}: {}", path.string(), ec.message())));
    }
    return std::optional<Checkpoint>{};
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return tl::unexpected(checkpoint_error(fmt::format("cannot open {}", path.string())));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  auto json = Json::parse(buffer.str(), nullptr, false);
  if (json.is_discarded()) {
    return tl::unexpected(checkpoint_error(fmt::format("checkpoint file is not valid json: {}", path.string())));
  }
  auto checkpoint = checkpoint_from_json(json);
  if (!checkpoint) {
    return tl::unexpected(checkpoint.error());
  }
  if (checkpoint->thread_id != thread_id) {
    return tl::unexpected(checkpoint_error(
      fmt::format("checkpoint file {} belongs to thread '{}'", path.string(), checkpoint->thread_id)));
  }
  return std::optional<Checkpoint>{std::move(*checkpoint)};
}

auto FileCheckpointer::remove(std::string_view thread_id) -> Expected<bool> {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::error_code ec;
  bool removed = std::filesystem::remove(path_for(thread_id), ec);
  if (ec) {
    return tl::unexpected(checkpoint_error(fmt::format("cannot remove checkpoint: {}", ec.message())));
  }
  return removed;
}

auto FileCheckpointer::list_threads() const -> Expected<std::vector<std::string>> {
  std::vector<std::string> threads;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir_, ec);
  if (ec) {
    return tl::unexpected(checkpoint_error(fmt::format("cannot list {}: {}", dir_.string(), ec.message())));
  }
  for (const auto& entry : it) {
    if (!entry.is_regular_file() || entry.path().extension().string() != kExtension) {
      continue;
    }
    auto thread_id = decode_thread_id(entry.path().stem().string());
    if (!thread_id) {
      sg::log::warn("skipping checkpoint file with malformed name: {}", entry.path().string());
      continue;
    }
    threads.push_back(std::move(*thread_id));
  }
  std::sort(threads.begin(), threads.end());
  return threads;
}

}  // namespace sg::engine
