#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/checkpoint.hpp"

namespace sg::engine {

/// One JSON file per thread under a directory. A save writes a sibling temp
/// file and renames it over the target, so readers never see a torn record.
class FileCheckpointer final : public Checkpointer {
  struct Private {
    explicit Private() = default;
  };

 public:
  /// Create the directory when missing.
  static auto create(std::filesystem::path dir) -> Expected<std::shared_ptr<FileCheckpointer>>;

  auto save(std::string_view thread_id, const Checkpoint& checkpoint) -> Expected<void> override;
  auto load(std::string_view thread_id) const -> Expected<std::optional<Checkpoint>> override;
  auto remove(std::string_view thread_id) -> Expected<bool> override;
  auto list_threads() const -> Expected<std::vector<std::string>> override;

  FileCheckpointer(Private, std::filesystem::path dir) : dir_(std::move(dir)) {}

  auto directory() const -> const std::filesystem::path& { return dir_; }

  /// Thread id <-> file stem. Bytes outside [A-Za-z0-9_-] become %XX.
  static auto encode_thread_id(std::string_view thread_id) -> std::string;
  static auto decode_thread_id(std::string_view stem) -> std::optional<std::string>;

 private:
  auto path_for(std::string_view thread_id) const -> std::filesystem::path;

  std::filesystem::path dir_;
  /// Serializes writers so temp file names never collide.
  std::mutex write_mutex_;
};

}  // namespace sg::engine
