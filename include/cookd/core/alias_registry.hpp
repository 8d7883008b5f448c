#pragma once

#include <filesystem>
#include <memory>
#include <shared_mutex>

#include <spdlog/spdlog.h>

#include "cookd/core/alias_table.hpp"

namespace cookd {

// Holds the alias table currently in effect. Readers take a snapshot pointer
// and keep using it while a reload publishes a new table.
class AliasRegistry {
 public:
  explicit AliasRegistry(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Never null; an empty table when nothing was loaded.
  [[nodiscard]] auto Current() const -> std::shared_ptr<const AliasTable>;

  void Publish(AliasTable table);

  // Blocking file read. On failure the registry holds an empty table.
  auto ReloadFromFile(const std::filesystem::path& path) -> bool;

  void Clear();

 private:
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<const AliasTable> table_;
};

}  // namespace cookd
