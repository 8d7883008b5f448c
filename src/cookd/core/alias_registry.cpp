#include "cookd/core/alias_registry.hpp"

#include <mutex>

namespace cookd {

AliasRegistry::AliasRegistry(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      table_(std::make_shared<const AliasTable>()) {
}

auto AliasRegistry::Current() const -> std::shared_ptr<const AliasTable> {
  std::shared_lock lock(mutex_);
  return table_;
}

void AliasRegistry::Publish(AliasTable table) {
  auto next = std::make_shared<const AliasTable>(std::move(table));
  logger_->debug("AliasRegistry publishing {} entries", next->Size());
  std::unique_lock lock(mutex_);
  table_ = std::move(next);
}

auto AliasRegistry::ReloadFromFile(const std::filesystem::path& path) -> bool {
  auto table = AliasTable::LoadFromFile(path, logger_);
  if (!table) {
    logger_->warn(
        "AliasRegistry could not load {}, using an empty table",
        path.string());
    Clear();
    return false;
  }

  logger_->info(
      "AliasRegistry loaded {} entries from {}", table->Size(), path.string());
  Publish(std::move(*table));
  return true;
}

void AliasRegistry::Clear() {
  Publish(AliasTable{});
}

}  // namespace cookd
