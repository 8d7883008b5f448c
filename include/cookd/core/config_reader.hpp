#pragma once

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "cookd/core/cookd_config_file.hpp"
#include "cookd/utils/canonical_path.hpp"

namespace cookd {

// Stateless lookup of the workspace configuration and the alias file it
// points at.
class ConfigReader {
 public:
  explicit ConfigReader(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Falls back to default settings when the file is missing or malformed
  [[nodiscard]] auto LoadFromWorkspace(const CanonicalPath& workspace_root)
      const -> CookdConfigFile;

  // Configured alias file when set, otherwise the first existing of
  // aisle.conf and config/aisle.conf under the workspace root
  [[nodiscard]] auto ResolveAisleFile(
      const CanonicalPath& workspace_root, const CookdConfigFile& config) const
      -> std::optional<CanonicalPath>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace cookd
