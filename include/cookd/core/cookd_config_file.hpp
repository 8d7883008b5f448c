#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "cookd/utils/canonical_path.hpp"

namespace cookd {

// Represents the contents of a .cookd configuration file
class CookdConfigFile {
 public:
  struct CompletionSettings {
    // Offer names found in other open buffers
    bool workspace_suggestions = true;
    // Offer the built-in ingredient, cookware and unit lists
    bool builtin_vocabulary = true;
  };

  struct DiagnosticsSettings {
    // Publish parser warnings next to errors
    bool warnings = true;
  };

  explicit CookdConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load a configuration from a .cookd file.
  // Returns std::nullopt if the file doesn't exist or cannot be parsed
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<CookdConfigFile>;

  // Workspace-relative alias file, when configured
  [[nodiscard]] auto GetAisleFile() const
      -> const std::optional<std::filesystem::path>& {
    return aisle_file_;
  }

  [[nodiscard]] auto GetCompletion() const -> const CompletionSettings& {
    return completion_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const DiagnosticsSettings& {
    return diagnostics_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;

  std::optional<std::filesystem::path> aisle_file_;
  CompletionSettings completion_;
  DiagnosticsSettings diagnostics_;
};

}  // namespace cookd
