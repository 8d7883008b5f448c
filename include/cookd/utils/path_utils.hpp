#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace cookd {

// File type checks
[[nodiscard]] auto IsRecipeFile(const std::filesystem::path& path) -> bool;
[[nodiscard]] auto IsConfigFile(const std::filesystem::path& path) -> bool;
[[nodiscard]] auto IsAliasFile(const std::filesystem::path& path) -> bool;

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(const std::filesystem::path& path) -> std::string;
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

}  // namespace cookd
