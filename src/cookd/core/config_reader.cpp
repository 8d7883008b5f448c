#include "cookd/core/config_reader.hpp"

#include <array>
#include <string_view>

namespace cookd {

namespace {

constexpr std::array<std::string_view, 2> kDefaultAisleFiles = {
    "aisle.conf", "config/aisle.conf"};

}  // namespace

ConfigReader::ConfigReader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto ConfigReader::LoadFromWorkspace(const CanonicalPath& workspace_root) const
    -> CookdConfigFile {
  auto config_path = workspace_root / ".cookd";
  logger_->debug("ConfigReader loading config from: {}", config_path);

  if (auto config = CookdConfigFile::LoadFromFile(config_path, logger_)) {
    return *config;
  }
  return CookdConfigFile(logger_);
}

auto ConfigReader::ResolveAisleFile(
    const CanonicalPath& workspace_root, const CookdConfigFile& config) const
    -> std::optional<CanonicalPath> {
  if (const auto& configured = config.GetAisleFile()) {
    auto path = configured->is_absolute() ? CanonicalPath(*configured)
                                          : workspace_root / *configured;
    logger_->debug("ConfigReader using configured alias file: {}", path);
    return path;
  }

  for (auto candidate : kDefaultAisleFiles) {
    auto path = workspace_root / std::filesystem::path(candidate);
    std::error_code ec;
    if (std::filesystem::is_regular_file(path.Path(), ec)) {
      logger_->debug("ConfigReader found alias file: {}", path);
      return path;
    }
  }

  logger_->debug("ConfigReader found no alias file under {}", workspace_root);
  return std::nullopt;
}

}  // namespace cookd
