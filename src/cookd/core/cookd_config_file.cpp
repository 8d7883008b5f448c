#include "cookd/core/cookd_config_file.hpp"

#include <yaml-cpp/yaml.h>

namespace cookd {

CookdConfigFile::CookdConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto CookdConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<CookdConfigFile> {
  CookdConfigFile config(logger);

  std::error_code ec;
  if (!std::filesystem::exists(config_path.Path(), ec)) {
    config.logger_->debug(
        "No .cookd configuration file found at {}", config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());
    if (yaml.IsNull()) {
      config.logger_->debug("Empty .cookd configuration at {}", config_path);
      return config;
    }
    if (!yaml.IsMap()) {
      config.logger_->error(
          ".cookd configuration at {} is not a mapping", config_path);
      return std::nullopt;
    }

    if (yaml["AisleFile"]) {
      config.aisle_file_ = yaml["AisleFile"].as<std::string>();
      config.logger_->debug(
          "Loaded AisleFile: {}", config.aisle_file_->string());
    }

    if (const auto& completion = yaml["Completion"]) {
      if (completion["WorkspaceSuggestions"]) {
        config.completion_.workspace_suggestions =
            completion["WorkspaceSuggestions"].as<bool>();
      }
      if (completion["BuiltinVocabulary"]) {
        config.completion_.builtin_vocabulary =
            completion["BuiltinVocabulary"].as<bool>();
      }
    }

    if (const auto& diagnostics = yaml["Diagnostics"]) {
      if (diagnostics["Warnings"]) {
        config.diagnostics_.warnings = diagnostics["Warnings"].as<bool>();
      }
    }

    config.logger_->debug("Loaded .cookd configuration from {}", config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .cookd configuration file: {}", e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    config.logger_->error(
        "Error loading .cookd configuration file: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace cookd
