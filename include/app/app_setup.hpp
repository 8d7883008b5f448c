#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

/// Name of the logger used by the cookd server and its services
inline constexpr std::string_view kServerLoggerName = "cookd";

/// Extracts the transport pipe from `--pipe=<name>`, the first argument
auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string>;

/// Maps an SPDLOG_LEVEL value to a level, debug when unrecognised
auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum;

/// Creates the transport, jsonrpc and cookd loggers. Only the cookd logger
/// follows SPDLOG_LEVEL; the protocol loggers stay at info.
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
