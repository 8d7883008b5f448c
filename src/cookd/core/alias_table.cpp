#include "cookd/core/alias_table.hpp"

#include <fstream>
#include <sstream>

#include "cookd/scan/scan_primitives.hpp"
#include "cookd/utils/string_utils.hpp"

namespace cookd {

namespace {

auto SplitNames(std::string_view line) -> std::vector<std::string_view> {
  std::vector<std::string_view> names;
  std::size_t start = 0;
  while (true) {
    auto bar = line.find('|', start);
    names.push_back(scan::Trim(line.substr(start, bar - start)));
    if (bar == std::string_view::npos) {
      break;
    }
    start = bar + 1;
  }
  return names;
}

}  // namespace

auto AliasTable::Parse(
    std::string_view content, std::shared_ptr<spdlog::logger> logger)
    -> AliasTable {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  AliasTable table;
  std::optional<std::string> category;
  std::size_t line_number = 0;
  std::size_t pos = 0;

  while (pos <= content.size()) {
    auto newline = content.find('\n', pos);
    auto raw = content.substr(
        pos, newline == std::string_view::npos ? std::string_view::npos
                                               : newline - pos);
    pos = newline == std::string_view::npos ? content.size() + 1 : newline + 1;
    ++line_number;

    if (!raw.empty() && raw.back() == '\r') {
      raw.remove_suffix(1);
    }
    auto line = scan::Trim(raw);
    if (line.empty() || line.starts_with('#') || line.starts_with("//")) {
      continue;
    }

    if (line.starts_with('[')) {
      if (!line.ends_with(']')) {
        logger->warn(
            "AliasTable line {}: unclosed category header '{}'", line_number,
            line);
        continue;
      }
      auto name = scan::Trim(line.substr(1, line.size() - 2));
      if (name.empty()) {
        logger->warn("AliasTable line {}: empty category name", line_number);
        continue;
      }
      category = std::string(name);
      continue;
    }

    if (!category) {
      logger->warn(
          "AliasTable line {}: entry '{}' appears before any category",
          line_number, line);
      continue;
    }

    auto names = SplitNames(line);
    if (names.front().empty()) {
      logger->warn(
          "AliasTable line {}: missing canonical name in '{}'", line_number,
          line);
      continue;
    }

    std::string canonical(names.front());
    for (const auto& name : names) {
      if (name.empty()) {
        logger->warn(
            "AliasTable line {}: skipping empty alias in '{}'", line_number,
            line);
        continue;
      }
      table.Add(
          AliasEntry{
              .name = std::string(name),
              .canonical = canonical,
              .category = *category});
    }
  }

  logger->debug("AliasTable parsed {} entries", table.Size());
  return table;
}

auto AliasTable::LoadFromFile(
    const std::filesystem::path& path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<AliasTable> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    logger->debug("AliasTable cannot open {}", path.string());
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    logger->warn("AliasTable failed to read {}", path.string());
    return std::nullopt;
  }
  return Parse(buffer.str(), logger);
}

auto AliasTable::Find(std::string_view name) const -> const AliasEntry* {
  auto it = index_.find(utils::ToLower(name));
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

void AliasTable::Add(AliasEntry entry) {
  auto key = utils::ToLower(entry.name);
  if (index_.contains(key)) {
    return;
  }
  index_.emplace(std::move(key), entries_.size());
  entries_.push_back(std::move(entry));
}

}  // namespace cookd
