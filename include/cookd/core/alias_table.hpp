#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace cookd {

struct AliasEntry {
  // Name as written in the file.
  std::string name;
  // First name of its line, which the other names alias.
  std::string canonical;
  std::string category;

  [[nodiscard]] auto IsAlias() const -> bool {
    return name != canonical;
  }
};

// Immutable ingredient alias table loaded from an aisle.conf file:
//
//   [produce]
//   onions|yellow onion
//   garlic
//
// Lines starting with '#' or "//" and blank lines are ignored. A bad line is
// skipped with a warning and never aborts the load.
class AliasTable {
 public:
  AliasTable() = default;

  static auto Parse(
      std::string_view content,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> AliasTable;

  // Returns std::nullopt when the file cannot be read.
  static auto LoadFromFile(
      const std::filesystem::path& path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<AliasTable>;

  // Entries in file order.
  [[nodiscard]] auto Entries() const -> const std::vector<AliasEntry>& {
    return entries_;
  }

  [[nodiscard]] auto Size() const -> std::size_t {
    return entries_.size();
  }

  [[nodiscard]] auto Empty() const -> bool {
    return entries_.empty();
  }

  // Case-insensitive lookup by name or alias.
  [[nodiscard]] auto Find(std::string_view name) const -> const AliasEntry*;

 private:
  void Add(AliasEntry entry);

  std::vector<AliasEntry> entries_;
  // Lower-cased name -> index into entries_. First definition wins.
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace cookd
