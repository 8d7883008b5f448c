#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cookd::recipe {

// Half-open byte range into the parsed text.
struct SourceSpan {
  std::size_t start{};
  std::size_t end{};

  [[nodiscard]] auto Contains(std::size_t offset) const -> bool {
    return offset >= start && offset < end;
  }

  auto operator==(const SourceSpan&) const -> bool = default;
};

// Amount as written, neither normalised nor validated.
struct Quantity {
  std::string value;
  std::optional<std::string> unit;

  // "200 g", "3" or "pinch".
  [[nodiscard]] auto ToString() const -> std::string;
};

struct Ingredient {
  std::string name;
  std::optional<Quantity> quantity;
  std::optional<std::string> note;
  // First mention.
  SourceSpan span;
  // Later mentions of the same name, compared case-insensitively.
  std::vector<SourceSpan> references;
};

struct Cookware {
  std::string name;
  std::optional<Quantity> quantity;
  std::optional<std::string> note;
  SourceSpan span;
  std::vector<SourceSpan> references;
};

struct Timer {
  std::optional<std::string> name;
  std::optional<Quantity> quantity;
  SourceSpan span;
};

struct Step {
  std::string text;
  SourceSpan span;
};

struct Section {
  std::optional<std::string> name;
  std::vector<Step> steps;
  SourceSpan span;
};

struct MetadataEntry {
  std::string key;
  std::string value;
  SourceSpan span;
};

struct Recipe {
  std::vector<MetadataEntry> metadata;
  std::vector<Section> sections;
  std::vector<Ingredient> ingredients;
  std::vector<Cookware> cookware;
  std::vector<Timer> timers;

  // Case-insensitive name lookups.
  [[nodiscard]] auto FindIngredient(std::string_view name) const
      -> const Ingredient*;
  [[nodiscard]] auto FindCookware(std::string_view name) const
      -> const Cookware*;
  [[nodiscard]] auto FindTimer(std::string_view name) const -> const Timer*;
  // Timer whose first mention starts at `offset`, named or not.
  [[nodiscard]] auto FindTimerAt(std::size_t offset) const -> const Timer*;
};

enum class Severity { kError, kWarning };

struct SourceDiagnostic {
  Severity severity{Severity::kError};
  std::string message;
  std::optional<SourceSpan> span;
};

struct ParseResult {
  // Absent when the text could not be turned into a recipe at all.
  std::optional<Recipe> recipe;
  std::vector<SourceDiagnostic> errors;
  std::vector<SourceDiagnostic> warnings;

  [[nodiscard]] auto HasRecipe() const -> bool {
    return recipe.has_value();
  }
};

}  // namespace cookd::recipe
