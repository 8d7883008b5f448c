#pragma once

#include <string_view>

#include "cookd/recipe/recipe.hpp"

namespace cookd::recipe {

// Turns raw recipe text into a structured model plus diagnostics. Diagnostic
// spans are byte offsets into the same text.
class RecipeParser {
 public:
  RecipeParser() = default;
  RecipeParser(const RecipeParser&) = delete;
  RecipeParser(RecipeParser&&) = delete;
  auto operator=(const RecipeParser&) -> RecipeParser& = delete;
  auto operator=(RecipeParser&&) -> RecipeParser& = delete;
  virtual ~RecipeParser() = default;

  [[nodiscard]] virtual auto Parse(std::string_view text) const
      -> ParseResult = 0;
};

}  // namespace cookd::recipe
