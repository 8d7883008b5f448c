#pragma once

#include <string>

#include "cookd/core/alias_table.hpp"
#include "cookd/core/document_state.hpp"
#include "cookd/recipe/recipe.hpp"
#include "lsp/document_features.hpp"

namespace cookd {

class HoverProvider {
 public:
  // Markdown description of the element under `position`, covering the
  // element's range. Ingredients, cookware and timers are described from the
  // parsed recipe when it has a matching entry and from the raw text
  // otherwise. Ingredients listed in `aliases` also show their aisle.
  static auto ResolveHover(
      const DocumentState& document, const lsp::Position& position,
      const AliasTable* aliases = nullptr) -> lsp::HoverResult;

  static auto FormatIngredient(const recipe::Ingredient& ingredient)
      -> std::string;
  static auto FormatCookware(const recipe::Cookware& cookware) -> std::string;
  static auto FormatTimer(const recipe::Timer& timer) -> std::string;
};

}  // namespace cookd
