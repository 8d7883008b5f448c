#pragma once

#include <vector>

#include "cookd/core/document_state.hpp"
#include "lsp/document_features.hpp"

namespace cookd {

class SymbolsProvider {
 public:
  // Outline of the recipe: a "Metadata" group, one entry per section, then
  // "Ingredients", "Cookware" and "Timers" groups. Groups without members
  // are left out. Empty when the buffer has no recipe.
  static auto BuildDocumentSymbols(const DocumentState& document)
      -> std::vector<lsp::DocumentSymbol>;
};

}  // namespace cookd
