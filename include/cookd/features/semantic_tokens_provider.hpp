#pragma once

#include <span>

#include "cookd/core/document_state.hpp"
#include "cookd/scan/tokenizer.hpp"
#include "cookd/text/position_index.hpp"
#include "lsp/document_features.hpp"

namespace cookd {

class SemanticTokensProvider {
 public:
  // Legend advertised in the server capabilities. No modifiers.
  static auto Legend() -> lsp::SemanticTokensLegend;

  static auto BuildSemanticTokens(const DocumentState& document)
      -> lsp::SemanticTokens;

  // Relative encoding of `tokens`: five integers per token (line delta,
  // start delta, length, type, modifiers), lengths and columns in UTF-16
  // units. Spans covering several lines become one token per line.
  static auto Encode(
      const text::PositionIndex& index, std::span<const scan::TokenSpan> tokens)
      -> std::vector<int>;
};

}  // namespace cookd
