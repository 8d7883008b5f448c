#include "cookd/features/semantic_tokens_provider.hpp"

#include <algorithm>

namespace cookd {

auto SemanticTokensProvider::Legend() -> lsp::SemanticTokensLegend {
  lsp::SemanticTokensLegend legend;
  for (auto type : scan::kTokenLegend) {
    legend.tokenTypes.emplace_back(type);
  }
  return legend;
}

auto SemanticTokensProvider::BuildSemanticTokens(const DocumentState& document)
    -> lsp::SemanticTokens {
  auto tokens = scan::Tokenize(document.Content());
  return lsp::SemanticTokens{
      .resultId = std::nullopt, .data = Encode(document.index, tokens)};
}

auto SemanticTokensProvider::Encode(
    const text::PositionIndex& index, std::span<const scan::TokenSpan> tokens)
    -> std::vector<int> {
  std::vector<int> data;
  data.reserve(tokens.size() * 5);

  int previous_line = 0;
  int previous_column = 0;

  auto emit = [&](int line, std::size_t start, std::size_t end,
                  scan::TokenKind kind) {
    auto column = index.Utf16Length(index.LineStart(line), start);
    auto length = index.Utf16Length(start, end);
    if (length <= 0) {
      return;
    }
    auto line_delta = line - previous_line;
    data.push_back(line_delta);
    data.push_back(line_delta == 0 ? column - previous_column : column);
    data.push_back(length);
    data.push_back(static_cast<int>(kind));
    data.push_back(0);
    previous_line = line;
    previous_column = column;
  };

  for (const auto& token : tokens) {
    auto first_line = index.LineOf(token.start);
    auto last_line = index.LineOf(std::max(token.start, token.end - 1));
    for (auto line = first_line; line <= last_line; ++line) {
      auto start = std::max(token.start, index.LineStart(line));
      auto end = std::min(token.end, index.LineContentEnd(line));
      if (start < end) {
        emit(line, start, end, token.kind);
      }
    }
  }
  return data;
}

}  // namespace cookd
