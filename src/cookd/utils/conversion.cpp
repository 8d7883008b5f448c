#include "cookd/utils/conversion.hpp"

#include <algorithm>
#include <ranges>
#include <variant>

namespace cookd {

auto ToLspPosition(const text::PositionIndex& index, std::size_t offset)
    -> lsp::Position {
  auto position = index.OffsetToPosition(offset);
  return lsp::Position{.line = position.line, .character = position.column};
}

auto ToLspRange(
    const text::PositionIndex& index, std::size_t start, std::size_t end)
    -> lsp::Range {
  return lsp::Range{
      .start = ToLspPosition(index, start),
      .end = ToLspPosition(index, std::max(start, end))};
}

auto ToLspRange(
    const text::PositionIndex& index, const recipe::SourceSpan& span)
    -> lsp::Range {
  return ToLspRange(index, span.start, span.end);
}

auto ToOffset(const text::PositionIndex& index, const lsp::Position& position)
    -> std::size_t {
  return index.PositionToOffset(
      std::max(position.line, 0), std::max(position.character, 0));
}

auto FindLastFullChange(
    std::vector<lsp::TextDocumentContentChangeEvent>& changes)
    -> lsp::TextDocumentContentFullChangeEvent* {
  for (auto& change : changes | std::views::reverse) {
    if (auto* full = std::get_if<lsp::TextDocumentContentFullChangeEvent>(
            &change)) {
      return full;
    }
  }
  return nullptr;
}

}  // namespace cookd
