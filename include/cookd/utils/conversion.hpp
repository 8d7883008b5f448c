#pragma once

#include <cstddef>
#include <vector>

#include "cookd/recipe/recipe.hpp"
#include "cookd/text/position_index.hpp"
#include "lsp/basic.hpp"
#include "lsp/document_sync.hpp"

namespace cookd {

// Convert a byte offset of the indexed buffer to an LSP position
auto ToLspPosition(const text::PositionIndex& index, std::size_t offset)
    -> lsp::Position;

// Convert a byte range [start, end) to an LSP range
auto ToLspRange(
    const text::PositionIndex& index, std::size_t start, std::size_t end)
    -> lsp::Range;

auto ToLspRange(
    const text::PositionIndex& index, const recipe::SourceSpan& span)
    -> lsp::Range;

// Convert an LSP position to a byte offset. Negative coordinates clamp to
// zero; everything else is clamped by the index.
auto ToOffset(const text::PositionIndex& index, const lsp::Position& position)
    -> std::size_t;

// Last whole-document replacement in a didChange batch, or nullptr when the
// batch holds only ranged edits. Ranged edits after it are not applied.
auto FindLastFullChange(
    std::vector<lsp::TextDocumentContentChangeEvent>& changes)
    -> lsp::TextDocumentContentFullChangeEvent*;

}  // namespace cookd
