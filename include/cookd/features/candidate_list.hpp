#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "lsp/document_features.hpp"

namespace cookd {

// Ordered completion candidates for one request. Items are kept when their
// label starts with the typed prefix (ASCII case-insensitive) and no earlier
// item has the same label under the same folding. Each accepted item gets a
// sortText so clients keep the insertion order.
class CandidateList {
 public:
  explicit CandidateList(std::string_view prefix);

  [[nodiscard]] auto Matches(std::string_view label) const -> bool;

  // Returns false when the item was filtered out or is a duplicate.
  auto Add(lsp::CompletionItem item) -> bool;

  // Adds without prefix filtering. Duplicates are still rejected.
  auto AddUnfiltered(lsp::CompletionItem item) -> bool;

  [[nodiscard]] auto Size() const -> std::size_t {
    return items_.size();
  }

  [[nodiscard]] auto Prefix() const -> std::string_view {
    return prefix_;
  }

  auto Take() -> std::vector<lsp::CompletionItem>;

 private:
  std::string prefix_;
  std::unordered_set<std::string> seen_;
  std::vector<lsp::CompletionItem> items_;
};

}  // namespace cookd
