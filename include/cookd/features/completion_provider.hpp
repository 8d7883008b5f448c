#pragma once

#include <memory>
#include <vector>

#include "cookd/core/alias_table.hpp"
#include "cookd/core/document_state.hpp"
#include "cookd/features/candidate_list.hpp"
#include "cookd/scan/completion_context.hpp"
#include "lsp/document_features.hpp"

namespace cookd {

// Everything outside the requesting buffer that completion may draw from.
struct CompletionSources {
  // Other open buffers. The requesting buffer may appear and is skipped.
  std::vector<std::shared_ptr<const DocumentState>> workspace;
  std::shared_ptr<const AliasTable> aliases;
  bool builtin_vocabulary = true;
};

class CompletionProvider {
 public:
  // Candidates for the element being typed at `position`, in source order:
  // this recipe, other buffers, the alias table, then built-in names. Empty
  // when the cursor is not inside an element.
  static auto ResolveCompletion(
      const DocumentState& document, const lsp::Position& position,
      const CompletionSources& sources) -> lsp::CompletionList;

 private:
  static void AddIngredients(
      const DocumentState& document, const scan::CompletionContext& context,
      const CompletionSources& sources, CandidateList& candidates);

  static void AddCookware(
      const DocumentState& document, const scan::CompletionContext& context,
      const CompletionSources& sources, CandidateList& candidates);

  static void AddTimers(
      const DocumentState& document, const scan::CompletionContext& context,
      const CompletionSources& sources, CandidateList& candidates);

  static void AddUnits(
      const scan::CompletionContext& context, CandidateList& candidates);

  static void AddQuantitySnippets(CandidateList& candidates);
};

}  // namespace cookd
