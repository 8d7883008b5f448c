#pragma once

#include <vector>

#include "cookd/core/document_state.hpp"
#include "lsp/basic.hpp"

namespace cookd {

class DiagnosticsProvider {
 public:
  static constexpr auto kSource = "cooklang";

  // Parser errors followed by parser warnings, converted with the buffer's
  // position index. A buffer with no recipe and no errors reports a single
  // "Failed to parse recipe" error at its start.
  static auto BuildDiagnostics(
      const DocumentState& document, bool include_warnings = true)
      -> std::vector<lsp::Diagnostic>;

  static auto ConvertSeverity(recipe::Severity severity)
      -> lsp::DiagnosticSeverity;
};

}  // namespace cookd
