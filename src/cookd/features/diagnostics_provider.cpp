#include "cookd/features/diagnostics_provider.hpp"

#include "cookd/utils/conversion.hpp"

namespace cookd {

namespace {

auto ToLspDiagnostic(
    const text::PositionIndex& index, const recipe::SourceDiagnostic& source)
    -> lsp::Diagnostic {
  lsp::Diagnostic diagnostic;
  if (source.span) {
    diagnostic.range = ToLspRange(index, *source.span);
  }
  diagnostic.severity = DiagnosticsProvider::ConvertSeverity(source.severity);
  diagnostic.source = DiagnosticsProvider::kSource;
  diagnostic.message = source.message;
  return diagnostic;
}

}  // namespace

auto DiagnosticsProvider::BuildDiagnostics(
    const DocumentState& document, bool include_warnings)
    -> std::vector<lsp::Diagnostic> {
  const auto& parse = document.parse;

  if (!parse.HasRecipe() && parse.errors.empty()) {
    lsp::Diagnostic failure;
    failure.severity = lsp::DiagnosticSeverity::kError;
    failure.source = kSource;
    failure.message = "Failed to parse recipe";
    return {failure};
  }

  std::vector<lsp::Diagnostic> diagnostics;
  for (const auto& error : parse.errors) {
    diagnostics.push_back(ToLspDiagnostic(document.index, error));
  }
  if (include_warnings) {
    for (const auto& warning : parse.warnings) {
      diagnostics.push_back(ToLspDiagnostic(document.index, warning));
    }
  }
  return diagnostics;
}

auto DiagnosticsProvider::ConvertSeverity(recipe::Severity severity)
    -> lsp::DiagnosticSeverity {
  switch (severity) {
    case recipe::Severity::kError:
      return lsp::DiagnosticSeverity::kError;
    case recipe::Severity::kWarning:
      return lsp::DiagnosticSeverity::kWarning;
  }
  return lsp::DiagnosticSeverity::kError;
}

}  // namespace cookd
