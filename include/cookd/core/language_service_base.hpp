#pragma once

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/document_features.hpp>
#include <lsp/error.hpp>
#include <lsp/workspace.hpp>

namespace cookd {

using lsp::error::LspError;

// Domain operations behind the protocol server. Requests for URIs that are
// not open succeed with empty results.
class LanguageServiceBase {
 public:
  LanguageServiceBase() = default;
  LanguageServiceBase(const LanguageServiceBase&) = delete;
  LanguageServiceBase(LanguageServiceBase&&) = delete;
  auto operator=(const LanguageServiceBase&) -> LanguageServiceBase& = delete;
  auto operator=(LanguageServiceBase&&) -> LanguageServiceBase& = delete;
  virtual ~LanguageServiceBase() = default;

  // A missing version clears the client's diagnostics for a closed buffer.
  using DiagnosticPublisher = std::function<void(
      std::string uri, std::optional<int> version,
      std::vector<lsp::Diagnostic>)>;

  virtual auto SetDiagnosticPublisher(DiagnosticPublisher publisher)
      -> void = 0;

  // Reads the workspace configuration and loads the alias table. Without a
  // workspace the defaults apply and the alias table stays empty.
  virtual auto InitializeWorkspace(std::optional<std::string> workspace_uri)
      -> asio::awaitable<void> = 0;

  // Called when .cookd or the alias file changes on disk
  virtual auto HandleConfigChange() -> asio::awaitable<void> = 0;

  // Document lifecycle events
  virtual auto OnDocumentOpened(
      std::string uri, std::string content, int version)
      -> asio::awaitable<void> = 0;

  virtual auto OnDocumentChanged(
      std::string uri, std::string content, int version)
      -> asio::awaitable<void> = 0;

  virtual auto OnDocumentSaved(std::string uri) -> asio::awaitable<void> = 0;

  virtual auto OnDocumentClosed(std::string uri) -> void = 0;

  virtual auto IsDocumentOpen(const std::string& uri) const -> bool = 0;

  // Language features
  virtual auto GetCompletions(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::CompletionList, LspError>> = 0;

  virtual auto GetHover(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> = 0;

  virtual auto GetDocumentSymbols(std::string uri) -> asio::awaitable<
      std::expected<std::vector<lsp::DocumentSymbol>, LspError>> = 0;

  virtual auto GetSemanticTokens(std::string uri)
      -> asio::awaitable<std::expected<lsp::SemanticTokens, LspError>> = 0;
};

}  // namespace cookd
