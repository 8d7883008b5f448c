#pragma once

#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>

#include "cookd/core/language_service_base.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"

namespace cookd {

class CookdLspServer : public lsp::LspServer {
 public:
  CookdLspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<LanguageServiceBase> language_service,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Advertised capabilities, independent of the client
  static auto BuildCapabilities() -> lsp::ServerCapabilities;

  // First workspace folder, then rootUri, then rootPath
  static auto ResolveWorkspaceUri(const lsp::InitializeParams& params)
      -> std::optional<std::string>;

 private:
  // Server state
  bool initialized_ = false;
  bool shutdown_requested_ = false;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  std::shared_ptr<LanguageServiceBase> language_service_{nullptr};

  // Workspace root from the initialize request
  std::optional<std::string> workspace_uri_;

  auto RegisterFileWatchers() -> asio::awaitable<void>;

 protected:
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnSetTrace(lsp::SetTraceParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidSaveTextDocument(lsp::DidSaveTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnCompletion(lsp::CompletionParams params) -> asio::awaitable<
      std::expected<lsp::CompletionResult, lsp::LspError>> override;

  auto OnHover(lsp::HoverParams params) -> asio::awaitable<
      std::expected<lsp::HoverResult, lsp::LspError>> override;

  auto OnDocumentSymbols(lsp::DocumentSymbolParams params) -> asio::awaitable<
      std::expected<lsp::DocumentSymbolResult, lsp::LspError>> override;

  auto OnSemanticTokensFull(lsp::SemanticTokensParams params)
      -> asio::awaitable<
          std::expected<lsp::SemanticTokensResult, lsp::LspError>> override;

  auto OnDidChangeWatchedFiles(lsp::DidChangeWatchedFilesParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;
};

}  // namespace cookd
