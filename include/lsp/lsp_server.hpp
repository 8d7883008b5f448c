#pragma once

#include <expected>
#include <memory>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/error/error.hpp>
#include <spdlog/spdlog.h>

#include "lsp/diagnostic.hpp"
#include "lsp/document_features.hpp"
#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/workspace.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

// Protocol-level base server. Owns the JSON-RPC endpoint, routes each LSP
// method to a virtual handler and offers helpers for server-to-client
// messages. Unimplemented handlers answer with kMethodNotImplemented.
class LspServer {
 public:
  LspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  auto Start() -> asio::awaitable<std::expected<void, LspError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, LspError>>;
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 protected:
  void RegisterHandlers();

 private:
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;

  void RegisterLifecycleHandlers();
  void RegisterDocumentSyncHandlers();
  void RegisterLanguageFeatureHandlers();
  void RegisterWorkspaceFeatureHandlers();

 protected:
  // Initialize Request
  virtual auto OnInitialize(InitializeParams /*unused*/)
      -> asio::awaitable<std::expected<InitializeResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnInitialize is not implemented");
  }

  // Initialized Notification
  virtual auto OnInitialized(InitializedParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnInitialized is not implemented");
  }

  // Register Capability
  auto RegisterCapability(RegistrationParams params)
      -> asio::awaitable<std::expected<RegistrationResult, LspError>> {
    auto result = co_await endpoint_
                      ->SendMethodCall<RegistrationParams, RegistrationResult>(
                          "client/registerCapability", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to register capability: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return result.value();
  }

  // SetTrace Notification
  virtual auto OnSetTrace(SetTraceParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnSetTrace is not implemented");
  }

  // Shutdown Request
  virtual auto OnShutdown(ShutdownParams /*unused*/)
      -> asio::awaitable<std::expected<ShutdownResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnShutdown is not implemented");
  }

  // Exit Notification
  virtual auto OnExit(ExitParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnExit is not implemented");
  }

  // DidOpenTextDocument Notification
  virtual auto OnDidOpenTextDocument(DidOpenTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidOpenTextDocument is not implemented");
  }

  // DidChangeTextDocument Notification
  virtual auto OnDidChangeTextDocument(DidChangeTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeTextDocument is not implemented");
  }

  // DidSaveTextDocument Notification
  virtual auto OnDidSaveTextDocument(DidSaveTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidSaveTextDocument is not implemented");
  }

  // DidCloseTextDocument Notification
  virtual auto OnDidCloseTextDocument(DidCloseTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidCloseTextDocument is not implemented");
  }

  // Hover Request
  virtual auto OnHover(HoverParams /*unused*/)
      -> asio::awaitable<std::expected<HoverResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnHover is not implemented");
  }

  // Document Symbols Request
  virtual auto OnDocumentSymbols(DocumentSymbolParams /*unused*/)
      -> asio::awaitable<std::expected<DocumentSymbolResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDocumentSymbols is not implemented");
  }

  // Semantic Tokens Full Request
  virtual auto OnSemanticTokensFull(SemanticTokensParams /*unused*/)
      -> asio::awaitable<std::expected<SemanticTokensResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnSemanticTokensFull is not implemented");
  }

  // Completion Request
  virtual auto OnCompletion(CompletionParams /*unused*/)
      -> asio::awaitable<std::expected<CompletionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnCompletion is not implemented");
  }

  // PublishDiagnostics Notification
  auto PublishDiagnostics(PublishDiagnosticsParams params)
      -> asio::awaitable<std::expected<void, LspError>> {
    auto result =
        co_await endpoint_->SendNotification<PublishDiagnosticsParams>(
            "textDocument/publishDiagnostics", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to publish diagnostics: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }

  // DidChangeWatchedFiles Notification
  virtual auto OnDidChangeWatchedFiles(DidChangeWatchedFilesParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeWatchedFiles is not implemented");
  }
};

}  // namespace lsp
