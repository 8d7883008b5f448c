#include "lsp/lsp_server.hpp"

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

using lsp::error::LspError;
using lsp::error::Ok;

LspServer::LspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)) {
}

auto LspServer::Start() -> asio::awaitable<std::expected<void, LspError>> {
  RegisterHandlers();

  auto result = co_await endpoint_->Start();
  if (result.has_value()) {
    Logger()->debug("LspServer endpoint started");
  } else {
    Logger()->error("LspServer endpoint error: {}", result.error().Message());
    co_return LspError::UnexpectedFromRpcError(result.error());
  }

  auto shutdown_result = co_await endpoint_->WaitForShutdown();
  if (shutdown_result.has_value()) {
    Logger()->debug("LspServer endpoint wait for shutdown completed");
  } else {
    Logger()->error(
        "LspServer endpoint wait for shutdown error: {}",
        shutdown_result.error().Message());
    co_return LspError::UnexpectedFromRpcError(shutdown_result.error());
  }

  co_return Ok();
}

auto LspServer::Shutdown() -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug("LspServer shutting down");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (result.has_value()) {
      Logger()->debug("LspServer endpoint shutdown");
    } else {
      Logger()->error(
          "LspServer endpoint shutdown error: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
  }

  // Let the io_context run out once pending work drains
  work_guard_.reset();

  co_return Ok();
}

void LspServer::RegisterHandlers() {
  RegisterLifecycleHandlers();
  RegisterDocumentSyncHandlers();
  RegisterLanguageFeatureHandlers();
  RegisterWorkspaceFeatureHandlers();
}

void LspServer::RegisterLifecycleHandlers() {
  // Initialize Request
  endpoint_->RegisterMethodCall<InitializeParams, InitializeResult, LspError>(
      "initialize",
      [this](const InitializeParams& params) { return OnInitialize(params); });

  // Initialized Notification
  endpoint_->RegisterNotification<InitializedParams, LspError>(
      "initialized", [this](const InitializedParams& params) {
        return OnInitialized(params);
      });

  // SetTrace Notification
  endpoint_->RegisterNotification<SetTraceParams, LspError>(
      "$/setTrace",
      [this](const SetTraceParams& params) { return OnSetTrace(params); });

  // Shutdown Request
  endpoint_->RegisterMethodCall<ShutdownParams, ShutdownResult, LspError>(
      "shutdown",
      [this](const ShutdownParams& params) { return OnShutdown(params); });

  // Exit Notification
  endpoint_->RegisterNotification<ExitParams, LspError>(
      "exit", [this](const ExitParams& params) { return OnExit(params); });
}

void LspServer::RegisterDocumentSyncHandlers() {
  // DidOpenTextDocument Notification
  endpoint_->RegisterNotification<DidOpenTextDocumentParams, LspError>(
      "textDocument/didOpen", [this](const DidOpenTextDocumentParams& params) {
        return OnDidOpenTextDocument(params);
      });

  // DidChangeTextDocument Notification
  endpoint_->RegisterNotification<DidChangeTextDocumentParams, LspError>(
      "textDocument/didChange",
      [this](const DidChangeTextDocumentParams& params) {
        return OnDidChangeTextDocument(params);
      });

  // DidSaveTextDocument Notification
  endpoint_->RegisterNotification<DidSaveTextDocumentParams, LspError>(
      "textDocument/didSave", [this](const DidSaveTextDocumentParams& params) {
        return OnDidSaveTextDocument(params);
      });

  // DidCloseTextDocument Notification
  endpoint_->RegisterNotification<DidCloseTextDocumentParams, LspError>(
      "textDocument/didClose",
      [this](const DidCloseTextDocumentParams& params) {
        return OnDidCloseTextDocument(params);
      });
}

void LspServer::RegisterLanguageFeatureHandlers() {
  // Hover Request
  endpoint_->RegisterMethodCall<HoverParams, HoverResult, LspError>(
      "textDocument/hover",
      [this](const HoverParams& params) { return OnHover(params); });

  // Document Symbols Request
  endpoint_->RegisterMethodCall<
      DocumentSymbolParams, DocumentSymbolResult, LspError>(
      "textDocument/documentSymbol",
      [this](const DocumentSymbolParams& params) {
        return OnDocumentSymbols(params);
      });

  // Semantic Tokens Full Request
  endpoint_->RegisterMethodCall<
      SemanticTokensParams, SemanticTokensResult, LspError>(
      "textDocument/semanticTokens/full",
      [this](const SemanticTokensParams& params) {
        return OnSemanticTokensFull(params);
      });

  // Completion Request
  endpoint_->RegisterMethodCall<CompletionParams, CompletionResult, LspError>(
      "textDocument/completion",
      [this](const CompletionParams& params) { return OnCompletion(params); });
}

void LspServer::RegisterWorkspaceFeatureHandlers() {
  // DidChangeWatchedFiles Notification
  endpoint_->RegisterNotification<DidChangeWatchedFilesParams, LspError>(
      "workspace/didChangeWatchedFiles",
      [this](const DidChangeWatchedFilesParams& params) {
        return OnDidChangeWatchedFiles(params);
      });
}

}  // namespace lsp
