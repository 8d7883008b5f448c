#include "cookd/core/cookd_lsp_server.hpp"

#include <variant>

#include <spdlog/spdlog.h>

#include "cookd/features/semantic_tokens_provider.hpp"
#include "cookd/utils/canonical_path.hpp"
#include "cookd/utils/conversion.hpp"
#include "cookd/utils/path_utils.hpp"
#include "lsp/document_features.hpp"
#include "lsp/server_capabilities.hpp"
#include "lsp/workspace.hpp"

namespace cookd {

using lsp::Ok;

namespace {

constexpr std::string_view kServerName = "cookd";
constexpr std::string_view kServerVersion = "0.1.0";
constexpr std::string_view kFileWatcherId = "cookd-file-system-watcher";
constexpr std::string_view kDidChangeWatchedFilesMethod =
    "workspace/didChangeWatchedFiles";

}  // namespace

CookdLspServer::CookdLspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<LanguageServiceBase> language_service,
    std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      language_service_(std::move(language_service)) {
  // Publishing is a client notification, so it runs as its own coroutine on
  // the server executor
  language_service_->SetDiagnosticPublisher(
      [this](
          std::string uri, std::optional<int> version,
          std::vector<lsp::Diagnostic> diagnostics) {
        auto coroutine =
            [this, uri = std::move(uri), version,
             diagnostics = std::move(diagnostics)]() -> asio::awaitable<void> {
          auto result = co_await PublishDiagnostics(
              {.uri = uri, .version = version, .diagnostics = diagnostics});
          if (!result) {
            logger_->warn("Dropped diagnostics for {}", uri);
          }
        };
        asio::co_spawn(executor_, std::move(coroutine), asio::detached);
      });
}

auto CookdLspServer::BuildCapabilities() -> lsp::ServerCapabilities {
  lsp::TextDocumentSyncOptions sync_options{
      .openClose = true,
      .change = lsp::TextDocumentSyncKind::kFull,
      .save = lsp::SaveOptions{.includeText = false},
  };

  lsp::CompletionOptions completion_options{
      .triggerCharacters = std::vector<std::string>{"@", "#", "~", "%", "{"},
      .resolveProvider = false,
  };

  lsp::SemanticTokensOptions semantic_tokens_options{
      .legend = SemanticTokensProvider::Legend(),
      .range = false,
      .full = true,
  };

  lsp::ServerCapabilities::Workspace workspace{
      .workspaceFolders =
          lsp::WorkspaceFoldersServerCapabilities{
              .supported = true,
          },
  };

  return lsp::ServerCapabilities{
      .textDocumentSync = sync_options,
      .completionProvider = completion_options,
      .hoverProvider = true,
      .documentSymbolProvider = true,
      .semanticTokensProvider = semantic_tokens_options,
      .workspace = workspace,
  };
}

auto CookdLspServer::ResolveWorkspaceUri(const lsp::InitializeParams& params)
    -> std::optional<std::string> {
  if (params.workspaceFolders && !params.workspaceFolders->empty()) {
    return params.workspaceFolders->front().uri;
  }
  if (params.rootUri) {
    return *params.rootUri;
  }
  if (params.rootPath) {
    return PathToUri(*params.rootPath);
  }
  return std::nullopt;
}

auto CookdLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, lsp::LspError>> {
  // Only record the workspace here; loading happens in OnInitialized
  workspace_uri_ = ResolveWorkspaceUri(params);
  if (workspace_uri_) {
    Logger()->info("Workspace root: {}", *workspace_uri_);
  }

  co_return lsp::InitializeResult{
      .capabilities = BuildCapabilities(),
      .serverInfo = lsp::InitializeResult::ServerInfo{
          .name = std::string(kServerName),
          .version = std::string(kServerVersion)}};
}

auto CookdLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  initialized_ = true;
  Logger()->info("cookd initialized");

  asio::co_spawn(
      executor_, language_service_->InitializeWorkspace(workspace_uri_),
      asio::detached);
  asio::co_spawn(executor_, RegisterFileWatchers(), asio::detached);
  co_return Ok();
}

auto CookdLspServer::RegisterFileWatchers() -> asio::awaitable<void> {
  Logger()->info("Registering file system watcher");

  lsp::FileSystemWatcher recipe_files{.globPattern = "**/*.cook"};
  lsp::FileSystemWatcher alias_files{.globPattern = "**/aisle.conf"};
  lsp::FileSystemWatcher cookd_config{.globPattern = "**/.cookd"};

  std::string registration_id(kFileWatcherId);
  if (workspace_uri_) {
    registration_id += "-" + *workspace_uri_;
  }

  lsp::DidChangeWatchedFilesRegistrationOptions options{
      .watchers = {recipe_files, alias_files, cookd_config},
  };
  auto registration = lsp::Registration{
      .id = registration_id,
      .method = std::string(kDidChangeWatchedFilesMethod),
      .registerOptions = nlohmann::json(options),
  };

  auto result = co_await RegisterCapability(
      lsp::RegistrationParams{.registrations = {registration}});
  if (!result) {
    Logger()->error(
        "Failed to register file system watcher: {}",
        result.error().Message());
  } else {
    Logger()->info("File system watcher registered successfully");
  }
}

auto CookdLspServer::OnSetTrace(lsp::SetTraceParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  co_return Ok();
}

auto CookdLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, lsp::LspError>> {
  Logger()->info("cookd shutting down");
  shutdown_requested_ = true;
  co_return lsp::ShutdownResult{};
}

auto CookdLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  if (!shutdown_requested_) {
    Logger()->warn("Exit received before shutdown");
  }
  co_await lsp::LspServer::Shutdown();
  co_return Ok();
}

auto CookdLspServer::OnDidOpenTextDocument(
    lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  auto& text_doc = params.textDocument;
  Logger()->debug("OnDidOpenTextDocument received: {}", text_doc.uri);

  co_await language_service_->OnDocumentOpened(
      std::move(text_doc.uri), std::move(text_doc.text), text_doc.version);
  co_return Ok();
}

auto CookdLspServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidChangeTextDocument received: {}", params.textDocument.uri);
  if (params.contentChanges.empty()) {
    co_return Ok();
  }

  // Full sync: only whole-document replacements are applied
  auto* full_change = FindLastFullChange(params.contentChanges);
  if (full_change == nullptr) {
    Logger()->warn(
        "Ignoring incremental change for {}, full sync expected",
        params.textDocument.uri);
    co_return Ok();
  }
  if (full_change != std::get_if<lsp::TextDocumentContentFullChangeEvent>(
                         &params.contentChanges.back())) {
    Logger()->warn(
        "Dropping ranged edits after the full change for {}",
        params.textDocument.uri);
  }

  co_await language_service_->OnDocumentChanged(
      params.textDocument.uri, std::move(full_change->text),
      params.textDocument.version);
  co_return Ok();
}

auto CookdLspServer::OnDidSaveTextDocument(
    lsp::DidSaveTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidSaveTextDocument received: {}", params.textDocument.uri);
  co_await language_service_->OnDocumentSaved(params.textDocument.uri);
  co_return Ok();
}

auto CookdLspServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidCloseTextDocument received: {}", params.textDocument.uri);
  language_service_->OnDocumentClosed(params.textDocument.uri);
  co_return Ok();
}

auto CookdLspServer::OnCompletion(lsp::CompletionParams params)
    -> asio::awaitable<std::expected<lsp::CompletionResult, lsp::LspError>> {
  Logger()->debug("OnCompletion received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetCompletions(
      params.textDocument.uri, params.position);
}

auto CookdLspServer::OnHover(lsp::HoverParams params)
    -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>> {
  Logger()->debug("OnHover received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetHover(
      params.textDocument.uri, params.position);
}

auto CookdLspServer::OnDocumentSymbols(lsp::DocumentSymbolParams params)
    -> asio::awaitable<
        std::expected<lsp::DocumentSymbolResult, lsp::LspError>> {
  Logger()->debug("OnDocumentSymbols received: {}", params.textDocument.uri);
  auto symbols =
      co_await language_service_->GetDocumentSymbols(params.textDocument.uri);
  if (!symbols) {
    co_return std::unexpected(symbols.error());
  }
  co_return lsp::DocumentSymbolResult{std::move(*symbols)};
}

auto CookdLspServer::OnSemanticTokensFull(lsp::SemanticTokensParams params)
    -> asio::awaitable<
        std::expected<lsp::SemanticTokensResult, lsp::LspError>> {
  Logger()->debug(
      "OnSemanticTokensFull received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetSemanticTokens(
      params.textDocument.uri);
}

auto CookdLspServer::OnDidChangeWatchedFiles(
    lsp::DidChangeWatchedFilesParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->info(
      "OnDidChangeWatchedFiles received: {} file change(s)",
      params.changes.size());

  bool has_config_change = false;
  for (const auto& change : params.changes) {
    auto path = CanonicalPath::FromUri(change.uri);
    if (IsConfigFile(path.Path()) || IsAliasFile(path.Path())) {
      has_config_change = true;
    } else if (IsRecipeFile(path.Path())) {
      // Completion only draws on open buffers, which the editor keeps in sync
      Logger()->debug("Recipe file changed on disk: {}", path);
    }
  }

  if (has_config_change) {
    asio::co_spawn(
        executor_, language_service_->HandleConfigChange(), asio::detached);
  }
  co_return Ok();
}

}  // namespace cookd
