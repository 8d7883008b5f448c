#include "cookd/services/language_service.hpp"

#include "cookd/features/completion_provider.hpp"
#include "cookd/features/diagnostics_provider.hpp"
#include "cookd/features/hover_provider.hpp"
#include "cookd/features/semantic_tokens_provider.hpp"
#include "cookd/features/symbols_provider.hpp"
#include "cookd/recipe/cooklang_parser.hpp"
#include "cookd/utils/scoped_timer.hpp"

namespace cookd::services {

LanguageService::LanguageService(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : LanguageService(
          executor, std::make_shared<recipe::CooklangParser>(logger),
          logger) {
}

LanguageService::LanguageService(
    asio::any_io_executor executor,
    std::shared_ptr<const recipe::RecipeParser> parser,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      store_(std::move(parser), logger_),
      alias_registry_(logger_),
      config_reader_(logger_),
      config_(logger_),
      io_pool_(std::make_unique<asio::thread_pool>(kIoThreads)) {
  logger_->debug("LanguageService created");
}

LanguageService::~LanguageService() {
  io_pool_->join();
}

auto LanguageService::InitializeWorkspace(
    std::optional<std::string> workspace_uri) -> asio::awaitable<void> {
  utils::ScopedTimer timer("Workspace initialization", logger_);

  if (!workspace_uri) {
    logger_->info("LanguageService running without a workspace folder");
    workspace_root_.reset();
  } else {
    logger_->debug(
        "LanguageService initializing workspace: {}", *workspace_uri);
    workspace_root_ = CanonicalPath::FromUri(*workspace_uri);
  }

  co_await LoadWorkspaceSettings();

  logger_->info(
      "LanguageService workspace initialized ({} aliases, {})",
      alias_registry_.Current()->Size(),
      utils::ScopedTimer::FormatDuration(timer.GetElapsed()));
}

auto LanguageService::HandleConfigChange() -> asio::awaitable<void> {
  logger_->info("LanguageService reloading configuration");
  co_await LoadWorkspaceSettings();

  // Diagnostic settings may have changed
  for (const auto& state : store_.Snapshot()) {
    PublishDiagnosticsFor(*state);
  }
}

auto LanguageService::LoadWorkspaceSettings() -> asio::awaitable<void> {
  if (!workspace_root_) {
    config_ = CookdConfigFile(logger_);
    alias_registry_.Clear();
    co_return;
  }

  auto root = *workspace_root_;
  auto config = co_await asio::co_spawn(
      io_pool_->get_executor(),
      [this, root]() -> asio::awaitable<CookdConfigFile> {
        auto config = config_reader_.LoadFromWorkspace(root);
        if (auto aisle_file = config_reader_.ResolveAisleFile(root, config)) {
          alias_registry_.ReloadFromFile(aisle_file->Path());
        } else {
          alias_registry_.Clear();
        }
        co_return config;
      },
      asio::use_awaitable);

  // Back to the handler executor before touching config_
  co_await asio::post(executor_, asio::use_awaitable);
  config_ = std::move(config);
}

auto LanguageService::OnDocumentOpened(
    std::string uri, std::string content, int version)
    -> asio::awaitable<void> {
  auto state = store_.Open(std::move(uri), version, std::move(content));
  PublishDiagnosticsFor(*state);
  co_return;
}

auto LanguageService::OnDocumentChanged(
    std::string uri, std::string content, int version)
    -> asio::awaitable<void> {
  auto state = store_.Update(std::move(uri), version, std::move(content));
  if (state) {
    PublishDiagnosticsFor(*state);
  }
  co_return;
}

auto LanguageService::OnDocumentSaved(std::string uri)
    -> asio::awaitable<void> {
  if (auto state = store_.Get(uri)) {
    PublishDiagnosticsFor(*state);
  } else {
    logger_->debug("LanguageService save for unopened document: {}", uri);
  }
  co_return;
}

auto LanguageService::OnDocumentClosed(std::string uri) -> void {
  store_.Close(uri);
  if (diagnostic_publisher_) {
    diagnostic_publisher_(std::move(uri), std::nullopt, {});
  }
}

auto LanguageService::IsDocumentOpen(const std::string& uri) const -> bool {
  return store_.Contains(uri);
}

auto LanguageService::GetCompletions(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::CompletionList, LspError>> {
  utils::ScopedTimer timer("GetCompletions", logger_);

  auto state = store_.Get(uri);
  if (!state) {
    logger_->debug("GetCompletions: document not open: {}", uri);
    co_return lsp::CompletionList{};
  }

  const auto& settings = config_.GetCompletion();
  CompletionSources sources{
      .workspace = settings.workspace_suggestions
                       ? store_.Snapshot()
                       : std::vector<std::shared_ptr<const DocumentState>>{},
      .aliases = alias_registry_.Current(),
      .builtin_vocabulary = settings.builtin_vocabulary};

  auto result =
      CompletionProvider::ResolveCompletion(*state, position, sources);
  logger_->debug(
      "GetCompletions: {} candidates at {}:{} in {}", result.items.size(),
      position.line, position.character, uri);
  co_return result;
}

auto LanguageService::GetHover(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> {
  utils::ScopedTimer timer("GetHover", logger_);

  auto state = store_.Get(uri);
  if (!state) {
    logger_->debug("GetHover: document not open: {}", uri);
    co_return lsp::HoverResult{};
  }
  auto aliases = alias_registry_.Current();
  co_return HoverProvider::ResolveHover(*state, position, aliases.get());
}

auto LanguageService::GetDocumentSymbols(std::string uri)
    -> asio::awaitable<
        std::expected<std::vector<lsp::DocumentSymbol>, LspError>> {
  utils::ScopedTimer timer("GetDocumentSymbols", logger_);

  auto state = store_.Get(uri);
  if (!state) {
    logger_->debug("GetDocumentSymbols: document not open: {}", uri);
    co_return std::vector<lsp::DocumentSymbol>{};
  }
  co_return SymbolsProvider::BuildDocumentSymbols(*state);
}

auto LanguageService::GetSemanticTokens(std::string uri)
    -> asio::awaitable<std::expected<lsp::SemanticTokens, LspError>> {
  utils::ScopedTimer timer("GetSemanticTokens", logger_);

  auto state = store_.Get(uri);
  if (!state) {
    logger_->debug("GetSemanticTokens: document not open: {}", uri);
    co_return lsp::SemanticTokens{};
  }
  co_return SemanticTokensProvider::BuildSemanticTokens(*state);
}

auto LanguageService::PublishDiagnosticsFor(const DocumentState& state)
    -> void {
  if (!diagnostic_publisher_) {
    return;
  }
  auto diagnostics = DiagnosticsProvider::BuildDiagnostics(
      state, config_.GetDiagnostics().warnings);
  logger_->debug(
      "LanguageService publishing {} diagnostics for {}", diagnostics.size(),
      state.uri);
  diagnostic_publisher_(state.uri, state.version, std::move(diagnostics));
}

}  // namespace cookd::services
