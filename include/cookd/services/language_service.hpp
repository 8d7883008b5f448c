#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "cookd/core/alias_registry.hpp"
#include "cookd/core/config_reader.hpp"
#include "cookd/core/cookd_config_file.hpp"
#include "cookd/core/document_store.hpp"
#include "cookd/core/language_service_base.hpp"
#include "cookd/recipe/recipe_parser.hpp"
#include "cookd/utils/canonical_path.hpp"

namespace cookd::services {

// Language service over the open recipe buffers. Handlers run on `executor`;
// only the alias file is read on the background pool.
class LanguageService : public LanguageServiceBase {
 public:
  explicit LanguageService(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LanguageService(
      asio::any_io_executor executor,
      std::shared_ptr<const recipe::RecipeParser> parser,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LanguageService(const LanguageService&) = delete;
  LanguageService(LanguageService&&) = delete;
  auto operator=(const LanguageService&) -> LanguageService& = delete;
  auto operator=(LanguageService&&) -> LanguageService& = delete;
  ~LanguageService() override;

  auto SetDiagnosticPublisher(DiagnosticPublisher publisher) -> void override {
    diagnostic_publisher_ = std::move(publisher);
  }

  auto InitializeWorkspace(std::optional<std::string> workspace_uri)
      -> asio::awaitable<void> override;

  auto HandleConfigChange() -> asio::awaitable<void> override;

  auto OnDocumentOpened(std::string uri, std::string content, int version)
      -> asio::awaitable<void> override;

  auto OnDocumentChanged(std::string uri, std::string content, int version)
      -> asio::awaitable<void> override;

  auto OnDocumentSaved(std::string uri) -> asio::awaitable<void> override;

  auto OnDocumentClosed(std::string uri) -> void override;

  auto IsDocumentOpen(const std::string& uri) const -> bool override;

  auto GetCompletions(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<lsp::CompletionList, LspError>> override;

  auto GetHover(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> override;

  auto GetDocumentSymbols(std::string uri) -> asio::awaitable<
      std::expected<std::vector<lsp::DocumentSymbol>, LspError>> override;

  auto GetSemanticTokens(std::string uri)
      -> asio::awaitable<
          std::expected<lsp::SemanticTokens, LspError>> override;

  [[nodiscard]] auto GetAliasRegistry() const -> const AliasRegistry& {
    return alias_registry_;
  }

  [[nodiscard]] auto GetConfig() const -> const CookdConfigFile& {
    return config_;
  }

 private:
  // Reads .cookd and the alias file it names, then swaps both in
  auto LoadWorkspaceSettings() -> asio::awaitable<void>;

  auto PublishDiagnosticsFor(const DocumentState& state) -> void;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  DocumentStore store_;
  AliasRegistry alias_registry_;
  ConfigReader config_reader_;
  CookdConfigFile config_;
  std::optional<CanonicalPath> workspace_root_;

  // Blocking file reads
  static constexpr std::size_t kIoThreads = 1;
  std::unique_ptr<asio::thread_pool> io_pool_;

  // Callback for publishing diagnostics (set by LSP server layer)
  DiagnosticPublisher diagnostic_publisher_;
};

}  // namespace cookd::services
