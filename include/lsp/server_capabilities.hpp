#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"
#include "lsp/document_features.hpp"

namespace lsp {

enum class TextDocumentSyncKind {
  kNone = 0,
  kFull = 1,
  kIncremental = 2,
};

void to_json(nlohmann::json& j, const TextDocumentSyncKind& o);
void from_json(const nlohmann::json& j, TextDocumentSyncKind& o);

struct SaveOptions {
  std::optional<bool> includeText;
};

void to_json(nlohmann::json& j, const SaveOptions& o);
void from_json(const nlohmann::json& j, SaveOptions& o);

struct TextDocumentSyncOptions {
  std::optional<bool> openClose = true;
  std::optional<TextDocumentSyncKind> change = TextDocumentSyncKind::kFull;
  std::optional<SaveOptions> save;
};

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o);
void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o);

struct CompletionOptions {
  std::optional<std::vector<std::string>> triggerCharacters;
  std::optional<bool> resolveProvider;
};

void to_json(nlohmann::json& j, const CompletionOptions& o);
void from_json(const nlohmann::json& j, CompletionOptions& o);

struct SemanticTokensOptions {
  SemanticTokensLegend legend;
  std::optional<bool> range;
  std::optional<bool> full;
};

void to_json(nlohmann::json& j, const SemanticTokensOptions& o);
void from_json(const nlohmann::json& j, SemanticTokensOptions& o);

struct WorkspaceFoldersServerCapabilities {
  std::optional<bool> supported;
  std::optional<bool> changeNotifications;
};

void to_json(nlohmann::json& j, const WorkspaceFoldersServerCapabilities& o);
void from_json(const nlohmann::json& j, WorkspaceFoldersServerCapabilities& o);

struct ServerCapabilities {
  std::optional<PositionEncodingKind> positionEncoding =
      PositionEncodingKind::kUtf16;
  std::optional<TextDocumentSyncOptions> textDocumentSync;
  std::optional<CompletionOptions> completionProvider;
  std::optional<bool> hoverProvider;
  std::optional<bool> documentSymbolProvider;
  std::optional<SemanticTokensOptions> semanticTokensProvider;

  struct Workspace {
    std::optional<WorkspaceFoldersServerCapabilities> workspaceFolders;
  };

  std::optional<Workspace> workspace;
};

void to_json(nlohmann::json& j, const ServerCapabilities::Workspace& o);
void from_json(const nlohmann::json& j, ServerCapabilities::Workspace& o);

void to_json(nlohmann::json& j, const ServerCapabilities& o);
void from_json(const nlohmann::json& j, ServerCapabilities& o);

}  // namespace lsp
