#include "lsp/server_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const TextDocumentSyncKind& o) {
  j = static_cast<int>(o);
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& o) {
  o = static_cast<TextDocumentSyncKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const SaveOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "includeText", o.includeText);
}

void from_json(const nlohmann::json& j, SaveOptions& o) {
  from_json_optional(j, "includeText", o.includeText);
}

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "openClose", o.openClose);
  to_json_optional(j, "change", o.change);
  to_json_optional(j, "save", o.save);
}

void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o) {
  from_json_optional(j, "openClose", o.openClose);
  from_json_optional(j, "change", o.change);
  from_json_optional(j, "save", o.save);
}

void to_json(nlohmann::json& j, const CompletionOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "triggerCharacters", o.triggerCharacters);
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, CompletionOptions& o) {
  from_json_optional(j, "triggerCharacters", o.triggerCharacters);
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const SemanticTokensOptions& o) {
  j = nlohmann::json{{"legend", o.legend}};
  to_json_optional(j, "range", o.range);
  to_json_optional(j, "full", o.full);
}

void from_json(const nlohmann::json& j, SemanticTokensOptions& o) {
  j.at("legend").get_to(o.legend);
  from_json_optional(j, "range", o.range);
  from_json_optional(j, "full", o.full);
}

void to_json(nlohmann::json& j, const WorkspaceFoldersServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "supported", o.supported);
  to_json_optional(j, "changeNotifications", o.changeNotifications);
}

void from_json(
    const nlohmann::json& j, WorkspaceFoldersServerCapabilities& o) {
  from_json_optional(j, "supported", o.supported);
  from_json_optional(j, "changeNotifications", o.changeNotifications);
}

void to_json(nlohmann::json& j, const ServerCapabilities::Workspace& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void from_json(const nlohmann::json& j, ServerCapabilities::Workspace& o) {
  from_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void to_json(nlohmann::json& j, const ServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncoding", o.positionEncoding);
  to_json_optional(j, "textDocumentSync", o.textDocumentSync);
  to_json_optional(j, "completionProvider", o.completionProvider);
  to_json_optional(j, "hoverProvider", o.hoverProvider);
  to_json_optional(j, "documentSymbolProvider", o.documentSymbolProvider);
  to_json_optional(j, "semanticTokensProvider", o.semanticTokensProvider);
  to_json_optional(j, "workspace", o.workspace);
}

void from_json(const nlohmann::json& j, ServerCapabilities& o) {
  from_json_optional(j, "positionEncoding", o.positionEncoding);
  from_json_optional(j, "textDocumentSync", o.textDocumentSync);
  from_json_optional(j, "completionProvider", o.completionProvider);
  from_json_optional(j, "hoverProvider", o.hoverProvider);
  from_json_optional(j, "documentSymbolProvider", o.documentSymbolProvider);
  from_json_optional(j, "semanticTokensProvider", o.semanticTokensProvider);
  from_json_optional(j, "workspace", o.workspace);
}

}  // namespace lsp
