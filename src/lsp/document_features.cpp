#include "lsp/document_features.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Hover Request
void to_json(nlohmann::json& j, const HoverParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, HoverParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

void to_json(nlohmann::json& j, const Hover& h) {
  j = nlohmann::json{{"contents", h.contents}};
  to_json_optional(j, "range", h.range);
}

void from_json(const nlohmann::json& j, Hover& h) {
  from_json_required(j, "contents", h.contents);
  from_json_optional(j, "range", h.range);
}

void to_json(nlohmann::json& j, const HoverResult& r) {
  if (r.has_value()) {
    j = *r;
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, HoverResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<Hover>();
  }
}

// Document Symbols Request
void to_json(nlohmann::json& j, const DocumentSymbolParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
}

void from_json(const nlohmann::json& j, DocumentSymbolParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
}

void to_json(nlohmann::json& j, const DocumentSymbol& s) {
  to_json_required(j, "name", s.name);
  to_json_optional(j, "detail", s.detail);
  to_json_required(j, "kind", s.kind);
  to_json_required(j, "range", s.range);
  to_json_required(j, "selectionRange", s.selectionRange);
  to_json_optional(j, "children", s.children);
}

void from_json(const nlohmann::json& j, DocumentSymbol& s) {
  from_json_required(j, "name", s.name);
  from_json_optional(j, "detail", s.detail);
  from_json_required(j, "kind", s.kind);
  from_json_required(j, "range", s.range);
  from_json_required(j, "selectionRange", s.selectionRange);
  from_json_optional(j, "children", s.children);
}

void to_json(nlohmann::json& j, const DocumentSymbolResult& r) {
  if (r.has_value()) {
    j = *r;
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, DocumentSymbolResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<std::vector<DocumentSymbol>>();
  }
}

// Semantic Tokens
void to_json(nlohmann::json& j, const SemanticTokensLegend& l) {
  j = nlohmann::json{
      {"tokenTypes", l.tokenTypes}, {"tokenModifiers", l.tokenModifiers}};
}

void from_json(const nlohmann::json& j, SemanticTokensLegend& l) {
  from_json_required(j, "tokenTypes", l.tokenTypes);
  from_json_required(j, "tokenModifiers", l.tokenModifiers);
}

void to_json(nlohmann::json& j, const SemanticTokensParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
}

void from_json(const nlohmann::json& j, SemanticTokensParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
}

void to_json(nlohmann::json& j, const SemanticTokens& t) {
  j = nlohmann::json{{"data", t.data}};
  to_json_optional(j, "resultId", t.resultId);
}

void from_json(const nlohmann::json& j, SemanticTokens& t) {
  from_json_required(j, "data", t.data);
  from_json_optional(j, "resultId", t.resultId);
}

// Completion Request
void to_json(nlohmann::json& j, const CompletionTriggerKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionTriggerKind& k) {
  k = static_cast<CompletionTriggerKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionContext& c) {
  j = nlohmann::json{{"triggerKind", c.triggerKind}};
  to_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void from_json(const nlohmann::json& j, CompletionContext& c) {
  from_json_required(j, "triggerKind", c.triggerKind);
  from_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void to_json(nlohmann::json& j, const CompletionParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
  to_json_optional(j, "context", p.context);
}

void from_json(const nlohmann::json& j, CompletionParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_optional(j, "context", p.context);
}

void to_json(nlohmann::json& j, const InsertTextFormat& f) {
  j = static_cast<int>(f);
}

void from_json(const nlohmann::json& j, InsertTextFormat& f) {
  f = static_cast<InsertTextFormat>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionItemKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionItemKind& k) {
  k = static_cast<CompletionItemKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionItem& c) {
  j = nlohmann::json{{"label", c.label}};
  to_json_optional(j, "kind", c.kind);
  to_json_optional(j, "detail", c.detail);
  to_json_optional(j, "documentation", c.documentation);
  to_json_optional(j, "sortText", c.sortText);
  to_json_optional(j, "filterText", c.filterText);
  to_json_optional(j, "insertText", c.insertText);
  to_json_optional(j, "insertTextFormat", c.insertTextFormat);
}

void from_json(const nlohmann::json& j, CompletionItem& c) {
  from_json_required(j, "label", c.label);
  from_json_optional(j, "kind", c.kind);
  from_json_optional(j, "detail", c.detail);
  from_json_optional(j, "documentation", c.documentation);
  from_json_optional(j, "sortText", c.sortText);
  from_json_optional(j, "filterText", c.filterText);
  from_json_optional(j, "insertText", c.insertText);
  from_json_optional(j, "insertTextFormat", c.insertTextFormat);
}

void to_json(nlohmann::json& j, const CompletionList& l) {
  j = nlohmann::json{{"isIncomplete", l.isIncomplete}, {"items", l.items}};
}

void from_json(const nlohmann::json& j, CompletionList& l) {
  from_json_required(j, "isIncomplete", l.isIncomplete);
  from_json_required(j, "items", l.items);
}

}  // namespace lsp
