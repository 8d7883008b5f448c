#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Hover Request
struct HoverParams : TextDocumentPositionParams, WorkDoneProgressParams {};

void to_json(nlohmann::json& j, const HoverParams& p);
void from_json(const nlohmann::json& j, HoverParams& p);

struct Hover {
  MarkupContent contents{.kind = MarkupKind::kMarkdown, .value = {}};
  std::optional<Range> range;
};

void to_json(nlohmann::json& j, const Hover& h);
void from_json(const nlohmann::json& j, Hover& h);

using HoverResult = std::optional<Hover>;

void to_json(nlohmann::json& j, const HoverResult& r);
void from_json(const nlohmann::json& j, HoverResult& r);

// Document Symbols Request
struct DocumentSymbolParams : WorkDoneProgressParams, PartialResultParams {
  TextDocumentIdentifier textDocument;
};

void to_json(nlohmann::json& j, const DocumentSymbolParams& p);
void from_json(const nlohmann::json& j, DocumentSymbolParams& p);

struct DocumentSymbol {
  std::string name;
  std::optional<std::string> detail;
  SymbolKind kind{SymbolKind::kVariable};
  Range range;
  Range selectionRange;
  std::optional<std::vector<DocumentSymbol>> children;
};

void to_json(nlohmann::json& j, const DocumentSymbol& s);
void from_json(const nlohmann::json& j, DocumentSymbol& s);

using DocumentSymbolResult = std::optional<std::vector<DocumentSymbol>>;

void to_json(nlohmann::json& j, const DocumentSymbolResult& r);
void from_json(const nlohmann::json& j, DocumentSymbolResult& r);

// Semantic Tokens
struct SemanticTokensLegend {
  std::vector<std::string> tokenTypes;
  std::vector<std::string> tokenModifiers;
};

void to_json(nlohmann::json& j, const SemanticTokensLegend& l);
void from_json(const nlohmann::json& j, SemanticTokensLegend& l);

struct SemanticTokensParams : WorkDoneProgressParams, PartialResultParams {
  TextDocumentIdentifier textDocument;
};

void to_json(nlohmann::json& j, const SemanticTokensParams& p);
void from_json(const nlohmann::json& j, SemanticTokensParams& p);

struct SemanticTokens {
  std::optional<std::string> resultId;
  std::vector<int> data;
};

void to_json(nlohmann::json& j, const SemanticTokens& t);
void from_json(const nlohmann::json& j, SemanticTokens& t);

using SemanticTokensResult = SemanticTokens;

// Completion Request
enum class CompletionTriggerKind {
  kInvoked = 1,
  kTriggerCharacter = 2,
  kTriggerForIncompleteCompletions = 3
};

void to_json(nlohmann::json& j, const CompletionTriggerKind& k);
void from_json(const nlohmann::json& j, CompletionTriggerKind& k);

struct CompletionContext {
  CompletionTriggerKind triggerKind{CompletionTriggerKind::kInvoked};
  std::optional<std::string> triggerCharacter;
};

void to_json(nlohmann::json& j, const CompletionContext& c);
void from_json(const nlohmann::json& j, CompletionContext& c);

struct CompletionParams : TextDocumentPositionParams,
                          WorkDoneProgressParams,
                          PartialResultParams {
  std::optional<CompletionContext> context;
};

void to_json(nlohmann::json& j, const CompletionParams& p);
void from_json(const nlohmann::json& j, CompletionParams& p);

enum class InsertTextFormat { kPlainText = 1, kSnippet = 2 };

void to_json(nlohmann::json& j, const InsertTextFormat& f);
void from_json(const nlohmann::json& j, InsertTextFormat& f);

enum class CompletionItemKind {
  kText = 1,
  kMethod = 2,
  kFunction = 3,
  kConstructor = 4,
  kField = 5,
  kVariable = 6,
  kClass = 7,
  kInterface = 8,
  kModule = 9,
  kProperty = 10,
  kUnit = 11,
  kValue = 12,
  kEnum = 13,
  kKeyword = 14,
  kSnippet = 15,
  kColor = 16,
  kFile = 17,
  kReference = 18,
  kFolder = 19,
  kEnumMember = 20,
  kConstant = 21,
  kStruct = 22,
  kEvent = 23,
  kOperator = 24,
  kTypeParameter = 25,
};

void to_json(nlohmann::json& j, const CompletionItemKind& k);
void from_json(const nlohmann::json& j, CompletionItemKind& k);

struct CompletionItem {
  std::string label;
  std::optional<CompletionItemKind> kind;
  std::optional<std::string> detail;
  std::optional<MarkupContent> documentation;
  std::optional<std::string> sortText;
  std::optional<std::string> filterText;
  std::optional<std::string> insertText;
  std::optional<InsertTextFormat> insertTextFormat;
};

void to_json(nlohmann::json& j, const CompletionItem& c);
void from_json(const nlohmann::json& j, CompletionItem& c);

struct CompletionList {
  bool isIncomplete{false};
  std::vector<CompletionItem> items;
};

void to_json(nlohmann::json& j, const CompletionList& l);
void from_json(const nlohmann::json& j, CompletionList& l);

using CompletionResult = CompletionList;

}  // namespace lsp
