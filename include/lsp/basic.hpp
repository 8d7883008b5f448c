#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsp {

// URI
using Uri = std::string;
using DocumentUri = std::string;

// Position
struct Position {
  int line{};
  int character{};
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

enum class PositionEncodingKind {
  kUtf8,
  kUtf16,
  kUtf32,
};

void to_json(nlohmann::json& j, const PositionEncodingKind& p);
void from_json(const nlohmann::json& j, PositionEncodingKind& p);

// Range
struct Range {
  Position start;
  Position end;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Text Document Item
struct TextDocumentItem {
  DocumentUri uri;
  std::string languageId;
  int version{};
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentItem& t);
void from_json(const nlohmann::json& j, TextDocumentItem& t);

// Text Document Identifier
struct TextDocumentIdentifier {
  DocumentUri uri;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

// Versioned Text Document Identifier
struct VersionedTextDocumentIdentifier : TextDocumentIdentifier {
  int version{};
};

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v);
void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v);

// Text Document Position Params
struct TextDocumentPositionParams {
  TextDocumentIdentifier textDocument;
  Position position;
};

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& t);

// Diagnostic
enum class DiagnosticSeverity {
  kError = 1,
  kWarning = 2,
  kInformation = 3,
  kHint = 4
};

void to_json(nlohmann::json& j, const DiagnosticSeverity& d);
void from_json(const nlohmann::json& j, DiagnosticSeverity& d);

struct Diagnostic {
  Range range;
  std::optional<DiagnosticSeverity> severity;
  std::optional<std::string> code;
  std::optional<std::string> source;
  std::string message;
  std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const Diagnostic& d);
void from_json(const nlohmann::json& j, Diagnostic& d);

// Markup Content
enum class MarkupKind { kPlainText, kMarkdown };

void to_json(nlohmann::json& j, const MarkupKind& m);
void from_json(const nlohmann::json& j, MarkupKind& m);

struct MarkupContent {
  MarkupKind kind;
  std::string value;
};

void to_json(nlohmann::json& j, const MarkupContent& m);
void from_json(const nlohmann::json& j, MarkupContent& m);

// Work Done Progress
using ProgressToken = std::string;

struct WorkDoneProgressParams {
  std::optional<ProgressToken> workDoneToken;
};

struct PartialResultParams {
  std::optional<ProgressToken> partialResultToken;
};

// Trace Value
enum class TraceValue { kOff, kMessages, kVerbose };

void to_json(nlohmann::json& j, const TraceValue& t);
void from_json(const nlohmann::json& j, TraceValue& t);

// Workspace Folder
struct WorkspaceFolder {
  DocumentUri uri;
  std::string name;
};

void to_json(nlohmann::json& j, const WorkspaceFolder& w);
void from_json(const nlohmann::json& j, WorkspaceFolder& w);

// Symbol Kind
enum class SymbolKind {
  kFile = 1,
  kModule = 2,
  kNamespace = 3,
  kPackage = 4,
  kClass = 5,
  kMethod = 6,
  kProperty = 7,
  kField = 8,
  kConstructor = 9,
  kEnum = 10,
  kInterface = 11,
  kFunction = 12,
  kVariable = 13,
  kConstant = 14,
  kString = 15,
  kNumber = 16,
  kBoolean = 17,
  kArray = 18,
  kObject = 19,
  kKey = 20,
  kNull = 21,
  kEnumMember = 22,
  kStruct = 23,
  kEvent = 24,
  kOperator = 25,
  kTypeParameter = 26
};

void to_json(nlohmann::json& j, const SymbolKind& k);
void from_json(const nlohmann::json& j, SymbolKind& k);

}  // namespace lsp
