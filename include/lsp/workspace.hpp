#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// DidChangeWatchedFiles Notification
enum class FileChangeType { kCreated = 1, kChanged = 2, kDeleted = 3 };

void to_json(nlohmann::json& j, const FileChangeType& p);
void from_json(const nlohmann::json& j, FileChangeType& p);

struct FileEvent {
  DocumentUri uri;
  FileChangeType type{FileChangeType::kChanged};
};

void to_json(nlohmann::json& j, const FileEvent& p);
void from_json(const nlohmann::json& j, FileEvent& p);

struct DidChangeWatchedFilesParams {
  std::vector<FileEvent> changes;
};

void to_json(nlohmann::json& j, const DidChangeWatchedFilesParams& p);
void from_json(const nlohmann::json& j, DidChangeWatchedFilesParams& p);

// DidChangeWatchedFiles Registration Options
using Pattern = std::string;

struct RelativePattern {
  WorkspaceFolder baseUri;
  Pattern pattern;
};

void to_json(nlohmann::json& j, const RelativePattern& p);
void from_json(const nlohmann::json& j, RelativePattern& p);

using GlobPattern = std::variant<Pattern, RelativePattern>;

enum class WatchKind {
  kCreate = 1,
  kChange = 2,
  kDelete = 4,
};

void to_json(nlohmann::json& j, const WatchKind& k);
void from_json(const nlohmann::json& j, WatchKind& k);

struct FileSystemWatcher {
  GlobPattern globPattern;
  std::optional<WatchKind> kind;
};

void to_json(nlohmann::json& j, const FileSystemWatcher& w);
void from_json(const nlohmann::json& j, FileSystemWatcher& w);

struct DidChangeWatchedFilesRegistrationOptions {
  std::vector<FileSystemWatcher> watchers;
};

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesRegistrationOptions& o);
void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesRegistrationOptions& o);

}  // namespace lsp
