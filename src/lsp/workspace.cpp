#include "lsp/workspace.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// DidChangeWatchedFiles Notification
void to_json(nlohmann::json& j, const FileChangeType& p) {
  j = static_cast<int>(p);
}

void from_json(const nlohmann::json& j, FileChangeType& p) {
  p = static_cast<FileChangeType>(j.get<int>());
}

void to_json(nlohmann::json& j, const FileEvent& p) {
  to_json_required(j, "uri", p.uri);
  to_json_required(j, "type", p.type);
}

void from_json(const nlohmann::json& j, FileEvent& p) {
  from_json_required(j, "uri", p.uri);
  from_json_required(j, "type", p.type);
}

void to_json(nlohmann::json& j, const DidChangeWatchedFilesParams& p) {
  to_json_required(j, "changes", p.changes);
}

void from_json(const nlohmann::json& j, DidChangeWatchedFilesParams& p) {
  from_json_required(j, "changes", p.changes);
}

// DidChangeWatchedFiles Registration Options
void to_json(nlohmann::json& j, const RelativePattern& p) {
  to_json_required(j, "baseUri", p.baseUri);
  to_json_required(j, "pattern", p.pattern);
}

void from_json(const nlohmann::json& j, RelativePattern& p) {
  from_json_required(j, "baseUri", p.baseUri);
  from_json_required(j, "pattern", p.pattern);
}

void to_json(nlohmann::json& j, const WatchKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, WatchKind& k) {
  k = static_cast<WatchKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const FileSystemWatcher& w) {
  std::visit([&j](const auto& arg) { j["globPattern"] = arg; }, w.globPattern);
  to_json_optional(j, "kind", w.kind);
}

void from_json(const nlohmann::json& j, FileSystemWatcher& w) {
  const auto& pattern = j.at("globPattern");
  if (pattern.is_string()) {
    w.globPattern = pattern.get<Pattern>();
  } else if (pattern.is_object()) {
    w.globPattern = pattern.get<RelativePattern>();
  } else {
    throw std::runtime_error("Invalid GlobPattern");
  }
  from_json_optional(j, "kind", w.kind);
}

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesRegistrationOptions& o) {
  to_json_required(j, "watchers", o.watchers);
}

void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesRegistrationOptions& o) {
  from_json_required(j, "watchers", o.watchers);
}

}  // namespace lsp
