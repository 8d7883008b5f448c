#include "cookd/core/document_store.hpp"

#include <functional>
#include <mutex>

namespace cookd {

DocumentStore::DocumentStore(
    std::shared_ptr<const recipe::RecipeParser> parser,
    std::shared_ptr<spdlog::logger> logger)
    : parser_(std::move(parser)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto DocumentStore::Build(std::string uri, int version, std::string content)
    const -> std::shared_ptr<const DocumentState> {
  text::PositionIndex index(std::move(content));
  auto parse = parser_->Parse(index.Text());
  return std::make_shared<const DocumentState>(DocumentState{
      .uri = std::move(uri),
      .version = version,
      .index = std::move(index),
      .parse = std::move(parse)});
}

auto DocumentStore::Open(std::string uri, int version, std::string content)
    -> std::shared_ptr<const DocumentState> {
  auto state = Build(uri, version, std::move(content));

  auto& shard = ShardFor(uri);
  {
    std::unique_lock lock(shard.mutex);
    shard.documents.insert_or_assign(std::move(uri), state);
  }
  logger_->debug(
      "DocumentStore opened {} (version {}, {} errors, {} warnings)",
      state->uri, version, state->parse.errors.size(),
      state->parse.warnings.size());
  return state;
}

auto DocumentStore::Update(std::string uri, int version, std::string content)
    -> std::shared_ptr<const DocumentState> {
  auto& shard = ShardFor(uri);
  {
    std::shared_lock lock(shard.mutex);
    auto it = shard.documents.find(uri);
    if (it == shard.documents.end()) {
      logger_->warn("DocumentStore ignoring update for unopened {}", uri);
      return nullptr;
    }
    if (version < it->second->version) {
      logger_->debug(
          "DocumentStore ignoring stale update for {} (version {} < {})", uri,
          version, it->second->version);
      return nullptr;
    }
  }

  auto state = Build(uri, version, std::move(content));

  std::unique_lock lock(shard.mutex);
  // The buffer may have been closed or moved on while parsing.
  auto it = shard.documents.find(uri);
  if (it == shard.documents.end()) {
    logger_->debug("DocumentStore dropping update for closed {}", uri);
    return nullptr;
  }
  if (version < it->second->version) {
    logger_->debug("DocumentStore dropping superseded update for {}", uri);
    return nullptr;
  }
  it->second = state;
  return state;
}

auto DocumentStore::Close(const std::string& uri) -> bool {
  auto& shard = ShardFor(uri);
  std::unique_lock lock(shard.mutex);
  auto erased = shard.documents.erase(uri) > 0;
  if (!erased) {
    logger_->debug("DocumentStore close for unopened {}", uri);
  }
  return erased;
}

auto DocumentStore::Get(const std::string& uri) const
    -> std::shared_ptr<const DocumentState> {
  const auto& shard = ShardFor(uri);
  std::shared_lock lock(shard.mutex);
  auto it = shard.documents.find(uri);
  if (it == shard.documents.end()) {
    return nullptr;
  }
  return it->second;
}

auto DocumentStore::Contains(const std::string& uri) const -> bool {
  const auto& shard = ShardFor(uri);
  std::shared_lock lock(shard.mutex);
  return shard.documents.contains(uri);
}

auto DocumentStore::Size() const -> std::size_t {
  std::size_t size = 0;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    size += shard.documents.size();
  }
  return size;
}

auto DocumentStore::Snapshot() const
    -> std::vector<std::shared_ptr<const DocumentState>> {
  std::vector<std::shared_ptr<const DocumentState>> states;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    for (const auto& [uri, state] : shard.documents) {
      states.push_back(state);
    }
  }
  return states;
}

auto DocumentStore::Uris() const -> std::vector<std::string> {
  std::vector<std::string> uris;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    for (const auto& [uri, state] : shard.documents) {
      uris.push_back(uri);
    }
  }
  return uris;
}

auto DocumentStore::ShardFor(const std::string& uri) -> Shard& {
  return shards_[std::hash<std::string>{}(uri) % kShardCount];
}

auto DocumentStore::ShardFor(const std::string& uri) const -> const Shard& {
  return shards_[std::hash<std::string>{}(uri) % kShardCount];
}

}  // namespace cookd
