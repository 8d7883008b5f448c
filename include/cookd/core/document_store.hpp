#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "cookd/core/document_state.hpp"
#include "cookd/recipe/recipe_parser.hpp"

namespace cookd {

// Open buffers keyed by URI. URIs hash into a fixed set of shards, each with
// its own lock, so edits to one buffer never block readers of another.
// Parsing runs outside the locks; only the pointer swap is exclusive.
class DocumentStore {
 public:
  static constexpr std::size_t kShardCount = 16;

  explicit DocumentStore(
      std::shared_ptr<const recipe::RecipeParser> parser,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Inserts or replaces the buffer for `uri`.
  auto Open(std::string uri, int version, std::string content)
      -> std::shared_ptr<const DocumentState>;

  // Full replacement. Returns nullptr, leaving the store unchanged, when the
  // URI is not open or `version` is older than the stored one.
  auto Update(std::string uri, int version, std::string content)
      -> std::shared_ptr<const DocumentState>;

  // Returns false when the URI was not open.
  auto Close(const std::string& uri) -> bool;

  [[nodiscard]] auto Get(const std::string& uri) const
      -> std::shared_ptr<const DocumentState>;

  [[nodiscard]] auto Contains(const std::string& uri) const -> bool;

  [[nodiscard]] auto Size() const -> std::size_t;

  // Every open buffer, in no particular order.
  [[nodiscard]] auto Snapshot() const
      -> std::vector<std::shared_ptr<const DocumentState>>;

  [[nodiscard]] auto Uris() const -> std::vector<std::string>;

 private:
  struct Shard {
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<const DocumentState>>
        documents;
  };

  auto Build(std::string uri, int version, std::string content) const
      -> std::shared_ptr<const DocumentState>;

  auto ShardFor(const std::string& uri) -> Shard&;
  [[nodiscard]] auto ShardFor(const std::string& uri) const -> const Shard&;

  std::shared_ptr<const recipe::RecipeParser> parser_;
  std::shared_ptr<spdlog::logger> logger_;
  std::array<Shard, kShardCount> shards_;
};

}  // namespace cookd
