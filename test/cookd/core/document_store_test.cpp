#include "cookd/core/document_store.hpp"

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cookd/recipe/cooklang_parser.hpp"

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::DocumentStore;

namespace {

constexpr auto kUri = "file:///recipes/soup.cook";

auto MakeStore() -> DocumentStore {
  return DocumentStore(std::make_shared<cookd::recipe::CooklangParser>());
}

}  // namespace

TEST_CASE("DocumentStore opens and parses a buffer", "[store]") {
  auto store = MakeStore();

  auto state = store.Open(kUri, 1, "Boil @water{1%l}.");

  REQUIRE(state != nullptr);
  CHECK(state->uri == kUri);
  CHECK(state->version == 1);
  CHECK(state->Content() == "Boil @water{1%l}.");
  REQUIRE(state->parse.HasRecipe());
  CHECK(state->parse.recipe->ingredients.size() == 1);
  CHECK(store.Contains(kUri));
  CHECK(store.Size() == 1);
  CHECK(store.Get(kUri) == state);
}

TEST_CASE("DocumentStore reopening replaces the buffer", "[store]") {
  auto store = MakeStore();
  store.Open(kUri, 5, "old");

  auto state = store.Open(kUri, 1, "new");

  CHECK(store.Size() == 1);
  CHECK(store.Get(kUri)->Content() == "new");
  CHECK(state->version == 1);
}

TEST_CASE("DocumentStore applies newer versions", "[store]") {
  auto store = MakeStore();
  auto original = store.Open(kUri, 1, "Add @salt.");

  auto updated = store.Update(kUri, 2, "Add @pepper.");

  REQUIRE(updated != nullptr);
  CHECK(updated->version == 2);
  CHECK(store.Get(kUri)->Content() == "Add @pepper.");
  // Earlier snapshots are untouched
  CHECK(original->Content() == "Add @salt.");
  CHECK(original->parse.recipe->ingredients[0].name == "salt");
}

TEST_CASE("DocumentStore ignores stale and unopened updates", "[store]") {
  auto store = MakeStore();
  store.Open(kUri, 3, "current");

  SECTION("Older version") {
    CHECK(store.Update(kUri, 2, "stale") == nullptr);
    CHECK(store.Get(kUri)->Content() == "current");
    CHECK(store.Get(kUri)->version == 3);
  }

  SECTION("Same version is accepted") {
    CHECK(store.Update(kUri, 3, "resent") != nullptr);
    CHECK(store.Get(kUri)->Content() == "resent");
  }

  SECTION("Unopened URI") {
    CHECK(store.Update("file:///other.cook", 9, "text") == nullptr);
    CHECK_FALSE(store.Contains("file:///other.cook"));
    CHECK(store.Size() == 1);
  }
}

TEST_CASE("DocumentStore closes buffers", "[store]") {
  auto store = MakeStore();
  store.Open(kUri, 1, "text");

  CHECK(store.Close(kUri));
  CHECK_FALSE(store.Contains(kUri));
  CHECK(store.Get(kUri) == nullptr);
  CHECK_FALSE(store.Close(kUri));
  CHECK(store.Update(kUri, 2, "after close") == nullptr);
}

TEST_CASE("DocumentStore lists every open buffer", "[store]") {
  auto store = MakeStore();
  for (int i = 0; i < 40; ++i) {
    store.Open(fmt::format("file:///recipes/r{}.cook", i), 1, "Stir.");
  }

  CHECK(store.Size() == 40);
  CHECK(store.Snapshot().size() == 40);

  auto uris = store.Uris();
  std::ranges::sort(uris);
  CHECK(std::ranges::adjacent_find(uris) == uris.end());
  CHECK(uris.size() == 40);
}

TEST_CASE("DocumentStore readers see whole snapshots", "[store][concurrency]") {
  auto store = MakeStore();
  constexpr int kUpdates = 300;
  constexpr int kReaders = 4;
  store.Open(kUri, 0, "version 0");

  std::atomic<bool> done{false};
  std::atomic<int> mismatches{0};
  std::atomic<int> regressions{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < kReaders; ++r) {
    readers.emplace_back([&]() {
      int last_seen = 0;
      while (!done.load()) {
        auto state = store.Get(kUri);
        if (!state) {
          ++mismatches;
          continue;
        }
        if (state->Content() != fmt::format("version {}", state->version)) {
          ++mismatches;
        }
        if (state->version < last_seen) {
          ++regressions;
        }
        last_seen = state->version;
      }
    });
  }

  // A second buffer in flight exercises the other shards
  std::thread other_writer([&store]() {
    for (int i = 0; i < kUpdates; ++i) {
      auto uri = fmt::format("file:///recipes/side{}.cook", i % 8);
      store.Open(uri, i, "Add @salt.");
      store.Close(uri);
    }
  });

  for (int version = 1; version <= kUpdates; ++version) {
    store.Update(kUri, version, fmt::format("version {}", version));
  }
  done = true;

  other_writer.join();
  for (auto& reader : readers) {
    reader.join();
  }

  CHECK(mismatches.load() == 0);
  CHECK(regressions.load() == 0);
  CHECK(store.Get(kUri)->version == kUpdates);
}
