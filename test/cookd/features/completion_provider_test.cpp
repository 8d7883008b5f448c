#include "cookd/features/completion_provider.hpp"

#include <algorithm>
#include <memory>
#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/document_fixture.hpp"
#include "cookd/core/alias_table.hpp"

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::AliasTable;
using cookd::CompletionProvider;
using cookd::CompletionSources;
using cookd::test::MakeDocument;

namespace {

// Completion at the end of the last line of `text`.
auto CompleteAtEnd(const std::string& text, const CompletionSources& sources)
    -> lsp::CompletionList {
  auto document = MakeDocument(text);
  auto last = document->index.LineCount() - 1;
  auto column = document->index.Utf16Length(
      document->index.LineStart(last), text.size());
  return CompletionProvider::ResolveCompletion(
      *document, lsp::Position{.line = last, .character = column}, sources);
}

auto FindLabel(const lsp::CompletionList& list, std::string_view label)
    -> const lsp::CompletionItem* {
  auto it = std::ranges::find_if(
      list.items, [label](const auto& item) { return item.label == label; });
  return it == list.items.end() ? nullptr : &*it;
}

auto CountLabel(const lsp::CompletionList& list, std::string_view label)
    -> std::ptrdiff_t {
  return std::ranges::count_if(
      list.items, [label](const auto& item) { return item.label == label; });
}

}  // namespace

TEST_CASE(
    "CompletionProvider offers recipe ingredients first", "[completion]") {
  auto list = CompleteAtEnd("Chop @onion{1}.\nAdd @on", {});

  REQUIRE_FALSE(list.items.empty());
  CHECK_FALSE(list.isIncomplete);
  const auto& first = list.items.front();
  CHECK(first.label == "onion");
  CHECK(first.kind == lsp::CompletionItemKind::kVariable);
  CHECK(first.detail == "Ingredient (from recipe)");
  CHECK(first.insertText == "onion{}");
  CHECK(first.sortText == "0000");

  // The built-in "onion" is the same label and is dropped
  CHECK(CountLabel(list, "onion") == 1);
  // The name being typed is not offered back
  CHECK(FindLabel(list, "on") == nullptr);
}

TEST_CASE(
    "CompletionProvider filters by prefix ignoring case", "[completion]") {
  auto list = CompleteAtEnd("Add @GAR", {});

  REQUIRE(list.items.size() == 1);
  CHECK(list.items[0].label == "garlic");
  CHECK(list.items[0].detail == "Common ingredient");
}

TEST_CASE("CompletionProvider offers workspace ingredients", "[completion]") {
  auto other = MakeDocument(
      "Crush @garlic{2%cloves} and @ginger.", "file:///workspace/other.cook");
  CompletionSources sources{.workspace = {other}};

  auto list = CompleteAtEnd("Add @g", sources);

  REQUIRE(list.items.size() >= 2);
  CHECK(list.items[0].label == "garlic");
  CHECK(list.items[0].detail == "Ingredient (from workspace)");
  CHECK(list.items[1].label == "ginger");
  CHECK(CountLabel(list, "garlic") == 1);
}

TEST_CASE("CompletionProvider skips the requesting buffer", "[completion]") {
  auto self = MakeDocument("Add @basil{1} and @ba");
  CompletionSources sources{.workspace = {self}};

  auto list = CompletionProvider::ResolveCompletion(
      *self, lsp::Position{.line = 0, .character = 21}, sources);

  REQUIRE_FALSE(list.items.empty());
  CHECK(list.items[0].label == "basil");
  CHECK(list.items[0].detail == "Ingredient (from recipe)");
  CHECK(CountLabel(list, "basil") == 1);
}

TEST_CASE("CompletionProvider offers aliases", "[completion]") {
  auto aliases = std::make_shared<const AliasTable>(
      AliasTable::Parse("[produce]\nonions|yellow onion\n"));
  CompletionSources sources{.aliases = aliases};

  SECTION("Canonical name") {
    auto list = CompleteAtEnd("Add @on", sources);
    const auto* item = FindLabel(list, "onions");
    REQUIRE(item != nullptr);
    CHECK(item->detail == "produce");
    REQUIRE(item->documentation.has_value());
    CHECK(item->documentation->value == "From aisle.conf - produce");
    // Alias entries come before the built-in list
    CHECK(list.items.front().label == "onions");
    CHECK(FindLabel(list, "yellow onion") == nullptr);
  }

  SECTION("Alias") {
    auto list = CompleteAtEnd("Add @yel", sources);
    REQUIRE(list.items.size() == 1);
    CHECK(list.items[0].label == "yellow onion");
    CHECK(list.items[0].detail == "produce (alias for onions)");
  }
}

TEST_CASE(
    "CompletionProvider ranks recipe names above aliases", "[completion]") {
  auto aliases = std::make_shared<const AliasTable>(
      AliasTable::Parse("[produce]\nonions|yellow onion\n"));
  CompletionSources sources{.aliases = aliases};

  auto list = CompleteAtEnd("Chop @onion paste.\nAdd @on", sources);

  REQUIRE(list.items.size() >= 2);
  CHECK(list.items[0].label == "onion");
  CHECK(list.items[0].detail == "Ingredient (from recipe)");
  CHECK(list.items[1].label == "onions");
  CHECK(list.items[1].detail == "produce");

  for (const auto& item : list.items) {
    INFO(item.label);
    CHECK(CountLabel(list, item.label) == 1);
  }
}

TEST_CASE("CompletionProvider can drop built-in names", "[completion]") {
  CompletionSources sources{.builtin_vocabulary = false};

  CHECK(CompleteAtEnd("Add @gar", sources).items.empty());
  CHECK(CompleteAtEnd("Use a #p", sources).items.empty());
  CHECK(CompleteAtEnd("@flour{200%k", sources).items.empty());
}

TEST_CASE("CompletionProvider offers cookware", "[completion]") {
  auto list = CompleteAtEnd("Heat a #skillet{}.\nUse the #s", {});

  REQUIRE_FALSE(list.items.empty());
  CHECK(list.items[0].label == "skillet");
  CHECK(list.items[0].kind == lsp::CompletionItemKind::kClass);
  CHECK(list.items[0].detail == "Cookware (from recipe)");
  CHECK(CountLabel(list, "skillet") == 1);

  const auto* saucepan = FindLabel(list, "saucepan");
  REQUIRE(saucepan != nullptr);
  CHECK(saucepan->detail == "Common cookware");
}

TEST_CASE("CompletionProvider offers timers and a duration", "[completion]") {
  auto list = CompleteAtEnd("Let it ~rise{1%hour}.\nThen ~ri", {});

  REQUIRE(list.items.size() == 2);
  CHECK(list.items[0].label == "rise");
  CHECK(list.items[0].kind == lsp::CompletionItemKind::kFunction);
  CHECK(list.items[0].detail == "Timer (from recipe)");

  const auto& snippet = list.items[1];
  CHECK(snippet.label == "duration");
  CHECK(snippet.kind == lsp::CompletionItemKind::kSnippet);
  CHECK(snippet.filterText == "ri");
  CHECK(snippet.insertText == "ri{${1:amount}%${2:minutes}}");
  CHECK(snippet.insertTextFormat == lsp::InsertTextFormat::kSnippet);
}

TEST_CASE("CompletionProvider offers quantity snippets", "[completion]") {
  auto list = CompleteAtEnd("Add @flour{", {});

  REQUIRE(list.items.size() == 2);
  CHECK(list.items[0].label == "quantity with unit");
  CHECK(list.items[0].insertText == "${1:amount}%${2:unit}");
  CHECK(list.items[1].label == "quantity only");
  CHECK(list.items[1].insertText == "${1:amount}");
}

TEST_CASE("CompletionProvider ranks units by context", "[completion]") {
  SECTION("Ingredient units come first") {
    auto list = CompleteAtEnd("@flour{200%m", {});
    REQUIRE(list.items.size() >= 3);
    CHECK(list.items[0].label == "mg");
    CHECK(list.items[0].detail == "milligrams");
    CHECK(list.items[1].label == "ml");
    const auto* min = FindLabel(list, "min");
    REQUIRE(min != nullptr);
    CHECK(min->detail == "minutes (time)");
  }

  SECTION("Timer units come first") {
    auto list = CompleteAtEnd("~{10%m", {});
    REQUIRE_FALSE(list.items.empty());
    CHECK(list.items[0].label == "min");
    CHECK(list.items[0].detail == "minutes");
    REQUIRE(list.items[0].documentation.has_value());
    CHECK(list.items[0].documentation->value == "Time unit: minutes");
    CHECK(FindLabel(list, "mg") != nullptr);
  }
}

TEST_CASE("CompletionProvider is silent outside elements", "[completion]") {
  CHECK(CompleteAtEnd("Just some text", {}).items.empty());
  CHECK(CompleteAtEnd("Add @salt{1%tsp}", {}).items.empty());
  CHECK(CompleteAtEnd("", {}).items.empty());
}

TEST_CASE(
    "CompletionProvider keeps insertion order in sortText", "[completion]") {
  auto list = CompleteAtEnd("Add @", {});

  REQUIRE(list.items.size() > 10);
  for (std::size_t i = 1; i < list.items.size(); ++i) {
    CHECK(*list.items[i - 1].sortText < *list.items[i].sortText);
  }
}

TEST_CASE("CompletionProvider works without a parsed recipe", "[completion]") {
  auto list = CompleteAtEnd("\xFF bad bytes then @sal", {});

  REQUIRE_FALSE(list.items.empty());
  CHECK(list.items[0].label == "salt");
  CHECK(list.items[0].detail == "Common ingredient");
}
