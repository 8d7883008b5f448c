#include "cookd/features/hover_provider.hpp"

#include <memory>
#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/document_fixture.hpp"

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::AliasTable;
using cookd::HoverProvider;
using cookd::test::MakeDocument;

namespace {

auto HoverAt(const std::string& text, int line, int character)
    -> lsp::HoverResult {
  auto document = MakeDocument(text);
  return HoverProvider::ResolveHover(
      *document, lsp::Position{.line = line, .character = character});
}

auto HoverText(const std::string& text, int line, int character)
    -> std::string {
  auto hover = HoverAt(text, line, character);
  REQUIRE(hover.has_value());
  CHECK(hover->contents.kind == lsp::MarkupKind::kMarkdown);
  return hover->contents.value;
}

}  // namespace

TEST_CASE("HoverProvider describes ingredients", "[hover]") {
  const std::string text = "Add @flour{200%g}(sifted).";

  auto hover = HoverAt(text, 0, 6);

  REQUIRE(hover.has_value());
  CHECK(hover->contents.value ==
        "**Ingredient:** flour\n\n**Quantity:** 200 g\n\n**Note:** sifted");
  REQUIRE(hover->range.has_value());
  CHECK(hover->range->start.line == 0);
  CHECK(hover->range->start.character == 4);
  CHECK(hover->range->end.character == 25);
}

TEST_CASE("HoverProvider uses the first mention's details", "[hover]") {
  const std::string text = "Add @salt{1%tsp}.\nTaste, add more @salt.";

  CHECK(
      HoverText(text, 1, 18) ==
      "**Ingredient:** salt\n\n**Quantity:** 1 tsp");
}

TEST_CASE("HoverProvider describes cookware", "[hover]") {
  CHECK(HoverText("Heat a #pan{}.", 0, 9) == "**Cookware:** pan");
  CHECK(
      HoverText("Use #ramekins{4}.", 0, 6) ==
      "**Cookware:** ramekins\n\n**Quantity:** 4");
}

TEST_CASE("HoverProvider describes timers", "[hover]") {
  SECTION("Anonymous timer") {
    CHECK(
        HoverText("Bake ~{10%minutes}.", 0, 7) ==
        "**Timer**\n\n**Duration:** 10 minutes");
  }

  SECTION("Named timer") {
    CHECK(
        HoverText("Let it ~rest{5%min}.", 0, 9) ==
        "**Timer:** rest\n\n**Duration:** 5 min");
  }

  SECTION("Second anonymous timer") {
    CHECK(
        HoverText("Bake ~{10%min}, cool ~{2%h}.", 0, 22) ==
        "**Timer**\n\n**Duration:** 2 h");
  }
}

TEST_CASE("HoverProvider describes whole-line forms", "[hover]") {
  CHECK(HoverText("== Dough ==\nKnead.", 0, 3) == "**Section:** Dough");
  CHECK(HoverText(">> servings: 4", 0, 4) == "**Metadata:** servings: 4");
  CHECK(HoverText("-- chill overnight", 0, 5) == "**Comment**");
  CHECK(HoverText("Stir. -- gently", 0, 8) == "**Comment**");
}

TEST_CASE("HoverProvider falls back to the raw text", "[hover]") {
  // Invalid UTF-8 leaves no recipe, the element is still recognised
  CHECK(HoverText("\xFF @saffron here", 0, 4) == "**Ingredient:** saffron");
  CHECK(HoverText("\xFF #wok", 0, 3) == "**Cookware:** wok");
  CHECK(HoverText("\xFF ~{5%min}", 0, 3) == "**Timer:** unnamed");
}

TEST_CASE("HoverProvider reports columns in UTF-16 units", "[hover]") {
  // The emoji takes two columns
  const std::string text = "\xF0\x9F\x8D\xB2 @jalape\xC3\xB1o{1}";

  auto hover = HoverAt(text, 0, 5);

  REQUIRE(hover.has_value());
  CHECK(hover->contents.value ==
        "**Ingredient:** jalape\xC3\xB1o\n\n**Quantity:** 1");
  CHECK(hover->range->start.character == 3);
  CHECK(hover->range->end.character == 15);
}

TEST_CASE("HoverProvider returns nothing off elements", "[hover]") {
  CHECK_FALSE(HoverAt("Just text here", 0, 3).has_value());
  CHECK_FALSE(HoverAt("Add @salt", 0, 1).has_value());
  CHECK_FALSE(HoverAt("Add @salt", 5, 0).has_value());
  CHECK_FALSE(HoverAt("", 0, 0).has_value());
}

TEST_CASE("HoverProvider shows the aisle of listed ingredients", "[hover]") {
  const auto aliases =
      AliasTable::Parse("[produce]\nonions|yellow onion\n");
  auto document = MakeDocument(
      "Dice @yellow onion{1} and @onions{2}.\nAdd @salt.");
  auto hover_at = [&](int line, int character) {
    auto hover = HoverProvider::ResolveHover(
        *document, lsp::Position{.line = line, .character = character},
        &aliases);
    REQUIRE(hover.has_value());
    return hover->contents.value;
  };

  CHECK(
      hover_at(0, 8) ==
      "**Ingredient:** yellow onion\n\n**Quantity:** 1\n\n"
      "**Aisle:** produce (alias for onions)");
  CHECK(
      hover_at(0, 29) ==
      "**Ingredient:** onions\n\n**Quantity:** 2\n\n**Aisle:** produce");
  CHECK(hover_at(1, 6) == "**Ingredient:** salt");
}
