#include "cookd/scan/element_locator.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::scan::ElementKind;
using cookd::scan::FindElementAt;

TEST_CASE("FindElementAt locates inline elements", "[locator]") {
  const std::string text = "Add @flour{200%g} to #bowl{}.";

  auto ingredient = FindElementAt(text, 6);
  REQUIRE(ingredient.has_value());
  CHECK(ingredient->kind == ElementKind::kIngredient);
  CHECK(ingredient->start == 4);
  CHECK(ingredient->end == 17);
  CHECK(ingredient->name == "flour");
  CHECK(ingredient->text == "@flour{200%g}");

  auto cookware = FindElementAt(text, 23);
  REQUIRE(cookware.has_value());
  CHECK(cookware->kind == ElementKind::kCookware);
  CHECK(cookware->name == "bowl");
  CHECK(cookware->end == 28);

  CHECK_FALSE(FindElementAt(text, 18).has_value());
  CHECK_FALSE(FindElementAt(text, 0).has_value());
}

TEST_CASE("FindElementAt covers the marker and the group", "[locator]") {
  const std::string text = "@salt{1%tsp}";

  CHECK(FindElementAt(text, 0).has_value());
  CHECK(FindElementAt(text, 11).has_value());
  CHECK_FALSE(FindElementAt(text, 12).has_value());
}

TEST_CASE("FindElementAt reads multi-word names and notes", "[locator]") {
  auto multi = FindElementAt("@red onion{1}", 3);
  REQUIRE(multi.has_value());
  CHECK(multi->name == "red onion");
  CHECK(multi->end == 13);

  auto noted = FindElementAt("@onion{1}(diced) now", 12);
  REQUIRE(noted.has_value());
  CHECK(noted->kind == ElementKind::kIngredient);
  CHECK(noted->end == 16);
}

TEST_CASE("FindElementAt ends single-word names at a blank", "[locator]") {
  const std::string text = "@salt to taste";

  auto element = FindElementAt(text, 2);
  REQUIRE(element.has_value());
  CHECK(element->name == "salt");
  CHECK(element->end == 5);
  CHECK_FALSE(FindElementAt(text, 8).has_value());
}

TEST_CASE("FindElementAt reports anonymous timers", "[locator]") {
  auto timer = FindElementAt("Wait ~{10%minutes}.", 8);

  REQUIRE(timer.has_value());
  CHECK(timer->kind == ElementKind::kTimer);
  CHECK(timer->name.empty());
  CHECK(timer->start == 5);
}

TEST_CASE("FindElementAt classifies whole-line forms", "[locator]") {
  SECTION("Comment line") {
    auto element = FindElementAt("-- a @note", 6);
    REQUIRE(element.has_value());
    CHECK(element->kind == ElementKind::kComment);
    CHECK(element->name.empty());
  }

  SECTION("Metadata line") {
    auto element = FindElementAt(">> servings: 4", 5);
    REQUIRE(element.has_value());
    CHECK(element->kind == ElementKind::kMetadata);
    CHECK(element->name == "servings");
  }

  SECTION("Section line") {
    auto element = FindElementAt("Intro\n== Dough ==\nKnead.", 9);
    REQUIRE(element.has_value());
    CHECK(element->kind == ElementKind::kSection);
    CHECK(element->name == "Dough");
    CHECK(element->start == 6);
    CHECK(element->end == 17);
  }
}

TEST_CASE("FindElementAt finds trailing comments", "[locator]") {
  const std::string text = "@salt -- season well";

  auto comment = FindElementAt(text, 9);
  REQUIRE(comment.has_value());
  CHECK(comment->kind == ElementKind::kComment);
  CHECK(comment->start == 6);
  CHECK(comment->end == text.size());
}

TEST_CASE("FindElementAt ignores escaped markers", "[locator]") {
  CHECK_FALSE(FindElementAt("\\@flour", 3).has_value());
}

TEST_CASE("FindElementAt rejects offsets off the content", "[locator]") {
  const std::string text = "@salt\nnext";

  CHECK_FALSE(FindElementAt(text, 5).has_value());
  CHECK_FALSE(FindElementAt(text, 100).has_value());
  CHECK_FALSE(FindElementAt("", 0).has_value());
}
