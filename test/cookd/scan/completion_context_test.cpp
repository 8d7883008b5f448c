#include "cookd/scan/completion_context.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::scan::CompletionContextKind;
using cookd::scan::MarkerKind;
using cookd::scan::ScanCompletionContext;

namespace {

auto ScanAtEnd(const std::string& text) {
  return ScanCompletionContext(text, text.size());
}

}  // namespace

TEST_CASE("ScanCompletionContext detects ingredient names", "[context]") {
  auto context = ScanAtEnd("Add @garl");

  REQUIRE(context.has_value());
  CHECK(context->kind == CompletionContextKind::kIngredientName);
  CHECK(context->marker == MarkerKind::kIngredient);
  CHECK(context->prefix == "garl");
  CHECK(context->marker_offset == 4);
}

TEST_CASE("ScanCompletionContext detects cookware and timers", "[context]") {
  auto cookware = ScanAtEnd("Heat the #pa");
  REQUIRE(cookware.has_value());
  CHECK(cookware->kind == CompletionContextKind::kCookwareName);
  CHECK(cookware->prefix == "pa");

  auto timer = ScanAtEnd("Bake for ~ba");
  REQUIRE(timer.has_value());
  CHECK(timer->kind == CompletionContextKind::kTimerName);
  CHECK(timer->marker == MarkerKind::kTimer);
  CHECK(timer->prefix == "ba");
}

TEST_CASE("ScanCompletionContext handles a bare marker", "[context]") {
  auto context = ScanAtEnd("Add @");

  REQUIRE(context.has_value());
  CHECK(context->kind == CompletionContextKind::kIngredientName);
  CHECK(context->prefix.empty());
}

TEST_CASE("ScanCompletionContext detects quantities and units", "[context]") {
  SECTION("Quantity inside an open group") {
    auto context = ScanAtEnd("@flour{200");
    REQUIRE(context.has_value());
    CHECK(context->kind == CompletionContextKind::kQuantity);
    CHECK(context->prefix == "200");
  }

  SECTION("Empty group") {
    auto context = ScanAtEnd("@flour{");
    REQUIRE(context.has_value());
    CHECK(context->kind == CompletionContextKind::kQuantity);
    CHECK(context->prefix.empty());
  }

  SECTION("Unit after the percent sign") {
    auto context = ScanAtEnd("@flour{200%g");
    REQUIRE(context.has_value());
    CHECK(context->kind == CompletionContextKind::kUnit);
    CHECK(context->prefix == "g");
    CHECK(context->marker == MarkerKind::kIngredient);
  }

  SECTION("Timer unit") {
    auto context = ScanAtEnd("~{10%mi");
    REQUIRE(context.has_value());
    CHECK(context->kind == CompletionContextKind::kUnit);
    CHECK(context->marker == MarkerKind::kTimer);
    CHECK(context->prefix == "mi");
  }

  SECTION("Multi-word name") {
    auto context = ScanAtEnd("@red onion{2%");
    REQUIRE(context.has_value());
    CHECK(context->kind == CompletionContextKind::kUnit);
    CHECK(context->prefix.empty());
    CHECK(context->marker_offset == 0);
  }
}

TEST_CASE("ScanCompletionContext stops at closed elements", "[context]") {
  CHECK_FALSE(ScanAtEnd("@flour{200}").has_value());
  CHECK_FALSE(ScanAtEnd("@flour{200%g} and more").has_value());
}

TEST_CASE("ScanCompletionContext stays on the cursor line", "[context]") {
  CHECK_FALSE(ScanAtEnd("Add @\nsecond line").has_value());
  CHECK_FALSE(ScanAtEnd("Add @salt\r\n").has_value());
  CHECK_FALSE(ScanAtEnd("no markers here").has_value());
}

TEST_CASE("ScanCompletionContext skips escaped markers", "[context]") {
  CHECK_FALSE(ScanAtEnd("email me \\@garl").has_value());

  auto context = ScanAtEnd("\\\\@garl");
  REQUIRE(context.has_value());
  CHECK(context->prefix == "garl");
}

TEST_CASE("ScanCompletionContext keeps nested markers as text", "[context]") {
  auto context = ScanAtEnd("@salt{a #pin");

  REQUIRE(context.has_value());
  CHECK(context->marker == MarkerKind::kIngredient);
  CHECK(context->kind == CompletionContextKind::kQuantity);
  CHECK(context->marker_offset == 0);
}

TEST_CASE("ScanCompletionContext looks back a bounded distance", "[context]") {
  std::string near = "@" + std::string(100, 'a');
  CHECK(ScanAtEnd(near).has_value());

  std::string far = "@" + std::string(250, 'a');
  CHECK_FALSE(ScanAtEnd(far).has_value());
}

TEST_CASE("ScanCompletionContext clamps the cursor", "[context]") {
  const std::string text = "Add @sal";
  auto context = ScanCompletionContext(text, 1000);

  REQUIRE(context.has_value());
  CHECK(context->prefix == "sal");
  CHECK_FALSE(ScanCompletionContext("", 0).has_value());
}
