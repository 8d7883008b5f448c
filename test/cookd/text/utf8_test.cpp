#include "cookd/text/utf8.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::debug);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using cookd::text::DecodeLength;
using cookd::text::FirstInvalidByte;
using cookd::text::SnapToCodePointStart;
using cookd::text::Utf16Width;

TEST_CASE("DecodeLength reports sequence sizes", "[utf8]") {
  const std::string text = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";

  CHECK(DecodeLength(text, 0) == 1);
  CHECK(DecodeLength(text, 1) == 2);
  CHECK(DecodeLength(text, 3) == 3);
  CHECK(DecodeLength(text, 6) == 4);
  CHECK(DecodeLength(text, text.size()) == 0);
}

TEST_CASE("DecodeLength treats malformed bytes as single units", "[utf8]") {
  SECTION("Truncated sequence") {
    const std::string text = "\xC3";
    CHECK(DecodeLength(text, 0) == 1);
  }

  SECTION("Overlong three byte encoding") {
    const std::string text = "\xE0\x80\x80";
    CHECK(DecodeLength(text, 0) == 1);
  }

  SECTION("Encoded surrogate") {
    const std::string text = "\xED\xA0\x80";
    CHECK(DecodeLength(text, 0) == 1);
  }

  SECTION("Lead byte followed by ASCII") {
    const std::string text = "\xE2x\x82";
    CHECK(DecodeLength(text, 0) == 1);
  }
}

TEST_CASE("Utf16Width counts astral code points twice", "[utf8]") {
  const std::string text = "\xC3\xA9\xF0\x9F\x98\x80";

  CHECK(Utf16Width(text, 0) == 1);
  CHECK(Utf16Width(text, 2) == 2);
}

TEST_CASE("SnapToCodePointStart moves back to the lead byte", "[utf8]") {
  const std::string text = "a\xF0\x9F\x98\x80z";

  CHECK(SnapToCodePointStart(text, 0) == 0);
  CHECK(SnapToCodePointStart(text, 2) == 1);
  CHECK(SnapToCodePointStart(text, 4) == 1);
  CHECK(SnapToCodePointStart(text, 5) == 5);
  CHECK(SnapToCodePointStart(text, 100) == text.size());
}

TEST_CASE("SnapToCodePointStart keeps stray continuation bytes", "[utf8]") {
  const std::string text = "a\x80\x80";

  CHECK(SnapToCodePointStart(text, 1) == 1);
  CHECK(SnapToCodePointStart(text, 2) == 2);
}

TEST_CASE("FirstInvalidByte locates malformed input", "[utf8]") {
  CHECK(FirstInvalidByte("") == 0);
  CHECK(FirstInvalidByte("plain ascii") == 11);
  CHECK(FirstInvalidByte("jalape\xC3\xB1o") == 8);
  CHECK(FirstInvalidByte("bad \xFF byte") == 4);
  CHECK(FirstInvalidByte("cut \xE2\x82") == 4);
}
