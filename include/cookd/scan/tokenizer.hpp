#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace cookd::scan {

// Order matches the semantic token legend advertised to the client; the
// numeric value is the legend index.
enum class TokenKind {
  kIngredient = 0,
  kCookware = 1,
  kTimer = 2,
  kQuantity = 3,
  kUnit = 4,
  kComment = 5,
  kMetadataKey = 6,
  kMetadataValue = 7,
  kSection = 8,
};

inline constexpr std::array<std::string_view, 9> kTokenLegend = {
    "variable", "class",   "function", "number",    "string",
    "comment",  "keyword", "property", "namespace",
};

struct TokenSpan {
  TokenKind kind{TokenKind::kComment};
  std::size_t start{};
  std::size_t end{};

  auto operator==(const TokenSpan&) const -> bool = default;
};

// Single left-to-right pass over the buffer. Spans are non-overlapping and in
// ascending order. Quantity, unit and metadata-value kinds are part of the
// legend but are not produced yet.
auto Tokenize(std::string_view text) -> std::vector<TokenSpan>;

}  // namespace cookd::scan
