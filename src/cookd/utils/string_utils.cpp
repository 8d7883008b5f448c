#include "cookd/utils/string_utils.hpp"

#include <algorithm>

namespace cookd::utils {

namespace {

auto FoldAscii(char c) -> char {
  if (c >= 'A' && c <= 'Z') {
    return static_cast<char>(c - 'A' + 'a');
  }
  return c;
}

}  // namespace

auto ToLower(std::string_view text) -> std::string {
  std::string result(text);
  std::ranges::transform(result, result.begin(), FoldAscii);
  return result;
}

auto EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
  return lhs.size() == rhs.size() &&
         std::ranges::equal(lhs, rhs, [](char a, char b) {
           return FoldAscii(a) == FoldAscii(b);
         });
}

auto StartsWithIgnoreCase(std::string_view text, std::string_view prefix)
    -> bool {
  return text.size() >= prefix.size() &&
         EqualsIgnoreCase(text.substr(0, prefix.size()), prefix);
}

}  // namespace cookd::utils
