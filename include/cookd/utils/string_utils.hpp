#pragma once

#include <string>
#include <string_view>

namespace cookd::utils {

// ASCII case folding. Bytes outside ASCII compare as-is, which keeps UTF-8
// sequences intact.
auto ToLower(std::string_view text) -> std::string;

auto EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool;

auto StartsWithIgnoreCase(std::string_view text, std::string_view prefix)
    -> bool;

}  // namespace cookd::utils
