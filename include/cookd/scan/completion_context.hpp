#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "cookd/scan/scan_primitives.hpp"

namespace cookd::scan {

// How far back from the cursor the context scan looks for a marker. A marker
// further away on a very long line is not found; this is an accepted
// approximation of the scan.
inline constexpr std::size_t kContextScanWindow = 200;

enum class CompletionContextKind {
  kIngredientName,
  kCookwareName,
  kTimerName,
  kQuantity,
  kUnit,
};

struct CompletionContext {
  CompletionContextKind kind{CompletionContextKind::kIngredientName};
  // Text typed so far for the part being completed.
  std::string prefix;
  MarkerKind marker{MarkerKind::kIngredient};
  std::size_t marker_offset{};
};

// Backward scan from `cursor` deciding what the user is typing:
//  - "@garl"        -> ingredient name, prefix "garl"
//  - "@flour{200"   -> quantity
//  - "@flour{200%g" -> unit, prefix "g"
//  - "@flour{200}"  -> nothing, the element is closed
auto ScanCompletionContext(std::string_view text, std::size_t cursor)
    -> std::optional<CompletionContext>;

}  // namespace cookd::scan
