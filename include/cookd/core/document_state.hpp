#pragma once

#include <string>
#include <string_view>

#include "cookd/recipe/recipe.hpp"
#include "cookd/text/position_index.hpp"

namespace cookd {

// Immutable snapshot of one open buffer. Every edit builds a new one.
struct DocumentState {
  std::string uri;
  int version{};
  // Owns the buffer text.
  text::PositionIndex index;
  recipe::ParseResult parse;

  [[nodiscard]] auto Content() const -> std::string_view {
    return index.Text();
  }
};

}  // namespace cookd
