#pragma once

#include <memory>
#include <string>
#include <utility>

#include "cookd/core/document_state.hpp"
#include "cookd/recipe/cooklang_parser.hpp"
#include "cookd/text/position_index.hpp"

namespace cookd::test {

inline constexpr auto kTestUri = "file:///workspace/test.cook";

// Parses `text` the way DocumentStore does and wraps it in a snapshot.
inline auto MakeDocument(
    std::string text, std::string uri = kTestUri, int version = 1)
    -> std::shared_ptr<const DocumentState> {
  static const recipe::CooklangParser kParser;
  auto parse = kParser.Parse(text);
  return std::make_shared<const DocumentState>(DocumentState{
      .uri = std::move(uri),
      .version = version,
      .index = text::PositionIndex(std::move(text)),
      .parse = std::move(parse)});
}

}  // namespace cookd::test
