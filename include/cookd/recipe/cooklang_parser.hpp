#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "cookd/recipe/recipe_parser.hpp"

namespace cookd::recipe {

// Parser for the Cooklang subset the server understands:
//  - YAML front matter between "---" lines;
//  - ">> key: value" metadata lines;
//  - "=Section=" lines;
//  - "--" and "[- -]" comments;
//  - steps as blank-line separated paragraphs holding @ingredient,
//    #cookware and ~timer elements with optional {quantity%unit} groups and
//    "(note)" suffixes.
//
// Invalid UTF-8 and malformed front matter are fatal and yield no recipe.
// Element level problems are reported and the element is skipped.
class CooklangParser : public RecipeParser {
 public:
  explicit CooklangParser(std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Parse(std::string_view text) const
      -> ParseResult override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace cookd::recipe
