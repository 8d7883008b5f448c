#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "cookd/scan/scan_primitives.hpp"

namespace cookd::scan {

struct ElementSpan {
  ElementKind kind{ElementKind::kComment};
  std::size_t start{};
  std::size_t end{};
  // Raw source of [start, end).
  std::string_view text;
  // Element name: the marker name, section title or metadata entry. Empty for
  // comments and anonymous timers.
  std::string_view name;
};

// Element under `offset`. Whole-line forms are classified first: a line
// starting with "--" is a comment, ">>" is metadata and "=...=" is a section.
// Otherwise the inline elements of the line are scanned left to right and the
// one covering the offset is returned. Elements opened on an earlier line are
// not considered.
auto FindElementAt(std::string_view text, std::size_t offset)
    -> std::optional<ElementSpan>;

// Name part of a scanned marker element, trimmed.
auto ElementName(std::string_view text, const ElementExtent& extent)
    -> std::string_view;

}  // namespace cookd::scan
