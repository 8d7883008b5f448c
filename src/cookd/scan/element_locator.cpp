#include "cookd/scan/element_locator.hpp"

#include <algorithm>

#include "cookd/text/utf8.hpp"

namespace cookd::scan {

namespace {

auto WholeLineSpan(
    std::string_view text, ElementKind kind, std::size_t start,
    std::size_t end, std::string_view name) -> ElementSpan {
  return ElementSpan{
      .kind = kind,
      .start = start,
      .end = end,
      .text = text.substr(start, end - start),
      .name = name};
}

auto MetadataKey(std::string_view line) -> std::string_view {
  auto body = line.substr(2);
  auto colon = body.find(':');
  return Trim(body.substr(0, colon));
}

}  // namespace

auto ElementName(std::string_view text, const ElementExtent& extent)
    -> std::string_view {
  return Trim(
      text.substr(extent.name_start, extent.name_end - extent.name_start));
}

auto FindElementAt(std::string_view text, std::size_t offset)
    -> std::optional<ElementSpan> {
  if (offset >= text.size()) {
    return std::nullopt;
  }
  offset = text::SnapToCodePointStart(text, offset);

  auto line_start = LineStartOf(text, offset);
  auto line_end = LineEndOf(text, offset);
  if (offset >= line_end) {
    return std::nullopt;
  }
  auto line = text.substr(line_start, line_end - line_start);

  if (line.starts_with("--")) {
    return WholeLineSpan(
        text, ElementKind::kComment, line_start, line_end, {});
  }
  if (line.starts_with(">>")) {
    return WholeLineSpan(
        text, ElementKind::kMetadata, line_start, line_end,
        MetadataKey(line));
  }
  if (IsSectionLine(line)) {
    return WholeLineSpan(
        text, ElementKind::kSection, line_start, line_end, SectionName(line));
  }

  auto pos = line_start;
  while (auto element = NextInlineElement(text, pos, line_end)) {
    if (element->start > offset) {
      break;
    }
    if (offset < element->end) {
      ElementSpan span{
          .kind = element->kind,
          .start = element->start,
          .end = element->end,
          .text = text.substr(element->start, element->end - element->start),
          .name = {}};
      if (element->kind != ElementKind::kComment) {
        span.name = ElementName(text, ScanElementExtent(text, element->start));
      }
      return span;
    }
    pos = std::max(element->end, element->start + 1);
  }
  return std::nullopt;
}

}  // namespace cookd::scan
