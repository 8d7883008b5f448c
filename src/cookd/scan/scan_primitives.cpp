#include "cookd/scan/scan_primitives.hpp"

#include <algorithm>

namespace cookd::scan {

auto MarkerKindOf(char c) -> std::optional<MarkerKind> {
  switch (c) {
    case '@':
      return MarkerKind::kIngredient;
    case '#':
      return MarkerKind::kCookware;
    case '~':
      return MarkerKind::kTimer;
    default:
      return std::nullopt;
  }
}

auto ToElementKind(MarkerKind kind) -> ElementKind {
  switch (kind) {
    case MarkerKind::kIngredient:
      return ElementKind::kIngredient;
    case MarkerKind::kCookware:
      return ElementKind::kCookware;
    case MarkerKind::kTimer:
      return ElementKind::kTimer;
  }
  return ElementKind::kIngredient;
}

auto ToString(ElementKind kind) -> std::string {
  switch (kind) {
    case ElementKind::kIngredient:
      return "ingredient";
    case ElementKind::kCookware:
      return "cookware";
    case ElementKind::kTimer:
      return "timer";
    case ElementKind::kSection:
      return "section";
    case ElementKind::kMetadata:
      return "metadata";
    case ElementKind::kComment:
      return "comment";
  }
  return "unknown";
}

auto IsNameChar(std::string_view text, std::size_t pos) -> bool {
  if (pos >= text.size()) {
    return false;
  }
  if (text[pos] == '-') {
    return pos + 1 >= text.size() || text[pos + 1] != '-';
  }
  return IsNameStartChar(text[pos]);
}

auto IsEscaped(std::string_view text, std::size_t pos) -> bool {
  std::size_t backslashes = 0;
  while (pos > 0 && text[pos - 1] == '\\') {
    ++backslashes;
    --pos;
  }
  return backslashes % 2 == 1;
}

auto LineStartOf(std::string_view text, std::size_t pos) -> std::size_t {
  pos = std::min(pos, text.size());
  while (pos > 0 && !IsLineTerminator(text[pos - 1])) {
    --pos;
  }
  return pos;
}

auto LineEndOf(std::string_view text, std::size_t pos) -> std::size_t {
  while (pos < text.size() && !IsLineTerminator(text[pos])) {
    ++pos;
  }
  return pos;
}

auto Trim(std::string_view text) -> std::string_view {
  constexpr std::string_view kBlanks = " \t";
  auto first = text.find_first_not_of(kBlanks);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(kBlanks);
  return text.substr(first, last - first + 1);
}

auto IsSectionLine(std::string_view line) -> bool {
  auto trimmed = Trim(line);
  return trimmed.size() >= 2 && trimmed.front() == '=' &&
         trimmed.back() == '=';
}

auto SectionName(std::string_view line) -> std::string_view {
  auto trimmed = Trim(line);
  auto first = trimmed.find_first_not_of('=');
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = trimmed.find_last_not_of('=');
  return Trim(trimmed.substr(first, last - first + 1));
}

namespace {

// Multi-word names are only recognised when a brace group closes them, so
// look ahead for a '{' reachable through name characters and blanks.
auto FindMultiWordBrace(
    std::string_view text, std::size_t pos, std::size_t line_end)
    -> std::size_t {
  while (pos < line_end) {
    auto c = text[pos];
    if (c == '{') {
      return pos;
    }
    if (c == ' ' || c == '\'' || IsNameChar(text, pos)) {
      ++pos;
      continue;
    }
    break;
  }
  return kNoOffset;
}

auto FindUnescaped(
    std::string_view text, char wanted, std::size_t from, std::size_t limit)
    -> std::size_t {
  limit = std::min(limit, text.size());
  for (auto i = from; i < limit; ++i) {
    if (text[i] == wanted && !IsEscaped(text, i)) {
      return i;
    }
  }
  return kNoOffset;
}

}  // namespace

auto ScanElementExtent(std::string_view text, std::size_t marker)
    -> ElementExtent {
  ElementExtent extent{
      .marker = marker, .name_start = marker + 1, .name_end = marker + 1};
  auto line_end = LineEndOf(text, marker);

  auto pos = marker + 1;
  while (pos < line_end && IsNameChar(text, pos)) {
    ++pos;
  }
  extent.name_end = pos;

  if (pos < line_end && text[pos] == ' ') {
    auto brace = FindMultiWordBrace(text, pos, line_end);
    if (brace != kNoOffset) {
      pos = brace;
      extent.name_end = brace;
    }
  }

  if (pos < line_end && text[pos] == '{') {
    extent.brace_open = pos;
    auto close =
        FindUnescaped(text, '}', pos + 1, pos + 1 + kBraceScanLimit);
    if (close != kNoOffset) {
      extent.brace_close = close;
      pos = close + 1;
    } else {
      pos = line_end;
    }
  }
  extent.end = pos;

  auto is_noted = text[marker] == '@' || text[marker] == '#';
  if (is_noted && extent.IsClosed() && pos < text.size() && text[pos] == '(') {
    auto note_line_end = LineEndOf(text, pos);
    auto close = FindUnescaped(text, ')', pos + 1, note_line_end);
    if (close != kNoOffset) {
      extent.note_open = pos;
      extent.note_close = close;
      extent.end = close + 1;
    }
  }
  return extent;
}

auto NextInlineElement(
    std::string_view text, std::size_t pos, std::size_t limit)
    -> std::optional<InlineElement> {
  limit = std::min(limit, text.size());
  while (pos < limit) {
    auto c = text[pos];
    if (c == '\\') {
      pos += 2;
      continue;
    }

    auto next = pos + 1 < text.size() ? text[pos + 1] : '\0';
    if (c == '-' && next == '-') {
      return InlineElement{
          .kind = ElementKind::kComment,
          .start = pos,
          .end = LineEndOf(text, pos)};
    }
    if (c == '[' && next == '-') {
      auto close = text.find("-]", pos + 2);
      auto end = close == std::string_view::npos ? text.size() : close + 2;
      return InlineElement{
          .kind = ElementKind::kComment, .start = pos, .end = end};
    }

    if (auto marker = MarkerKindOf(c)) {
      if (IsNameStartChar(next) || next == '{') {
        auto extent = ScanElementExtent(text, pos);
        return InlineElement{
            .kind = ToElementKind(*marker), .start = pos, .end = extent.end};
      }
    }
    ++pos;
  }
  return std::nullopt;
}

}  // namespace cookd::scan
