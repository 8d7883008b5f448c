#include "cookd/scan/tokenizer.hpp"

#include <algorithm>

#include "cookd/scan/scan_primitives.hpp"

namespace cookd::scan {

namespace {

auto IsFrontMatterDelimiter(std::string_view line) -> bool {
  auto trimmed = Trim(line);
  return trimmed.size() >= 3 &&
         trimmed.find_first_not_of('-') == std::string_view::npos;
}

auto NextLineStart(std::string_view text, std::size_t line_end)
    -> std::size_t {
  if (line_end >= text.size()) {
    return text.size();
  }
  if (text[line_end] == '\r' && line_end + 1 < text.size() &&
      text[line_end + 1] == '\n') {
    return line_end + 2;
  }
  return line_end + 1;
}

auto ToTokenKind(ElementKind kind) -> TokenKind {
  switch (kind) {
    case ElementKind::kIngredient:
      return TokenKind::kIngredient;
    case ElementKind::kCookware:
      return TokenKind::kCookware;
    case ElementKind::kTimer:
      return TokenKind::kTimer;
    case ElementKind::kSection:
      return TokenKind::kSection;
    case ElementKind::kMetadata:
      return TokenKind::kMetadataKey;
    case ElementKind::kComment:
      return TokenKind::kComment;
  }
  return TokenKind::kComment;
}

// Emits the "---" delimiters and the keys of a leading YAML block. Returns
// the offset right after the closing delimiter, or 0 when the buffer has no
// complete front matter.
auto TokenizeFrontMatter(std::string_view text, std::vector<TokenSpan>& spans)
    -> std::size_t {
  auto first_end = LineEndOf(text, 0);
  if (!IsFrontMatterDelimiter(text.substr(0, first_end))) {
    return 0;
  }

  std::vector<TokenSpan> block{
      {.kind = TokenKind::kMetadataKey, .start = 0, .end = first_end}};
  auto pos = NextLineStart(text, first_end);
  while (pos < text.size()) {
    auto line_end = LineEndOf(text, pos);
    auto line = text.substr(pos, line_end - pos);
    if (IsFrontMatterDelimiter(line)) {
      block.push_back(
          {.kind = TokenKind::kMetadataKey, .start = pos, .end = line_end});
      spans.insert(spans.end(), block.begin(), block.end());
      return NextLineStart(text, line_end);
    }

    auto colon = line.find(':');
    auto key_start = line.find_first_not_of(" \t");
    if (colon != std::string_view::npos &&
        key_start != std::string_view::npos && key_start < colon &&
        line[key_start] != '#') {
      auto key = Trim(line.substr(key_start, colon - key_start));
      if (!key.empty()) {
        block.push_back(
            {.kind = TokenKind::kMetadataKey,
             .start = pos + key_start,
             .end = pos + key_start + key.size()});
      }
    }
    pos = NextLineStart(text, line_end);
  }
  return 0;
}

}  // namespace

auto Tokenize(std::string_view text) -> std::vector<TokenSpan> {
  std::vector<TokenSpan> spans;
  auto pos = TokenizeFrontMatter(text, spans);

  while (pos < text.size()) {
    auto line_end = LineEndOf(text, pos);

    auto at_line_start = pos == 0 || IsLineTerminator(text[pos - 1]);
    if (at_line_start) {
      auto line = text.substr(pos, line_end - pos);
      if (line.starts_with(">>")) {
        auto colon = line.find(':');
        auto end = colon == std::string_view::npos ? line_end : pos + colon + 1;
        spans.push_back(
            {.kind = TokenKind::kMetadataKey, .start = pos, .end = end});
        pos = NextLineStart(text, line_end);
        continue;
      }
      if (IsSectionLine(line)) {
        spans.push_back(
            {.kind = TokenKind::kSection, .start = pos, .end = line_end});
        pos = NextLineStart(text, line_end);
        continue;
      }
    }

    auto element = NextInlineElement(text, pos, line_end);
    if (!element) {
      pos = NextLineStart(text, line_end);
      continue;
    }
    spans.push_back(
        {.kind = ToTokenKind(element->kind),
         .start = element->start,
         .end = element->end});
    pos = std::max(element->end, element->start + 1);
  }
  return spans;
}

}  // namespace cookd::scan
