#include "cookd/scan/completion_context.hpp"

#include <algorithm>

#include "cookd/text/utf8.hpp"

namespace cookd::scan {

namespace {

auto NameContextFor(MarkerKind marker) -> CompletionContextKind {
  switch (marker) {
    case MarkerKind::kIngredient:
      return CompletionContextKind::kIngredientName;
    case MarkerKind::kCookware:
      return CompletionContextKind::kCookwareName;
    case MarkerKind::kTimer:
      return CompletionContextKind::kTimerName;
  }
  return CompletionContextKind::kIngredientName;
}

// Offset of the nearest unescaped '{' in [from, to) that no unescaped '}'
// closes before `to`.
auto FindOpenBrace(std::string_view text, std::size_t from, std::size_t to)
    -> std::size_t {
  auto open = kNoOffset;
  for (auto i = from; i < to; ++i) {
    if (IsEscaped(text, i)) {
      continue;
    }
    if (text[i] == '{') {
      open = i;
    } else if (text[i] == '}') {
      open = kNoOffset;
    }
  }
  return open;
}

auto BuildContext(
    std::string_view text, std::size_t marker_offset, MarkerKind marker,
    std::size_t cursor) -> CompletionContext {
  CompletionContext context{.marker = marker, .marker_offset = marker_offset};

  auto brace = FindOpenBrace(text, marker_offset + 1, cursor);
  if (brace == kNoOffset) {
    context.kind = NameContextFor(marker);
    context.prefix =
        std::string(text.substr(marker_offset + 1, cursor - marker_offset - 1));
    return context;
  }

  auto inside = text.substr(brace + 1, cursor - brace - 1);
  auto percent = inside.rfind('%');
  if (percent == std::string_view::npos) {
    context.kind = CompletionContextKind::kQuantity;
    context.prefix = std::string(Trim(inside));
  } else {
    context.kind = CompletionContextKind::kUnit;
    context.prefix = std::string(Trim(inside.substr(percent + 1)));
  }
  return context;
}

}  // namespace

auto ScanCompletionContext(std::string_view text, std::size_t cursor)
    -> std::optional<CompletionContext> {
  cursor = text::SnapToCodePointStart(text, std::min(cursor, text.size()));
  auto window_start = cursor > kContextScanWindow ? cursor - kContextScanWindow
                                                  : std::size_t{0};
  window_start = text::SnapToCodePointStart(text, window_start);

  for (auto pos = cursor; pos-- > window_start;) {
    auto c = text[pos];
    if (IsLineTerminator(c)) {
      return std::nullopt;
    }
    if (IsEscaped(text, pos)) {
      continue;
    }
    if (c == '}') {
      return std::nullopt;
    }

    auto marker = MarkerKindOf(c);
    if (!marker) {
      continue;
    }

    // A marker inside an open group is plain text of that group; the outer
    // element decides the context.
    auto line_start = std::max(LineStartOf(text, pos), window_start);
    auto outer_brace = FindOpenBrace(text, line_start, pos);
    if (outer_brace != kNoOffset) {
      for (auto outer = outer_brace; outer-- > line_start;) {
        if (IsEscaped(text, outer)) {
          continue;
        }
        if (auto outer_marker = MarkerKindOf(text[outer])) {
          return BuildContext(text, outer, *outer_marker, cursor);
        }
      }
      return std::nullopt;
    }

    return BuildContext(text, pos, *marker, cursor);
  }
  return std::nullopt;
}

}  // namespace cookd::scan
