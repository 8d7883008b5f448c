#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cookd::scan {

// Rules shared by every scanner in this directory:
//  - a backslash escapes the character after it;
//  - markers never nest, a marker inside an open brace group belongs to it;
//  - the search for an opening marker never crosses a line terminator.

enum class MarkerKind { kIngredient, kCookware, kTimer };

enum class ElementKind {
  kIngredient,
  kCookware,
  kTimer,
  kSection,
  kMetadata,
  kComment,
};

// Upper bound on the bytes searched for the '}' of an unterminated group.
inline constexpr std::size_t kBraceScanLimit = 256;

inline constexpr std::size_t kNoOffset = std::string_view::npos;

auto MarkerKindOf(char c) -> std::optional<MarkerKind>;
auto ToElementKind(MarkerKind kind) -> ElementKind;
auto ToString(ElementKind kind) -> std::string;

inline auto IsLineTerminator(char c) -> bool {
  return c == '\n' || c == '\r';
}

inline auto IsNameStartChar(char c) -> bool {
  auto byte = static_cast<unsigned char>(c);
  return (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') ||
         (byte >= '0' && byte <= '9') || byte == '_' || byte >= 0x80;
}

// Name characters also include a single '-', but "--" starts a comment.
auto IsNameChar(std::string_view text, std::size_t pos) -> bool;

// True when `pos` is preceded by an odd run of backslashes.
auto IsEscaped(std::string_view text, std::size_t pos) -> bool;

// Start of the line holding `pos`.
auto LineStartOf(std::string_view text, std::size_t pos) -> std::size_t;

// End of the content of the line holding `pos`, excluding the terminator.
auto LineEndOf(std::string_view text, std::size_t pos) -> std::size_t;

auto Trim(std::string_view text) -> std::string_view;

// "=Dough=" or "== Dough ==": the trimmed line starts and ends with '='.
auto IsSectionLine(std::string_view line) -> bool;

// Section title with the surrounding '=' and blanks removed.
auto SectionName(std::string_view line) -> std::string_view;

// Layout of a marker element found by ScanElementExtent. Offsets are absolute
// and kNoOffset marks a missing part.
struct ElementExtent {
  std::size_t marker{};
  std::size_t name_start{};
  std::size_t name_end{};
  std::size_t brace_open{kNoOffset};
  std::size_t brace_close{kNoOffset};
  std::size_t note_open{kNoOffset};
  std::size_t note_close{kNoOffset};
  std::size_t end{};

  [[nodiscard]] auto HasBraces() const -> bool {
    return brace_open != kNoOffset;
  }

  [[nodiscard]] auto IsClosed() const -> bool {
    return brace_close != kNoOffset;
  }
};

// Forward scan of the element whose marker sits at `marker`. The name is a
// single word, or several words when a '{' follows on the same line. The
// brace group ends at the first unescaped '}' within kBraceScanLimit bytes;
// without one it ends at the end of the line that opened it. An ingredient or
// cookware note "(...)" may follow the group on the same line.
auto ScanElementExtent(std::string_view text, std::size_t marker)
    -> ElementExtent;

struct InlineElement {
  ElementKind kind{ElementKind::kComment};
  std::size_t start{};
  std::size_t end{};
};

// Next inline element starting in [pos, limit): a "--" comment to the end of
// its line, a "[- -]" block comment, or a marker followed by a name character
// or '{'. Escaped characters are skipped.
auto NextInlineElement(
    std::string_view text, std::size_t pos, std::size_t limit)
    -> std::optional<InlineElement>;

}  // namespace cookd::scan
