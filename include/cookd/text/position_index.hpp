#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cookd::text {

// Zero-based line and UTF-16 column, the coordinates the editor protocol uses.
struct LineCol {
  int line{};
  int column{};

  auto operator==(const LineCol&) const -> bool = default;
};

// Maps byte offsets of a buffer to (line, UTF-16 column) and back. The index
// owns its text so the line table can never drift from the content. Line
// terminators are "\n", "\r\n" and a lone "\r". All lookups clamp instead of
// failing.
class PositionIndex {
 public:
  explicit PositionIndex(std::string text);

  [[nodiscard]] auto Text() const -> std::string_view {
    return text_;
  }

  [[nodiscard]] auto LineCount() const -> int {
    return static_cast<int>(line_starts_.size());
  }

  // First byte of `line`. Lines past the end map to the end of the buffer.
  [[nodiscard]] auto LineStart(int line) const -> std::size_t;

  // End of the line's content, excluding its terminator.
  [[nodiscard]] auto LineContentEnd(int line) const -> std::size_t;

  // Line containing `offset`. Terminator bytes belong to the line they end.
  [[nodiscard]] auto LineOf(std::size_t offset) const -> int;

  // Offsets past the end clamp to the end, offsets inside a multi-byte
  // sequence snap back to its first byte, and an offset between the CR and
  // LF of a CRLF pair snaps back to the CR.
  [[nodiscard]] auto OffsetToPosition(std::size_t offset) const -> LineCol;

  // A line past the end yields the end of the buffer. A column past the end
  // of the line yields the line's content end. A column inside a surrogate
  // pair yields the start of that code point.
  [[nodiscard]] auto PositionToOffset(int line, int utf16_column) const
      -> std::size_t;

  // UTF-16 code units in [start, end).
  [[nodiscard]] auto Utf16Length(std::size_t start, std::size_t end) const
      -> int;

 private:
  std::string text_;
  std::vector<std::size_t> line_starts_;
  std::vector<std::size_t> content_ends_;
};

}  // namespace cookd::text
