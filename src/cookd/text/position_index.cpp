#include "cookd/text/position_index.hpp"

#include <algorithm>

#include "cookd/text/utf8.hpp"

namespace cookd::text {

PositionIndex::PositionIndex(std::string text) : text_(std::move(text)) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\r') {
      content_ends_.push_back(i);
      if (i + 1 < text_.size() && text_[i + 1] == '\n') {
        ++i;
      }
      line_starts_.push_back(i + 1);
    } else if (text_[i] == '\n') {
      content_ends_.push_back(i);
      line_starts_.push_back(i + 1);
    }
  }
  content_ends_.push_back(text_.size());
}

auto PositionIndex::LineStart(int line) const -> std::size_t {
  if (line < 0) {
    return 0;
  }
  if (line >= LineCount()) {
    return text_.size();
  }
  return line_starts_[static_cast<std::size_t>(line)];
}

auto PositionIndex::LineContentEnd(int line) const -> std::size_t {
  if (line < 0) {
    return content_ends_.front();
  }
  if (line >= LineCount()) {
    return text_.size();
  }
  return content_ends_[static_cast<std::size_t>(line)];
}

auto PositionIndex::LineOf(std::size_t offset) const -> int {
  offset = std::min(offset, text_.size());
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  return static_cast<int>(std::distance(line_starts_.begin(), it)) - 1;
}

auto PositionIndex::OffsetToPosition(std::size_t offset) const -> LineCol {
  offset = std::min(offset, text_.size());
  if (offset > 0 && offset < text_.size() && text_[offset] == '\n' &&
      text_[offset - 1] == '\r') {
    --offset;
  }
  offset = SnapToCodePointStart(text_, offset);

  auto line = LineOf(offset);
  auto start = LineStart(line);
  auto end = std::min(offset, LineContentEnd(line));
  return LineCol{.line = line, .column = Utf16Length(start, end)};
}

auto PositionIndex::PositionToOffset(int line, int utf16_column) const
    -> std::size_t {
  if (line < 0) {
    line = 0;
  }
  if (line >= LineCount()) {
    return text_.size();
  }

  auto offset = LineStart(line);
  auto end = LineContentEnd(line);
  int units = 0;
  while (offset < end && units < utf16_column) {
    auto width = Utf16Width(text_, offset);
    if (units + width > utf16_column) {
      break;
    }
    units += width;
    offset += DecodeLength(text_, offset);
  }
  return std::min(offset, end);
}

auto PositionIndex::Utf16Length(std::size_t start, std::size_t end) const
    -> int {
  end = std::min(end, text_.size());
  int units = 0;
  auto offset = start;
  while (offset < end) {
    units += Utf16Width(text_, offset);
    offset += DecodeLength(text_, offset);
  }
  return units;
}

}  // namespace cookd::text
