#include "cookd/text/utf8.hpp"

namespace cookd::text {

auto DecodeLength(std::string_view text, std::size_t offset) -> std::size_t {
  if (offset >= text.size()) {
    return 0;
  }
  auto lead = static_cast<unsigned char>(text[offset]);
  auto length = SequenceLength(lead);
  if (length == 1 || offset + length > text.size()) {
    return 1;
  }

  // Reject overlong and surrogate encodings the same way a strict decoder
  // would, so that such bytes are counted one by one.
  auto second = static_cast<unsigned char>(text[offset + 1]);
  if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
      (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
    return 1;
  }

  for (std::size_t i = 1; i < length; ++i) {
    if (!IsContinuationByte(static_cast<unsigned char>(text[offset + i]))) {
      return 1;
    }
  }
  return length;
}

auto Utf16Width(std::string_view text, std::size_t offset) -> int {
  return DecodeLength(text, offset) == 4 ? 2 : 1;
}

auto SnapToCodePointStart(std::string_view text, std::size_t offset)
    -> std::size_t {
  if (offset >= text.size()) {
    return text.size();
  }
  if (!IsContinuationByte(static_cast<unsigned char>(text[offset]))) {
    return offset;
  }

  // A code point is at most four bytes long, so the lead byte (if any) is
  // within three bytes.
  auto lower = offset >= 3 ? offset - 3 : 0;
  for (auto candidate = offset; candidate-- > lower;) {
    if (!IsContinuationByte(static_cast<unsigned char>(text[candidate]))) {
      if (candidate + DecodeLength(text, candidate) > offset) {
        return candidate;
      }
      break;
    }
  }
  // Stray continuation byte: it stands for itself.
  return offset;
}

auto FirstInvalidByte(std::string_view text) -> std::size_t {
  std::size_t offset = 0;
  while (offset < text.size()) {
    auto length = DecodeLength(text, offset);
    if (length == 1 && static_cast<unsigned char>(text[offset]) >= 0x80) {
      return offset;
    }
    offset += length;
  }
  return text.size();
}

}  // namespace cookd::text
