#pragma once

#include <cstddef>
#include <string_view>

namespace cookd::text {

// Byte-level UTF-8 helpers. Malformed input is tolerated: every byte that is
// not part of a well-formed sequence is treated as a one-byte code point.

inline auto IsContinuationByte(unsigned char byte) -> bool {
  return (byte & 0xC0) == 0x80;
}

// Length of the sequence announced by a lead byte, or 1 for anything that
// cannot start a sequence.
inline auto SequenceLength(unsigned char lead) -> std::size_t {
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 2;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    return 4;
  }
  return 1;
}

// Number of bytes of the code point at `offset`. Truncated or malformed
// sequences report 1 so callers always make progress.
auto DecodeLength(std::string_view text, std::size_t offset) -> std::size_t;

// UTF-16 code units taken by the code point at `offset`: 2 for a valid
// four-byte sequence, 1 otherwise.
auto Utf16Width(std::string_view text, std::size_t offset) -> int;

// Moves `offset` back to the first byte of the code point containing it.
// Offsets past the end clamp to text.size().
auto SnapToCodePointStart(std::string_view text, std::size_t offset)
    -> std::size_t;

// Offset of the first byte that is not part of a well-formed sequence, or
// text.size() when the whole text is valid.
auto FirstInvalidByte(std::string_view text) -> std::size_t;

}  // namespace cookd::text
