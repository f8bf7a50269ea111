#include "data_stream/utf8.hpp"

#include <algorithm>

namespace data_stream {
namespace utf8 {

namespace {

bool is_continuation(uint8_t b) { return (b & 0xC0) == 0x80; }

// Length of the sequence introduced by lead byte b, or 0 if b cannot start one.
size_t sequence_length(uint8_t b) {
  if (b < 0x80) {
    return 1;
  }
  if (b >= 0xC2 && b <= 0xDF) {
    return 2;
  }
  if (b >= 0xE0 && b <= 0xEF) {
    return 3;
  }
  if (b >= 0xF0 && b <= 0xF4) {
    return 4;
  }
  return 0;
}

// Valid range of the second byte, which depends on the lead byte.
bool second_byte_ok(uint8_t lead, uint8_t b) {
  switch (lead) {
  case 0xE0:
    return b >= 0xA0 && b <= 0xBF; // no overlongs
  case 0xED:
    return b >= 0x80 && b <= 0x9F; // no surrogates
  case 0xF0:
    return b >= 0x90 && b <= 0xBF;
  case 0xF4:
    return b >= 0x80 && b <= 0x8F; // <= U+10FFFF
  default:
    return is_continuation(b);
  }
}

} // namespace

bool is_valid(const uint8_t *data, size_t len) {
  size_t i = 0;
  while (i < len) {
    const uint8_t lead = data[i];
    const size_t n = sequence_length(lead);
    if (n == 0 || i + n > len) {
      return false;
    }
    if (n > 1) {
      if (!second_byte_ok(lead, data[i + 1])) {
        return false;
      }
      for (size_t k = 2; k < n; ++k) {
        if (!is_continuation(data[i + k])) {
          return false;
        }
      }
    }
    i += n;
  }
  return true;
}

bool is_valid(const std::string &text) {
  return is_valid(reinterpret_cast<const uint8_t *>(text.data()), text.size());
}

size_t incomplete_suffix_length(const uint8_t *data, size_t len) {
  // A truncated character has at most 3 of its 4 bytes present.
  const size_t window = std::min<size_t>(len, 3);
  for (size_t back = 1; back <= window; ++back) {
    const uint8_t b = data[len - back];
    if (is_continuation(b)) {
      continue;
    }
    const size_t n = sequence_length(b);
    if (n > back) {
      if (back >= 2 && !second_byte_ok(b, data[len - back + 1])) {
        return 0;
      }
      return back;
    }
    return 0;
  }
  return 0;
}

size_t split_point(const std::string &text, size_t begin, size_t max_bytes) {
  const size_t size = text.size();
  if (begin >= size) {
    return size;
  }
  size_t end = std::min(size, begin + std::max<size_t>(max_bytes, 1));
  const auto at = [&text](size_t i) { return static_cast<uint8_t>(text[i]); };

  size_t cut = end;
  while (cut > begin && cut < size && is_continuation(at(cut))) {
    --cut;
  }
  if (cut > begin) {
    return cut;
  }

  // max_bytes is narrower than the character at begin.
  cut = begin + 1;
  while (cut < size && is_continuation(at(cut))) {
    ++cut;
  }
  return cut;
}

} // namespace utf8
} // namespace data_stream
