#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace data_stream {
namespace utf8 {

// Strict validation: rejects overlong forms, surrogates, code points above
// U+10FFFF and truncated sequences.
bool is_valid(const uint8_t *data, size_t len);
bool is_valid(const std::string &text);

// Number of trailing bytes that form the start of a multi-byte character
// whose remaining bytes are missing. 0 if the buffer ends on a boundary or
// the tail is malformed (left for is_valid to reject).
size_t incomplete_suffix_length(const uint8_t *data, size_t len);

// End offset of the next piece of text starting at begin that is at most
// max_bytes long and does not cut a character in half. A single character
// wider than max_bytes is returned whole.
size_t split_point(const std::string &text, size_t begin, size_t max_bytes);

} // namespace utf8
} // namespace data_stream
