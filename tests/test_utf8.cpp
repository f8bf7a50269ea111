#include <doctest/doctest.h>

#include <string>

#include "data_stream/utf8.hpp"

using namespace data_stream;

namespace {

size_t suffix(const std::string &s) {
  return utf8::incomplete_suffix_length(
      reinterpret_cast<const uint8_t *>(s.data()), s.size());
}

} // namespace

TEST_CASE("utf8 validation") {
  CHECK(utf8::is_valid(""));
  CHECK(utf8::is_valid("plain ascii"));
  CHECK(utf8::is_valid("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));

  CHECK_FALSE(utf8::is_valid("\xC3"));             // truncated
  CHECK_FALSE(utf8::is_valid("\x80"));             // stray continuation
  CHECK_FALSE(utf8::is_valid("\xC0\xAF"));         // overlong
  CHECK_FALSE(utf8::is_valid("\xE0\x80\xAF"));     // overlong
  CHECK_FALSE(utf8::is_valid("\xED\xA0\x80"));     // surrogate
  CHECK_FALSE(utf8::is_valid("\xF4\x90\x80\x80")); // above U+10FFFF
  CHECK_FALSE(utf8::is_valid("\xFF"));
}

TEST_CASE("incomplete suffix of a cut character") {
  CHECK(suffix("") == 0);
  CHECK(suffix("abc") == 0);
  CHECK(suffix("ab\xC3\xA9") == 0);
  CHECK(suffix("ab\xC3") == 1);
  CHECK(suffix("ab\xE2\x82") == 2);
  CHECK(suffix("\xF0\x9F\x98") == 3);
  CHECK(suffix("\xF0\x9F") == 2);
  // Malformed tails are left for validation to reject.
  CHECK(suffix("a\x80") == 0);
  CHECK(suffix("\xE0\x80") == 0);
}

TEST_CASE("split_point never cuts a character") {
  const std::string text = "a\xE2\x82\xAC" "b"; // a, euro sign, b

  CHECK(utf8::split_point(text, 0, 1) == 1);
  CHECK(utf8::split_point(text, 0, 2) == 1);
  CHECK(utf8::split_point(text, 0, 3) == 1);
  CHECK(utf8::split_point(text, 0, 4) == 4);
  CHECK(utf8::split_point(text, 0, 100) == text.size());

  // A character wider than the limit is returned whole.
  CHECK(utf8::split_point(text, 1, 2) == 4);
  CHECK(utf8::split_point(text, 4, 2) == 5);
  CHECK(utf8::split_point(text, 5, 2) == 5);
}
