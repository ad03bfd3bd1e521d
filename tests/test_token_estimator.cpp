#include "token_estimator.hpp"

#include <doctest/doctest.h>

#include <string>

TEST_SUITE_BEGIN("contextfilter.token_estimator");

TEST_CASE("empty text has no tokens") {
  CHECK(contextfilter::estimateTokens("") == 0);
}

TEST_CASE("one token per four characters, rounded down") {
  using contextfilter::estimateTokens;
  CHECK(estimateTokens("abc") == 0);
  CHECK(estimateTokens("abcd") == 1);
  CHECK(estimateTokens("abcdefg") == 1);
  CHECK(estimateTokens("abcdefgh") == 2);
  CHECK(estimateTokens("abcdefghi") == 2);
}

TEST_CASE("estimate follows floor(length / 4) across lengths") {
  for (size_t length = 0; length <= 64; ++length) {
    std::string text(length, 'x');
    CHECK(contextfilter::estimateTokens(text) == length / 4);
  }
}

TEST_CASE("estimate counts bytes of multi-byte text") {
  // "größe" is 7 bytes in UTF-8
  CHECK(contextfilter::estimateTokens("gr\xc3\xb6\xc3\x9f" "e") == 1);
}

TEST_SUITE_END();
