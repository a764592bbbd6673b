#include "LineFit/style/Spacing.hpp"

#include <doctest/doctest.h>

using namespace LineFit;
TEST_SUITE_BEGIN("linefit.spacing");

TEST_CASE("keywords_are_zero") {
  for (auto keyword : {"", "normal", "inherit", "initial", "unset"}) {
    auto spacing = BuildSpacing(keyword, keyword);
    REQUIRE(spacing.has_value());
    CHECK(spacing->isZero());
    CHECK((*spacing)("some text here") == 0.0f);
  }
}

TEST_CASE("counts_words_after_collapsing_and_chars_before") {
  auto spacing = BuildSpacing("4px", "1px");
  REQUIRE(spacing.has_value());
  // "a b c" has two word gaps; the raw text has six characters.
  CHECK((*spacing)("a b  c") == doctest::Approx(2 * 4.0f + 6 * 1.0f));
  CHECK_MESSAGE((*spacing)("  word  ") == doctest::Approx(8 * 1.0f), "trimmed single word has no gap");
  CHECK((*spacing)("") == 0.0f);
}

TEST_CASE("characters_are_code_points") {
  auto spacing = BuildSpacing("normal", "2px");
  REQUIRE(spacing.has_value());
  CHECK((*spacing)("\xC3\xA9t\xC3\xA9") == doctest::Approx(6.0f));
}

TEST_CASE("relative_units_use_base_font_size") {
  auto spacing = BuildSpacing("1em", "0.5em", 10.0f);
  REQUIRE(spacing.has_value());
  CHECK(spacing->wordPx == doctest::Approx(10.0f));
  CHECK(spacing->letterPx == doctest::Approx(5.0f));
  CHECK((*spacing)("a b") == doctest::Approx(10.0f + 15.0f));
}

TEST_CASE("unsupported_unit_propagates") {
  auto spacing = BuildSpacing("2xyz", "0px");
  REQUIRE_FALSE(spacing.has_value());
  CHECK(spacing.error().code == Error::Code::UnsupportedUnit);
  CHECK_FALSE(BuildSpacing("normal", "3vw").has_value());
}

TEST_SUITE_END();
