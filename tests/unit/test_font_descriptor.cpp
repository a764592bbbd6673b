#include "LineFit/style/FontDescriptor.hpp"

#include <doctest/doctest.h>

using namespace LineFit;
TEST_SUITE_BEGIN("linefit.font_descriptor");

TEST_CASE("from_default_style") {
  auto font = FontDescriptor::FromStyle(StyleSnapshot::Merge({}));
  REQUIRE(font.has_value());
  CHECK(font->toString() == "400 16px Helvetica, Arial, sans-serif");
  CHECK(font->numericWeight() == 400);
}

TEST_CASE("from_style_keeps_recognized_keywords") {
  StyleMap styles{{"font-weight", "bold"},
                  {"font-style", "italic"},
                  {"font-variant", "small-caps"},
                  {"font-size", "2em"},
                  {"font-family", "\"Open Sans\", serif"}};
  auto font = FontDescriptor::FromStyle(StyleSnapshot::Merge({&styles}), 10.0f);
  REQUIRE(font.has_value());
  CHECK(font->toString() == "bold italic small-caps 20px \"Open Sans\", serif");
  CHECK(font->families() == std::vector<std::string>{"Open Sans", "serif"});
  CHECK(font->numericWeight() == 700);
}

TEST_CASE("from_style_drops_unknown_values") {
  StyleMap styles{{"font-weight", "heavy"}, {"font-style", "slanted"}, {"font-variant", "all-caps"}};
  auto font = FontDescriptor::FromStyle(StyleSnapshot::Merge({&styles}));
  REQUIRE(font.has_value());
  CHECK_FALSE(font->weight.has_value());
  CHECK_FALSE(font->style.has_value());
  CHECK_FALSE(font->variant.has_value());
  CHECK(font->toString() == "16px Helvetica, Arial, sans-serif");
}

TEST_CASE("from_style_propagates_unit_errors") {
  StyleMap styles{{"font-size", "12vw"}};
  auto font = FontDescriptor::FromStyle(StyleSnapshot::Merge({&styles}));
  REQUIRE_FALSE(font.has_value());
  CHECK(font.error().code == Error::Code::UnsupportedUnit);
}

TEST_CASE("parses_shorthand") {
  auto font = FontDescriptor::Parse("italic bold 12px/1.5 Georgia, serif");
  REQUIRE(font.has_value());
  CHECK(font->style == std::optional<std::string>{"italic"});
  CHECK(font->weight == std::optional<std::string>{"bold"});
  CHECK(font->sizePx == doctest::Approx(12.0f));
  CHECK(font->family == "Georgia, serif");

  auto numeric = FontDescriptor::Parse("300 1.5em sans-serif", 10.0f);
  REQUIRE(numeric.has_value());
  CHECK(numeric->weight == std::optional<std::string>{"300"});
  CHECK(numeric->sizePx == doctest::Approx(15.0f));

  auto detached = FontDescriptor::Parse("20px / 2 monospace");
  REQUIRE(detached.has_value());
  CHECK(detached->family == "monospace");
}

TEST_CASE("malformed_shorthand") {
  auto noSize = FontDescriptor::Parse("bold serif");
  REQUIRE_FALSE(noSize.has_value());
  CHECK(noSize.error().code == Error::Code::MalformedInput);

  auto noFamily = FontDescriptor::Parse("bold 12px");
  REQUIRE_FALSE(noFamily.has_value());
  CHECK(noFamily.error().code == Error::Code::MalformedInput);

  auto badUnit = FontDescriptor::Parse("12furlongs serif");
  REQUIRE_FALSE(badUnit.has_value());
  CHECK(badUnit.error().code == Error::Code::UnsupportedUnit);
}

TEST_CASE("weights_and_resizing") {
  FontDescriptor font;
  font.weight = "lighter";
  CHECK(font.numericWeight() == 100);
  font.weight = "600";
  CHECK(font.numericWeight() == 600);
  font.weight.reset();
  CHECK(font.numericWeight() == 400);

  auto bigger = font.withSize(42.0f);
  CHECK(bigger.sizePx == doctest::Approx(42.0f));
  CHECK(bigger.family == font.family);
  CHECK_FALSE(bigger == font);
  CHECK(bigger.withSize(font.sizePx) == font);
}

TEST_CASE("keyword_tables") {
  CHECK(IsFontWeightKeyword("bolder"));
  CHECK_FALSE(IsFontWeightKeyword("450"));
  CHECK(IsFontStyleKeyword("oblique"));
  CHECK(IsFontVariantKeyword("small-caps"));
  CHECK_FALSE(IsFontVariantKeyword("italic"));
}

TEST_SUITE_END();
