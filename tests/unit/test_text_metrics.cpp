#include "LineFit/TextMetrics.hpp"
#include "LineFit/text/BitmapMetrics.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

using namespace LineFit;
using namespace LineFitTest;
TEST_SUITE_BEGIN("linefit.text_metrics");

namespace {

using Lines = std::vector<std::string>;

// Half an em per code point: 8px at the default 16px.
struct HalfEmFixture {
  BitmapMetrics metrics{BitmapMetrics::Grid{1.0f, 2.0f}};
  StaticElementHost host;

  auto host_only() -> TextHost { return TextHost{&metrics, nullptr, nullptr}; }
  auto with_elements() -> TextHost { return TextHost{&metrics, &host, &host}; }
};

auto with_width(std::string width) -> MeasureOptions {
  MeasureOptions options;
  options.width = std::move(width);
  return options;
}

auto cat_dash(std::string text) -> std::string {
  return text + kEmDash;
}

} // namespace

TEST_CASE_FIXTURE(HalfEmFixture, "width_of_a_single_line") {
  TextMetrics tm{host_only()};
  CHECK(tm.width("Hello").value() == doctest::Approx(40.0f));
  CHECK(tm.width("").value() == doctest::Approx(0.0f));

  MeasureOptions bigger;
  bigger.fontSize = "32px";
  CHECK(tm.width("Hello", bigger).value() == doctest::Approx(80.0f));
  CHECK(tm.width("Hello", {}, {{"letterSpacing", "1px"}}).value() == doctest::Approx(45.0f));
  CHECK(tm.width("a b", {}, {{"word-spacing", "4px"}}).value() == doctest::Approx(28.0f));
}

TEST_CASE_FIXTURE(HalfEmFixture, "width_normalizes_whitespace") {
  TextMetrics tm{host_only()};
  CHECK(tm.width("  Hello    World  ").value() == doctest::Approx(88.0f));
  CHECK(tm.width("a  b", {}, {{"white-space", "pre"}}).value() == doctest::Approx(32.0f));
}

TEST_CASE_FIXTURE(HalfEmFixture, "multiline_width_is_the_widest_line") {
  TextMetrics tm{host_only()};
  auto options = with_width("50");
  options.multiline = true;
  CHECK(tm.width("Hello World", options).value() == doctest::Approx(40.0f));
  CHECK(tm.width("Hi World", options).value() == doctest::Approx(40.0f));
}

TEST_CASE_FIXTURE(HalfEmFixture, "multiline_width_keeps_a_trailing_dash") {
  TextMetrics tm{host_only()};
  MeasureOptions options;
  options.multiline = true;
  auto text = cat_dash("Hello");
  CHECK(tm.lines(text).value() == Lines{text});
  CHECK(tm.width(text, options).value() == doctest::Approx(48.0f));
  CHECK(tm.width(text, options).value() == doctest::Approx(tm.width(text).value()));
}

TEST_CASE_FIXTURE(HalfEmFixture, "lines_wrap_at_the_width") {
  TextMetrics tm{host_only()};
  CHECK(tm.lines("Hello World", with_width("40")).value() == Lines{"Hello", "World"});
  CHECK(tm.lines("Hello World", with_width("88")).value() == Lines{"Hello World"});
  CHECK_MESSAGE((tm.lines("Hello World").value() == Lines{"Hello World"}), "no width never wraps");
  CHECK_MESSAGE((tm.lines("Hello World", with_width("0")).value() == Lines{"Hello World"}),
                "zero width counts as absent");
  CHECK_MESSAGE((tm.lines("Hello World", {}, {{"width", "40px"}}).value() == Lines{"Hello", "World"}),
                "width falls back to the overrides");
  CHECK(tm.lines("").value().empty());
}

TEST_CASE_FIXTURE(HalfEmFixture, "lines_break_all") {
  TextMetrics tm{host_only(), {{"wordBreak", "break-all"}}};
  CHECK(tm.lines("abcdef", with_width("24")).value() == Lines{"abc", "def"});
}

TEST_CASE_FIXTURE(HalfEmFixture, "markup_breaks") {
  TextMetrics tm{host_only()};
  CHECK(tm.lines("Hello<br>World").value() == Lines{"Hello", "World"});
  CHECK(tm.lines("super&shy;califragilistic", with_width("80")).value() ==
        Lines{"super-", "califragilistic"});
}

TEST_CASE_FIXTURE(HalfEmFixture, "text_transform_applies") {
  TextMetrics tm{host_only(), {{"textTransform", "uppercase"}}};
  CHECK(tm.lines("abc").value() == Lines{"ABC"});
}

TEST_CASE_FIXTURE(HalfEmFixture, "height_is_lines_times_line_height") {
  TextMetrics tm{host_only()};
  auto options = with_width("40");
  options.lineHeight = "20px";
  CHECK(tm.height("Hello World", options).value() == 40);

  options.lineHeight = "1.5";
  CHECK_MESSAGE(tm.height("Hello World", options).value() == 48, "unitless multiplies the font size");

  options.lineHeight = "150%";
  CHECK(tm.height("Hello World", options).value() == 48);

  options.lineHeight.reset();
  CHECK_MESSAGE(tm.height("Hello World", options).value() == 0, "no line height gives zero");

  options.lineHeight = "1em";
  CHECK(tm.height("Hello", options).value() == 16);
}

TEST_CASE_FIXTURE(HalfEmFixture, "max_font_size_fits_the_width") {
  TextMetrics tm{host_only()};
  // 5 code points at size / 2 each: 2.5 * size <= 100.
  CHECK(tm.maxFontSize("Hello", with_width("100")).value() == std::optional<int32_t>{40});
  CHECK(tm.maxFontSize("", with_width("100")).value() == std::nullopt);
}

TEST_CASE_FIXTURE(HalfEmFixture, "max_font_size_with_large_widths") {
  TextMetrics tm{host_only()};
  CHECK(tm.maxFontSize("Hello", with_width("5000000")).value() == std::optional<int32_t>{2'000'000});

  // The width saturates at the largest 32-bit value before the search starts.
  auto huge = tm.maxFontSize("Hello", with_width("99999999999"));
  REQUIRE(huge.has_value());
  REQUIRE(huge->has_value());
  CHECK(**huge > 850'000'000);
}

TEST_CASE_FIXTURE(HalfEmFixture, "max_font_size_without_width_warns") {
  LogCapture capture(LogLevel::Warn);
  TextMetrics tm{host_only()};
  CHECK(tm.maxFontSize("Hello").value() == std::nullopt);
  CHECK(capture.count(LogLevel::Warn, "metrics") == 1);
}

TEST_CASE_FIXTURE(HalfEmFixture, "unsupported_units_propagate") {
  TextMetrics tm{host_only()};
  MeasureOptions options;
  options.fontSize = "12xyz";
  auto width = tm.width("Hello", options);
  REQUIRE_FALSE(width.has_value());
  CHECK(width.error().code == Error::Code::UnsupportedUnit);

  auto lines = tm.lines("Hello", {}, {{"letter-spacing", "1vh"}});
  REQUIRE_FALSE(lines.has_value());
  CHECK(lines.error().code == Error::Code::UnsupportedUnit);
}

TEST_CASE("missing_capabilities_surface_at_first_use") {
  TextMetrics tm{TextHost{}};
  auto width = tm.width("Hello");
  REQUIRE_FALSE(width.has_value());
  CHECK(width.error().code == Error::Code::MissingCapability);

  TextMetrics bound{TextHost{}, ElementHandle{1}};
  auto font = bound.font();
  REQUIRE_FALSE(font.has_value());
  CHECK(font.error().code == Error::Code::MissingCapability);
}

TEST_CASE_FIXTURE(HalfEmFixture, "element_supplies_text_width_and_style") {
  auto handle = host.add({{{"paddingLeft", "5px"}, {"padding-right", "5px"}}, 50.0f, "Hello World"});
  TextMetrics tm{with_elements(), handle};
  CHECK_MESSAGE((tm.lines().value() == Lines{"Hello", "World"}), "box width minus padding is 40");
  CHECK(tm.width().value() == doctest::Approx(88.0f));
  CHECK_MESSAGE((tm.lines("Hi there", with_width("100")).value() == Lines{"Hi there"}),
                "explicit width still loses the padding");
}

TEST_CASE_FIXTURE(HalfEmFixture, "element_style_width_is_the_last_fallback") {
  auto handle = host.add({{{"width", "40px"}}, std::nullopt, "Hello World"});
  TextMetrics tm{with_elements(), handle};
  CHECK(tm.lines().value() == Lines{"Hello", "World"});
}

TEST_CASE_FIXTURE(HalfEmFixture, "style_precedence") {
  auto handle = host.add({{{"font-size", "64px"}}, std::nullopt, "ab"});
  TextMetrics tm{with_elements(), handle, {{"fontSize", "32px"}}};
  CHECK_MESSAGE(tm.width().value() == doctest::Approx(32.0f), "instance overrides beat the element");

  MeasureOptions options;
  options.fontSize = "24px";
  CHECK_MESSAGE(tm.width(std::nullopt, options).value() == doctest::Approx(24.0f),
                "options beat instance overrides");
  CHECK_MESSAGE((tm.width(std::nullopt, options, {{"font-size", "8px"}}).value() == doctest::Approx(8.0f)),
                "call overrides beat everything");
}

TEST_CASE_FIXTURE(HalfEmFixture, "font_descriptor") {
  TextMetrics tm{host_only()};
  CHECK(tm.font().value().toString() == "400 16px Helvetica, Arial, sans-serif");

  MeasureOptions options;
  options.fontWeight = "bold";
  options.fontFamily = "Georgia";
  CHECK(tm.font(options).value().toString() == "bold 16px Georgia");

  auto shorthand = tm.font({}, {{"font", "italic 20px serif"}});
  REQUIRE(shorthand.has_value());
  CHECK(shorthand->sizePx == doctest::Approx(20.0f));
  CHECK(shorthand->style == std::optional<std::string>{"italic"});
  CHECK(tm.width("ab", {}, {{"font", "20px serif"}}).value() == doctest::Approx(20.0f));
}

TEST_CASE_FIXTURE(HalfEmFixture, "base_font_size_scales_relative_units") {
  TextMetrics tm{host_only()};
  MeasureOptions options;
  options.baseFontSize = 10.0f;
  options.fontSize = "2em";
  // 20px font gives 10px per code point; 0.5em letter spacing adds 5px each.
  CHECK(tm.width("abc", options, {{"letterSpacing", "0.5em"}}).value() == doctest::Approx(45.0f));
}

TEST_CASE("options_become_style_keys") {
  MeasureOptions options;
  options.fontSize = "12px";
  options.width = "100";
  auto styles = ToStyleMap(options);
  CHECK(styles.size() == 2);
  CHECK(styles.at("font-size") == "12px");
  CHECK(styles.at("width") == "100");
}

TEST_SUITE_END();
