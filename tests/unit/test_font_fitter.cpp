#include "LineFit/text/FontFitter.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <cmath>

using namespace LineFit;
using namespace LineFitTest;
TEST_SUITE_BEGIN("linefit.font_fitter");

namespace {

auto linear(float slope, float offset = 0.0f) -> SizeMeasureFn {
  return [slope, offset](int32_t size) -> Expected<float> {
    return slope * static_cast<float>(size) + offset;
  };
}

} // namespace

TEST_CASE("exact_fit_after_rescale") {
  auto size = MaxFontSize(100, linear(5.0f));
  REQUIRE(size.has_value());
  CHECK(*size == std::optional<int32_t>{20});

  auto half = MaxFontSize(100, linear(2.5f));
  REQUIRE(half.has_value());
  CHECK(*half == std::optional<int32_t>{40});
}

TEST_CASE("walks_up_to_the_budget") {
  // 33 * 3 = 99 fits, 34 * 3 = 102 does not.
  auto size = MaxFontSize(100, linear(3.0f));
  REQUIRE(size.has_value());
  CHECK(*size == std::optional<int32_t>{33});
}

TEST_CASE("walks_down_when_the_offset_overshoots") {
  // Rescale lands on 14 (103px); 13 gives 96px.
  auto size = MaxFontSize(100, linear(7.0f, 5.0f));
  REQUIRE(size.has_value());
  CHECK(*size == std::optional<int32_t>{13});
}

TEST_CASE("fractional_widths_round_up") {
  // 0.99 * 101 = 99.99 rounds to 100 and still fits.
  auto size = MaxFontSize(100, linear(0.99f));
  REQUIRE(size.has_value());
  REQUIRE(size->has_value());
  CHECK(**size >= 100);
  CHECK(std::ceil(0.99f * static_cast<float>(**size)) <= 100.0f);
  CHECK(std::ceil(0.99f * static_cast<float>(**size + 1)) > 100.0f);
}

TEST_CASE("large_budgets_converge") {
  auto size = MaxFontSize(5'000'000, linear(2.5f));
  REQUIRE(size.has_value());
  CHECK(*size == std::optional<int32_t>{2'000'000});

  // The offset makes the rescale land short, so the search walks up the rest of the way.
  auto offset = MaxFontSize(3'000'000, linear(1.0f, 1000.0f));
  REQUIRE(offset.has_value());
  CHECK(*offset == std::optional<int32_t>{2'999'000});
}

TEST_CASE("iteration_cap_reports_did_not_converge") {
  LogCapture capture(LogLevel::Error);
  // Seed and rescale use both measurements; the first step up needs a third.
  auto size = MaxFontSize(100, linear(3.0f), 2);
  REQUIRE_FALSE(size.has_value());
  CHECK(size.error().code == Error::Code::DidNotConverge);
  CHECK(capture.count(LogLevel::Error, "fit") == 1);
}

TEST_CASE("nothing_fits") {
  auto size = MaxFontSize(100, linear(1.0f, 1000.0f));
  REQUIRE(size.has_value());
  CHECK_FALSE(size->has_value());
}

TEST_CASE("flat_width_does_not_converge") {
  LogCapture capture(LogLevel::Error);
  auto size = MaxFontSize(100, linear(0.0f), 100);
  REQUIRE_FALSE(size.has_value());
  CHECK(size.error().code == Error::Code::DidNotConverge);
  CHECK(capture.count(LogLevel::Error, "fit") == 1);
}

TEST_CASE("measure_errors_propagate") {
  int calls = 0;
  auto size = MaxFontSize(100, [&](int32_t) -> Expected<float> {
    ++calls;
    return std::unexpected(Error{Error::Code::UnsupportedUnit, "bad"});
  });
  REQUIRE_FALSE(size.has_value());
  CHECK(size.error().code == Error::Code::UnsupportedUnit);
  CHECK(calls == 1);
}

TEST_SUITE_END();
