#include "LineFit/text/FontFitter.hpp"

#include "LineFit/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace LineFit {

namespace {

constexpr int64_t kLargestSize = std::numeric_limits<int32_t>::max();

auto settle(int64_t size) -> std::optional<int32_t> {
  if (size <= 0) return std::nullopt;
  return static_cast<int32_t>(size);
}

} // namespace

auto MaxFontSize(int32_t maxWidth,
                 SizeMeasureFn const& renderWidthAtSize,
                 int32_t maxIterations) -> Expected<std::optional<int32_t>> {
  int32_t iterations = 0;
  auto fail = [&](std::string const& reason) -> Error {
    lf_log(LogLevel::Error, "fit", "font size search stopped: " + reason);
    return Error{Error::Code::DidNotConverge, "font size search did not converge: " + reason};
  };
  auto compute = [&](int64_t size) -> Expected<double> {
    if (++iterations > maxIterations) {
      return std::unexpected(fail("more than " + std::to_string(maxIterations) + " measurements"));
    }
    auto width = renderWidthAtSize(static_cast<int32_t>(size));
    if (!width) return std::unexpected(width.error());
    return std::ceil(static_cast<double>(*width));
  };

  auto const max = static_cast<double>(maxWidth);

  int64_t size = maxWidth / 2;
  if (maxWidth < 0 && maxWidth % 2 != 0) --size;
  auto cur = compute(size);
  if (!cur) return std::unexpected(cur.error());

  // A zero width carries no scale information; keep the seed.
  if (*cur > 0.0) {
    auto scaled = std::floor(static_cast<double>(size) / *cur * max);
    size = static_cast<int64_t>(std::clamp(scaled, 0.0, static_cast<double>(kLargestSize)));
    cur = compute(size);
    if (!cur) return std::unexpected(cur.error());
  }

  if (*cur == max) return settle(size);

  // Gallop away from the estimate until the budget is crossed, then bisect. For a monotone
  // width this lands on the same size as a one pixel walk.
  int64_t fits = 0;
  int64_t exceeds = 0;
  if (*cur > max) {
    if (size <= 0) return settle(0);
    exceeds = size;
    for (int64_t step = 1;; step *= 2) {
      int64_t trial = std::max<int64_t>(exceeds - step, 0);
      auto width = compute(trial);
      if (!width) return std::unexpected(width.error());
      if (*width <= max) {
        fits = trial;
        break;
      }
      exceeds = trial;
      if (trial == 0) return settle(0);
    }
  } else {
    fits = size;
    for (int64_t step = 1;; step *= 2) {
      if (fits == kLargestSize) return std::unexpected(fail("width does not grow with the font size"));
      int64_t trial = std::min(fits + step, kLargestSize);
      auto width = compute(trial);
      if (!width) return std::unexpected(width.error());
      if (*width > max) {
        exceeds = trial;
        break;
      }
      fits = trial;
    }
  }

  while (exceeds - fits > 1) {
    int64_t mid = fits + (exceeds - fits) / 2;
    auto width = compute(mid);
    if (!width) return std::unexpected(width.error());
    if (*width <= max) {
      fits = mid;
    } else {
      exceeds = mid;
    }
  }
  return settle(fits);
}

} // namespace LineFit
