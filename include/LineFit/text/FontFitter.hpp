#pragma once

#include "LineFit/core/Error.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace LineFit {

// Rendered width of the text at an integer pixel font size.
using SizeMeasureFn = std::function<Expected<float>(int32_t sizePx)>;

inline constexpr int32_t kMaxFitIterations = 4096;

// Largest integer font size whose width stays within maxWidth.
//
// Local search: seed at half the budget, rescale once from the measured ratio, then
// gallop toward the budget and bisect the last step. The result is locally optimal for
// a monotone width function. Returns nullopt when no positive size fits. Fails with
// Error::Code::DidNotConverge when the search exceeds maxIterations measurements or the
// width stays within the budget up to the largest representable size.
auto MaxFontSize(int32_t maxWidth,
                 SizeMeasureFn const& renderWidthAtSize,
                 int32_t maxIterations = kMaxFitIterations) -> Expected<std::optional<int32_t>>;

} // namespace LineFit
