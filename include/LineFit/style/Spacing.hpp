#pragma once

#include "LineFit/core/Error.hpp"
#include "LineFit/style/Units.hpp"

#include <string_view>

namespace LineFit {

// Extra width contributed by word-spacing and letter-spacing for a candidate string.
struct Spacing {
  float wordPx = 0.0f;
  float letterPx = 0.0f;

  auto operator()(std::string_view text) const -> float;
  bool isZero() const { return wordPx == 0.0f && letterPx == 0.0f; }
};

// Keywords inherit/initial/unset/normal and empty values count as zero.
auto BuildSpacing(std::string_view wordSpacing,
                  std::string_view letterSpacing,
                  float baseFontSizePx = DefaultBaseFontSize) -> Expected<Spacing>;

} // namespace LineFit
