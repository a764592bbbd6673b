#pragma once

#include "LineFit/text/MetricsProvider.hpp"

#include <cstdint>
#include <string_view>

namespace LineFit {

inline constexpr int UiFontHeight = 7;
inline constexpr int UiFontAdvance = 6;

// Fixed-grid metrics: every visible code point advances by the same amount, scaled from
// the grid height to the requested font size. Needs no font files.
class BitmapMetrics final : public MetricsProvider {
public:
  struct Grid {
    float advance = static_cast<float>(UiFontAdvance);
    float height = static_cast<float>(UiFontHeight);
  };

  BitmapMetrics() = default;
  explicit BitmapMetrics(Grid grid) : grid(grid) {}

  auto measure(FontDescriptor const& font, std::string_view text) -> Expected<float> override;

  auto advanceFor(float sizePx) const -> float;

private:
  Grid grid;
};

// Soft hyphens and zero width characters take no space.
bool IsZeroAdvance(uint32_t codepoint);

} // namespace LineFit
