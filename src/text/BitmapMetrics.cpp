#include "LineFit/text/BitmapMetrics.hpp"

#include "LineFit/text/Utf8.hpp"

namespace LineFit {

bool IsZeroAdvance(uint32_t codepoint) {
  switch (codepoint) {
    case 0x00ADu: // soft hyphen
    case 0x200Bu: // zero width space
    case 0x200Cu:
    case 0x200Du:
    case 0x2060u:
    case 0xFEFFu:
      return true;
    default:
      return false;
  }
}

auto BitmapMetrics::advanceFor(float sizePx) const -> float {
  if (sizePx <= 0.0f || grid.height <= 0.0f) return 0.0f;
  return grid.advance * sizePx / grid.height;
}

auto BitmapMetrics::measure(FontDescriptor const& font, std::string_view text) -> Expected<float> {
  float advance = advanceFor(font.sizePx);
  float width = 0.0f;
  for (auto const& cp : DecodeUtf8(text)) {
    if (IsZeroAdvance(cp.codepoint)) continue;
    width += advance;
  }
  return width;
}

} // namespace LineFit
