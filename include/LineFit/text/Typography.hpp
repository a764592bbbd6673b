#pragma once

#include "LineFit/style/FontDescriptor.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace LineFit {

enum class FontSlant : uint8_t {
  Upright = 0,
  Italic,
  Oblique,
};

// Face selection request derived from a FontDescriptor.
struct Typography {
  std::vector<std::string> families;
  float size = 16.0f;
  uint16_t weight = 400;
  FontSlant slant = FontSlant::Upright;
  bool smallCaps = false;
};

auto ToTypography(FontDescriptor const& font) -> Typography;

// Generic CSS families resolve to whatever face the registry prefers.
bool IsGenericFamily(std::string_view family);

} // namespace LineFit

inline auto LineFit::IsGenericFamily(std::string_view family) -> bool {
  return family == "serif" || family == "sans-serif" || family == "monospace" ||
         family == "cursive" || family == "fantasy" || family == "system-ui" ||
         family == "default";
}

inline auto LineFit::ToTypography(FontDescriptor const& font) -> Typography {
  Typography typography;
  typography.families = font.families();
  typography.size = font.sizePx;
  typography.weight = font.numericWeight();
  if (font.style == "italic") {
    typography.slant = FontSlant::Italic;
  } else if (font.style == "oblique") {
    typography.slant = FontSlant::Oblique;
  }
  typography.smallCaps = font.variant == "small-caps";
  return typography;
}
