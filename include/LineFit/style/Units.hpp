#pragma once

#include "LineFit/core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace LineFit {

inline constexpr float DefaultBaseFontSize = 16.0f;

struct LeadingNumber {
  double value = 0.0;
  size_t length = 0; // bytes consumed, including leading whitespace
};

// Leading decimal number with optional sign and exponent. Leading whitespace is skipped.
auto ParseLeadingNumber(std::string_view text) -> std::optional<LeadingNumber>;

// Integer prefix of a length ("300.7px" -> 300).
auto ParseLeadingInt(std::string_view text) -> std::optional<int32_t>;

// Converts px, pt, em and rem lengths to pixels. Any other unit, a missing unit, or a
// missing number fails with Error::Code::UnsupportedUnit.
auto ToPixels(std::string_view length, float baseFontSizePx = DefaultBaseFontSize) -> Expected<float>;

// Shortest round-trip rendering followed by "px" ("16px", "15.5px").
auto FormatPixels(float px) -> std::string;

} // namespace LineFit
