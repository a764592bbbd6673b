#pragma once

#include <cstdint>
#include <string_view>

namespace LineFit {

// Curated subset of the UAX #14 line breaking classes.
enum class BreakCategory : uint8_t {
  None = 0,
  B2,  // break opportunity before and after (em dash)
  BAI, // break after, dropped at the break (spaces)
  SHY, // soft hyphen, rendered as '-' only when broken
  BA,  // break after, kept at the end of the line
  BB,  // break before
  BK,  // mandatory break
};

auto Classify(uint32_t codepoint) -> BreakCategory;

bool IsCollapsibleSpace(uint32_t codepoint);

// True when the text is non-empty and every code point classifies as BAI.
bool IsCollapsibleRun(std::string_view utf8);

auto ToString(BreakCategory category) -> std::string_view;

inline constexpr uint32_t SoftHyphen = 0x00ADu;
inline constexpr uint32_t EmDash = 0x2014u;
inline constexpr uint32_t LineFeed = 0x000Au;
inline constexpr uint32_t ZeroWidthSpace = 0x200Bu;

} // namespace LineFit
