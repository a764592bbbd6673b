#pragma once

#include "LineFit/core/Error.hpp"
#include "LineFit/style/Spacing.hpp"
#include "LineFit/text/BreakClass.hpp"
#include "LineFit/text/MetricsProvider.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LineFit {

struct Breakpoint {
  std::string character;
  BreakCategory category = BreakCategory::None;
};

// parts[i + 1] follows breakpoints[i]. A trailing break character leaves one more
// breakpoint than there are following parts.
struct TextParts {
  std::vector<std::string> parts;
  std::vector<Breakpoint> breakpoints;
};

// Splits text at every break opportunity. Collapsible spaces at the start of a part are
// dropped.
auto ScanParts(std::string_view text) -> TextParts;

enum class WordBreak : uint8_t {
  Normal = 0,
  BreakAll,
};

auto ParseWordBreak(std::string_view value) -> WordBreak;

// An absent budget never forces a split.
struct LineBudget {
  std::optional<float> maxWidth;

  bool fits(float width) const { return !maxWidth || width <= *maxWidth; }
};

// Greedy packing at word and punctuation opportunities. Widths are rounded half up.
auto PackDefault(std::string_view text,
                 LineBudget budget,
                 Spacing const& spacing,
                 MeasureFn const& measure) -> Expected<std::vector<std::string>>;

// Greedy packing at any code point boundary. Widths are rounded up.
auto PackBreakAll(std::string_view text,
                  LineBudget budget,
                  Spacing const& spacing,
                  MeasureFn const& measure) -> Expected<std::vector<std::string>>;

auto PackLines(WordBreak mode,
               std::string_view text,
               LineBudget budget,
               Spacing const& spacing,
               MeasureFn const& measure) -> Expected<std::vector<std::string>>;

} // namespace LineFit
