#pragma once

#include "LineFit/core/Error.hpp"
#include "LineFit/style/FontDescriptor.hpp"

#include <functional>
#include <string_view>

namespace LineFit {

// Host capability: advance width in pixels of a string set in a font. Implementations
// backed by a shared mutable context serialize access themselves.
class MetricsProvider {
public:
  virtual ~MetricsProvider() = default;

  virtual auto measure(FontDescriptor const& font, std::string_view text) -> Expected<float> = 0;
};

// Width of a candidate string with the font already bound.
using MeasureFn = std::function<Expected<float>(std::string_view)>;

auto BindMeasure(MetricsProvider& metrics, FontDescriptor font) -> MeasureFn;

} // namespace LineFit
