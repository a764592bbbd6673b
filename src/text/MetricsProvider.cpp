#include "LineFit/text/MetricsProvider.hpp"

#include <utility>

namespace LineFit {

auto BindMeasure(MetricsProvider& metrics, FontDescriptor font) -> MeasureFn {
  return [&metrics, font = std::move(font)](std::string_view text) -> Expected<float> {
    return metrics.measure(font, text);
  };
}

} // namespace LineFit
