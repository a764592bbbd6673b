#pragma once

#include "LineFit/core/Error.hpp"
#include "LineFit/host/ElementHost.hpp"
#include "LineFit/style/FontDescriptor.hpp"
#include "LineFit/style/Spacing.hpp"
#include "LineFit/style/StyleSnapshot.hpp"
#include "LineFit/text/LineBreaker.hpp"
#include "LineFit/text/MetricsProvider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LineFit {

struct MeasureOptions {
  std::optional<std::string> fontSize;
  std::optional<std::string> lineHeight;
  std::optional<std::string> fontFamily;
  std::optional<std::string> fontWeight;
  std::optional<std::string> width;
  bool multiline = false;
  std::optional<float> baseFontSize;
};

// Style keys carried by the options, for use as an override layer.
auto ToStyleMap(MeasureOptions const& options) -> StyleMap;

// Capabilities supplied by the host. Not owned; they must outlive the TextMetrics using
// them. A missing capability is reported by the first operation that needs it.
struct TextHost {
  MetricsProvider* metrics = nullptr;
  StyleSource const* styles = nullptr;
  TextSource const* texts = nullptr;
};

// Measures text against a MetricsProvider, optionally bound to a host element whose
// computed style, box width and text content act as fallbacks.
//
// Style precedence per call: call overrides > options > instance overrides > element
// style > defaults. When no text is passed, the element's text is used.
class TextMetrics {
public:
  explicit TextMetrics(TextHost host, StyleMap overrides = {});
  TextMetrics(TextHost host, ElementHandle element, StyleMap overrides = {});

  auto width(std::optional<std::string_view> text = std::nullopt,
             MeasureOptions const& options = {},
             StyleMap const& overrides = {}) const -> Expected<float>;

  auto height(std::optional<std::string_view> text = std::nullopt,
              MeasureOptions const& options = {},
              StyleMap const& overrides = {}) const -> Expected<int32_t>;

  auto lines(std::optional<std::string_view> text = std::nullopt,
             MeasureOptions const& options = {},
             StyleMap const& overrides = {}) const -> Expected<std::vector<std::string>>;

  // Largest pixel font size whose width fits the available width; nullopt when none does.
  auto maxFontSize(std::optional<std::string_view> text = std::nullopt,
                   MeasureOptions const& options = {},
                   StyleMap const& overrides = {}) const -> Expected<std::optional<int32_t>>;

  auto font(MeasureOptions const& options = {},
            StyleMap const& overrides = {}) const -> Expected<FontDescriptor>;

private:
  struct Resolved {
    StyleSnapshot style;
    FontDescriptor font;
    Spacing spacing;
    LineBudget budget;
    WordBreak wordBreak = WordBreak::Normal;
    std::string text;
    float baseFontSize = DefaultBaseFontSize;
    bool multiline = false;
  };

  auto resolveStyle(MeasureOptions const& options, StyleMap const& overrides) const -> Expected<StyleSnapshot>;
  auto resolve(std::optional<std::string_view> text,
               MeasureOptions const& options,
               StyleMap const& overrides) const -> Expected<Resolved>;
  auto resolveText(std::optional<std::string_view> text, StyleSnapshot const& style) const -> Expected<std::string>;
  auto availableWidth(MeasureOptions const& options,
                      StyleMap const& overrides,
                      StyleSnapshot const& style) const -> std::optional<float>;
  auto padding(StyleSnapshot const& style) const -> float;

  auto measureWidth(Resolved const& resolved, FontDescriptor const& font) const -> Expected<float>;
  auto packLines(Resolved const& resolved, FontDescriptor const& font) const -> Expected<std::vector<std::string>>;
  auto metrics() const -> Expected<MetricsProvider*>;

  TextHost host;
  std::optional<ElementHandle> element;
  StyleMap instanceOverrides;
};

} // namespace LineFit
