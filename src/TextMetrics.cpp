#include "LineFit/TextMetrics.hpp"

#include "LineFit/core/Log.hpp"
#include "LineFit/style/TextPrepare.hpp"
#include "LineFit/style/Units.hpp"
#include "LineFit/text/FontFitter.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace LineFit {

namespace {

// Zero counts as absent, so the next fallback is tried.
auto positive_int(std::optional<std::string_view> value) -> std::optional<int32_t> {
  if (!value) return std::nullopt;
  auto parsed = ParseLeadingInt(*value);
  if (!parsed || *parsed == 0) return std::nullopt;
  return parsed;
}

auto lookup(StyleMap const& styles, std::string_view key) -> std::optional<std::string_view> {
  auto it = styles.find(key);
  if (it == styles.end() || it->second.empty()) return std::nullopt;
  return std::string_view{it->second};
}

auto line_height_px(StyleSnapshot const& style, FontDescriptor const& font, float baseFontSize) -> Expected<float> {
  auto value = style.get("line-height");
  if (!value || *value == "normal") return 0.0f;
  auto number = ParseLeadingNumber(*value);
  if (!number) return 0.0f;
  auto unit = value->substr(number->length);
  while (!unit.empty() && unit.back() == ' ') unit.remove_suffix(1);
  if (unit.empty()) return static_cast<float>(number->value) * font.sizePx;
  if (unit == "%") return static_cast<float>(number->value) / 100.0f * font.sizePx;
  return ToPixels(*value, baseFontSize);
}

auto base_font_size(MeasureOptions const& options, StyleSnapshot const& style) -> float {
  if (options.baseFontSize) return *options.baseFontSize;
  if (auto base = style.get("base-font-size")) {
    if (auto parsed = ParseLeadingNumber(*base); parsed && parsed->value > 0.0) {
      return static_cast<float>(parsed->value);
    }
  }
  return DefaultBaseFontSize;
}

auto font_for(StyleSnapshot const& style, float baseFontSize) -> Expected<FontDescriptor> {
  if (auto shorthand = style.get("font")) return FontDescriptor::Parse(*shorthand, baseFontSize);
  return FontDescriptor::FromStyle(style, baseFontSize);
}

} // namespace

auto ToStyleMap(MeasureOptions const& options) -> StyleMap {
  StyleMap out;
  if (options.fontSize) out["font-size"] = *options.fontSize;
  if (options.lineHeight) out["line-height"] = *options.lineHeight;
  if (options.fontFamily) out["font-family"] = *options.fontFamily;
  if (options.fontWeight) out["font-weight"] = *options.fontWeight;
  if (options.width) out["width"] = *options.width;
  return out;
}

TextMetrics::TextMetrics(TextHost host, StyleMap overrides)
    : host(host), instanceOverrides(NormalizeKeys(overrides)) {}

TextMetrics::TextMetrics(TextHost host, ElementHandle element, StyleMap overrides)
    : host(host), element(element), instanceOverrides(NormalizeKeys(overrides)) {}

auto TextMetrics::metrics() const -> Expected<MetricsProvider*> {
  if (!host.metrics) {
    return std::unexpected(Error{Error::Code::MissingCapability, "no metrics provider configured"});
  }
  return host.metrics;
}

auto TextMetrics::resolveStyle(MeasureOptions const& options,
                               StyleMap const& overrides) const -> Expected<StyleSnapshot> {
  StyleMap elementStyle;
  if (element) {
    if (!host.styles) {
      return std::unexpected(Error{Error::Code::MissingCapability, "no style source configured"});
    }
    auto resolved = host.styles->resolve(*element);
    if (!resolved) return std::unexpected(resolved.error());
    elementStyle = std::move(*resolved);
  }
  auto optionStyle = ToStyleMap(options);
  return StyleSnapshot::Merge({&elementStyle, &instanceOverrides, &optionStyle, &overrides});
}

auto TextMetrics::resolveText(std::optional<std::string_view> text,
                              StyleSnapshot const& style) const -> Expected<std::string> {
  auto whiteSpace = ParseWhiteSpace(style.value("white-space"));
  std::string normalized;
  if ((!text || text->empty()) && element) {
    if (!host.texts) {
      return std::unexpected(Error{Error::Code::MissingCapability, "no text source configured"});
    }
    normalized = NormalizeWhitespace(host.texts->read(*element), whiteSpace);
  } else if (text) {
    normalized = PrepareText(NormalizeWhitespace(*text, whiteSpace));
  }
  return ApplyTextTransform(normalized, ParseTextTransform(style.value("text-transform")));
}

auto TextMetrics::padding(StyleSnapshot const& style) const -> float {
  if (!element) return 0.0f;
  auto left = ParseLeadingInt(style.value("padding-left", "0")).value_or(0);
  auto right = ParseLeadingInt(style.value("padding-right", "0")).value_or(0);
  return static_cast<float>(left + right);
}

auto TextMetrics::availableWidth(MeasureOptions const& options,
                                 StyleMap const& overrides,
                                 StyleSnapshot const& style) const -> std::optional<float> {
  std::optional<float> width;
  if (options.width) {
    if (auto parsed = positive_int(*options.width)) width = static_cast<float>(*parsed);
  }
  if (!width) {
    auto normalized = NormalizeKeys(overrides);
    if (auto parsed = positive_int(lookup(normalized, "width"))) width = static_cast<float>(*parsed);
  }
  if (!width && element && host.styles) {
    if (auto box = host.styles->boxWidth(*element); box && *box != 0.0f) width = *box;
  }
  if (!width) {
    if (auto parsed = positive_int(style.get("width"))) width = static_cast<float>(*parsed);
  }
  if (!width) return std::nullopt;
  return *width - padding(style);
}

auto TextMetrics::font(MeasureOptions const& options, StyleMap const& overrides) const -> Expected<FontDescriptor> {
  auto style = resolveStyle(options, overrides);
  if (!style) return std::unexpected(style.error());
  return font_for(*style, base_font_size(options, *style));
}

auto TextMetrics::resolve(std::optional<std::string_view> text,
                          MeasureOptions const& options,
                          StyleMap const& overrides) const -> Expected<Resolved> {
  auto style = resolveStyle(options, overrides);
  if (!style) return std::unexpected(style.error());

  Resolved resolved;
  resolved.style = std::move(*style);
  resolved.multiline = options.multiline;
  resolved.baseFontSize = base_font_size(options, resolved.style);

  auto font = font_for(resolved.style, resolved.baseFontSize);
  if (!font) return std::unexpected(font.error());
  resolved.font = std::move(*font);

  auto spacing = BuildSpacing(resolved.style.value("word-spacing"),
                              resolved.style.value("letter-spacing"),
                              resolved.baseFontSize);
  if (!spacing) return std::unexpected(spacing.error());
  resolved.spacing = *spacing;

  auto prepared = resolveText(text, resolved.style);
  if (!prepared) return std::unexpected(prepared.error());
  resolved.text = std::move(*prepared);

  resolved.budget.maxWidth = availableWidth(options, overrides, resolved.style);
  resolved.wordBreak = ParseWordBreak(resolved.style.value("word-break"));
  return resolved;
}

auto TextMetrics::packLines(Resolved const& resolved,
                            FontDescriptor const& font) const -> Expected<std::vector<std::string>> {
  auto provider = metrics();
  if (!provider) return std::unexpected(provider.error());
  lf_log(LogLevel::Debug, "metrics",
         std::string{resolved.wordBreak == WordBreak::BreakAll ? "break-all" : "default"} +
             " packing with font '" + font.toString() + "'");
  return PackLines(resolved.wordBreak, resolved.text, resolved.budget, resolved.spacing,
                   BindMeasure(**provider, font));
}

auto TextMetrics::measureWidth(Resolved const& resolved, FontDescriptor const& font) const -> Expected<float> {
  if (resolved.text.empty()) return 0.0f;
  auto provider = metrics();
  if (!provider) return std::unexpected(provider.error());

  if (!resolved.multiline) {
    auto width = (*provider)->measure(font, resolved.text);
    if (!width) return std::unexpected(width.error());
    return *width + resolved.spacing(resolved.text);
  }

  auto lines = packLines(resolved, font);
  if (!lines) return std::unexpected(lines.error());
  float widest = 0.0f;
  for (auto const& line : *lines) {
    auto width = (*provider)->measure(font, line);
    if (!width) return std::unexpected(width.error());
    widest = std::max(widest, *width + resolved.spacing(line));
  }
  return widest;
}

auto TextMetrics::width(std::optional<std::string_view> text,
                        MeasureOptions const& options,
                        StyleMap const& overrides) const -> Expected<float> {
  auto resolved = resolve(text, options, overrides);
  if (!resolved) return std::unexpected(resolved.error());
  return measureWidth(*resolved, resolved->font);
}

auto TextMetrics::lines(std::optional<std::string_view> text,
                        MeasureOptions const& options,
                        StyleMap const& overrides) const -> Expected<std::vector<std::string>> {
  auto resolved = resolve(text, options, overrides);
  if (!resolved) return std::unexpected(resolved.error());
  return packLines(*resolved, resolved->font);
}

auto TextMetrics::height(std::optional<std::string_view> text,
                         MeasureOptions const& options,
                         StyleMap const& overrides) const -> Expected<int32_t> {
  auto resolved = resolve(text, options, overrides);
  if (!resolved) return std::unexpected(resolved.error());
  auto lineHeight = line_height_px(resolved->style, resolved->font, resolved->baseFontSize);
  if (!lineHeight) return std::unexpected(lineHeight.error());
  auto packed = packLines(*resolved, resolved->font);
  if (!packed) return std::unexpected(packed.error());
  return static_cast<int32_t>(std::ceil(static_cast<float>(packed->size()) * *lineHeight));
}

auto TextMetrics::maxFontSize(std::optional<std::string_view> text,
                              MeasureOptions const& options,
                              StyleMap const& overrides) const -> Expected<std::optional<int32_t>> {
  auto resolved = resolve(text, options, overrides);
  if (!resolved) return std::unexpected(resolved.error());
  if (!resolved->budget.maxWidth) {
    lf_log(LogLevel::Warn, "metrics", "maxFontSize needs a width; none was given or resolved");
    return std::optional<int32_t>{};
  }
  if (resolved->text.empty()) return std::optional<int32_t>{};

  auto budget = static_cast<int32_t>(std::clamp(std::floor(static_cast<double>(*resolved->budget.maxWidth)),
                                                static_cast<double>(std::numeric_limits<int32_t>::min()),
                                                static_cast<double>(std::numeric_limits<int32_t>::max())));
  Resolved const& fixed = *resolved;
  return MaxFontSize(budget, [&](int32_t size) -> Expected<float> {
    return measureWidth(fixed, fixed.font.withSize(static_cast<float>(size)));
  });
}

} // namespace LineFit
