#pragma once

#include "LineFit/core/Error.hpp"
#include "LineFit/style/StyleSnapshot.hpp"
#include "LineFit/style/Units.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LineFit {

inline constexpr std::string_view DefaultFontFamily = "Helvetica, Arial, sans-serif";

bool IsFontWeightKeyword(std::string_view value);
bool IsFontStyleKeyword(std::string_view value);
bool IsFontVariantKeyword(std::string_view value);

// "[weight] [style] [variant] <size>px <family>" as handed to a MetricsProvider.
struct FontDescriptor {
  std::optional<std::string> weight;
  std::optional<std::string> style;
  std::optional<std::string> variant;
  float sizePx = DefaultBaseFontSize;
  std::string family{DefaultFontFamily};

  // Unrecognized weight/style/variant values are dropped.
  static auto FromStyle(StyleSnapshot const& style,
                        float baseFontSizePx = DefaultBaseFontSize) -> Expected<FontDescriptor>;

  // Parses a font shorthand such as "italic bold 12pt/1.5 Georgia, serif".
  static auto Parse(std::string_view shorthand,
                    float baseFontSizePx = DefaultBaseFontSize) -> Expected<FontDescriptor>;

  auto toString() const -> std::string;
  auto withSize(float px) const -> FontDescriptor;

  // Family list split on commas with surrounding quotes removed.
  auto families() const -> std::vector<std::string>;

  // 100..900; keywords map to their CSS values relative to 400.
  auto numericWeight() const -> uint16_t;

  bool operator==(FontDescriptor const& other) const = default;
};

} // namespace LineFit
