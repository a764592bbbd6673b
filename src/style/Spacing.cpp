#include "LineFit/style/Spacing.hpp"

#include "LineFit/style/TextPrepare.hpp"
#include "LineFit/text/Utf8.hpp"

#include <algorithm>
#include <array>

namespace LineFit {

namespace {

bool is_keyword(std::string_view value) {
  constexpr std::array<std::string_view, 4> kKeywords = {"inherit", "initial", "unset", "normal"};
  return std::find(kKeywords.begin(), kKeywords.end(), value) != kKeywords.end();
}

auto resolve(std::string_view value, float baseFontSizePx) -> Expected<float> {
  if (value.empty() || is_keyword(value)) return 0.0f;
  return ToPixels(value, baseFontSizePx);
}

} // namespace

auto Spacing::operator()(std::string_view text) const -> float {
  if (isZero()) return 0.0f;
  auto normalized = CollapseWhitespace(text);
  auto words = static_cast<float>(std::count(normalized.begin(), normalized.end(), ' '));
  auto chars = static_cast<float>(CodepointCount(text));
  return words * wordPx + chars * letterPx;
}

auto BuildSpacing(std::string_view wordSpacing,
                  std::string_view letterSpacing,
                  float baseFontSizePx) -> Expected<Spacing> {
  auto word = resolve(wordSpacing, baseFontSizePx);
  if (!word) return std::unexpected(word.error());
  auto letter = resolve(letterSpacing, baseFontSizePx);
  if (!letter) return std::unexpected(letter.error());
  return Spacing{*word, *letter};
}

} // namespace LineFit
