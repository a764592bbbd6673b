#include "LineFit/style/FontDescriptor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace LineFit {

namespace {

constexpr std::array<std::string_view, 13> kWeights = {
    "normal", "bold", "bolder", "lighter",
    "100", "200", "300", "400", "500", "600", "700", "800", "900",
};
constexpr std::array<std::string_view, 3> kStyles = {"normal", "italic", "oblique"};
constexpr std::array<std::string_view, 2> kVariants = {"normal", "small-caps"};

template <size_t N>
bool contains(std::array<std::string_view, N> const& table, std::string_view value) {
  return std::find(table.begin(), table.end(), value) != table.end();
}

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

auto split_tokens(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> tokens;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    size_t start = i;
    while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    if (i > start) tokens.push_back(text.substr(start, i - start));
  }
  return tokens;
}

bool looks_numeric(std::string_view token) {
  if (token.empty()) return false;
  char c = token.front();
  return (c >= '0' && c <= '9') || c == '.';
}

} // namespace

bool IsFontWeightKeyword(std::string_view value) {
  return contains(kWeights, value);
}

bool IsFontStyleKeyword(std::string_view value) {
  return contains(kStyles, value);
}

bool IsFontVariantKeyword(std::string_view value) {
  return contains(kVariants, value);
}

auto FontDescriptor::FromStyle(StyleSnapshot const& style,
                               float baseFontSizePx) -> Expected<FontDescriptor> {
  FontDescriptor font;
  auto weight = style.value("font-weight", "400");
  if (IsFontWeightKeyword(weight)) font.weight = std::string{weight};
  if (auto slant = style.get("font-style"); slant && IsFontStyleKeyword(*slant)) {
    font.style = std::string{*slant};
  }
  if (auto variant = style.get("font-variant"); variant && IsFontVariantKeyword(*variant)) {
    font.variant = std::string{*variant};
  }
  auto size = ToPixels(style.value("font-size", "16px"), baseFontSizePx);
  if (!size) return std::unexpected(size.error());
  font.sizePx = *size;
  font.family = std::string{style.value("font-family", DefaultFontFamily)};
  return font;
}

auto FontDescriptor::Parse(std::string_view shorthand,
                           float baseFontSizePx) -> Expected<FontDescriptor> {
  auto tokens = split_tokens(shorthand);
  FontDescriptor font;
  font.family.clear();

  size_t i = 0;
  for (; i < tokens.size(); ++i) {
    auto token = tokens[i];
    if (looks_numeric(token) && !IsFontWeightKeyword(token)) break;
    if (token == "normal") continue;
    if (IsFontWeightKeyword(token)) {
      font.weight = std::string{token};
    } else if (IsFontStyleKeyword(token)) {
      font.style = std::string{token};
    } else if (IsFontVariantKeyword(token)) {
      font.variant = std::string{token};
    }
  }
  if (i >= tokens.size()) {
    return std::unexpected(Error{Error::Code::MalformedInput,
                                 "font shorthand has no size: " + std::string{shorthand}});
  }

  auto sizeToken = tokens[i++];
  if (auto slash = sizeToken.find('/'); slash != std::string_view::npos) {
    sizeToken = sizeToken.substr(0, slash);
  }
  auto size = ToPixels(sizeToken, baseFontSizePx);
  if (!size) return std::unexpected(size.error());
  font.sizePx = *size;

  // A detached line height ("12px / 1.5 serif") is skipped.
  if (i < tokens.size() && tokens[i].front() == '/') {
    if (tokens[i].size() == 1) ++i;
    ++i;
  }
  for (; i < tokens.size(); ++i) {
    if (!font.family.empty()) font.family.push_back(' ');
    font.family.append(tokens[i]);
  }
  if (font.family.empty()) {
    return std::unexpected(Error{Error::Code::MalformedInput,
                                 "font shorthand has no family: " + std::string{shorthand}});
  }
  return font;
}

auto FontDescriptor::toString() const -> std::string {
  std::ostringstream out;
  if (weight) out << *weight << ' ';
  if (style) out << *style << ' ';
  if (variant) out << *variant << ' ';
  out << FormatPixels(sizePx) << ' ' << family;
  return out.str();
}

auto FontDescriptor::withSize(float px) const -> FontDescriptor {
  FontDescriptor copy = *this;
  copy.sizePx = px;
  return copy;
}

auto FontDescriptor::families() const -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string_view rest{family};
  while (!rest.empty()) {
    size_t comma = rest.find(',');
    auto entry = trim(rest.substr(0, comma));
    if (entry.size() >= 2 && (entry.front() == '"' || entry.front() == '\'') && entry.back() == entry.front()) {
      entry = entry.substr(1, entry.size() - 2);
    }
    if (!entry.empty()) out.emplace_back(entry);
    if (comma == std::string_view::npos) break;
    rest.remove_prefix(comma + 1);
  }
  return out;
}

auto FontDescriptor::numericWeight() const -> uint16_t {
  if (!weight || *weight == "normal") return 400;
  if (*weight == "bold" || *weight == "bolder") return 700;
  if (*weight == "lighter") return 100;
  auto parsed = ParseLeadingInt(*weight);
  if (!parsed) return 400;
  return static_cast<uint16_t>(std::clamp(*parsed, 1, 1000));
}

} // namespace LineFit
