#include "LineFit/style/Units.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace LineFit {

namespace {

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
  while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
  return text;
}

} // namespace

auto ParseLeadingNumber(std::string_view text) -> std::optional<LeadingNumber> {
  size_t i = 0;
  while (i < text.size() && is_space(text[i])) ++i;
  size_t start = i;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;

  size_t mantissaStart = i;
  size_t digits = 0;
  while (i < text.size() && is_digit(text[i])) {
    ++i;
    ++digits;
  }
  if (i < text.size() && text[i] == '.') {
    size_t dot = i++;
    size_t fraction = 0;
    while (i < text.size() && is_digit(text[i])) {
      ++i;
      ++fraction;
    }
    if (fraction == 0) i = dot;
    digits += fraction;
  }
  if (digits == 0) return std::nullopt;

  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    size_t e = i + 1;
    if (e < text.size() && (text[e] == '+' || text[e] == '-')) ++e;
    if (e < text.size() && is_digit(text[e])) {
      while (e < text.size() && is_digit(text[e])) ++e;
      i = e;
    }
  }

  std::string number{text.substr(mantissaStart, i - mantissaStart)};
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
  if (ec == std::errc::result_out_of_range) {
    value = std::numeric_limits<double>::infinity();
  } else if (ec != std::errc{} || ptr != number.data() + number.size()) {
    return std::nullopt;
  }
  if (text[start] == '-') value = -value;
  return LeadingNumber{value, i};
}

auto ParseLeadingInt(std::string_view text) -> std::optional<int32_t> {
  size_t i = 0;
  while (i < text.size() && is_space(text[i])) ++i;
  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }
  size_t start = i;
  int64_t value = 0;
  while (i < text.size() && is_digit(text[i])) {
    value = value * 10 + (text[i] - '0');
    if (value > std::numeric_limits<int32_t>::max()) {
      value = std::numeric_limits<int32_t>::max();
    }
    ++i;
  }
  if (i == start) return std::nullopt;
  return static_cast<int32_t>(negative ? -value : value);
}

auto ToPixels(std::string_view length, float baseFontSizePx) -> Expected<float> {
  auto trimmed = trim(length);
  auto number = ParseLeadingNumber(trimmed);
  if (!number) {
    return std::unexpected(Error{Error::Code::UnsupportedUnit,
                                 "The unit " + std::string{trimmed} + " is not supported"});
  }
  auto unit = trim(trimmed.substr(number->length));
  auto value = number->value;
  if (unit == "px") return static_cast<float>(value);
  if (unit == "pt") return static_cast<float>(value / (96.0 / 72.0));
  if (unit == "em" || unit == "rem") return static_cast<float>(value * baseFontSizePx);
  return std::unexpected(Error{Error::Code::UnsupportedUnit,
                               "The unit " + std::string{unit} + " is not supported"});
}

auto FormatPixels(float px) -> std::string {
  std::array<char, 64> buffer{};
  auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), px);
  if (ec != std::errc{}) return "0px";
  std::string out{buffer.data(), ptr};
  out += "px";
  return out;
}

} // namespace LineFit
