#include "LineFit/text/Utf8.hpp"

namespace LineFit {

namespace {

auto continuation(std::string_view text, size_t index) -> bool {
  return index < text.size() && (static_cast<unsigned char>(text[index]) & 0xC0) == 0x80;
}

auto byte_at(std::string_view text, size_t index) -> unsigned char {
  return static_cast<unsigned char>(text[index]);
}

// Second-byte range for a lead byte. Narrower ranges exclude overlong forms, surrogates and
// values past U+10FFFF.
auto second_byte_in_range(unsigned char lead, unsigned char second) -> bool {
  switch (lead) {
    case 0xE0: return second >= 0xA0;
    case 0xED: return second <= 0x9F;
    case 0xF0: return second >= 0x90;
    case 0xF4: return second <= 0x8F;
    default: return true;
  }
}

auto decode_at(std::string_view text, size_t i) -> Utf8Codepoint {
  unsigned char c = byte_at(text, i);
  Utf8Codepoint cp;
  cp.byteOffset = i;
  cp.codepoint = ReplacementCodepoint;
  cp.byteLength = 1;

  size_t length = 0;
  if (c < 0x80) {
    cp.codepoint = c;
    return cp;
  } else if (c >= 0xC2 && c <= 0xDF) {
    length = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    length = 3;
  } else if (c >= 0xF0 && c <= 0xF4) {
    length = 4;
  } else {
    return cp;
  }

  for (size_t k = 1; k < length; ++k) {
    if (!continuation(text, i + k)) return cp;
  }
  if (!second_byte_in_range(c, byte_at(text, i + 1))) return cp;

  uint32_t value = c & (0xFFu >> (length + 1));
  for (size_t k = 1; k < length; ++k) {
    value = (value << 6) | (byte_at(text, i + k) & 0x3Fu);
  }
  cp.codepoint = value;
  cp.byteLength = length;
  return cp;
}

} // namespace

auto DecodeUtf8(std::string_view text) -> std::vector<Utf8Codepoint> {
  std::vector<Utf8Codepoint> out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    auto cp = decode_at(text, i);
    i += cp.byteLength;
    out.push_back(cp);
  }
  return out;
}

void AppendUtf8(std::string& out, uint32_t codepoint) {
  if (codepoint > 0x10FFFFu || (codepoint >= 0xD800u && codepoint <= 0xDFFFu)) {
    codepoint = ReplacementCodepoint;
  }
  if (codepoint < 0x80u) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80u | (codepoint & 0x3Fu)));
  } else if (codepoint < 0x10000u) {
    out.push_back(static_cast<char>(0xE0u | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80u | ((codepoint >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (codepoint & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (codepoint >> 18)));
    out.push_back(static_cast<char>(0x80u | ((codepoint >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((codepoint >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (codepoint & 0x3Fu)));
  }
}

auto EncodeUtf8(uint32_t codepoint) -> std::string {
  std::string out;
  AppendUtf8(out, codepoint);
  return out;
}

auto CodepointCount(std::string_view text) -> size_t {
  size_t count = 0;
  size_t i = 0;
  while (i < text.size()) {
    i += decode_at(text, i).byteLength;
    ++count;
  }
  return count;
}

auto LastCodepoint(std::string_view text) -> std::optional<uint32_t> {
  if (text.empty()) return std::nullopt;
  size_t start = text.size() - 1;
  size_t steps = 0;
  while (start > 0 && steps < 3 && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
    --start;
    ++steps;
  }
  auto cp = decode_at(text, start);
  if (cp.byteOffset + cp.byteLength != text.size()) {
    return ReplacementCodepoint;
  }
  return cp.codepoint;
}

} // namespace LineFit
