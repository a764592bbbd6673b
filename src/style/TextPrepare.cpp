#include "LineFit/style/TextPrepare.hpp"

#include "LineFit/core/Log.hpp"
#include "LineFit/text/Utf8.hpp"

#include <cctype>

namespace LineFit {

namespace {

auto ascii_lower(char c) -> char {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool starts_with_icase(std::string_view text, size_t pos, std::string_view needle) {
  if (pos + needle.size() > text.size()) return false;
  for (size_t i = 0; i < needle.size(); ++i) {
    if (ascii_lower(text[pos + i]) != needle[i]) return false;
  }
  return true;
}

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Matches <br>, <br/>, <br />. Returns the matched length or 0.
auto match_br(std::string_view text, size_t pos) -> size_t {
  if (!starts_with_icase(text, pos, "<br")) return 0;
  size_t i = pos + 3;
  while (i < text.size() && is_ascii_space(text[i])) ++i;
  if (i < text.size() && text[i] == '/') ++i;
  if (i < text.size() && text[i] == '>') return i + 1 - pos;
  return 0;
}

auto upper(uint32_t cp) -> uint32_t {
  if (cp >= 'a' && cp <= 'z') return cp - 0x20u;
  if (cp >= 0xE0u && cp <= 0xFEu && cp != 0xF7u) return cp - 0x20u;
  if (cp == 0xFFu) return 0x178u;
  return cp;
}

auto lower(uint32_t cp) -> uint32_t {
  if (cp >= 'A' && cp <= 'Z') return cp + 0x20u;
  if (cp >= 0xC0u && cp <= 0xDEu && cp != 0xD7u) return cp + 0x20u;
  if (cp == 0x178u) return 0xFFu;
  return cp;
}

} // namespace

auto ParseWhiteSpace(std::string_view value) -> WhiteSpace {
  if (value == "pre") return WhiteSpace::Pre;
  if (value == "pre-wrap") return WhiteSpace::PreWrap;
  if (value == "pre-line") return WhiteSpace::PreLine;
  return WhiteSpace::Normal;
}

auto ParseTextTransform(std::string_view value) -> TextTransform {
  if (value == "uppercase") return TextTransform::Uppercase;
  if (value == "lowercase") return TextTransform::Lowercase;
  return TextTransform::None;
}

bool IsWhitespace(uint32_t codepoint) {
  switch (codepoint) {
    case 0x09u:
    case 0x0Au:
    case 0x0Bu:
    case 0x0Cu:
    case 0x0Du:
    case 0x20u:
    case 0xA0u:
    case 0x1680u:
    case 0x2028u:
    case 0x2029u:
    case 0x202Fu:
    case 0x205Fu:
    case 0x3000u:
    case 0xFEFFu:
      return true;
    default:
      return codepoint >= 0x2000u && codepoint <= 0x200Au;
  }
}

auto CollapseWhitespace(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  bool pendingSpace = false;
  for (auto const& cp : DecodeUtf8(text)) {
    if (IsWhitespace(cp.codepoint)) {
      pendingSpace = true;
      continue;
    }
    if (pendingSpace && !out.empty()) out.push_back(' ');
    pendingSpace = false;
    out.append(text.substr(cp.byteOffset, cp.byteLength));
  }
  return out;
}

auto NormalizeWhitespace(std::string_view text, WhiteSpace mode) -> std::string {
  switch (mode) {
    case WhiteSpace::Pre:
    case WhiteSpace::PreWrap:
      return std::string{text};
    case WhiteSpace::PreLine: {
      std::string out;
      size_t start = 0;
      while (start <= text.size()) {
        size_t end = text.find_first_of("\r\n", start);
        if (end == std::string_view::npos) end = text.size();
        out += CollapseWhitespace(text.substr(start, end - start));
        if (end == text.size()) break;
        out.push_back('\n');
        start = end + 1;
        if (text[end] == '\r' && start < text.size() && text[start] == '\n') ++start;
      }
      return out;
    }
    case WhiteSpace::Normal:
      break;
  }
  return CollapseWhitespace(text);
}

auto ApplyTextTransform(std::string_view text, TextTransform transform) -> std::string {
  if (transform == TextTransform::None) return std::string{text};
  std::string out;
  out.reserve(text.size());
  for (auto const& cp : DecodeUtf8(text)) {
    if (cp.codepoint == ReplacementCodepoint) {
      out.append(text.substr(cp.byteOffset, cp.byteLength));
      continue;
    }
    AppendUtf8(out, transform == TextTransform::Uppercase ? upper(cp.codepoint) : lower(cp.codepoint));
  }
  return out;
}

bool HasEncodedEntities(std::string_view text) {
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '&') continue;
    size_t j = i + 1;
    if (j < text.size() && text[j] == '#') {
      ++j;
      if (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) return true;
      if (j + 1 < text.size() && (text[j] == 'x' || text[j] == 'X') &&
          std::isxdigit(static_cast<unsigned char>(text[j + 1]))) {
        return true;
      }
      continue;
    }
    size_t nameStart = j;
    while (j < text.size() && std::isalnum(static_cast<unsigned char>(text[j]))) ++j;
    if (j > nameStart && j < text.size() && text[j] == ';') return true;
  }
  return false;
}

auto PrepareText(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '<') {
      if (starts_with_icase(text, i, "<wbr>")) {
        AppendUtf8(out, 0x200Bu);
        i += 5;
        continue;
      }
      if (auto len = match_br(text, i)) {
        out.push_back('\n');
        i += len;
        continue;
      }
    } else if (c == '&') {
      if (starts_with_icase(text, i, "&shy;")) {
        AppendUtf8(out, 0x00ADu);
        i += 5;
        continue;
      }
      if (starts_with_icase(text, i, "&mdash;")) {
        AppendUtf8(out, 0x2014u);
        i += 7;
        continue;
      }
    }
    out.push_back(c);
    ++i;
  }

  if (HasEncodedEntities(out)) {
    lf_log(LogLevel::Warn, "text",
           "Found encoded html entities. Decode the text before measuring it.");
  }
  return out;
}

} // namespace LineFit
