#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace LineFit {

enum class WhiteSpace : uint8_t {
  Normal = 0,
  Pre,
  PreWrap,
  PreLine,
};

enum class TextTransform : uint8_t {
  None = 0,
  Uppercase,
  Lowercase,
};

auto ParseWhiteSpace(std::string_view value) -> WhiteSpace;
auto ParseTextTransform(std::string_view value) -> TextTransform;

// Whitespace as matched by a regular expression "\s" class.
bool IsWhitespace(uint32_t codepoint);

// Collapses every whitespace run to a single space and trims both ends.
auto CollapseWhitespace(std::string_view text) -> std::string;

auto NormalizeWhitespace(std::string_view text, WhiteSpace mode) -> std::string;

// Case mapping covers ASCII and Latin-1.
auto ApplyTextTransform(std::string_view text, TextTransform transform) -> std::string;

// Converts the few markup fragments that carry break semantics (<wbr>, <br>, &shy;,
// &mdash;) to their code points. Warns when other encoded entities remain.
auto PrepareText(std::string_view text) -> std::string;

bool HasEncodedEntities(std::string_view text);

} // namespace LineFit
