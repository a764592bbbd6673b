#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LineFit {

struct Utf8Codepoint {
  uint32_t codepoint = 0;
  size_t byteOffset = 0;
  size_t byteLength = 0;
};

inline constexpr uint32_t ReplacementCodepoint = 0xFFFDu;

// Malformed sequences decode to U+FFFD one byte at a time. Overlong forms, surrogates and
// values past U+10FFFF count as malformed.
auto DecodeUtf8(std::string_view text) -> std::vector<Utf8Codepoint>;
void AppendUtf8(std::string& out, uint32_t codepoint);
auto EncodeUtf8(uint32_t codepoint) -> std::string;
auto CodepointCount(std::string_view text) -> size_t;
auto LastCodepoint(std::string_view text) -> std::optional<uint32_t>;

} // namespace LineFit
