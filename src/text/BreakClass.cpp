#include "LineFit/text/BreakClass.hpp"

#include "LineFit/text/Utf8.hpp"

#include <algorithm>
#include <array>

namespace LineFit {

namespace {

// Tables are kept sorted for binary search.
constexpr auto kB2 = std::to_array<uint32_t>({0x2014u});

constexpr auto kBAI = std::to_array<uint32_t>({
    0x0009u, // tab
    0x0020u,
    0x1680u,
    0x2000u, 0x2001u, 0x2002u, 0x2003u, 0x2004u, 0x2005u, 0x2006u,
    0x2008u, 0x2009u, 0x200Au,
    0x200Bu, // zero width space
    0x2028u, 0x2029u, // separators html does not treat as mandatory
    0x205Fu,
    0x3000u,
});

constexpr auto kSHY = std::to_array<uint32_t>({0x00ADu});

constexpr auto kBA = std::to_array<uint32_t>({
    0x007Cu,
    0x058Au,
    0x05BEu,
    0x0F0Bu,
    0x1361u,
    0x16EBu, 0x16ECu, 0x16EDu,
    0x17D8u, 0x17DAu,
    0x2010u, 0x2012u, 0x2013u,
    0x2027u,
    0x2056u, 0x2058u, 0x2059u, 0x205Au, 0x205Bu, 0x205Du, 0x205Eu,
    0x2E19u, 0x2E2Au, 0x2E2Bu, 0x2E2Cu, 0x2E2Du, 0x2E30u,
    0x10100u, 0x10101u, 0x10102u,
    0x1039Fu,
    0x103D0u,
    0x1091Fu,
    0x12470u,
});

constexpr auto kBB = std::to_array<uint32_t>({0x00B4u, 0x1FFDu});

constexpr auto kBK = std::to_array<uint32_t>({0x000Au});

template <size_t N>
constexpr bool is_sorted_table(std::array<uint32_t, N> const& table) {
  for (size_t i = 1; i < N; ++i) {
    if (table[i - 1] >= table[i]) return false;
  }
  return true;
}

static_assert(is_sorted_table(kBAI), "BAI table must be sorted");
static_assert(is_sorted_table(kBA), "BA table must be sorted");
static_assert(is_sorted_table(kBB), "BB table must be sorted");

template <size_t N>
bool contains(std::array<uint32_t, N> const& table, uint32_t codepoint) {
  return std::binary_search(table.begin(), table.end(), codepoint);
}

} // namespace

auto Classify(uint32_t codepoint) -> BreakCategory {
  if (contains(kB2, codepoint)) return BreakCategory::B2;
  if (contains(kBAI, codepoint)) return BreakCategory::BAI;
  if (contains(kSHY, codepoint)) return BreakCategory::SHY;
  if (contains(kBA, codepoint)) return BreakCategory::BA;
  if (contains(kBB, codepoint)) return BreakCategory::BB;
  if (contains(kBK, codepoint)) return BreakCategory::BK;
  return BreakCategory::None;
}

bool IsCollapsibleSpace(uint32_t codepoint) {
  return contains(kBAI, codepoint);
}

bool IsCollapsibleRun(std::string_view utf8) {
  if (utf8.empty()) return false;
  for (auto const& cp : DecodeUtf8(utf8)) {
    if (!IsCollapsibleSpace(cp.codepoint)) return false;
  }
  return true;
}

auto ToString(BreakCategory category) -> std::string_view {
  switch (category) {
    case BreakCategory::None: return "none";
    case BreakCategory::B2: return "B2";
    case BreakCategory::BAI: return "BAI";
    case BreakCategory::SHY: return "SHY";
    case BreakCategory::BA: return "BA";
    case BreakCategory::BB: return "BB";
    case BreakCategory::BK: return "BK";
  }
  return "none";
}

} // namespace LineFit
