#include "LineFit/text/BreakClass.hpp"

#include <doctest/doctest.h>

using namespace LineFit;
TEST_SUITE_BEGIN("linefit.break_class");

TEST_CASE("classifies_curated_sets") {
  CHECK_MESSAGE(Classify(0x2014u) == BreakCategory::B2, "em dash breaks before and after");
  CHECK_MESSAGE(Classify(0x0020u) == BreakCategory::BAI, "space is collapsible");
  CHECK_MESSAGE(Classify(0x0009u) == BreakCategory::BAI, "tab is collapsible");
  CHECK_MESSAGE(Classify(0x200Bu) == BreakCategory::BAI, "zero width space is collapsible");
  CHECK_MESSAGE(Classify(0x3000u) == BreakCategory::BAI, "ideographic space is collapsible");
  CHECK_MESSAGE(Classify(0x2028u) == BreakCategory::BAI, "line separator is collapsible");
  CHECK_MESSAGE(Classify(0x00ADu) == BreakCategory::SHY, "soft hyphen");
  CHECK_MESSAGE(Classify(0x2010u) == BreakCategory::BA, "hyphen breaks after");
  CHECK_MESSAGE(Classify(0x2013u) == BreakCategory::BA, "en dash breaks after");
  CHECK_MESSAGE(Classify(0x007Cu) == BreakCategory::BA, "vertical line breaks after");
  CHECK_MESSAGE(Classify(0x10100u) == BreakCategory::BA, "aegean word separator breaks after");
  CHECK_MESSAGE(Classify(0x12470u) == BreakCategory::BA, "cuneiform divider breaks after");
  CHECK_MESSAGE(Classify(0x00B4u) == BreakCategory::BB, "acute accent breaks before");
  CHECK_MESSAGE(Classify(0x1FFDu) == BreakCategory::BB, "greek oxia breaks before");
  CHECK_MESSAGE(Classify(0x000Au) == BreakCategory::BK, "line feed is mandatory");
}

TEST_CASE("unlisted_characters_have_no_category") {
  CHECK(Classify('a') == BreakCategory::None);
  CHECK_MESSAGE(Classify('-') == BreakCategory::None, "hyphen-minus is not in the curated sets");
  CHECK_MESSAGE(Classify(0x00A0u) == BreakCategory::None, "no-break space never breaks");
  CHECK_MESSAGE(Classify(0x2007u) == BreakCategory::None, "figure space never breaks");
  CHECK_MESSAGE(Classify(0x000Du) == BreakCategory::None, "carriage return is not mandatory");
  CHECK(Classify(0x1F600u) == BreakCategory::None);
}

TEST_CASE("classification_is_stable") {
  for (uint32_t cp : {0x20u, 0x2014u, 0xADu, 0x2010u, 0xB4u, 0x0Au, 0x41u}) {
    CHECK(Classify(cp) == Classify(cp));
  }
}

TEST_CASE("collapsible_runs") {
  CHECK(IsCollapsibleSpace(0x20u));
  CHECK_FALSE(IsCollapsibleSpace(0x0Au));
  CHECK(IsCollapsibleRun("  \t"));
  CHECK_FALSE_MESSAGE(IsCollapsibleRun(""), "empty part is not a run");
  CHECK_FALSE(IsCollapsibleRun(" a"));
}

TEST_CASE("category_names") {
  CHECK(ToString(BreakCategory::B2) == std::string_view("B2"));
  CHECK(ToString(BreakCategory::SHY) == std::string_view("SHY"));
  CHECK(ToString(BreakCategory::None) == std::string_view("none"));
}

TEST_SUITE_END();
