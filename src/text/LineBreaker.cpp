#include "LineFit/text/LineBreaker.hpp"

#include "LineFit/text/Utf8.hpp"

#include <cmath>

namespace LineFit {

namespace {

auto raw_width(MeasureFn const& measure, Spacing const& spacing, std::string const& candidate) -> Expected<float> {
  auto width = measure(candidate);
  if (!width) return std::unexpected(width.error());
  return *width + spacing(candidate);
}

auto round_half_up(float value) -> float {
  return std::floor(value + 0.5f);
}

} // namespace

auto ScanParts(std::string_view text) -> TextParts {
  TextParts out;
  std::string part;
  for (auto const& cp : DecodeUtf8(text)) {
    auto category = Classify(cp.codepoint);
    if (part.empty() && category == BreakCategory::BAI) continue;
    if (category != BreakCategory::None) {
      out.breakpoints.push_back(Breakpoint{std::string{text.substr(cp.byteOffset, cp.byteLength)}, category});
      out.parts.push_back(std::move(part));
      part.clear();
    } else {
      part.append(text.substr(cp.byteOffset, cp.byteLength));
    }
  }
  if (!part.empty()) out.parts.push_back(std::move(part));
  return out;
}

auto ParseWordBreak(std::string_view value) -> WordBreak {
  return value == "break-all" ? WordBreak::BreakAll : WordBreak::Normal;
}

auto PackDefault(std::string_view text,
                 LineBudget budget,
                 Spacing const& spacing,
                 MeasureFn const& measure) -> Expected<std::vector<std::string>> {
  std::vector<std::string> lines;
  if (text.empty()) return lines;

  auto scanned = ScanParts(text);
  auto const& parts = scanned.parts;
  std::string line;

  for (size_t i = 0; i < parts.size(); ++i) {
    if (i == 0) {
      line = parts[i];
      continue;
    }

    auto const& part = parts[i];
    if (IsCollapsibleRun(parts[i - 1]) && IsCollapsibleRun(part)) continue;

    auto const& breakpoint = scanned.breakpoints[i - 1];
    if (breakpoint.category == BreakCategory::BK) {
      lines.push_back(std::move(line));
      line = part;
      continue;
    }

    // The soft hyphen only renders when the line is split there.
    std::string const chr = breakpoint.category == BreakCategory::SHY ? std::string{} : breakpoint.character;

    auto width = raw_width(measure, spacing, line + chr + part);
    if (!width) return std::unexpected(width.error());
    if (budget.fits(round_half_up(*width))) {
      line += chr + part;
      continue;
    }

    switch (breakpoint.category) {
      case BreakCategory::SHY:
        lines.push_back(line + "-");
        line = part;
        break;
      case BreakCategory::BA:
        lines.push_back(line + chr);
        line = part;
        break;
      case BreakCategory::BAI:
        lines.push_back(std::move(line));
        line = part;
        break;
      case BreakCategory::BB:
        lines.push_back(std::move(line));
        line = chr + part;
        break;
      case BreakCategory::B2: {
        auto withLine = raw_width(measure, spacing, line + chr);
        if (!withLine) return std::unexpected(withLine.error());
        if (budget.fits(*withLine)) {
          lines.push_back(line + chr);
          line = part;
          break;
        }
        auto withPart = raw_width(measure, spacing, chr + part);
        if (!withPart) return std::unexpected(withPart.error());
        if (budget.fits(*withPart)) {
          lines.push_back(std::move(line));
          line = chr + part;
          break;
        }
        lines.push_back(std::move(line));
        lines.push_back(chr);
        line = part;
        break;
      }
      case BreakCategory::BK:
      case BreakCategory::None:
        lines.push_back(std::move(line));
        line = part;
        break;
    }
  }

  // A break character that ends the text has no part after it.
  if (!scanned.breakpoints.empty() && scanned.breakpoints.size() == parts.size()) {
    auto const& trailing = scanned.breakpoints.back();
    switch (trailing.category) {
      case BreakCategory::B2:
      case BreakCategory::BA:
      case BreakCategory::BB:
        line += trailing.character;
        break;
      default:
        break;
    }
  }

  if (!line.empty()) lines.push_back(std::move(line));
  return lines;
}

auto PackBreakAll(std::string_view text,
                  LineBudget budget,
                  Spacing const& spacing,
                  MeasureFn const& measure) -> Expected<std::vector<std::string>> {
  std::vector<std::string> lines;
  if (text.empty()) return lines;

  auto codepoints = DecodeUtf8(text);
  std::string line;

  for (size_t i = 0; i < codepoints.size(); ++i) {
    auto const& cp = codepoints[i];
    auto category = Classify(cp.codepoint);
    std::string chr{text.substr(cp.byteOffset, cp.byteLength)};

    if (category == BreakCategory::BK) {
      lines.push_back(std::move(line));
      line.clear();
      continue;
    }

    if (category == BreakCategory::BAI) {
      auto last = LastCodepoint(line);
      if (!last || IsCollapsibleSpace(*last)) continue;
    }

    std::string candidate = line + chr;
    if (category == BreakCategory::SHY && i + 1 < codepoints.size()) {
      auto const& next = codepoints[i + 1];
      candidate.append(text.substr(next.byteOffset, next.byteLength));
    }
    auto width = raw_width(measure, spacing, candidate);
    if (!width) return std::unexpected(width.error());

    if (!budget.fits(std::ceil(*width)) && !line.empty()) {
      switch (category) {
        case BreakCategory::SHY:
          lines.push_back(line + "-");
          line.clear();
          break;
        case BreakCategory::BA:
          lines.push_back(line + chr);
          line.clear();
          break;
        case BreakCategory::BAI:
          lines.push_back(std::move(line));
          line.clear();
          break;
        default:
          lines.push_back(std::move(line));
          line = chr;
          break;
      }
    } else if (category != BreakCategory::SHY) {
      line += chr;
    }
  }

  if (!line.empty()) lines.push_back(std::move(line));
  return lines;
}

auto PackLines(WordBreak mode,
               std::string_view text,
               LineBudget budget,
               Spacing const& spacing,
               MeasureFn const& measure) -> Expected<std::vector<std::string>> {
  if (mode == WordBreak::BreakAll) return PackBreakAll(text, budget, spacing, measure);
  return PackDefault(text, budget, spacing, measure);
}

} // namespace LineFit
