#include "LineFit/TextMetrics.hpp"
#include "LineFit/core/Log.hpp"
#include "LineFit/style/Units.hpp"
#include "LineFit/text/BitmapMetrics.hpp"
#include "LineFit/text/FontRegistry.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace LineFitDemo {

using namespace LineFit;

void print_usage(char const* program) {
  std::cerr << "usage: " << program
            << " [--font-dir DIR] [--bitmap] [--width PX] [--font SHORTHAND]"
               " [--font-size LEN] [--font-family LIST] [--font-weight W]"
               " [--line-height LEN] [--letter-spacing LEN] [--word-spacing LEN]"
               " [--word-break normal|break-all] [--white-space MODE] [--multiline]"
               " [--verbose] TEXT\n";
}

void report(Error const& error) {
  std::cerr << "error: " << ToString(error.code);
  if (error.message) std::cerr << ": " << *error.message;
  std::cerr << "\n";
}

} // namespace LineFitDemo

int main(int argc, char** argv) {
  using namespace LineFit;
  using namespace LineFitDemo;

  std::vector<std::string> fontDirs;
  bool useBitmap = false;
  std::string text;
  MeasureOptions options;
  StyleMap overrides;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--font-dir" && i + 1 < argc) {
      fontDirs.emplace_back(argv[++i]);
    } else if (arg == "--bitmap") {
      useBitmap = true;
    } else if (arg == "--width" && i + 1 < argc) {
      options.width = argv[++i];
    } else if (arg == "--font" && i + 1 < argc) {
      overrides["font"] = argv[++i];
    } else if (arg == "--font-size" && i + 1 < argc) {
      options.fontSize = argv[++i];
    } else if (arg == "--font-family" && i + 1 < argc) {
      options.fontFamily = argv[++i];
    } else if (arg == "--font-weight" && i + 1 < argc) {
      options.fontWeight = argv[++i];
    } else if (arg == "--line-height" && i + 1 < argc) {
      options.lineHeight = argv[++i];
    } else if (arg == "--letter-spacing" && i + 1 < argc) {
      overrides["letterSpacing"] = argv[++i];
    } else if (arg == "--word-spacing" && i + 1 < argc) {
      overrides["wordSpacing"] = argv[++i];
    } else if (arg == "--word-break" && i + 1 < argc) {
      overrides["wordBreak"] = argv[++i];
    } else if (arg == "--white-space" && i + 1 < argc) {
      overrides["whiteSpace"] = argv[++i];
    } else if (arg == "--multiline") {
      options.multiline = true;
    } else if (arg == "--verbose") {
      logger().setLevel(LogLevel::Debug);
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else {
      if (!text.empty()) text.push_back(' ');
      text += arg;
    }
  }

  if (text.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  std::unique_ptr<MetricsProvider> provider;
  if (useBitmap) {
    provider = std::make_unique<BitmapMetrics>();
  } else {
    auto registry = std::make_unique<FontRegistry>();
    for (auto const& dir : fontDirs) {
      registry->addFontDir(dir);
    }
    registry->loadFonts();
    provider = std::move(registry);
  }

  TextMetrics metrics(TextHost{provider.get(), nullptr, nullptr});

  auto font = metrics.font(options, overrides);
  if (!font) {
    report(font.error());
    return 1;
  }
  std::cout << "font: " << font->toString() << "\n";

  auto width = metrics.width(text, options, overrides);
  if (!width) {
    report(width.error());
    return 1;
  }
  std::cout << "width: " << *width << "\n";

  auto lines = metrics.lines(text, options, overrides);
  if (!lines) {
    report(lines.error());
    return 1;
  }
  std::cout << "lines: " << lines->size() << "\n";
  for (auto const& line : *lines) {
    std::cout << "  | " << line << "\n";
  }

  auto height = metrics.height(text, options, overrides);
  if (!height) {
    report(height.error());
    return 1;
  }
  std::cout << "height: " << *height << "\n";

  if (options.width) {
    auto fitted = metrics.maxFontSize(text, options, overrides);
    if (!fitted) {
      report(fitted.error());
      return 1;
    }
    std::cout << "max font size: " << (*fitted ? FormatPixels(static_cast<float>(**fitted)) : "none") << "\n";
  }
  return 0;
}
