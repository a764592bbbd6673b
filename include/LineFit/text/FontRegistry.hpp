#pragma once

#include "LineFit/text/MetricsProvider.hpp"
#include "LineFit/text/Typography.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace LineFit {

struct TextRunMetrics {
  float width = 0.0f;
  uint32_t glyphCount = 0;
};

// MetricsProvider backed by FreeType faces shaped with HarfBuzz. Faces come from the
// configured font directories first, then lazily from OS fallback directories.
class FontRegistry final : public MetricsProvider {
public:
  FontRegistry();
  ~FontRegistry() override;

  FontRegistry(FontRegistry const&) = delete;
  FontRegistry& operator=(FontRegistry const&) = delete;

  void addFontDir(std::string dir);
  void addOsFallbackDir(std::string dir);
  void setDeviceScale(float scale);

  // Scans the configured directories and LINEFIT_FONT_DIRS. Called on first measure.
  void loadFonts();
  bool hasFaces() const;
  auto faceCount() const -> size_t;

  auto measure(FontDescriptor const& font, std::string_view text) -> Expected<float> override;

  auto measureRun(std::string_view text, Typography const& typography) -> Expected<TextRunMetrics>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl;
};

auto DefaultOsFontDirs() -> std::vector<std::string>;

} // namespace LineFit
