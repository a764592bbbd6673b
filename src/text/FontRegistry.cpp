#include "LineFit/text/FontRegistry.hpp"

#include "LineFit/core/Log.hpp"
#include "LineFit/text/Utf8.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <mutex>
#include <optional>
#include <unordered_map>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H
#include <hb.h>
#include <hb-ft.h>

namespace LineFit {

namespace {

struct FontFace {
  uint32_t id = 0;
  std::string family;
  uint16_t weight = 400;
  FontSlant slant = FontSlant::Upright;
  FT_Face face = nullptr;
  hb_font_t* hbFont = nullptr;
  bool fromConfigured = false;
};

auto to_lower(std::string_view text) -> std::string {
  std::string out{text};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto compute_synthetic_bold(uint16_t faceWeight,
                            uint16_t targetWeight,
                            uint16_t sizePx) -> uint16_t {
  if (sizePx == 0u || targetWeight <= faceWeight) return 0u;
  float weightDelta = std::min<float>(static_cast<float>(targetWeight - faceWeight), 300.0f);
  float weightScale = weightDelta / 300.0f;
  constexpr float EmboldenScale = 0.04f;
  constexpr float EmboldenMinPx = 0.25f;
  constexpr float EmboldenMaxPx = 1.5f;
  float pxStrength = static_cast<float>(sizePx) * EmboldenScale * weightScale;
  if (pxStrength < EmboldenMinPx) return 0u;
  pxStrength = std::min(pxStrength, EmboldenMaxPx);
  return static_cast<uint16_t>(std::lround(pxStrength * 64.0f));
}

auto resolve_face_weight(FT_Face face) -> uint16_t {
  if (!face) return 400;
  if (auto* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, ft_sfnt_os2)); os2) {
    if (os2->usWeightClass != 0) {
      uint32_t weight = std::min<uint32_t>(os2->usWeightClass, 1000u);
      return static_cast<uint16_t>(std::max<uint32_t>(weight, 1u));
    }
  }
  return (face->style_flags & FT_STYLE_FLAG_BOLD) ? 700 : 400;
}

auto infer_weight_from_style(std::string_view style) -> std::optional<uint16_t> {
  if (style.empty()) return std::nullopt;
  auto lowered = to_lower(style);
  auto has = [&](std::string_view needle) { return lowered.find(needle) != std::string::npos; };

  if (has("thin")) return 100;
  if (has("extralight") || has("ultralight")) return 200;
  if (has("light")) return 300;
  if (has("regular") || has("normal") || has("book")) return 400;
  if (has("medium")) return 500;
  if (has("semibold") || has("demibold")) return 600;
  if (has("extrabold") || has("ultrabold")) return 800;
  if (has("black") || has("heavy")) return 900;
  if (has("bold")) return 700;
  return std::nullopt;
}

bool is_font_file(std::filesystem::path const& path) {
  auto ext = to_lower(path.extension().string());
  return ext == ".ttf" || ext == ".otf" || ext == ".ttc" || ext == ".otc";
}

void append_font_files(std::filesystem::path const& root,
                       std::vector<std::string>& out) {
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) return;
  for (auto const& entry : std::filesystem::recursive_directory_iterator(root, ec)) {
    if (ec) break;
    if (!entry.is_regular_file()) continue;
    if (!is_font_file(entry.path())) continue;
    out.push_back(entry.path().string());
  }
}

auto split_dir_list(std::string_view list) -> std::vector<std::string> {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(':', start);
    if (end == std::string_view::npos) end = list.size();
    if (end > start) out.emplace_back(list.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

bool face_supports_glyph(FontFace* face, uint32_t codepoint) {
  if (!face || !face->face) return false;
  return FT_Get_Char_Index(face->face, codepoint) != 0;
}

void select_unicode_charmap(FT_Face face) {
  if (!face) return;
  if (FT_Select_Charmap(face, FT_ENCODING_UNICODE) == 0) return;
  for (int i = 0; i < face->num_charmaps; ++i) {
    if (face->charmaps[i] && face->charmaps[i]->encoding == FT_ENCODING_UNICODE) {
      FT_Set_Charmap(face, face->charmaps[i]);
      break;
    }
  }
}

auto set_face_pixel_size(FT_Face face, uint16_t sizePx) -> uint16_t {
  if (!face || sizePx == 0) return 0;
  if (FT_Set_Pixel_Sizes(face, 0, sizePx) == 0) return sizePx;
  if (face->num_fixed_sizes <= 0) return 0;

  int bestIndex = -1;
  int bestDiff = std::numeric_limits<int>::max();
  int bestSize = 0;
  for (int i = 0; i < face->num_fixed_sizes; ++i) {
    FT_Bitmap_Size size = face->available_sizes[i];
    int yPpem = size.y_ppem > 0 ? static_cast<int>(size.y_ppem / 64) : size.height;
    int diff = std::abs(yPpem - static_cast<int>(sizePx));
    if (diff < bestDiff || (diff == bestDiff && yPpem > bestSize)) {
      bestDiff = diff;
      bestIndex = i;
      bestSize = yPpem;
    }
  }
  if (bestIndex < 0) return 0;
  if (FT_Select_Size(face, bestIndex) != 0) return 0;
  return static_cast<uint16_t>(bestSize > 0 ? bestSize : sizePx);
}

} // namespace

struct FontRegistry::Impl {
  FT_Library ftLibrary = nullptr;
  uint32_t nextFaceId = 1;
  std::vector<std::unique_ptr<FontFace>> faces;
  std::vector<FontFace*> configuredFaces;
  std::vector<FontFace*> osFaces;
  std::unordered_map<uint64_t, FontFace*> fallbackCache;
  std::vector<std::string> fontDirs;
  std::vector<std::string> osFontDirs;
  std::vector<std::string> osFontFiles;
  size_t osFontNext = 0;
  size_t fontDirsScanned = 0;
  size_t osDirsListed = 0;
  float deviceScale = 1.0f;
  bool envDirsRead = false;
  mutable std::mutex mutex;

  Impl() {
    if (FT_Init_FreeType(&ftLibrary) != 0) {
      ftLibrary = nullptr;
      lf_log(LogLevel::Error, "fonts", "FreeType failed to initialize");
    }
  }

  ~Impl() {
    for (auto& face : faces) {
      if (face->hbFont) hb_font_destroy(face->hbFont);
      if (face->face) FT_Done_Face(face->face);
    }
    if (ftLibrary) FT_Done_FreeType(ftLibrary);
  }

  void loadFaceFile(std::string const& path, bool fromConfigured) {
    if (!ftLibrary) return;
    FT_Face face = nullptr;
    if (FT_New_Face(ftLibrary, path.c_str(), 0, &face) != 0 || !face) {
      lf_log(LogLevel::Debug, "fonts", "skipping unreadable font " + path);
      return;
    }
    int faceCount = static_cast<int>(face->num_faces);
    FT_Done_Face(face);
    for (int idx = 0; idx < std::max(1, faceCount); ++idx) {
      FT_Face f = nullptr;
      if (FT_New_Face(ftLibrary, path.c_str(), idx, &f) != 0 || !f) {
        continue;
      }
      select_unicode_charmap(f);
      auto entry = std::make_unique<FontFace>();
      entry->id = nextFaceId++;
      entry->family = f->family_name ? f->family_name : "";
      entry->weight = resolve_face_weight(f);
      if (auto styleWeight = infer_weight_from_style(f->style_name ? f->style_name : "")) {
        if (entry->weight == 0 || entry->weight == 400 ||
            std::abs(static_cast<int>(entry->weight) - static_cast<int>(*styleWeight)) >= 100) {
          entry->weight = *styleWeight;
        }
      }
      entry->slant = (f->style_flags & FT_STYLE_FLAG_ITALIC) ? FontSlant::Italic : FontSlant::Upright;
      entry->face = f;
      entry->hbFont = hb_ft_font_create_referenced(f);
      entry->fromConfigured = fromConfigured;
      lf_log(LogLevel::Debug, "fonts", "loaded face '" + entry->family + "' from " + path);

      FontFace* ptr = entry.get();
      faces.push_back(std::move(entry));
      if (fromConfigured) {
        configuredFaces.push_back(ptr);
      } else {
        osFaces.push_back(ptr);
      }
    }
  }

  void loadConfiguredFonts() {
    if (!envDirsRead) {
      envDirsRead = true;
      if (auto env = std::getenv("LINEFIT_FONT_DIRS")) {
        for (auto& dir : split_dir_list(env)) {
          fontDirs.push_back(std::move(dir));
        }
      }
    }
    for (; fontDirsScanned < fontDirs.size(); ++fontDirsScanned) {
      auto const& dir = fontDirs[fontDirsScanned];
      std::vector<std::string> files;
      append_font_files(dir, files);
      std::sort(files.begin(), files.end());
      lf_log(LogLevel::Debug, "fonts", "scanning " + dir + ": " + std::to_string(files.size()) + " files");
      for (auto const& file : files) {
        loadFaceFile(file, /*fromConfigured=*/true);
      }
    }
  }

  // Directories added later are appended after the files already queued.
  void listOsFontFiles() {
    for (; osDirsListed < osFontDirs.size(); ++osDirsListed) {
      std::vector<std::string> files;
      append_font_files(osFontDirs[osDirsListed], files);
      std::sort(files.begin(), files.end());
      osFontFiles.insert(osFontFiles.end(), files.begin(), files.end());
    }
  }

  FontFace* loadNextOsFallbackFace() {
    listOsFontFiles();
    while (osFontNext < osFontFiles.size()) {
      std::string path = osFontFiles[osFontNext++];
      size_t before = faces.size();
      loadFaceFile(path, /*fromConfigured=*/false);
      if (faces.size() > before) {
        return osFaces.back();
      }
    }
    return nullptr;
  }

  FontFace* selectPrimaryFace(Typography const& typography) {
    loadConfiguredFonts();

    auto pick_best = [&](std::vector<FontFace*> const& pool, std::string const& target) -> FontFace* {
      FontFace* best = nullptr;
      int bestScore = std::numeric_limits<int>::max();
      for (auto* face : pool) {
        if (!face) continue;
        if (!target.empty() && to_lower(face->family) != target) continue;
        int score = std::abs(static_cast<int>(face->weight) - static_cast<int>(typography.weight));
        if (face->slant != typography.slant) score += 500;
        if (score < bestScore) {
          bestScore = score;
          best = face;
        }
      }
      return best;
    };

    auto search = [&](std::string const& target) -> FontFace* {
      if (auto* best = pick_best(configuredFaces, target)) return best;
      listOsFontFiles();
      while (true) {
        if (auto* best = pick_best(osFaces, target)) return best;
        if (!loadNextOsFallbackFace()) break;
      }
      return nullptr;
    };

    for (auto const& family : typography.families) {
      auto target = to_lower(family);
      if (IsGenericFamily(target)) {
        if (auto* face = search("")) return face;
        continue;
      }
      if (auto* face = search(target)) return face;
    }

    if (!configuredFaces.empty()) return configuredFaces.front();
    if (!osFaces.empty()) return osFaces.front();
    return search("");
  }

  FontFace* resolveFaceForCodepoint(uint32_t codepoint,
                                    FontFace* primary) {
    if (primary && face_supports_glyph(primary, codepoint)) return primary;

    uint64_t cacheKey = (static_cast<uint64_t>(primary ? primary->id : 0) << 32) | codepoint;
    auto it = fallbackCache.find(cacheKey);
    if (it != fallbackCache.end()) return it->second;

    for (auto* face : configuredFaces) {
      if (face == primary) continue;
      if (face_supports_glyph(face, codepoint)) {
        fallbackCache[cacheKey] = face;
        return face;
      }
    }

    while (true) {
      for (auto* face : osFaces) {
        if (face_supports_glyph(face, codepoint)) {
          fallbackCache[cacheKey] = face;
          return face;
        }
      }
      if (!loadNextOsFallbackFace()) break;
    }

    fallbackCache[cacheKey] = primary;
    return primary;
  }

  Expected<TextRunMetrics> measureRun(std::string_view text, Typography const& typography) {
    if (!ftLibrary) {
      return std::unexpected(Error{Error::Code::MissingCapability, "FreeType is not available"});
    }
    loadConfiguredFonts();
    if (text.empty()) return TextRunMetrics{};

    FontFace* primary = selectPrimaryFace(typography);
    if (!primary) {
      std::string families;
      for (auto const& family : typography.families) {
        if (!families.empty()) families += ", ";
        families += family;
      }
      lf_log(LogLevel::Warn, "fonts", "no font face available for '" + families + "'");
      return std::unexpected(Error{Error::Code::MissingCapability,
                                   "no font face available for '" + families + "'"});
    }

    float scale = deviceScale > 0.0f ? deviceScale : 1.0f;
    float invScale = 1.0f / scale;
    uint16_t sizePixels = static_cast<uint16_t>(
        std::clamp(std::round(typography.size * scale), 1.0f, static_cast<float>(std::numeric_limits<uint16_t>::max())));

    auto codepoints = DecodeUtf8(text);

    struct RunSegment {
      FontFace* face;
      size_t startIndex;
      size_t endIndex;
    };

    std::vector<RunSegment> segments;
    FontFace* currentFace = nullptr;
    size_t segmentStart = 0;
    for (size_t i = 0; i < codepoints.size(); ++i) {
      FontFace* face = resolveFaceForCodepoint(codepoints[i].codepoint, primary);
      if (!currentFace) {
        currentFace = face;
        segmentStart = i;
        continue;
      }
      if (face != currentFace) {
        segments.push_back(RunSegment{currentFace, segmentStart, i});
        currentFace = face;
        segmentStart = i;
      }
    }
    segments.push_back(RunSegment{currentFace, segmentStart, codepoints.size()});

    TextRunMetrics run;
    float penX = 0.0f;
    float maxEmbolden = 0.0f;

    for (auto const& seg : segments) {
      if (!seg.face || !seg.face->face || seg.startIndex >= seg.endIndex) continue;

      uint16_t effectiveSize = set_face_pixel_size(seg.face->face, sizePixels);
      if (effectiveSize == 0) continue;
      if (seg.face->hbFont) {
        hb_ft_font_set_load_flags(seg.face->hbFont, FT_LOAD_DEFAULT);
        hb_ft_font_changed(seg.face->hbFont);
      }
      uint16_t emboldenStrength = compute_synthetic_bold(seg.face->weight, typography.weight, effectiveSize);
      if (emboldenStrength > 0) {
        maxEmbolden = std::max(maxEmbolden, static_cast<float>(emboldenStrength) / 64.0f * invScale);
      }

      size_t startByte = codepoints[seg.startIndex].byteOffset;
      size_t endByte = codepoints[seg.endIndex - 1].byteOffset + codepoints[seg.endIndex - 1].byteLength;

      hb_buffer_t* buffer = hb_buffer_create();
      hb_buffer_add_utf8(buffer,
                         text.data() + startByte,
                         static_cast<int>(endByte - startByte),
                         0,
                         static_cast<int>(endByte - startByte));
      hb_buffer_guess_segment_properties(buffer);

      hb_feature_t smallCaps;
      bool useSmallCaps = typography.smallCaps && hb_feature_from_string("smcp", -1, &smallCaps);
      hb_shape(seg.face->hbFont, buffer, useSmallCaps ? &smallCaps : nullptr, useSmallCaps ? 1u : 0u);

      unsigned int glyphCount = 0;
      hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer, &glyphCount);

      // Fixed-size faces report advances at the strike size.
      float strikeScale = static_cast<float>(sizePixels) / static_cast<float>(effectiveSize);
      for (unsigned int i = 0; i < glyphCount; ++i) {
        penX += static_cast<float>(positions[i].x_advance) / 64.0f * strikeScale * invScale;
      }
      run.glyphCount += glyphCount;

      hb_buffer_destroy(buffer);
    }

    run.width = penX + maxEmbolden;
    return run;
  }
};

FontRegistry::FontRegistry() : impl(std::make_unique<Impl>()) {
  impl->osFontDirs = DefaultOsFontDirs();
}

FontRegistry::~FontRegistry() = default;

void FontRegistry::addFontDir(std::string dir) {
  if (dir.empty()) return;
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->fontDirs.push_back(std::move(dir));
}

void FontRegistry::addOsFallbackDir(std::string dir) {
  if (dir.empty()) return;
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->osFontDirs.push_back(std::move(dir));
}

void FontRegistry::setDeviceScale(float scale) {
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->deviceScale = scale > 0.0f ? scale : 1.0f;
}

void FontRegistry::loadFonts() {
  std::lock_guard<std::mutex> lock(impl->mutex);
  impl->loadConfiguredFonts();
}

bool FontRegistry::hasFaces() const {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return !impl->faces.empty();
}

auto FontRegistry::faceCount() const -> size_t {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->faces.size();
}

auto FontRegistry::measure(FontDescriptor const& font, std::string_view text) -> Expected<float> {
  auto run = measureRun(text, ToTypography(font));
  if (!run) return std::unexpected(run.error());
  return run->width;
}

auto FontRegistry::measureRun(std::string_view text, Typography const& typography) -> Expected<TextRunMetrics> {
  std::lock_guard<std::mutex> lock(impl->mutex);
  return impl->measureRun(text, typography);
}

auto DefaultOsFontDirs() -> std::vector<std::string> {
  std::vector<std::string> dirs;
#if defined(__APPLE__)
  dirs.emplace_back("/System/Library/Fonts");
  dirs.emplace_back("/Library/Fonts");
  if (auto* home = std::getenv("HOME")) {
    dirs.push_back((std::filesystem::path(home) / "Library/Fonts").string());
  }
#elif defined(_WIN32)
  if (auto* windir = std::getenv("WINDIR")) {
    dirs.push_back((std::filesystem::path(windir) / "Fonts").string());
  } else {
    dirs.emplace_back("C:\\Windows\\Fonts");
  }
#else
  dirs.emplace_back("/usr/share/fonts");
  dirs.emplace_back("/usr/local/share/fonts");
  if (auto* home = std::getenv("HOME")) {
    dirs.push_back((std::filesystem::path(home) / ".local/share/fonts").string());
    dirs.push_back((std::filesystem::path(home) / ".fonts").string());
  }
#endif
  return dirs;
}

} // namespace LineFit
