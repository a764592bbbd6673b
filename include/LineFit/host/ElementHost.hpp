#pragma once

#include "LineFit/core/Error.hpp"
#include "LineFit/style/StyleSnapshot.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace LineFit {

struct ElementHandle {
  uint64_t id = 0;

  bool operator==(ElementHandle const& other) const = default;
};

// Computed style and box of a UI element.
class StyleSource {
public:
  virtual ~StyleSource() = default;

  virtual auto resolve(ElementHandle element) const -> Expected<StyleMap> = 0;
  virtual auto boxWidth(ElementHandle element) const -> std::optional<float> = 0;
};

// Visible text content of a UI element.
class TextSource {
public:
  virtual ~TextSource() = default;

  virtual auto read(ElementHandle element) const -> std::string = 0;
};

// Headless host holding element styles, widths and text in memory.
class StaticElementHost final : public StyleSource, public TextSource {
public:
  struct Element {
    StyleMap styles;
    std::optional<float> boxWidth;
    std::string text;
  };

  auto add(Element element) -> ElementHandle;
  void update(ElementHandle handle, Element element);

  auto resolve(ElementHandle element) const -> Expected<StyleMap> override;
  auto boxWidth(ElementHandle element) const -> std::optional<float> override;
  auto read(ElementHandle element) const -> std::string override;

private:
  auto find(ElementHandle handle) const -> Element const*;

  std::unordered_map<uint64_t, Element> elements;
  uint64_t nextId = 1;
};

} // namespace LineFit
