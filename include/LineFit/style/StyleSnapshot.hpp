#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace LineFit {

using StyleMap = std::map<std::string, std::string, std::less<>>;

// fontSize -> font-size
auto NormalizeKey(std::string_view key) -> std::string;
auto NormalizeKeys(StyleMap const& styles) -> StyleMap;

// Immutable merge of style layers. Later layers win; empty values count as absent.
class StyleSnapshot {
public:
  StyleSnapshot() = default;

  static auto Defaults() -> StyleMap const&;

  // Layers are given lowest precedence first. Defaults sit below all of them.
  static auto Merge(std::initializer_list<StyleMap const*> layers) -> StyleSnapshot;

  auto get(std::string_view key) const -> std::optional<std::string_view>;
  auto value(std::string_view key, std::string_view fallback = {}) const -> std::string_view;
  bool has(std::string_view key) const { return get(key).has_value(); }
  auto entries() const -> StyleMap const& { return values; }

private:
  StyleMap values;
};

} // namespace LineFit
