#include "LineFit/style/StyleSnapshot.hpp"

namespace LineFit {

auto NormalizeKey(std::string_view key) -> std::string {
  std::string out;
  out.reserve(key.size() + 4);
  for (char c : key) {
    if (c >= 'A' && c <= 'Z') {
      out.push_back('-');
      out.push_back(static_cast<char>(c - 'A' + 'a'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

auto NormalizeKeys(StyleMap const& styles) -> StyleMap {
  StyleMap out;
  for (auto const& [key, value] : styles) {
    out[NormalizeKey(key)] = value;
  }
  return out;
}

auto StyleSnapshot::Defaults() -> StyleMap const& {
  static StyleMap const defaults = {
      {"font-size", "16px"},
      {"font-weight", "400"},
      {"font-family", "Helvetica, Arial, sans-serif"},
  };
  return defaults;
}

auto StyleSnapshot::Merge(std::initializer_list<StyleMap const*> layers) -> StyleSnapshot {
  StyleSnapshot snapshot;
  snapshot.values = Defaults();
  for (auto const* layer : layers) {
    if (!layer) continue;
    for (auto const& [key, value] : *layer) {
      if (value.empty()) continue;
      snapshot.values[NormalizeKey(key)] = value;
    }
  }
  return snapshot;
}

auto StyleSnapshot::get(std::string_view key) const -> std::optional<std::string_view> {
  auto it = values.find(key);
  if (it == values.end() || it->second.empty()) return std::nullopt;
  return std::string_view{it->second};
}

auto StyleSnapshot::value(std::string_view key, std::string_view fallback) const -> std::string_view {
  if (auto found = get(key)) return *found;
  return fallback;
}

} // namespace LineFit
