#include "LineFit/host/ElementHost.hpp"

#include <string>
#include <utility>

namespace LineFit {

auto StaticElementHost::add(Element element) -> ElementHandle {
  ElementHandle handle{nextId++};
  element.styles = NormalizeKeys(element.styles);
  elements.emplace(handle.id, std::move(element));
  return handle;
}

void StaticElementHost::update(ElementHandle handle, Element element) {
  element.styles = NormalizeKeys(element.styles);
  elements[handle.id] = std::move(element);
}

auto StaticElementHost::find(ElementHandle handle) const -> Element const* {
  auto it = elements.find(handle.id);
  if (it == elements.end()) return nullptr;
  return &it->second;
}

auto StaticElementHost::resolve(ElementHandle element) const -> Expected<StyleMap> {
  auto const* found = find(element);
  if (!found) {
    return std::unexpected(Error{Error::Code::MissingCapability,
                                 "no element " + std::to_string(element.id)});
  }
  return found->styles;
}

auto StaticElementHost::boxWidth(ElementHandle element) const -> std::optional<float> {
  auto const* found = find(element);
  if (!found) return std::nullopt;
  return found->boxWidth;
}

auto StaticElementHost::read(ElementHandle element) const -> std::string {
  auto const* found = find(element);
  if (!found) return {};
  return found->text;
}

} // namespace LineFit
