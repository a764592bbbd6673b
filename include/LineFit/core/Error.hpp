#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace LineFit {

struct Error {
  enum class Code {
    UnsupportedUnit,
    MissingCapability,
    DidNotConverge,
    MalformedInput,
  };

  Code code;
  std::optional<std::string> message;

  Error(Code c, std::string m) : code(c), message(std::move(m)) {}
  explicit Error(Code c) : code(c) {}
};

template <typename T>
using Expected = std::expected<T, Error>;

auto ToString(Error::Code code) -> std::string_view;

} // namespace LineFit

inline auto LineFit::ToString(Error::Code code) -> std::string_view {
  switch (code) {
    case Error::Code::UnsupportedUnit: return "unsupported_unit";
    case Error::Code::MissingCapability: return "missing_capability";
    case Error::Code::DidNotConverge: return "did_not_converge";
    case Error::Code::MalformedInput: return "malformed_input";
  }
  return "unknown";
}
