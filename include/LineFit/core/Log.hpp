#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace LineFit {

enum class LogLevel : uint8_t {
  Debug = 0,
  Info,
  Warn,
  Error,
  Off,
};

auto ToString(LogLevel level) -> std::string_view;
auto ParseLogLevel(std::string_view text) -> std::optional<LogLevel>;

struct LogMessage {
  LogLevel level = LogLevel::Info;
  std::string tag;
  std::string message;
  std::source_location location;
};

// Process-wide tagged logger. Writes to stderr unless a sink is installed. The sink is
// called without the logger lock held.
class Logger {
public:
  using Sink = std::function<void(LogMessage const&)>;

  Logger();

  Logger(Logger const&) = delete;
  Logger& operator=(Logger const&) = delete;

  void setLevel(LogLevel level);
  auto level() const -> LogLevel;
  bool enabled(LogLevel level) const;

  // Returns the previous sink so callers can restore it.
  auto setSink(Sink sink) -> Sink;

  void log(LogLevel level,
           std::string_view tag,
           std::string_view message,
           std::source_location const& location);

private:
  void writeToStderr(LogMessage const& msg) const;

  LogLevel threshold = LogLevel::Warn;
  Sink sink;
  mutable std::mutex mutex;
  mutable std::mutex writeMutex;
};

auto logger() -> Logger&;

} // namespace LineFit

#define lf_log(level, tag, message) \
  do { \
    if (::LineFit::logger().enabled(level)) { \
      ::LineFit::logger().log(level, tag, message, std::source_location::current()); \
    } \
  } while (0)
