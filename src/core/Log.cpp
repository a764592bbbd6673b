#include "LineFit/core/Log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace LineFit {

namespace {

auto short_path(char const* filepath) -> std::string_view {
  std::string_view path{filepath ? filepath : ""};
  auto slash = path.find_last_of("/\\");
  if (slash == std::string_view::npos) return path;
  return path.substr(slash + 1);
}

} // namespace

auto ToString(LogLevel level) -> std::string_view {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off: return "OFF";
  }
  return "INFO";
}

auto ParseLogLevel(std::string_view text) -> std::optional<LogLevel> {
  std::string lowered;
  lowered.reserve(text.size());
  for (char c : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lowered == "debug") return LogLevel::Debug;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "off" || lowered == "none") return LogLevel::Off;
  return std::nullopt;
}

Logger::Logger() {
  if (auto env = std::getenv("LINEFIT_LOG_LEVEL")) {
    if (auto parsed = ParseLogLevel(env)) {
      threshold = *parsed;
    }
  }
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex);
  threshold = level;
}

auto Logger::level() const -> LogLevel {
  std::lock_guard<std::mutex> lock(mutex);
  return threshold;
}

bool Logger::enabled(LogLevel level) const {
  if (level == LogLevel::Off) return false;
  std::lock_guard<std::mutex> lock(mutex);
  return level >= threshold;
}

auto Logger::setSink(Sink next) -> Sink {
  std::lock_guard<std::mutex> lock(mutex);
  std::swap(sink, next);
  return next;
}

void Logger::log(LogLevel level,
                 std::string_view tag,
                 std::string_view message,
                 std::source_location const& location) {
  Sink target;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (level == LogLevel::Off || level < threshold) return;
    target = sink;
  }
  // Sinks run unlocked so they may query or log through the logger themselves.
  LogMessage msg{level, std::string{tag}, std::string{message}, location};
  if (target) {
    target(msg);
    return;
  }
  writeToStderr(msg);
}

void Logger::writeToStderr(LogMessage const& msg) const {
  std::ostringstream oss;
  oss << '[' << ToString(msg.level) << "][" << msg.tag << "] " << msg.message
      << " (" << short_path(msg.location.file_name()) << ':' << msg.location.line() << ")\n";
  std::lock_guard<std::mutex> lock(writeMutex);
  std::cerr << oss.str() << std::flush;
}

auto logger() -> Logger& {
  static Logger instance;
  return instance;
}

} // namespace LineFit
