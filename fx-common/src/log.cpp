#include "fx/log.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <utility>

namespace fx::log {

namespace {

void stderr_sink(Level level, std::string_view message) {
  fmt::print(stderr, "[fx][{}] {}\n", to_string(level), message);
}

}  // namespace

std::string_view to_string(Level level) noexcept {
  switch (level) {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

Sink& Logger::sink() noexcept {
  static Sink instance = stderr_sink;
  return instance;
}

void Logger::set_sink(Sink sink) {
  if (!sink) {
    reset_sink();
    return;
  }
  Logger::sink() = std::move(sink);
}

void Logger::reset_sink() { Logger::sink() = stderr_sink; }

void Logger::emit(Level level, std::string_view message) {
  Logger::sink()(level, message);
}

}  // namespace fx::log
