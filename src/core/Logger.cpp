/* @file Logger.cpp
 * @brief line formatting and level filtering for the shared logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

// tvlink headers
#include "core/Logger.hpp"

using namespace tvlink::core;

namespace tvlink::core {

  const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      return "OFF";
    default:
      return "UNKNOWN";
    }
  }

  std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
      return LogLevel::Debug;
    if (lower == "info")
      return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
      return LogLevel::Warn;
    if (lower == "error")
      return LogLevel::Error;
    if (lower == "off")
      return LogLevel::Off;
    return std::nullopt;
  }

} // namespace tvlink::core

Logger::Logger(std::ostream& sink, LogLevel threshold) : sink_(sink), threshold_(threshold) {}

void Logger::log(const LogEvent& event) {
  if (!enabled(event.level))
    return;

  // format outside the lock, only the stream write is serialised
  const std::string line = format(event);
  std::lock_guard<std::mutex> lock(mtx_);
  sink_ << line << '\n';
  sink_.flush();
}

void Logger::debug(std::string source, std::string message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Debug, std::move(source),
                std::move(message) });
}

void Logger::info(std::string source, std::string message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Info, std::move(source),
                std::move(message) });
}

void Logger::warn(std::string source, std::string message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warn, std::move(source),
                std::move(message) });
}

void Logger::error(std::string source, std::string message) {
  log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Error, std::move(source),
                std::move(message) });
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mtx_);
  threshold_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return threshold_;
}

bool Logger::enabled(LogLevel level) const {
  if (level == LogLevel::Off)
    return false;
  std::lock_guard<std::mutex> lock(mtx_);
  return threshold_ != LogLevel::Off && level >= threshold_;
}

std::string Logger::format(const LogEvent& event) {
  using namespace std::chrono;

  const std::time_t secs = system_clock::to_time_t(event.when);
  const auto millis =
      duration_cast<milliseconds>(event.when.time_since_epoch()).count() % 1000;

  std::tm tm{};
  localtime_r(&secs, &tm); // POSIX, thread-safe variant

  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
     << millis << ' ' << toString(event.level) << " [" << event.source << "] " << event.message;
  return os.str();
}
