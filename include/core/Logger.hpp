#pragma once
/** @file  Logger.hpp
 *  @brief Thread-safe leveled logger shared by every subsystem.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tvlink {
  namespace core {

    enum class LogLevel { Debug, Info, Warn, Error, Off };

    const char* toString(LogLevel level);

    /// Case-insensitive "debug" / "info" / "warn" / "error" / "off".
    std::optional<LogLevel> parseLogLevel(std::string_view text);

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string source; ///< emitting subsystem, e.g. "Dispatcher"
      std::string message;
    };

    /**
 * @class Logger
 * @brief Formats one line per event and writes it to a sink stream.
 *
 *  * Events below the threshold are dropped before formatting.
 *  * The sink is not owned; it must outlive the logger.
 */
    class Logger {

    public:
      explicit Logger(std::ostream& sink = std::clog, LogLevel threshold = LogLevel::Info);
      ~Logger() = default;

      // --- public API ---
      void log(const LogEvent& event);

      void debug(std::string source, std::string message);
      void info(std::string source, std::string message);
      void warn(std::string source, std::string message);
      void error(std::string source, std::string message);

      void setLevel(LogLevel level);
      LogLevel level() const;
      bool enabled(LogLevel level) const;

      /// `YYYY-MM-DDTHH:MM:SS.mmm LEVEL [source] message` (no newline).
      static std::string format(const LogEvent& event);

      //---non-copyable-----------------------------------------
      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      std::ostream& sink_;
      LogLevel threshold_;
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace tvlink
