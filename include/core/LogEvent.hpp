#pragma once
/** @file  LogEvent.hpp
 *  @brief One row of the run log.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace petctl::core {

  enum class LogLevel : std::uint8_t { Info, Warn, Error };

  inline const char* toString(LogLevel l) {
    switch (l) {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    default:
      return "Unknown";
    }
  }

  struct LogEvent {
    std::int64_t timestampMs{ 0 }; ///< wall clock, ms since epoch
    LogLevel level{ LogLevel::Info };
    std::string source;  ///< component name, e.g. "GearOverrideEngine"
    std::string message;

    /// Stamp a new event with the current wall-clock time.
    static LogEvent make(LogLevel level, std::string source, std::string message) {
      const auto now = std::chrono::system_clock::now().time_since_epoch();
      return LogEvent{ std::chrono::duration_cast<std::chrono::milliseconds>(now).count(), level,
                       std::move(source), std::move(message) };
    }
  };

  /// Render as one CSV line (with trailing '\n'); quotes fields that need it.
  std::string toCsv(const LogEvent& event);

} // namespace petctl::core
