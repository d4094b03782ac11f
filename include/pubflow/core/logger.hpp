#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pubflow::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn,
  Info,
  Debug,
  Trace,
};

/// One emitted log line. \p extra carries structured diagnostic data (null when absent).
struct LogRecord {
  LogLevel level{LogLevel::Info};
  std::string logger_name;
  std::string message;
  nlohmann::json extra;
};

/// Receives every record that passes the logger's level. May be called from
/// several threads; the default sink serializes writes to std::clog.
using LogSink = std::function<void(const LogRecord&)>;

/// Named, leveled logger. Plugins own one each; the library uses library_logger().
/// Thread-safety: log() may be called concurrently; set_level()/set_sink() must not
/// race with logging.
class Logger {
 public:
  explicit Logger(std::string name);
  Logger(std::string name, LogLevel level);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] LogLevel level() const noexcept { return level_; }
  void set_level(LogLevel level) noexcept { level_ = level; }

  /// Replace the output sink; an empty sink restores the default (std::clog).
  void set_sink(LogSink sink);

  [[nodiscard]] bool enabled(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(level_);
  }

  void log(LogLevel level, std::string_view message,
           const nlohmann::json& extra = nullptr) const;

  void error(std::string_view msg, const nlohmann::json& extra = nullptr) const {
    log(LogLevel::Error, msg, extra);
  }
  void warn(std::string_view msg, const nlohmann::json& extra = nullptr) const {
    log(LogLevel::Warn, msg, extra);
  }
  void info(std::string_view msg, const nlohmann::json& extra = nullptr) const {
    log(LogLevel::Info, msg, extra);
  }
  void debug(std::string_view msg, const nlohmann::json& extra = nullptr) const {
    log(LogLevel::Debug, msg, extra);
  }
  void trace(std::string_view msg, const nlohmann::json& extra = nullptr) const {
    log(LogLevel::Trace, msg, extra);
  }

 private:
  std::string name_;
  LogLevel level_;
  LogSink sink_;
};

/// Logger used by the library itself ("pubflow.core").
Logger& library_logger();

/// Level from PUBFLOW_LOG_LEVEL, or Info when unset or unrecognised.
[[nodiscard]] LogLevel default_log_level() noexcept;

/// Case-insensitive parse of error/warn/warning/info/debug/trace; nullopt otherwise.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// As above, with \p fallback for unrecognised text.
[[nodiscard]] LogLevel parse_log_level(std::string_view text, LogLevel fallback) noexcept;

[[nodiscard]] const char* to_string(LogLevel level) noexcept;

}  // namespace pubflow::core
