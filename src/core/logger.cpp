#include <pubflow/core/logger.hpp>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace pubflow::core {

namespace {

std::mutex g_clog_mutex;

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

void write_to_clog(const LogRecord& record) {
  const auto now = std::chrono::system_clock::now();
  const auto time_t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
  std::tm tm{};
  localtime_r(&time_t, &tm);

  std::ostringstream ss;
  ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
  ss << " [" << to_string(record.level) << "]";
  ss << " [" << record.logger_name << "]";
  ss << " " << record.message;
  if (!record.extra.is_null()) {
    ss << " " << record.extra.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }

  std::lock_guard lock(g_clog_mutex);
  std::clog << ss.str() << '\n';
}

}  // namespace

Logger::Logger(std::string name) : Logger(std::move(name), default_log_level()) {}

Logger::Logger(std::string name, LogLevel level)
    : name_(std::move(name)), level_(level) {}

void Logger::set_sink(LogSink sink) {
  sink_ = std::move(sink);
}

void Logger::log(LogLevel level, std::string_view message,
                 const nlohmann::json& extra) const {
  if (!enabled(level)) return;

  LogRecord record{level, name_, std::string(message), extra};
  if (sink_) {
    sink_(record);
  } else {
    write_to_clog(record);
  }
}

Logger& library_logger() {
  static Logger logger("pubflow.core");
  return logger;
}

LogLevel default_log_level() noexcept {
  const char* env_val = std::getenv("PUBFLOW_LOG_LEVEL");
  if (!env_val) return LogLevel::Info;
  return parse_log_level(env_val, LogLevel::Info);
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
  if (iequals(text, "error")) return LogLevel::Error;
  if (iequals(text, "warn") || iequals(text, "warning")) return LogLevel::Warn;
  if (iequals(text, "info")) return LogLevel::Info;
  if (iequals(text, "debug")) return LogLevel::Debug;
  if (iequals(text, "trace")) return LogLevel::Trace;
  return std::nullopt;
}

LogLevel parse_log_level(std::string_view text, LogLevel fallback) noexcept {
  return parse_log_level(text).value_or(fallback);
}

const char* to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Trace:
      return "TRACE";
    default:
      return "UNKNOWN";
  }
}

}  // namespace pubflow::core
