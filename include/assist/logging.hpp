#pragma once

#include <functional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace assist {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

/**
 * Receives every record that passes the threshold. Streaming components call it
 * from the background transfer thread as well as from the caller's thread, so
 * implementations must be safe to invoke concurrently.
 */
using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* to_string(LogLevel level);

/**
 * Callback plus threshold. Copied by value into every component that logs.
 */
class Logger {
public:
  Logger() = default;
  Logger(LoggerCallback callback, LogLevel level)
      : callback_(std::move(callback)), level_(level) {}

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  bool enabled(LogLevel level) const;
  LogLevel level() const { return level_; }

private:
  LoggerCallback callback_;
  LogLevel level_ = LogLevel::Off;
};

/**
 * Writes "[assist] LEVEL message {details}" lines to stderr.
 */
LoggerCallback make_stderr_logger();

}  // namespace assist
