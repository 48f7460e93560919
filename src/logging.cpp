#include "assist/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>

namespace assist {

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  std::string lowered; lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "off" || lowered == "none") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug") return LogLevel::Debug;
  return fallback;
}

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Off:
      return "OFF";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Debug:
      return "DEBUG";
  }
  return "UNKNOWN";
}

bool Logger::enabled(LogLevel level) const {
  if (!callback_ || level == LogLevel::Off) {
    return false;
  }
  return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!enabled(level)) {
    return;
  }
  callback_(level, message, details);
}

LoggerCallback make_stderr_logger() {
  // The decoder logs from a background thread while the sink logs from the caller.
  auto mutex = std::make_shared<std::mutex>();
  return [mutex](LogLevel level, const std::string& message, const nlohmann::json& details) {
    std::lock_guard<std::mutex> lock(*mutex);
    std::cerr << "[assist] " << to_string(level) << ' ' << message;
    if (!details.is_null() && !details.empty()) {
      std::cerr << ' ' << details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::cerr << '\n';
  };
}

}  // namespace assist
