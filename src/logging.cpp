#include "finagent/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>

namespace finagent {

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  std::string lowered; lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "off") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug") return LogLevel::Debug;
  return fallback;
}

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Off:
      return "off";
    case LogLevel::Error:
      return "error";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
  }
  return "unknown";
}

LoggerCallback make_stderr_logger() {
  // Recorder worker and caller threads share stderr.
  static std::mutex stderr_mutex;
  return [](LogLevel level, const std::string& message, const nlohmann::json& details) {
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << '[' << to_string(level) << "] " << message;
    if (!details.is_null() && !details.empty()) {
      std::cerr << ' ' << details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::cerr << std::endl;
  };
}

bool Logger::enabled(LogLevel level) const {
  if (!sink_ || level == LogLevel::Off) {
    return false;
  }
  return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!enabled(level)) {
    return;
  }
  // A failing sink must not change the outcome of the call being logged.
  try {
    sink_(level, message, details);
  } catch (const std::exception& ex) {
    std::cerr << "[finagent] log sink failed: " << ex.what() << std::endl;
  }
}

}  // namespace finagent
