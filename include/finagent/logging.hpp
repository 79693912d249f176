#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace finagent {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* to_string(LogLevel level);

LoggerCallback make_stderr_logger();

class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback sink) : level_(level), sink_(std::move(sink)) {}

  LogLevel level() const { return level_; }
  bool enabled(LogLevel level) const;

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  void error(const std::string& message, const nlohmann::json& details = {}) const {
    log(LogLevel::Error, message, details);
  }
  void warn(const std::string& message, const nlohmann::json& details = {}) const {
    log(LogLevel::Warn, message, details);
  }
  void info(const std::string& message, const nlohmann::json& details = {}) const {
    log(LogLevel::Info, message, details);
  }
  void debug(const std::string& message, const nlohmann::json& details = {}) const {
    log(LogLevel::Debug, message, details);
  }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback sink_;
};

}  // namespace finagent
