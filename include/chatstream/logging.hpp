#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace chatstream {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* to_string(LogLevel level);

/**
 * Level-filtered front for a LoggerCallback. Messages above the configured
 * level, or with no callback installed, are dropped.
 */
class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback callback) : level_(level), callback_(std::move(callback)) {}

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  bool enabled(LogLevel level) const {
    return callback_ && level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(level_);
  }

  LogLevel level() const { return level_; }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback callback_;
};

}  // namespace chatstream
