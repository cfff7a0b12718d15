#include "chatstream/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace chatstream {

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  std::string lowered;
  lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
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
  return "off";
}

void Logger::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!enabled(level)) {
    return;
  }
  callback_(level, message, details);
}

}  // namespace chatstream
