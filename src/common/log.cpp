#include "common/log.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace chatimport::common {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::Info;
std::ostream* Logger::output_ = nullptr;

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::level() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::enabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::setOutput(std::ostream* out) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_ = out;
}

void Logger::log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }

  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_snapshot{};
  localtime_r(&now_time, &tm_snapshot);

  std::ostream* out = output_;
  if (!out) {
    out = static_cast<int>(level) >= static_cast<int>(LogLevel::Warn) ? &std::cerr : &std::cout;
  }
  *out << std::put_time(&tm_snapshot, "%Y-%m-%d %H:%M:%S")
       << " [" << toString(level) << "] " << message << std::endl;
}

LogLevel parseLogLevel(const std::string& value) {
  std::string lowered = value;
  for (auto& ch : lowered) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (lowered == "debug") {
    return LogLevel::Debug;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::Warn;
  }
  if (lowered == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    default:
      return "INFO";
  }
}

}  // namespace chatimport::common
