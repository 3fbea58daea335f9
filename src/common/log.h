#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace chatimport::common {

enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3
};

// Process-wide line logger. Lines below the configured level are dropped.
class Logger {
 public:
  static void setLevel(LogLevel level);
  static LogLevel level();
  static bool enabled(LogLevel level);

  // nullptr restores the default (stdout for Debug/Info, stderr otherwise).
  static void setOutput(std::ostream* out);

  static void log(LogLevel level, const std::string& message);

 private:
  static std::mutex mutex_;
  static LogLevel level_;
  static std::ostream* output_;
};

LogLevel parseLogLevel(const std::string& value);
const char* toString(LogLevel level);

}  // namespace chatimport::common
