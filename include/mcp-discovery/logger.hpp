#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace mcpd {

enum class LogLevel { INFO, WARNING, ERROR };

class Logger {
public:
  static void setTag(const std::string &tag);
  static void setMinLevel(LogLevel level);
  static void log(LogLevel level, const std::string &message);

private:
  static const char *levelToString(LogLevel level);
  static std::string getCurrentTimestamp();

  static std::mutex mutex_;
  static std::string tag_;
  static LogLevel min_level_;
};

} // namespace mcpd
