#include "mcp-discovery/logger.hpp"
#include <cstdio>
#include <ctime>
#include <sstream>

namespace mcpd {

std::mutex Logger::mutex_;
std::string Logger::tag_;
LogLevel Logger::min_level_ = LogLevel::INFO;

void Logger::setTag(const std::string &tag) {
  std::lock_guard lock(mutex_);
  tag_ = tag;
}

void Logger::setMinLevel(LogLevel level) {
  std::lock_guard lock(mutex_);
  min_level_ = level;
}

void Logger::log(LogLevel level, const std::string &message) {
  std::string timestamp = getCurrentTimestamp();
  std::lock_guard lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  if (tag_.empty()) {
    fprintf(stderr, "%s [%s] %s\n", timestamp.c_str(), levelToString(level),
            message.c_str());
  } else {
    fprintf(stderr, "%s [%s] %s: %s\n", timestamp.c_str(),
            levelToString(level), tag_.c_str(), message.c_str());
  }
  fflush(stderr);
}

const char *Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local_time{};
  localtime_r(&time, &local_time);

  std::ostringstream timestamp;
  timestamp << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count();

  return timestamp.str();
}

} // namespace mcpd
