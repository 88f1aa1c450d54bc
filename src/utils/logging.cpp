#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace streamingcore {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize(LogLevel level) {
  setLevel(level);
  if (!initialized_) {
    initialized_ = true;
    info("Logger initialized");
  }
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, message);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") {
    return LogLevel::DEBUG;
  } else if (upper == "WARN" || upper == "WARNING") {
    return LogLevel::WARN;
  } else if (upper == "ERROR") {
    return LogLevel::ERROR;
  }
  return LogLevel::INFO;
}

const char *Logger::levelName(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "INFO";
}

void Logger::write(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) % 1000;

  std::tm localTime{};
  localtime_r(&nowTime, &localTime);

  std::ostringstream line;
  line << std::put_time(&localTime, "%H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << millis.count() << " [" << levelName(level) << "] "
       << message;

  // Errors go to stderr, everything else to stdout
  if (level == LogLevel::ERROR) {
    std::cerr << line.str() << std::endl;
  } else {
    std::cout << line.str() << std::endl;
  }
}

} // namespace utils
} // namespace streamingcore
